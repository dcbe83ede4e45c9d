#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "AppSettings.h"
#include "SshHostCatalog.h"
#include "test_utils.h"

class AppSettingsTest : public ::testing::Test {
protected:
  QTemporaryDir tmp;

  void SetUp() override { ASSERT_TRUE(tmp.isValid()); }

  QString ini() const { return tmp.filePath("hostdeck.ini"); }
};

TEST_F(AppSettingsTest, EmptyStoreYieldsDefaults) {
  QSettings s(ini(), QSettings::IniFormat);
  const AppSettings a = AppSettings::load(s);

  EXPECT_EQ(a.configPaths, SshHostCatalog::defaultConfigPaths());
  EXPECT_FALSE(a.strict);
  EXPECT_EQ(a.includeDir, QString("~/.ssh"));
  EXPECT_TRUE(a.sortByName);
  EXPECT_FALSE(a.showProxyCommand);
  EXPECT_TRUE(a.search.isEmpty());
  EXPECT_EQ(a.logLevel, 1);
  EXPECT_TRUE(a.logFilePath.isEmpty());
}

TEST_F(AppSettingsTest, SaveThenLoad) {
  AppSettings a = AppSettings::defaults();
  a.configPaths = QStringList{"/tmp/a", "/tmp/b"};
  a.strict = true;
  a.includeDir = "/etc/ssh";
  a.sortByName = false;
  a.showProxyCommand = true;
  a.search = "prod";
  a.logLevel = 2;
  a.logFilePath = "/tmp/hostdeck.log";

  {
    QSettings s(ini(), QSettings::IniFormat);
    a.save(s);
    s.sync();
    ASSERT_EQ(s.status(), QSettings::NoError);
  }

  QSettings s(ini(), QSettings::IniFormat);
  const AppSettings b = AppSettings::load(s);

  EXPECT_EQ(b.configPaths, a.configPaths);
  EXPECT_TRUE(b.strict);
  EXPECT_EQ(b.includeDir, QString("/etc/ssh"));
  EXPECT_FALSE(b.sortByName);
  EXPECT_TRUE(b.showProxyCommand);
  EXPECT_EQ(b.search, QString("prod"));
  EXPECT_EQ(b.logLevel, 2);
  EXPECT_EQ(b.logFilePath, QString("/tmp/hostdeck.log"));
}

TEST_F(AppSettingsTest, LogLevelIsClamped) {
  QSettings s(ini(), QSettings::IniFormat);

  s.setValue("logging/level", 9);
  EXPECT_EQ(AppSettings::load(s).logLevel, 2);

  s.setValue("logging/level", -3);
  EXPECT_EQ(AppSettings::load(s).logLevel, 0);
}

TEST_F(AppSettingsTest, BlankValuesFallBackToDefaults) {
  QSettings s(ini(), QSettings::IniFormat);
  s.setValue("config/paths", QStringList{QString()});
  s.setValue("config/includeDir", "   ");

  const AppSettings a = AppSettings::load(s);
  EXPECT_EQ(a.configPaths, SshHostCatalog::defaultConfigPaths());
  EXPECT_EQ(a.includeDir, QString("~/.ssh"));
}
