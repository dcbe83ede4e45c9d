#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "SshHostCatalog.h"
#include "test_utils.h"

using testutil::block;
using testutil::writeFile;

TEST(SshHostCatalogTest, ProjectFullBlock) {
  const auto h = SshHostCatalog::project(block({"db", "db-old", "database"},
                                               {{SshConfigKeyword::User, "admin"},
                                                {SshConfigKeyword::Hostname, "10.0.0.5"},
                                                {SshConfigKeyword::Port, "2222"},
                                                {SshConfigKeyword::ProxyCommand, "ssh -W %h:%p jump"}}));

  EXPECT_EQ(h.name, QString("db"));
  EXPECT_EQ(h.aliases, QString("db-old, database"));
  EXPECT_EQ(h.user, QString("admin"));
  EXPECT_EQ(h.destination, QString("10.0.0.5"));
  EXPECT_EQ(h.port, QString("2222"));
  EXPECT_EQ(h.proxyCommand, QString("ssh -W %h:%p jump"));
}

TEST(SshHostCatalogTest, ProjectMinimalBlock) {
  const auto h = SshHostCatalog::project(block({"solo"}));

  EXPECT_EQ(h.name, QString("solo"));
  EXPECT_TRUE(h.aliases.isEmpty());
  EXPECT_TRUE(h.user.isEmpty());
  EXPECT_EQ(h.destination, QString("solo"));
  EXPECT_TRUE(h.port.isEmpty());
  EXPECT_TRUE(h.proxyCommand.isEmpty());
}

TEST(SshHostCatalogTest, DefaultConfigPaths) {
  EXPECT_EQ(SshHostCatalog::defaultConfigPaths(),
            (QStringList{"/etc/ssh/ssh_config", "~/.ssh/config"}));
}

class SshHostCatalogFileTest : public ::testing::Test {
protected:
  QTemporaryDir tmp;
  SshConfigParserOptions opt;

  void SetUp() override {
    ASSERT_TRUE(tmp.isValid());
    opt.includeDir = tmp.path();
  }

  QString path(const QString& rel) const { return tmp.filePath(rel); }
};

TEST_F(SshHostCatalogFileTest, LoadFileResolvesAndProjects) {
  writeFile(path("config"),
            "User everyone\n"
            "Host *.corp\n"
            "  Port 2200\n"
            "Host db.corp\n"
            "  HostName 10.1.1.1\n"
            "Host web.corp web\n");

  QVector<ResolvedHost> hosts;
  SshConfigError err;
  ASSERT_TRUE(SshHostCatalog::loadFile(path("config"), opt, &hosts, &err)) << err.toString().toStdString();

  ASSERT_EQ(hosts.size(), 3);

  EXPECT_EQ(hosts[0].name, QString("db.corp"));
  EXPECT_EQ(hosts[0].destination, QString("10.1.1.1"));
  EXPECT_EQ(hosts[0].user, QString("everyone"));
  EXPECT_EQ(hosts[0].port, QString("2200"));

  EXPECT_EQ(hosts[1].name, QString("web.corp"));
  EXPECT_EQ(hosts[1].destination, QString("web.corp"));
  EXPECT_EQ(hosts[1].port, QString("2200"));

  // "web" does not match "*.corp".
  EXPECT_EQ(hosts[2].name, QString("web"));
  EXPECT_EQ(hosts[2].destination, QString("web"));
  EXPECT_TRUE(hosts[2].port.isEmpty());
  EXPECT_EQ(hosts[2].user, QString("everyone"));
}

TEST_F(SshHostCatalogFileTest, LoadFilePropagatesErrors) {
  writeFile(path("config"), "Host a\n  Broken\n");

  QVector<ResolvedHost> hosts;
  SshConfigError err;
  EXPECT_FALSE(SshHostCatalog::loadFile(path("config"), opt, &hosts, &err));
  EXPECT_EQ(err.kind, SshConfigErrorKind::UnparseableLine);
  EXPECT_TRUE(hosts.isEmpty());
}

TEST_F(SshHostCatalogFileTest, LoadAllConcatenatesInPathOrder) {
  writeFile(path("one"), "Host first\n");
  writeFile(path("two"), "Host second\n");

  SshHostLoadOptions lo;
  lo.parser = opt;

  QVector<ResolvedHost> hosts;
  ASSERT_TRUE(SshHostCatalog::loadAll({path("two"), path("one")}, lo, &hosts));
  ASSERT_EQ(hosts.size(), 2);
  EXPECT_EQ(hosts[0].name, QString("second"));
  EXPECT_EQ(hosts[1].name, QString("first"));
}

TEST_F(SshHostCatalogFileTest, LoadAllSkipsMissingOptionalPath) {
  writeFile(path("config"), "Host only\n");

  SshHostLoadOptions lo;
  lo.parser = opt;
  lo.optionalPaths = QStringList{path("system")};

  QVector<ResolvedHost> hosts;
  SshConfigError err;
  ASSERT_TRUE(SshHostCatalog::loadAll({path("system"), path("config")}, lo, &hosts, &err))
      << err.toString().toStdString();
  ASSERT_EQ(hosts.size(), 1);
  EXPECT_EQ(hosts[0].name, QString("only"));
}

TEST_F(SshHostCatalogFileTest, LoadAllFailsOnMissingRequiredPath) {
  SshHostLoadOptions lo;
  lo.parser = opt;
  lo.optionalPaths.clear();

  QVector<ResolvedHost> hosts;
  SshConfigError err;
  EXPECT_FALSE(SshHostCatalog::loadAll({path("absent")}, lo, &hosts, &err));
  EXPECT_EQ(err.kind, SshConfigErrorKind::Io);
  EXPECT_TRUE(err.notFound);
}

TEST_F(SshHostCatalogFileTest, MissingIncludeInOptionalPathIsStillAnError) {
  writeFile(path("system"), "Include does-not-exist\n");

  SshHostLoadOptions lo;
  lo.parser = opt;
  lo.optionalPaths = QStringList{path("system")};

  QVector<ResolvedHost> hosts;
  SshConfigError err;
  EXPECT_FALSE(SshHostCatalog::loadAll({path("system")}, lo, &hosts, &err));
  EXPECT_EQ(err.kind, SshConfigErrorKind::Io);
  EXPECT_EQ(err.line, 1);
}
