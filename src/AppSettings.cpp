// AppSettings.cpp

#include "AppSettings.h"

#include "SshHostCatalog.h"

#include <QSettings>

AppSettings AppSettings::defaults()
{
    AppSettings a;
    a.configPaths = SshHostCatalog::defaultConfigPaths();
    a.includeDir = "~/.ssh";
    return a;
}

AppSettings AppSettings::load(QSettings& s)
{
    const AppSettings d = defaults();
    AppSettings a;

    a.configPaths = s.value("config/paths", d.configPaths).toStringList();
    a.configPaths.removeAll(QString());
    if (a.configPaths.isEmpty())
        a.configPaths = d.configPaths;

    a.strict     = s.value("config/strict", d.strict).toBool();
    a.includeDir = s.value("config/includeDir", d.includeDir).toString().trimmed();
    if (a.includeDir.isEmpty())
        a.includeDir = d.includeDir;

    a.sortByName       = s.value("display/sortByName", d.sortByName).toBool();
    a.showProxyCommand = s.value("display/showProxyCommand", d.showProxyCommand).toBool();
    a.search           = s.value("display/search", d.search).toString();

    a.logLevel    = qBound(0, s.value("logging/level", d.logLevel).toInt(), 2);
    a.logFilePath = s.value("logging/filePath", d.logFilePath).toString().trimmed();

    return a;
}

void AppSettings::save(QSettings& s) const
{
    s.setValue("config/paths", configPaths);
    s.setValue("config/strict", strict);
    s.setValue("config/includeDir", includeDir);
    s.setValue("display/sortByName", sortByName);
    s.setValue("display/showProxyCommand", showProxyCommand);
    s.setValue("display/search", search);
    s.setValue("logging/level", logLevel);
    s.setValue("logging/filePath", logFilePath);
}
