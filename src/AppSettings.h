#pragma once

#include <QString>
#include <QStringList>

class QSettings;

/*
    AppSettings
    -----------
    Persistent defaults for the hostdeck CLI, stored with QSettings
    (~/.config/hostdeck/hostdeck.conf on Linux when the default
    organization/application names are used).

    Keys:
        config/paths               QStringList  files to resolve, in order
        config/strict              bool         unknown keywords are errors
        config/includeDir          QString      base for relative Include paths
        display/sortByName         bool
        display/showProxyCommand   bool
        display/search             QString      initial search filter
        logging/level              int          0=errors, 1=normal, 2=debug
        logging/filePath           QString      empty => stderr

    Command-line options are applied on top of these values by main().
*/
struct AppSettings {
    QStringList configPaths;
    bool strict = false;
    QString includeDir;

    bool sortByName = true;
    bool showProxyCommand = false;
    QString search;

    int logLevel = 1;
    QString logFilePath;

    static AppSettings defaults();

    // Missing keys keep their defaults. logLevel is clamped to 0..2 and an
    // empty config/paths list falls back to the default paths.
    static AppSettings load(QSettings& s);

    void save(QSettings& s) const;
};
