/*
 * hostdeck — OpenSSH host catalog
 *
 * Licensed under the Apache License, Version 2.0
 * http://www.apache.org/licenses/LICENSE-2.0
 */

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSettings>
#include <QTextStream>

#include "AppSettings.h"
#include "HostFilter.h"
#include "HostTable.h"
#include "Logger.h"
#include "SshHostCatalog.h"

// main.cpp
// --------
// Application entry point.
//
// Responsibilities:
// - Set QCoreApplication metadata (org/app name/version) for QSettings
// - Load persisted defaults (AppSettings), then apply command-line overrides
// - Install logging
// - Resolve every config path through SshHostCatalog
// - Sort / filter for display and print the host table
//
// Exit codes: 0 success, 1 config error, 2 invalid command line.

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setOrganizationName("hostdeck");
    QCoreApplication::setApplicationName("hostdeck");
    QCoreApplication::setApplicationVersion("0.3.0");

    QCommandLineParser cli;
    cli.setApplicationDescription("List the hosts defined in OpenSSH config files.");
    cli.addHelpOption();
    cli.addVersionOption();

    const QCommandLineOption configOpt({"c", "config"},
        "SSH config file to read (repeatable).", "path");
    const QCommandLineOption strictOpt("strict",
        "Fail on unknown configuration keywords.");
    const QCommandLineOption includeDirOpt("include-dir",
        "Base directory for relative Include paths.", "dir");
    const QCommandLineOption searchOpt({"s", "search"},
        "Only show hosts matching this fuzzy filter.", "text");
    const QCommandLineOption noSortOpt("no-sort",
        "Keep config order instead of sorting by name.");
    const QCommandLineOption proxyOpt("show-proxy-command",
        "Add a ProxyCommand column.");
    const QCommandLineOption logLevelOpt("log-level",
        "0=errors, 1=normal, 2=debug.", "level");
    const QCommandLineOption logFileOpt("log-file",
        "Write log records to this file instead of stderr.", "path");

    cli.addOption(configOpt);
    cli.addOption(strictOpt);
    cli.addOption(includeDirOpt);
    cli.addOption(searchOpt);
    cli.addOption(noSortOpt);
    cli.addOption(proxyOpt);
    cli.addOption(logLevelOpt);
    cli.addOption(logFileOpt);
    cli.process(app);

    QSettings s;
    AppSettings settings = AppSettings::load(s);

    if (cli.isSet(configOpt))     settings.configPaths = cli.values(configOpt);
    if (cli.isSet(strictOpt))     settings.strict = true;
    if (cli.isSet(includeDirOpt)) settings.includeDir = cli.value(includeDirOpt);
    if (cli.isSet(searchOpt))     settings.search = cli.value(searchOpt);
    if (cli.isSet(noSortOpt))     settings.sortByName = false;
    if (cli.isSet(proxyOpt))      settings.showProxyCommand = true;
    if (cli.isSet(logFileOpt))    settings.logFilePath = cli.value(logFileOpt);
    if (cli.isSet(logLevelOpt)) {
        bool ok = false;
        const int lvl = cli.value(logLevelOpt).toInt(&ok);
        if (!ok || lvl < 0 || lvl > 2) {
            QTextStream(stderr) << "hostdeck: invalid --log-level '" << cli.value(logLevelOpt) << "'\n";
            return 2;
        }
        settings.logLevel = lvl;
    }

    Logger::setLogLevel(settings.logLevel);
    Logger::install("hostdeck");
    if (!settings.logFilePath.isEmpty() && !Logger::setLogFile(settings.logFilePath))
        qWarning().noquote() << QString("Cannot open log file %1, logging to stderr").arg(settings.logFilePath);

    SshHostLoadOptions opt;
    opt.parser.strict = settings.strict;
    opt.parser.includeDir = settings.includeDir;

    QVector<ResolvedHost> hosts;
    SshConfigError err;
    if (!SshHostCatalog::loadAll(settings.configPaths, opt, &hosts, &err)) {
        QTextStream(stderr) << "hostdeck: " << err.toString() << "\n";
        return 1;
    }

    if (settings.sortByName)
        HostFilter::sortByName(hosts);
    hosts = HostFilter::filter(hosts, settings.search);

    qInfo().noquote() << QString("%1 host(s) to display").arg(hosts.size());

    QTextStream(stdout) << HostTable::render(hosts, settings.showProxyCommand);
    return 0;
}
