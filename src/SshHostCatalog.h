#pragma once
//
// SshHostCatalog.h
//
// PURPOSE
// -------
// Entry point of the host resolution engine. Turns one or more OpenSSH config
// files into a flat list of display-ready hosts.
//
// ARCHITECTURAL ROLE
// ------------------
//    path(s)
//       ↓
//    SshConfigParser::parseFile()     blocks + global defaults
//       ↓
//    SshHostResolver::resolve()       patterns applied, duplicates merged
//       ↓
//    SshHostCatalog::project()        ResolvedHost rows
//
// It intentionally does NOT:
// - sort or filter rows (HostFilter)
// - render rows (HostTable)
// - launch ssh
//
// MULTIPLE FILES
// --------------
// Each path is parsed independently; results are concatenated in path order.
// loadAll() skips a path listed in LoadOptions::optionalPaths when, and only
// when, it fails because the file does not exist (the system-wide
// /etc/ssh/ssh_config is commonly absent).

#include "SshConfigError.h"
#include "SshConfigParser.h"
#include "SshHostBlock.h"

#include <QString>
#include <QStringList>
#include <QVector>

// One display row. Optional fields are empty when the config does not set them.
struct ResolvedHost {
    QString name;         // first pattern of the block
    QString aliases;      // remaining patterns, joined with ", "
    QString user;         // User (optional)
    QString destination;  // HostName, or name when none is configured
    QString port;         // Port (optional, verbatim)
    QString proxyCommand; // ProxyCommand (optional, verbatim)

    bool operator==(const ResolvedHost& o) const;
    bool operator!=(const ResolvedHost& o) const { return !(*this == o); }
};

struct SshHostLoadOptions {
    SshConfigParserOptions parser;

    // Paths whose absence is not an error in loadAll().
    QStringList optionalPaths = QStringList{"/etc/ssh/ssh_config"};
};

class SshHostCatalog
{
public:
    static QStringList defaultConfigPaths();

    // Parse + resolve + project a single file.
    static bool loadFile(const QString& path,
                         const SshConfigParserOptions& opt,
                         QVector<ResolvedHost>* out,
                         SshConfigError* err = nullptr);

    // loadFile() for every path, concatenated.
    static bool loadAll(const QStringList& paths,
                        const SshHostLoadOptions& opt,
                        QVector<ResolvedHost>* out,
                        SshConfigError* err = nullptr);

    static ResolvedHost project(const SshHostBlock& block);
    static QVector<ResolvedHost> project(const QVector<SshHostBlock>& blocks);
};
