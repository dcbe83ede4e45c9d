// SshHostCatalog.cpp
//
// Glue between parsing, resolution and the ResolvedHost rows consumed by the
// CLI. Deterministic and side-effect free apart from reading files, so it is
// unit-tested directly against temporary config trees.

#include "SshHostCatalog.h"

#include "SshHostResolver.h"

#include <QDebug>

bool ResolvedHost::operator==(const ResolvedHost& o) const
{
    return name == o.name
        && aliases == o.aliases
        && user == o.user
        && destination == o.destination
        && port == o.port
        && proxyCommand == o.proxyCommand;
}

QStringList SshHostCatalog::defaultConfigPaths()
{
    return QStringList{"/etc/ssh/ssh_config", "~/.ssh/config"};
}

ResolvedHost SshHostCatalog::project(const SshHostBlock& block)
{
    ResolvedHost h;
    h.name = block.patterns.isEmpty() ? QString() : block.patterns.first();
    h.aliases = block.patterns.mid(1).join(", ");
    h.user = block.value(SshConfigKeyword::User);
    h.destination = block.value(SshConfigKeyword::Hostname);
    if (h.destination.isEmpty())
        h.destination = h.name;
    h.port = block.value(SshConfigKeyword::Port);
    h.proxyCommand = block.value(SshConfigKeyword::ProxyCommand);
    return h;
}

QVector<ResolvedHost> SshHostCatalog::project(const QVector<SshHostBlock>& blocks)
{
    QVector<ResolvedHost> out;
    out.reserve(blocks.size());
    for (const SshHostBlock& b : blocks)
        out.push_back(project(b));
    return out;
}

bool SshHostCatalog::loadFile(const QString& path,
                              const SshConfigParserOptions& opt,
                              QVector<ResolvedHost>* out,
                              SshConfigError* err)
{
    SshConfigParseResult parsed;
    if (!SshConfigParser::parseFile(path, opt, &parsed, err))
        return false;

    const QVector<ResolvedHost> hosts = project(SshHostResolver::resolve(parsed.blocks));
    if (out) *out = hosts;
    return true;
}

bool SshHostCatalog::loadAll(const QStringList& paths,
                             const SshHostLoadOptions& opt,
                             QVector<ResolvedHost>* out,
                             SshConfigError* err)
{
    QVector<ResolvedHost> all;

    for (const QString& path : paths) {
        QVector<ResolvedHost> hosts;
        SshConfigError e;
        if (!loadFile(path, opt.parser, &hosts, &e)) {
            // Only a missing top-level optional file is tolerated; a missing
            // Include inside it is still an error.
            const bool missingOptional = opt.optionalPaths.contains(path)
                && e.kind == SshConfigErrorKind::Io
                && e.notFound
                && e.line == 0;
            if (missingOptional) {
                qInfo().noquote() << QString("Skipping missing optional config %1").arg(path);
                continue;
            }
            if (err) *err = e;
            return false;
        }
        all += hosts;
    }

    if (out) *out = all;
    return true;
}
