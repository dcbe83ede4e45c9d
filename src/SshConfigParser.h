#pragma once
//
// SshConfigParser.h
//
// PURPOSE
// -------
// Reads OpenSSH client config text into an ordered list of host blocks plus
// the implicit global block, following Include directives.
//
// ARCHITECTURAL ROLE
// ------------------
// SshConfigParser is the input stage of host resolution:
//
//    ~/.ssh/config (text, + included files)
//           ↓
//    SshConfigParser::parseFile()
//           ↓
//    SshConfigParseResult (global block + host blocks, global defaults applied)
//           ↓
//    SshHostResolver::resolve()       (patterns, hostname defaults, dedup)
//           ↓
//    SshHostCatalog                   (projection into ResolvedHost rows)
//
// Boundaries:
// - Does NOT modify any file
// - Does NOT evaluate Match blocks ("Match" is kept as an opaque value)
// - Does NOT interpret option values beyond storing them as strings
//
// PARSING MODEL
// -------------
// Two modes:
// - top-level: before the first "Host" line; entries go to the global block
// - in-block : after a "Host" line; entries go to the most recent host block
//
// Within one block a repeated keyword overwrites the earlier value.
// Unknown keywords are dropped, or fail the parse when options.strict is set.
//
// INCLUDE
// -------
// "Include <path-or-glob>" is tilde-expanded, anchored at options.includeDir
// when relative, glob-expanded and each match is parsed recursively. The
// included file's result is merged depending on the mode at the Include line:
// - top-level: included globals overwrite the caller's globals, included host
//              blocks are appended in file order
// - in-block : included globals fill missing keys of the current host block;
//              included host blocks are an error
//
// Files currently being parsed are tracked by canonical path; an Include that
// re-enters one of them fails with an include-cycle error.

#include "SshConfigError.h"
#include "SshHostBlock.h"

#include <QString>
#include <QStringList>
#include <QVector>

class QTextStream;

struct SshConfigParserOptions {
    // Unknown keywords are an error instead of being ignored.
    bool strict = false;

    // Base directory for relative Include paths. Empty => ~/.ssh
    QString includeDir;
};

struct SshConfigParseResult {
    // Entries outside any Host block (patterns always empty).
    SshHostBlock global;

    // Host blocks in file order, included files spliced in place.
    QVector<SshHostBlock> blocks;

    // Every file that was read, in the order it was opened.
    QStringList files;
};

class SshConfigParser
{
public:
    // Parses "path" (tilde-expanded) and its includes, then fills every host
    // block with the global entries it does not define itself.
    static bool parseFile(const QString& path,
                          const SshConfigParserOptions& opt,
                          SshConfigParseResult* out,
                          SshConfigError* err = nullptr);

    // Same as parseFile() for in-memory text. "sourceName" is used in errors.
    static bool parseText(const QString& text,
                          const QString& sourceName,
                          const SshConfigParserOptions& opt,
                          SshConfigParseResult* out,
                          SshConfigError* err = nullptr);

    // global -> every host block, fill-if-absent.
    static void applyGlobalDefaults(SshConfigParseResult& r);

private:
    struct Context {
        SshConfigParserOptions opt;
        QStringList openFiles; // canonical paths on the current include chain
    };

    static bool parseRawFile(const QString& path,
                             Context& ctx,
                             SshConfigParseResult* out,
                             SshConfigError* err);

    static bool parseStream(QTextStream& in,
                            const QString& sourceName,
                            Context& ctx,
                            SshConfigParseResult* out,
                            SshConfigError* err);

    static bool processInclude(const QString& value,
                               const QString& sourceName,
                               int lineNo,
                               const QString& lineText,
                               bool inBlock,
                               Context& ctx,
                               SshConfigParseResult* out,
                               SshConfigError* err);
};
