// SshConfigParser.cpp
//
// Line-oriented parser for OpenSSH client config files.
//
// Data flow per file:
//
//    QFile -> QTextStream::readLine()
//          -> SshConfigLine::stripInlineComment()
//          -> SshConfigLine::classify()        (key/value + keyword lookup)
//          -> Host    : open a new SshHostBlock
//             Include : processInclude() -> parseRawFile() (recursive)
//             other   : SshHostBlock::set() on the current block
//
// Errors are reported through SshConfigError with the file and line of the
// innermost failing directive. Nothing is recovered locally: the first error
// aborts the parse of every file on the include chain.

#include "SshConfigParser.h"

#include "SshConfigEntry.h"
#include "SshHostPattern.h"
#include "SshPathExpansion.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

static void setUtf8(QTextStream& in)
{
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
    in.setEncoding(QStringConverter::Utf8);
#else
    in.setCodec("UTF-8");
#endif
}

static void fail(SshConfigError* err,
                 SshConfigErrorKind kind,
                 const QString& file,
                 int line,
                 const QString& lineText,
                 const QString& detail = QString())
{
    if (!err) return;
    *err = SshConfigError{};
    err->kind = kind;
    err->file = file;
    err->line = line;
    err->lineText = lineText;
    err->detail = detail;
}

static void failInclude(SshConfigError* err,
                        SshIncludeFailure reason,
                        const QString& file,
                        int line,
                        const QString& lineText,
                        const QString& detail = QString())
{
    fail(err, SshConfigErrorKind::InvalidInclude, file, line, lineText, detail);
    if (err) err->includeFailure = reason;
}

bool SshConfigParser::parseFile(const QString& path,
                                const SshConfigParserOptions& opt,
                                SshConfigParseResult* out,
                                SshConfigError* err)
{
    Context ctx;
    ctx.opt = opt;

    SshConfigParseResult r;
    if (!parseRawFile(SshPathExpansion::expandTilde(path), ctx, &r, err)) {
        if (err)
            qWarning().noquote() << QString("ssh config parse failed: %1").arg(err->toString());
        return false;
    }

    applyGlobalDefaults(r);

    qInfo().noquote() << QString("Parsed %1: %2 host block(s) from %3 file(s)")
                             .arg(path)
                             .arg(r.blocks.size())
                             .arg(r.files.size());
    if (out) *out = r;
    return true;
}

bool SshConfigParser::parseText(const QString& text,
                                const QString& sourceName,
                                const SshConfigParserOptions& opt,
                                SshConfigParseResult* out,
                                SshConfigError* err)
{
    Context ctx;
    ctx.opt = opt;

    QString copy = text;
    QTextStream in(&copy, QIODevice::ReadOnly);

    SshConfigParseResult r;
    if (!parseStream(in, sourceName, ctx, &r, err))
        return false;

    applyGlobalDefaults(r);
    if (out) *out = r;
    return true;
}

void SshConfigParser::applyGlobalDefaults(SshConfigParseResult& r)
{
    if (r.global.isEmpty())
        return;

    for (SshHostBlock& b : r.blocks)
        SshHostBlock::fillIfAbsent(b.entries, r.global.entries);
}

bool SshConfigParser::parseRawFile(const QString& path,
                                   Context& ctx,
                                   SshConfigParseResult* out,
                                   SshConfigError* err)
{
    const QFileInfo fi(path);
    if (!fi.exists()) {
        fail(err, SshConfigErrorKind::Io, path, 0, QString(), "No such file or directory");
        if (err) err->notFound = true;
        return false;
    }
    if (fi.isDir()) {
        fail(err, SshConfigErrorKind::Io, path, 0, QString(), "Is a directory");
        return false;
    }

    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        fail(err, SshConfigErrorKind::Io, path, 0, QString(), f.errorString());
        return false;
    }

    const QString canonical = fi.canonicalFilePath();
    ctx.openFiles.push_back(canonical);
    out->files << path;

    QTextStream in(&f);
    setUtf8(in);

    const bool ok = parseStream(in, path, ctx, out, err);

    ctx.openFiles.removeLast();
    return ok;
}

bool SshConfigParser::parseStream(QTextStream& in,
                                  const QString& sourceName,
                                  Context& ctx,
                                  SshConfigParseResult* out,
                                  SshConfigError* err)
{
    bool inBlock = false;
    int lineNo = 0;

    while (!in.atEnd()) {
        const QString raw = in.readLine();
        lineNo++;

        const QString trimmed = raw.trimmed();
        if (SshConfigLine::isSkippable(trimmed))
            continue;

        const QString line = SshConfigLine::stripInlineComment(trimmed);
        if (line.isEmpty())
            continue;

        SshConfigEntry entry;
        if (!SshConfigLine::classify(line, &entry)) {
            fail(err, SshConfigErrorKind::UnparseableLine, sourceName, lineNo, line);
            return false;
        }

        switch (entry.key.keyword) {
        case SshConfigKeyword::Unknown:
            if (ctx.opt.strict) {
                fail(err, SshConfigErrorKind::UnknownEntry, sourceName, lineNo, line);
                if (err) err->entryKey = entry.key.unknownName;
                return false;
            }
            qDebug().noquote() << QString("%1:%2 ignoring unknown entry '%3'")
                                      .arg(sourceName)
                                      .arg(lineNo)
                                      .arg(entry.key.unknownName);
            continue;

        case SshConfigKeyword::Host: {
            SshHostBlock b;
            b.patterns = SshHostPattern::tokenize(entry.value);
            b.sourceFile = sourceName;
            b.startLine = lineNo;
            if (b.patterns.isEmpty()) {
                fail(err, SshConfigErrorKind::UnparseableLine, sourceName, lineNo, line,
                     "Host line without patterns");
                return false;
            }
            out->blocks.push_back(b);
            inBlock = true;
            continue;
        }

        case SshConfigKeyword::Include:
            if (!processInclude(entry.value, sourceName, lineNo, line, inBlock, ctx, out, err))
                return false;
            continue;

        case SshConfigKeyword::Match:
            qDebug().noquote() << QString("%1:%2 Match conditions are not evaluated")
                                      .arg(sourceName)
                                      .arg(lineNo);
            break;

        default:
            break;
        }

        SshHostBlock& target = inBlock ? out->blocks.last() : out->global;
        target.set(entry.key.keyword, entry.value);
    }

    return true;
}

bool SshConfigParser::processInclude(const QString& value,
                                     const QString& sourceName,
                                     int lineNo,
                                     const QString& lineText,
                                     bool inBlock,
                                     Context& ctx,
                                     SshConfigParseResult* out,
                                     SshConfigError* err)
{
    if (value.trimmed().isEmpty()) {
        failInclude(err, SshIncludeFailure::BadPattern, sourceName, lineNo, lineText,
                    "Include without a path");
        return false;
    }

    const QString pattern = SshPathExpansion::resolveIncludePath(value, ctx.opt.includeDir);

    QStringList matches;
    QString globDetail;
    switch (SshPathExpansion::expandGlob(pattern, &matches, &globDetail)) {
    case SshPathExpansion::GlobStatus::Ok:
        break;
    case SshPathExpansion::GlobStatus::BadPattern:
        failInclude(err, SshIncludeFailure::BadPattern, sourceName, lineNo, lineText,
                    QString("%1 (component '%2')").arg(pattern, globDetail));
        return false;
    case SshPathExpansion::GlobStatus::ReadFailure:
        failInclude(err, SshIncludeFailure::GlobFailure, sourceName, lineNo, lineText,
                    QString("cannot read directory %1").arg(globDetail));
        return false;
    }

    if (matches.isEmpty()) {
        if (!SshPathExpansion::hasGlobCharacters(pattern)) {
            fail(err, SshConfigErrorKind::Io, sourceName, lineNo, lineText,
                 QString("%1: No such file or directory").arg(pattern));
            if (err) err->notFound = true;
            return false;
        }
        qDebug().noquote() << QString("%1:%2 Include %3 matched no files")
                                  .arg(sourceName)
                                  .arg(lineNo)
                                  .arg(pattern);
        return true;
    }

    for (const QString& path : matches) {
        const QString canonical = QFileInfo(path).canonicalFilePath();
        if (ctx.openFiles.contains(canonical)) {
            failInclude(err, SshIncludeFailure::Cycle, sourceName, lineNo, lineText,
                        QString("%1 is already being parsed").arg(canonical));
            return false;
        }

        qDebug().noquote() << QString("%1:%2 including %3").arg(sourceName).arg(lineNo).arg(path);

        SshConfigParseResult included;
        if (!parseRawFile(path, ctx, &included, err))
            return false;

        out->files << included.files;

        if (inBlock) {
            const SshHostBlock& current = out->blocks.last();
            if (!included.blocks.isEmpty()) {
                failInclude(err, SshIncludeFailure::HostsInsideHostBlock, sourceName, lineNo, lineText,
                            QString("%1 defines %2 host block(s) inside Host %3 (%4:%5)")
                                .arg(path)
                                .arg(included.blocks.size())
                                .arg(current.patterns.join(' '))
                                .arg(current.sourceFile)
                                .arg(current.startLine));
                return false;
            }
            SshHostBlock::fillIfAbsent(out->blocks.last().entries, included.global.entries);
        } else {
            SshHostBlock::overwrite(out->global.entries, included.global.entries);
            out->blocks += included.blocks;
        }
    }

    return true;
}
