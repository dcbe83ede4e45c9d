#pragma once
//
// SshHostBlock.h
//
// One "Host ..." section of an OpenSSH config, or the implicit global section
// that precedes the first Host line (patterns empty).
//
// DATA MODEL
// ----------
// - patterns: in file order. After resolution the first pattern is the display
//   name and the rest become aliases.
// - entries : one value per keyword. Inside one block a repeated keyword
//   overwrites the earlier value (set()).
//
// INVARIANT
// ---------
// entries never holds Host or Include: both are structural and are consumed by
// SshConfigParser. set() refuses them.
//
// MERGE RULES
// -----------
// Two ways of combining entry maps exist and both live here:
//
//   overwrite(dst, src)     src wins on conflicts  (included globals -> global)
//   fillIfAbsent(dst, src)  dst wins on conflicts  (global -> host,
//                                                  pattern -> literal host,
//                                                  include -> current host)

#include "SshConfigKeyword.h"

#include <QMap>
#include <QString>
#include <QStringList>

using SshConfigEntries = QMap<SshConfigKeyword, QString>;

struct SshHostBlock {
    QStringList patterns;
    SshConfigEntries entries;

    // Source metadata for diagnostics.
    QString sourceFile;
    int startLine = 0;

    bool isGlobal() const { return patterns.isEmpty(); }
    bool isEmpty() const { return entries.isEmpty(); }

    bool has(SshConfigKeyword k) const { return entries.contains(k); }
    QString value(SshConfigKeyword k) const { return entries.value(k); }

    // Returns false (and stores nothing) for Host / Include / Unknown.
    bool set(SshConfigKeyword k, const QString& value);

    static void overwrite(SshConfigEntries& dst, const SshConfigEntries& src);
    static void fillIfAbsent(SshConfigEntries& dst, const SshConfigEntries& src);
};
