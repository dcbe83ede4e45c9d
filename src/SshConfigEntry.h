#pragma once
//
// SshConfigEntry.h
//
// Line-level classification for OpenSSH config text.
//
//    raw line  ->  stripInlineComment()  ->  trimmed line
//    trimmed line  ->  classify()  ->  SshConfigEntry { key, value }
//
// Accepted directive shapes:
//   Key Value
//   Key=Value
//   Key = Value
//
// A line with no separator ("Port") cannot be classified; the caller turns
// that into an UnparseableLine error with file/line context. Nothing after the
// separator ("Port =") classifies with an empty value.

#include "SshConfigKeyword.h"

#include <QString>

struct SshConfigEntry {
    SshConfigEntryKey key;
    QString value;
};

namespace SshConfigLine {
    // Removes a trailing "#comment" that is outside double quotes, then trims.
    QString stripInlineComment(const QString& line);

    // True for lines the parser skips entirely (blank / full-line comment).
    bool isSkippable(const QString& trimmedLine);

    // Splits and classifies one trimmed, non-comment line.
    // Returns false if the line has no key/value separator.
    bool classify(const QString& line, SshConfigEntry* out);
}
