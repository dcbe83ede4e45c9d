// SshConfigEntry.cpp
//
// Key/value splitting for single config lines. The separator is the first
// whitespace character or '=' after the key; any run of whitespace and '='
// around it is discarded, so "Key = Value", "Key=Value" and "Key  Value"
// classify identically.

#include "SshConfigEntry.h"

static bool isSeparator(QChar c)
{
    return c.isSpace() || c == '=';
}

namespace SshConfigLine {

QString stripInlineComment(const QString& line)
{
    bool inQuotes = false;
    for (int i = 0; i < line.size(); ++i) {
        const QChar c = line.at(i);
        if (c == '"') {
            inQuotes = !inQuotes;
        } else if (c == '#' && !inQuotes) {
            return line.left(i).trimmed();
        }
    }
    return line.trimmed();
}

bool isSkippable(const QString& trimmedLine)
{
    return trimmedLine.isEmpty() || trimmedLine.startsWith('#');
}

bool classify(const QString& line, SshConfigEntry* out)
{
    const QString s = line.trimmed();

    int sep = -1;
    for (int i = 0; i < s.size(); ++i) {
        if (isSeparator(s.at(i))) {
            sep = i;
            break;
        }
    }
    if (sep <= 0)
        return false;

    const QString key = s.left(sep);

    int valueStart = sep;
    while (valueStart < s.size() && isSeparator(s.at(valueStart)))
        ++valueStart;

    const QString value = s.mid(valueStart).trimmed();

    if (out) {
        out->key = SshConfigKeywords::lookup(key);
        out->value = value;
    }
    return true;
}

} // namespace SshConfigLine
