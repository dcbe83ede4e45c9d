// SshHostPattern.cpp

#include "SshHostPattern.h"

bool SshHostPatternMatcher::matches(const QString& hostName) const
{
    return regex.match(hostName).hasMatch();
}

bool SshHostPatternMatcher::appliesTo(const QString& hostName) const
{
    return matches(hostName) != negated;
}

QStringList SshHostPattern::tokenize(const QString& hostLineValue)
{
    QStringList patterns;
    QString pattern;
    bool inQuotes = false;

    auto flush = [&]() {
        const QString p = pattern.trimmed();
        if (!p.isEmpty())
            patterns << p;
        pattern.clear();
    };

    for (const QChar c : hostLineValue) {
        if (c == '"') {
            // Closing quote ends the span even when no whitespace follows.
            if (inQuotes) flush();
            inQuotes = !inQuotes;
        } else if (c.isSpace()) {
            if (inQuotes)
                pattern.append(c);
            else
                flush();
        } else {
            pattern.append(c);
        }
    }
    flush();

    return patterns;
}

bool SshHostPattern::isWildcard(const QString& pattern)
{
    return pattern.contains('*') || pattern.contains('?') || pattern.contains('!');
}

bool SshHostPattern::compile(const QString& pattern, SshHostPatternMatcher* out)
{
    if (!isWildcard(pattern))
        return false;

    QString body = pattern;
    bool negated = false;
    if (body.startsWith('!')) {
        negated = true;
        body.remove(0, 1);
    }

    QString rx;
    rx.reserve(body.size() * 2 + 2);
    rx += '^';
    for (const QChar c : body) {
        if (c == '*')
            rx += QStringLiteral(".*");
        else if (c == '?')
            rx += '.';
        else
            rx += QRegularExpression::escape(QString(c));
    }
    rx += '$';

    if (out) {
        out->regex = QRegularExpression(rx);
        out->negated = negated;
    }
    return true;
}

QVector<SshHostPatternMatcher> SshHostPattern::compileAll(const QStringList& patterns)
{
    QVector<SshHostPatternMatcher> out;
    for (const QString& p : patterns) {
        SshHostPatternMatcher m;
        if (compile(p, &m))
            out.push_back(m);
    }
    return out;
}
