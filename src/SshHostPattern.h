#pragma once
//
// SshHostPattern.h
//
// Host patterns as they appear on "Host" lines.
//
// Two kinds:
// - literal  : "db1.example.com"   matched by plain string equality
// - wildcard : contains '*', '?' or '!'
//                '*'  any sequence (including empty)
//                '?'  exactly one character
//                '!'  as first character: negated pattern
//
// Wildcard patterns compile into an anchored QRegularExpression. Literal
// patterns are never compiled.
//
// Negation semantics are those of the resolver: a compiled pattern "applies"
// to a host name when match(name) != negated.

#include <QRegularExpression>
#include <QString>
#include <QStringList>
#include <QVector>

struct SshHostPatternMatcher {
    QRegularExpression regex;
    bool negated = false;

    bool matches(const QString& hostName) const;

    // match(hostName) != negated
    bool appliesTo(const QString& hostName) const;
};

class SshHostPattern
{
public:
    // Splits the value of a "Host" line into patterns.
    // Double-quoted spans may contain whitespace; empty spans are dropped.
    //   a b "c d"  ->  ["a", "b", "c d"]
    static QStringList tokenize(const QString& hostLineValue);

    static bool isWildcard(const QString& pattern);

    // Compiles a wildcard pattern. Returns false for literal patterns.
    static bool compile(const QString& pattern, SshHostPatternMatcher* out);

    // Compiles every wildcard pattern of the list; literal patterns are skipped.
    static QVector<SshHostPatternMatcher> compileAll(const QStringList& patterns);
};
