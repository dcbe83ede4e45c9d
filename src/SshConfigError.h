#pragma once
//
// SshConfigError.h
//
// Structured failure report for config parsing and resolution.
//
// Every parse function returns bool and fills an optional SshConfigError*.
// A failure anywhere in an include chain aborts the whole parse; the error
// carries the file and line where it was raised (the innermost file).
//
// Kinds:
//   Io              config or include file missing / unreadable
//   UnparseableLine no key/value separator, or no value
//   UnknownEntry    unrecognized keyword while strict mode is on
//   InvalidInclude  see SshIncludeFailure

#include <QString>

enum class SshConfigErrorKind {
    None,
    Io,
    UnparseableLine,
    UnknownEntry,
    InvalidInclude
};

enum class SshIncludeFailure {
    None,
    BadPattern,           // malformed glob (e.g. unterminated '[')
    GlobFailure,          // directory could not be read during expansion
    HostsInsideHostBlock, // include inside a Host block defines Host sections
    Cycle                 // file is already being parsed further up the chain
};

struct SshConfigError {
    SshConfigErrorKind kind = SshConfigErrorKind::None;
    SshIncludeFailure includeFailure = SshIncludeFailure::None;

    QString file;      // file in which the error was detected
    int line = 0;      // 1-based, 0 when not line-related
    QString lineText;  // raw offending line (trimmed)
    QString entryKey;  // UnknownEntry: key as written
    QString detail;    // human-readable detail (OS error text, include path, ...)

    // Io only: the file did not exist (as opposed to existing but unreadable).
    bool notFound = false;

    bool isSet() const { return kind != SshConfigErrorKind::None; }

    // Single-line rendering: "<file>:<line>: <kind>: <detail>"
    QString toString() const;

    static QString kindName(SshConfigErrorKind k);
    static QString includeFailureName(SshIncludeFailure f);
};
