#pragma once
//
// SshPathExpansion.h
//
// Path helpers for config files and Include directives:
//
//   "~/x"       -> <home>/x
//   "~alice/x"  -> <home of alice>/x
//   "conf.d/*"  -> <ssh dir>/conf.d/*        (relative include)
//   "/a/*/b?"   -> sorted list of existing paths matching the glob
//
// Glob syntax is shell-style, per path component: '*', '?', '[...]'.
// Components without glob characters are taken literally.

#include <QString>
#include <QStringList>

namespace SshPathExpansion {

enum class GlobStatus {
    Ok,
    BadPattern,   // e.g. unterminated '[' in a component
    ReadFailure   // an existing directory could not be listed
};

// Unknown users and a missing home directory leave the path unchanged.
QString expandTilde(const QString& path);

// <home>/.ssh
QString defaultSshDir();

// Drops one pair of enclosing double quotes, tilde-expands; relative results
// are anchored at baseDir.
QString resolveIncludePath(const QString& raw, const QString& baseDir);

bool hasGlobCharacters(const QString& path);

// Expands an absolute glob into the sorted list of existing matches.
// A pattern without glob characters yields itself when it exists.
// On failure, errDetail receives the offending component or directory.
GlobStatus expandGlob(const QString& pattern, QStringList* matches, QString* errDetail = nullptr);

} // namespace SshPathExpansion
