// SshConfigError.cpp

#include "SshConfigError.h"

QString SshConfigError::kindName(SshConfigErrorKind k)
{
    switch (k) {
        case SshConfigErrorKind::None:            return "no error";
        case SshConfigErrorKind::Io:              return "I/O error";
        case SshConfigErrorKind::UnparseableLine: return "unparseable line";
        case SshConfigErrorKind::UnknownEntry:    return "unknown entry";
        case SshConfigErrorKind::InvalidInclude:  return "invalid include";
    }
    return "error";
}

QString SshConfigError::includeFailureName(SshIncludeFailure f)
{
    switch (f) {
        case SshIncludeFailure::None:                 return QString();
        case SshIncludeFailure::BadPattern:           return "bad glob pattern";
        case SshIncludeFailure::GlobFailure:          return "glob expansion failed";
        case SshIncludeFailure::HostsInsideHostBlock: return "cannot include hosts inside a host block";
        case SshIncludeFailure::Cycle:                return "include cycle";
    }
    return QString();
}

QString SshConfigError::toString() const
{
    QString where = file;
    if (line > 0)
        where += QString(":%1").arg(line);

    QString what = kindName(kind);
    if (kind == SshConfigErrorKind::InvalidInclude && includeFailure != SshIncludeFailure::None)
        what += QString(" (%1)").arg(includeFailureName(includeFailure));
    if (kind == SshConfigErrorKind::UnknownEntry && !entryKey.isEmpty())
        what += QString(" '%1'").arg(entryKey);

    QString s = where.isEmpty() ? what : QString("%1: %2").arg(where, what);
    if (!detail.isEmpty())
        s += QString(": %1").arg(detail);
    else if (!lineText.isEmpty())
        s += QString(": %1").arg(lineText);
    return s;
}
