// SshPathExpansion.cpp
//
// Tilde expansion and component-wise glob expansion on top of QDir.
//
// Glob expansion walks the pattern one path component at a time:
//
//   "/etc/ssh/ssh_config.d/*.conf"
//     "/"            -> ["/"]
//     "etc"          -> ["/etc"]                       (literal)
//     "ssh"          -> ["/etc/ssh"]                   (literal)
//     "ssh_config.d" -> ["/etc/ssh/ssh_config.d"]      (literal)
//     "*.conf"       -> entries of each directory matching the name filter
//
// Only paths that exist survive the last step. Directory listings are sorted
// by name, so the result order is stable and lexicographic per component.

#include "SshPathExpansion.h"

#include <QDir>
#include <QFileInfo>

#include <pwd.h>
#include <sys/types.h>

static QString homeForUser(const QString& user)
{
    const QByteArray name = user.toLocal8Bit();
    const struct passwd* pw = getpwnam(name.constData());
    if (!pw || !pw->pw_dir)
        return QString();
    return QString::fromLocal8Bit(pw->pw_dir);
}

// Validates '[' ... ']' groups in one component. "[]x]" and "[!]x]" treat the
// first ']' as a literal member, as POSIX fnmatch does.
static bool bracketsBalanced(const QString& component)
{
    for (int i = 0; i < component.size(); ++i) {
        if (component.at(i) != '[')
            continue;

        int j = i + 1;
        if (j < component.size() && component.at(j) == '!')
            ++j;
        ++j; // first member is always literal
        const int close = component.indexOf(']', j);
        if (close < 0)
            return false;
        i = close;
    }
    return true;
}

static QString joinPath(const QString& dir, const QString& name)
{
    if (dir.endsWith('/'))
        return dir + name;
    return dir + '/' + name;
}

namespace SshPathExpansion {

QString expandTilde(const QString& path)
{
    if (!path.startsWith('~'))
        return path;

    const int slash = path.indexOf('/');
    const QString user = (slash < 0) ? path.mid(1) : path.mid(1, slash - 1);
    const QString rest = (slash < 0) ? QString() : path.mid(slash);

    QString home;
    if (user.isEmpty())
        home = QDir::homePath();
    else
        home = homeForUser(user);

    if (home.isEmpty())
        return path;

    return home + rest;
}

QString defaultSshDir()
{
    return QDir::home().filePath(".ssh");
}

QString resolveIncludePath(const QString& raw, const QString& baseDir)
{
    QString path = raw.trimmed();
    if (path.size() >= 2 && path.startsWith('"') && path.endsWith('"'))
        path = path.mid(1, path.size() - 2);

    const QString expanded = expandTilde(path);
    if (QDir::isAbsolutePath(expanded))
        return expanded;

    const QString base = baseDir.isEmpty() ? defaultSshDir() : expandTilde(baseDir);
    return joinPath(base, expanded);
}

bool hasGlobCharacters(const QString& path)
{
    return path.contains('*') || path.contains('?') || path.contains('[');
}

GlobStatus expandGlob(const QString& pattern, QStringList* matches, QString* errDetail)
{
    QStringList found;

    if (!hasGlobCharacters(pattern)) {
        if (QFileInfo::exists(pattern))
            found << pattern;
        if (matches) *matches = found;
        return GlobStatus::Ok;
    }

    const QStringList components = pattern.split('/', Qt::SkipEmptyParts);
    for (const QString& c : components) {
        if (hasGlobCharacters(c) && !bracketsBalanced(c)) {
            if (errDetail) *errDetail = c;
            return GlobStatus::BadPattern;
        }
    }

    QStringList current;
    current << (QDir::isAbsolutePath(pattern) ? QString("/") : QString("."));

    for (const QString& component : components) {
        QStringList next;

        if (!hasGlobCharacters(component)) {
            for (const QString& base : current) {
                const QString candidate = joinPath(base, component);
                if (QFileInfo::exists(candidate))
                    next << candidate;
            }
            current = next;
            continue;
        }

        for (const QString& base : current) {
            const QFileInfo info(base);
            if (!info.isDir())
                continue;
            if (!info.isReadable()) {
                if (errDetail) *errDetail = base;
                return GlobStatus::ReadFailure;
            }

            QDir dir(base);
            dir.setNameFilters(QStringList() << component);
            dir.setFilter(QDir::AllEntries | QDir::Hidden | QDir::System
                          | QDir::NoDotAndDotDot | QDir::CaseSensitive);
            dir.setSorting(QDir::Name);

            for (const QString& name : dir.entryList())
                next << joinPath(base, name);
        }
        current = next;

        if (current.isEmpty())
            break;
    }

    found = current;
    if (matches) *matches = found;
    return GlobStatus::Ok;
}

} // namespace SshPathExpansion
