// HostFilter.cpp

#include "HostFilter.h"

#include <algorithm>

namespace HostFilter {

bool fuzzyMatch(const QString& text, const QString& query)
{
    if (query.isEmpty())
        return true;

    int qi = 0;
    for (const QChar c : text) {
        if (c.toCaseFolded() == query.at(qi).toCaseFolded()) {
            if (++qi == query.size())
                return true;
        }
    }
    return false;
}

bool matches(const ResolvedHost& h, const QString& query)
{
    const QString q = query.trimmed();
    if (q.isEmpty())
        return true;
    return fuzzyMatch(h.name, q) || fuzzyMatch(h.destination, q) || fuzzyMatch(h.aliases, q);
}

QVector<ResolvedHost> filter(const QVector<ResolvedHost>& hosts, const QString& query)
{
    QVector<ResolvedHost> out;
    for (const ResolvedHost& h : hosts) {
        if (matches(h, query))
            out.push_back(h);
    }
    return out;
}

void sortByName(QVector<ResolvedHost>& hosts)
{
    std::stable_sort(hosts.begin(), hosts.end(), [](const ResolvedHost& a, const ResolvedHost& b) {
        return a.name.compare(b.name, Qt::CaseInsensitive) < 0;
    });
}

} // namespace HostFilter
