// HostTable.cpp

#include "HostTable.h"

#include <QStringList>

static QString cell(const QString& v)
{
    return v.isEmpty() ? QString("-") : v;
}

namespace HostTable {

QString render(const QVector<ResolvedHost>& hosts, bool showProxyCommand)
{
    QVector<QStringList> rows;

    QStringList header{"NAME", "ALIASES", "USER", "DESTINATION", "PORT"};
    if (showProxyCommand) header << "PROXYCOMMAND";
    rows.push_back(header);

    for (const ResolvedHost& h : hosts) {
        QStringList r{cell(h.name), cell(h.aliases), cell(h.user), cell(h.destination), cell(h.port)};
        if (showProxyCommand) r << cell(h.proxyCommand);
        rows.push_back(r);
    }

    const int columns = header.size();
    QVector<int> widths(columns, 0);
    for (const QStringList& r : rows) {
        for (int c = 0; c < columns; ++c)
            widths[c] = qMax(widths[c], int(r.at(c).size()));
    }

    QString out;
    for (const QStringList& r : rows) {
        QString line;
        for (int c = 0; c < columns; ++c) {
            if (c == columns - 1)
                line += r.at(c);
            else
                line += r.at(c).leftJustified(widths[c]) + "  ";
        }
        out += line + '\n';
    }
    return out;
}

} // namespace HostTable
