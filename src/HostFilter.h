#pragma once
//
// HostFilter.h
//
// Display-order helpers over resolved hosts. They never affect resolution.
//
// Search is a case-insensitive subsequence match: "wbp" matches "web-prod"
// because w, b and p appear in that order. A host matches when its name,
// destination or aliases match. An empty query matches every host.

#include "SshHostCatalog.h"

#include <QString>
#include <QVector>

namespace HostFilter {
    bool fuzzyMatch(const QString& text, const QString& query);

    bool matches(const ResolvedHost& h, const QString& query);

    QVector<ResolvedHost> filter(const QVector<ResolvedHost>& hosts, const QString& query);

    // Stable, case-insensitive on name.
    void sortByName(QVector<ResolvedHost>& hosts);
}
