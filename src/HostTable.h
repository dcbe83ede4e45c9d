#pragma once
//
// HostTable.h
//
// Plain-text table for the hostdeck CLI:
//
//   NAME     ALIASES  USER   DESTINATION   PORT
//   db       db-old   admin  10.0.0.5      2222
//   web      -        -      web.example   -
//
// Columns are padded to their widest cell and separated by two spaces.
// Empty optional fields are rendered as "-". The ProxyCommand column is only
// present when requested; it is last, so long commands are never padded.

#include "SshHostCatalog.h"

#include <QString>
#include <QVector>

namespace HostTable {
    QString render(const QVector<ResolvedHost>& hosts, bool showProxyCommand);
}
