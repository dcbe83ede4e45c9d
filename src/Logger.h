#pragma once
#include <QString>
#include <QtGlobal>

// Process-wide Qt message handler.
//
// Records are single lines:
//   2026-01-31 12:00:00.123 [WARN] SshConfigParser.cpp:84 parseFile - message
//
// Sink is stderr until setLogFile() opens a file (append mode).
namespace Logger {
    void install(const QString& appName);

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // Empty path => back to stderr. Returns false if the file cannot be opened
    // (the sink then stays on stderr).
    bool setLogFile(const QString& path);
    QString logFilePath();

    QString formatRecord(QtMsgType type, const QString& where, const QString& msg);
    bool allows(QtMsgType type);
}
