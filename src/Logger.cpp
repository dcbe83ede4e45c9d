// Logger.cpp
#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#include <QStringConverter>
#endif

// =====================================================
// Global logger state (process-wide)
// =====================================================

static QFile*     g_file = nullptr;  // Open log file, null => stderr
static QMutex     g_mutex;           // Guards g_file and writes
static QString    g_path;
static QString    g_appName;
static QAtomicInt g_level(1);

static thread_local bool g_inHandler = false;

static QString levelToString(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// One record = one physical line.
static QString normalizeMessage(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

static void closeFileLocked()
{
    if (!g_file) return;
    if (g_file->isOpen()) g_file->close();
    delete g_file;
    g_file = nullptr;
}

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!Logger::allows(type) || g_inHandler) {
        if (type == QtFatalMsg) std::abort();
        return;
    }
    g_inHandler = true;

    const QString where =
        (ctx.file && ctx.function)
            ? QString("%1:%2 %3")
                  .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                  .arg(ctx.line)
                  .arg(QString::fromUtf8(ctx.function))
            : QString();

    const QString record = Logger::formatRecord(type, where, msg);

    {
        QMutexLocker lock(&g_mutex);

        if (g_file && g_file->isOpen()) {
            QTextStream out(g_file);
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
            out.setEncoding(QStringConverter::Utf8);
#else
            out.setCodec("UTF-8");
#endif
            out << record << "\n";
            out.flush();
        } else {
            const QByteArray utf8 = record.toUtf8();
            std::fprintf(stderr, "%s\n", utf8.constData());
            std::fflush(stderr);
        }
    }

    g_inHandler = false;

    if (type == QtFatalMsg)
        std::abort();
}

namespace Logger {

void install(const QString& appName)
{
    g_appName = appName;
    qInstallMessageHandler(handler);
    qDebug().noquote() << QString("%1 logging to %2")
                              .arg(appName, g_path.isEmpty() ? QString("stderr") : g_path);
}

// 0 = Errors only: WARN/ERROR/FATAL
// 1 = Normal:      INFO and above
// 2 = Debug:       everything
bool allows(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    if (type == QtFatalMsg || type == QtCriticalMsg || type == QtWarningMsg)
        return true;
    if (type == QtInfoMsg)
        return lvl >= 1;
    return lvl >= 2;
}

QString formatRecord(QtMsgType type, const QString& where, const QString& msg)
{
    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    const QString clean = normalizeMessage(msg);
    if (where.isEmpty())
        return QString("%1 [%2] %3").arg(ts, levelToString(type), clean);
    return QString("%1 [%2] %3 - %4").arg(ts, levelToString(type), where, clean);
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

bool setLogFile(const QString& path)
{
    QMutexLocker lock(&g_mutex);

    const QString clean = path.trimmed().isEmpty() ? QString() : QDir::cleanPath(path.trimmed());
    closeFileLocked();
    g_path.clear();

    if (clean.isEmpty())
        return true;

    QDir().mkpath(QFileInfo(clean).absolutePath());

    g_file = new QFile(clean);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s: failed to open log file: %s\n",
                     g_appName.toUtf8().constData(), clean.toUtf8().constData());
        std::fflush(stderr);
        closeFileLocked();
        return false;
    }

    g_path = clean;
    return true;
}

QString logFilePath()
{
    return g_path;
}

} // namespace Logger
