#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace hostprep::logging {

namespace {

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;
QString g_logFilePath;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

void writeLine(const QString &path, const QString &line)
{
    if (path.isEmpty()) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, const QString &logFilePath,
                 bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_logFilePath = logFilePath;
    g_traceEnabled = traceEnabled;
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

QString currentLogFilePath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_logFilePath;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("hostprep");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }

    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", process.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context}
    };

    // Replace invalid UTF-8 from captured tool output instead of throwing.
    const QString line = QString::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(g_logFilePath, line);
}

} // namespace hostprep::logging
