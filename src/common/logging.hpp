#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace hostprep::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Every run gets its own timestamped log file; lines are only ever appended.
void initLogging(const QString &processName, const QString &logFilePath,
                 bool traceEnabled);

bool isTraceEnabled();
QString currentLogFilePath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace hostprep::logging

#define HPLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::hostprep::logging::logEvent(::hostprep::logging::LogLevel::Debug, \
                                  ::hostprep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HPLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::hostprep::logging::logEvent(::hostprep::logging::LogLevel::Info, \
                                  ::hostprep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HPLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::hostprep::logging::logEvent(::hostprep::logging::LogLevel::Warn, \
                                  ::hostprep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HPLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::hostprep::logging::logEvent(::hostprep::logging::LogLevel::Error, \
                                  ::hostprep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
