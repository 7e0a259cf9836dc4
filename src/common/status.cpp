#include "common/status.hpp"

#include <iostream>

#include "common/logging.hpp"

namespace hostprep {

namespace {

std::ostream *g_statusStream = nullptr;

logging::LogLevel levelForStatus(Status status)
{
    switch (status) {
    case Status::Info:
    case Status::Success:
        return logging::LogLevel::Info;
    case Status::Warning:
    case Status::Retry:
        return logging::LogLevel::Warn;
    case Status::Error:
        return logging::LogLevel::Error;
    }
    return logging::LogLevel::Info;
}

} // namespace

std::string toStatusTag(Status status)
{
    switch (status) {
    case Status::Info:
        return "INFO";
    case Status::Success:
        return "SUCCESS";
    case Status::Warning:
        return "WARNING";
    case Status::Error:
        return "ERROR";
    case Status::Retry:
        return "RETRY";
    }
    return "INFO";
}

void setStatusStream(std::ostream *stream)
{
    g_statusStream = stream;
}

void printStatus(Status status,
                 const QString &component,
                 const QString &where,
                 const QString &what,
                 const std::string &message,
                 const nlohmann::json &context)
{
    const std::string tag = toStatusTag(status);
    std::ostream &out = g_statusStream ? *g_statusStream : std::cout;
    out << "[" << tag << "] " << message << std::endl;

    nlohmann::json payload = context.is_object() ? context : nlohmann::json::object();
    payload["status"] = tag;
    payload["message"] = message;

    logging::logEvent(levelForStatus(status),
                      logging::defaultProcessName(),
                      component,
                      where,
                      what,
                      QStringLiteral("status_update"),
                      QStringLiteral("console_and_log"),
                      logging::defaultWho(),
                      QString(),
                      payload);
}

} // namespace hostprep
