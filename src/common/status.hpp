#pragma once

#include <ostream>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

namespace hostprep {

enum class Status {
    Info,
    Success,
    Warning,
    Error,
    Retry
};

std::string toStatusTag(Status status);

// Console sink for status lines. Defaults to std::cout; tests redirect it.
void setStatusStream(std::ostream *stream);

/**
 * Print "[TAG] message" on the console and append the same message to the
 * run log, with the tag stored under context.status.
 */
void printStatus(Status status,
                 const QString &component,
                 const QString &where,
                 const QString &what,
                 const std::string &message,
                 const nlohmann::json &context = nlohmann::json::object());

} // namespace hostprep
