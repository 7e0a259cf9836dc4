#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hostprep {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toFamilyString(DistroFamily family)
{
    switch (family) {
    case DistroFamily::Debian:
        return "debian";
    case DistroFamily::Alpine:
        return "alpine";
    case DistroFamily::RHELLike:
        return "rhel";
    case DistroFamily::Unsupported:
        return "unsupported";
    }
    return "unsupported";
}

inline std::string toOutcomeString(OutcomeKind kind)
{
    switch (kind) {
    case OutcomeKind::Installed:
        return "installed";
    case OutcomeKind::Skipped:
        return "skipped";
    case OutcomeKind::Failed:
        return "failed";
    }
    return "failed";
}

inline std::string toRunStatusString(RunStatus status)
{
    switch (status) {
    case RunStatus::Completed:
        return "completed";
    case RunStatus::Interrupted:
        return "interrupted";
    }
    return "completed";
}

inline void to_json(nlohmann::json &j, const DistroFamily &family)
{
    j = toFamilyString(family);
}

inline void to_json(nlohmann::json &j, const OutcomeKind &kind)
{
    j = toOutcomeString(kind);
}

inline void to_json(nlohmann::json &j, const RunStatus &status)
{
    j = toRunStatusString(status);
}

inline void to_json(nlohmann::json &j, const CommandTemplate &command)
{
    j = nlohmann::json{
        {"program", command.program},
        {"arguments", command.arguments}
    };
}

inline void to_json(nlohmann::json &j, const LedgerEntry &entry)
{
    j = nlohmann::json{
        {"package", entry.spec.name},
        {"required", entry.spec.required},
        {"outcome", entry.outcome.kind},
        {"attempts", entry.outcome.attempts}
    };
    if (!entry.outcome.concreteName.empty()) {
        j["concreteName"] = entry.outcome.concreteName;
    }
    if (entry.outcome.kind == OutcomeKind::Skipped) {
        j["reason"] = entry.outcome.reason;
    }
    if (entry.outcome.kind == OutcomeKind::Failed) {
        j["lastError"] = entry.outcome.lastError;
        j["attemptsExhausted"] = entry.outcome.attemptsExhausted;
    }
}

inline void to_json(nlohmann::json &j, const HostMetadata &host)
{
    j = nlohmann::json{
        {"osName", host.osName},
        {"kernel", host.kernel},
        {"architecture", host.architecture},
        {"hostname", host.hostname}
    };
}

inline void to_json(nlohmann::json &j, const ArtifactPaths &paths)
{
    j = nlohmann::json{
        {"log", paths.logPath},
        {"report", paths.reportPath},
        {"jsonReport", paths.jsonReportPath}
    };
}

inline void to_json(nlohmann::json &j, const ProvisioningReport &report)
{
    const auto durationSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                                     report.timing.end - report.timing.start)
                                     .count();
    j = nlohmann::json{
        {"status", report.status},
        {"startedAt", toIso8601Utc(report.timing.start)},
        {"finishedAt", toIso8601Utc(report.timing.end)},
        {"durationSeconds", durationSeconds},
        {"distroId", report.distroId},
        {"packageManager", report.packageManager},
        {"host", report.host},
        {"counts", nlohmann::json{
            {"installed", report.summary.installed},
            {"skipped", report.summary.skipped},
            {"failed", report.summary.failed},
            {"total", report.summary.total()}
        }},
        {"packages", report.summary.ledger.entries},
        {"errorDetails", report.summary.ledger.errorDetails},
        {"troubleshooting", report.troubleshooting},
        {"artifacts", report.artifacts}
    };
}

} // namespace hostprep
