#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace hostprep {

// An executable plus fixed arguments. Never joined into a shell string.
struct CommandTemplate {
    std::string program;
    std::vector<std::string> arguments;
};

/**
 * Resolved once per run from the host identity and read by reference
 * everywhere afterwards.
 */
struct DistroProfile {
    DistroFamily family = DistroFamily::Unsupported;
    std::string distroId;
    std::string packageManager;

    CommandTemplate updateCommand;
    CommandTemplate installCommandPrefix;
    // Run in order; the sequence stops at the first failing step.
    std::vector<CommandTemplate> repairCommands;
    CommandTemplate upgradeCommand;

    // RHEL rebuilds carry yadm and friends in EPEL only.
    bool needsEpel = false;
};

struct PackageSpec {
    std::string name;
    bool required = true;
};

struct ResolvedPackage {
    // Empty when the package does not exist for the distro family.
    std::optional<std::string> concreteName;

    bool isApplicable() const { return concreteName.has_value(); }
};

struct AttemptRecord {
    int attempt = 0;
    bool success = false;
    std::string errorText;
};

struct PackageOutcome {
    OutcomeKind kind = OutcomeKind::Skipped;
    std::string reason;
    std::string lastError;
    bool attemptsExhausted = false;
    int attempts = 0;
    std::string concreteName;

    static PackageOutcome installed(const std::string &concreteName, int attempts)
    {
        PackageOutcome outcome;
        outcome.kind = OutcomeKind::Installed;
        outcome.concreteName = concreteName;
        outcome.attempts = attempts;
        return outcome;
    }

    static PackageOutcome skipped(const std::string &reason)
    {
        PackageOutcome outcome;
        outcome.kind = OutcomeKind::Skipped;
        outcome.reason = reason;
        return outcome;
    }

    static PackageOutcome failed(const std::string &lastError, int attempts,
                                 bool attemptsExhausted)
    {
        PackageOutcome outcome;
        outcome.kind = OutcomeKind::Failed;
        outcome.lastError = lastError;
        outcome.attempts = attempts;
        outcome.attemptsExhausted = attemptsExhausted;
        return outcome;
    }
};

struct LedgerEntry {
    PackageSpec spec;
    PackageOutcome outcome;
};

struct Ledger {
    std::vector<LedgerEntry> entries;
    std::vector<std::string> errorDetails;
};

struct LedgerSummary {
    std::size_t installed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    Ledger ledger;

    std::size_t total() const { return installed + skipped + failed; }
};

struct HostMetadata {
    std::string osName;
    std::string kernel;
    std::string architecture;
    std::string hostname;
};

struct RunTiming {
    std::chrono::system_clock::time_point start;
    std::chrono::system_clock::time_point end;
};

struct ArtifactPaths {
    std::string logPath;
    std::string reportPath;
    std::string jsonReportPath;
};

/**
 * Write-once snapshot handed to the report writer at shutdown.
 */
struct ProvisioningReport {
    RunStatus status = RunStatus::Completed;
    HostMetadata host;
    RunTiming timing;
    std::string distroId;
    std::string packageManager;
    LedgerSummary summary;
    std::vector<std::string> troubleshooting;
    ArtifactPaths artifacts;
};

} // namespace hostprep
