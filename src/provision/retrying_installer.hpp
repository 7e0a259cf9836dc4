#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace hostprep {

constexpr int kMaxRetryAttempts = 3;
constexpr std::chrono::milliseconds kRetryDelay = std::chrono::seconds(2);

struct RetryPolicy {
    std::chrono::milliseconds retryDelay = kRetryDelay;
    // Applied to every install, update and repair invocation; zero disables.
    std::chrono::milliseconds attemptTimeout{0};
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

void blockingSleep(std::chrono::milliseconds delay);

/**
 * RetryingInstaller drives one package at a time through the package
 * manager described by the profile:
 * - the logical name is mapped first; "not applicable" skips without running anything
 * - up to kMaxRetryAttempts install invocations, stopping at the first success
 * - between attempts: repair, refresh, then wait retryDelay
 *
 * Repair, refresh and the EPEL check are best-effort; their failures are
 * logged and otherwise ignored.
 */
class RetryingInstaller
{
public:
    RetryingInstaller(ProcessRunner &runner,
                      const DistroProfile &profile,
                      RetryPolicy policy = {},
                      SleepFunction sleep = blockingSleep);

    // Throws RunInterrupted if an interrupt arrives while the package is in flight.
    PackageOutcome install(const std::string &logicalName);

    bool refreshRepositories();
    bool repairPackageManager();
    bool upgradeSystem();

    // EPEL presence check for RHEL rebuilds. Runs at most once per installer.
    bool ensureExtraRepositories();

private:
    ProcessResult runCommand(const CommandTemplate &command,
                             const std::vector<std::string> &extraArguments = {});

    ProcessRunner &m_runner;
    const DistroProfile &m_profile;
    RetryPolicy m_policy;
    SleepFunction m_sleep;
    bool m_extraReposChecked = false;
    bool m_extraReposReady = true;
};

} // namespace hostprep
