#pragma once

#include <functional>
#include <optional>
#include <utility>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/process_utils.hpp"
#include "provision/collaborators.hpp"
#include "provision/distro_profile.hpp"
#include "provision/outcome_aggregator.hpp"
#include "provision/retrying_installer.hpp"

namespace hostprep {

// Process exit codes.
constexpr int kExitSuccess = 0;
constexpr int kExitPackageFailures = 1;
constexpr int kExitFatalPrecondition = 2;
constexpr int kExitReportFailure = 3;
constexpr int kExitInternalError = 4;
constexpr int kExitInterrupted = 130;

/**
 * ProvisioningPipeline runs one provisioning pass:
 * - privilege and host identity checks (fatal, no report)
 * - profile resolution (fatal, no report)
 * - initial refresh, optional upgrade, EPEL check
 * - required packages, then optional packages gated by the prompter
 * - dotfiles clone recorded as the "dotfiles" pseudo-package
 * - report emission, guaranteed once the profile is resolved
 *
 * No package failure stops the pass; only fatal preconditions and
 * interrupts do.
 */
class ProvisioningPipeline
{
public:
    ProvisioningPipeline(const ProvisionConfig &config,
                         const ArtifactPaths &artifacts,
                         ProcessRunner &runner,
                         Prompter &prompter,
                         DotfilesCloner &cloner);

    // Returns the process exit code.
    int run();

    void setSleepFunction(SleepFunction sleep) { m_sleep = std::move(sleep); }
    void setProgramLookup(ProgramLookup lookup) { m_hasProgram = std::move(lookup); }
    void setPrivilegeCheck(std::function<bool()> check) { m_isPrivileged = std::move(check); }

    const OutcomeAggregator &aggregator() const { return m_aggregator; }
    const std::optional<ProvisioningReport> &report() const { return m_report; }

private:
    void processPackages(RetryingInstaller &installer, const DistroProfile &profile);
    void processPackage(RetryingInstaller &installer, const PackageSpec &spec);
    void processDotfiles();
    void recordOutcome(const PackageSpec &spec, const PackageOutcome &outcome);
    bool confirm(const std::string &question);
    void printSummary() const;

    const ProvisionConfig &m_config;
    ArtifactPaths m_artifacts;
    ProcessRunner &m_runner;
    Prompter &m_prompter;
    DotfilesCloner &m_cloner;

    SleepFunction m_sleep = blockingSleep;
    ProgramLookup m_hasProgram = isProgramAvailable;
    std::function<bool()> m_isPrivileged;

    OutcomeAggregator m_aggregator;
    std::optional<ProvisioningReport> m_report;
};

} // namespace hostprep
