#include "provision/retrying_installer.hpp"

#include <utility>
#include <vector>

#include <QString>
#include <QThread>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/interrupt.hpp"
#include "common/logging.hpp"
#include "common/status.hpp"
#include "provision/package_mapper.hpp"

namespace hostprep {

namespace {

const char *const kNotApplicableReason = "not applicable for distro";
const char *const kEpelPackage = "epel-release";

QString component()
{
    return QStringLiteral("RetryingInstaller");
}

// "2s", "0.5s", "0s": the delay may be configured below a second.
std::string formatDelay(std::chrono::milliseconds delay)
{
    return QString::number(static_cast<double>(delay.count()) / 1000.0).toStdString() + "s";
}

} // namespace

void blockingSleep(std::chrono::milliseconds delay)
{
    if (delay.count() > 0) {
        QThread::msleep(static_cast<unsigned long>(delay.count()));
    }
}

RetryingInstaller::RetryingInstaller(ProcessRunner &runner,
                                     const DistroProfile &profile,
                                     RetryPolicy policy,
                                     SleepFunction sleep)
    : m_runner(runner)
    , m_profile(profile)
    , m_policy(policy)
    , m_sleep(std::move(sleep))
{
}

ProcessResult RetryingInstaller::runCommand(const CommandTemplate &command,
                                            const std::vector<std::string> &extraArguments)
{
    ProcessResult result =
        m_runner.run(requestFor(command, extraArguments, m_policy.attemptTimeout));
    if (result.interrupted) {
        throw RunInterrupted();
    }
    return result;
}

PackageOutcome RetryingInstaller::install(const std::string &logicalName)
{
    const logging::CorrelationScope scope(QString::fromStdString("pkg:" + logicalName));

    const ResolvedPackage resolved = mapPackageName(logicalName, m_profile.family);
    if (!resolved.isApplicable()) {
        printStatus(Status::Warning, component(), QStringLiteral("install"),
                    QStringLiteral("package_not_applicable"),
                    logicalName + " is not available on " + m_profile.distroId + ", skipping",
                    nlohmann::json{{"package", logicalName}, {"distro", m_profile.distroId}});
        return PackageOutcome::skipped(kNotApplicableReason);
    }

    const std::string &concreteName = *resolved.concreteName;
    // Only the current attempt is kept; nothing outlives the retry loop.
    AttemptRecord attempt;

    for (int index = 1; index <= kMaxRetryAttempts; ++index) {
        throwIfInterrupted();

        printStatus(Status::Info, component(), QStringLiteral("install"),
                    QStringLiteral("install_attempt"),
                    "Installing " + logicalName + " (attempt " + std::to_string(index)
                        + "/" + std::to_string(kMaxRetryAttempts) + ")...",
                    nlohmann::json{{"package", logicalName},
                                   {"concreteName", concreteName},
                                   {"attempt", index},
                                   {"command", describeCommand(m_profile.installCommandPrefix,
                                                               {concreteName})}});

        const ProcessResult result = runCommand(m_profile.installCommandPrefix, {concreteName});
        attempt.attempt = index;
        attempt.success = result.succeeded();
        attempt.errorText = attempt.success ? std::string() : result.errorText();

        if (attempt.success) {
            return PackageOutcome::installed(concreteName, index);
        }

        HPLOG_WARN(component(),
                   QStringLiteral("install"),
                   QStringLiteral("install_attempt_failed"),
                   QStringLiteral("nonzero_exit"),
                   QStringLiteral("package_manager"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"package", logicalName},
                                   {"attempt", index},
                                   {"exitCode", result.exitCode},
                                   {"timedOut", result.timedOut},
                                   {"error", attempt.errorText}}));

        if (index == kMaxRetryAttempts) {
            break;
        }

        printStatus(Status::Retry, component(), QStringLiteral("install"),
                    QStringLiteral("install_retry"),
                    logicalName + " installation failed, retrying in "
                        + formatDelay(m_policy.retryDelay) + "...",
                    nlohmann::json{{"package", logicalName}, {"attempt", index}});
        repairPackageManager();
        refreshRepositories();
        m_sleep(m_policy.retryDelay);
    }

    printStatus(Status::Error, component(), QStringLiteral("install"),
                QStringLiteral("install_exhausted"),
                logicalName + " installation failed after "
                    + std::to_string(kMaxRetryAttempts) + " attempts",
                nlohmann::json{{"package", logicalName}, {"error", attempt.errorText}});
    PackageOutcome outcome = PackageOutcome::failed(attempt.errorText, attempt.attempt, true);
    outcome.concreteName = concreteName;
    return outcome;
}

bool RetryingInstaller::refreshRepositories()
{
    printStatus(Status::Info, component(), QStringLiteral("refreshRepositories"),
                QStringLiteral("repo_refresh"), "Updating package repositories...");

    const ProcessResult result = runCommand(m_profile.updateCommand);
    if (result.succeeded()) {
        printStatus(Status::Success, component(), QStringLiteral("refreshRepositories"),
                    QStringLiteral("repo_refresh_ok"),
                    "Package repositories updated successfully");
        return true;
    }

    printStatus(Status::Warning, component(), QStringLiteral("refreshRepositories"),
                QStringLiteral("repo_refresh_failed"),
                "Failed to update repositories, continuing anyway...",
                nlohmann::json{{"error", result.errorText()}});
    return false;
}

bool RetryingInstaller::repairPackageManager()
{
    printStatus(Status::Info, component(), QStringLiteral("repairPackageManager"),
                QStringLiteral("repair_start"), "Attempting to fix broken packages...");

    for (const CommandTemplate &step : m_profile.repairCommands) {
        const ProcessResult result = runCommand(step);
        if (!result.succeeded()) {
            printStatus(Status::Warning, component(), QStringLiteral("repairPackageManager"),
                        QStringLiteral("repair_failed"),
                        "Package repair had issues, continuing...",
                        nlohmann::json{{"command", describeCommand(step)},
                                       {"error", result.errorText()}});
            return false;
        }
    }

    printStatus(Status::Success, component(), QStringLiteral("repairPackageManager"),
                QStringLiteral("repair_ok"), "Package repair completed successfully");
    return true;
}

bool RetryingInstaller::upgradeSystem()
{
    printStatus(Status::Info, component(), QStringLiteral("upgradeSystem"),
                QStringLiteral("upgrade_start"), "Upgrading installed packages...");

    const ProcessResult result = runCommand(m_profile.upgradeCommand);
    if (result.succeeded()) {
        printStatus(Status::Success, component(), QStringLiteral("upgradeSystem"),
                    QStringLiteral("upgrade_ok"), "System upgrade completed");
        return true;
    }

    printStatus(Status::Warning, component(), QStringLiteral("upgradeSystem"),
                QStringLiteral("upgrade_failed"),
                "System upgrade failed, continuing anyway...",
                nlohmann::json{{"error", result.errorText()}});
    return false;
}

bool RetryingInstaller::ensureExtraRepositories()
{
    if (!m_profile.needsEpel || m_extraReposChecked) {
        return m_extraReposReady;
    }
    m_extraReposChecked = true;

    const ProcessResult query = runCommand(CommandTemplate{"rpm", {"-q", kEpelPackage}});
    if (query.succeeded()) {
        m_extraReposReady = true;
        return true;
    }

    printStatus(Status::Info, component(), QStringLiteral("ensureExtraRepositories"),
                QStringLiteral("epel_install"), "Installing EPEL repository...");
    const ProcessResult result = runCommand(m_profile.installCommandPrefix, {kEpelPackage});
    m_extraReposReady = result.succeeded();
    if (!m_extraReposReady) {
        printStatus(Status::Warning, component(), QStringLiteral("ensureExtraRepositories"),
                    QStringLiteral("epel_install_failed"),
                    "EPEL repository could not be installed, continuing...",
                    nlohmann::json{{"error", result.errorText()}});
    }
    return m_extraReposReady;
}

} // namespace hostprep
