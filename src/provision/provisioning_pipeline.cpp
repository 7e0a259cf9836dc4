#include "provision/provisioning_pipeline.hpp"

#include <chrono>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/interrupt.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/status.hpp"
#include "provision/os_release.hpp"
#include "provision/package_mapper.hpp"
#include "report/ReportFinalizer.hpp"
#include "report/ReportGenerator.hpp"

namespace hostprep {

namespace {

const char *const kDotfilesPackage = "dotfiles";
const char *const kDeclinedReason = "declined by user";

QString component()
{
    return QStringLiteral("ProvisioningPipeline");
}

std::string joinIds(const std::vector<std::string> &ids)
{
    std::string text;
    for (const auto &id : ids) {
        if (!text.empty()) {
            text += ", ";
        }
        text += id;
    }
    return text;
}

} // namespace

ProvisioningPipeline::ProvisioningPipeline(const ProvisionConfig &config,
                                           const ArtifactPaths &artifacts,
                                           ProcessRunner &runner,
                                           Prompter &prompter,
                                           DotfilesCloner &cloner)
    : m_config(config)
    , m_artifacts(artifacts)
    , m_runner(runner)
    , m_prompter(prompter)
    , m_cloner(cloner)
    , m_isPrivileged([] { return geteuid() == 0; })
{
}

int ProvisioningPipeline::run()
{
    const auto startTime = std::chrono::system_clock::now();

    HPLOG_INFO(component(),
               QStringLiteral("run"),
               QStringLiteral("run_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("sequential_pipeline"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"osRelease", m_config.osReleasePath},
                               {"required", m_config.requiredPackages.size()},
                               {"optional", m_config.optionalPackages.size()},
                               {"log", m_artifacts.logPath}}));

    if (m_config.requirePrivileges) {
        if (!m_isPrivileged()) {
            printStatus(Status::Error, component(), QStringLiteral("run"),
                        QStringLiteral("privilege_check_failed"),
                        "This tool must be run as root or with sudo privileges");
            return kExitFatalPrecondition;
        }
        printStatus(Status::Success, component(), QStringLiteral("run"),
                    QStringLiteral("privilege_check_ok"),
                    "Running with appropriate privileges");
    }

    printStatus(Status::Info, component(), QStringLiteral("run"),
                QStringLiteral("distro_detect"), "Detecting Linux distribution...");

    OsRelease release;
    DistroProfile profile;
    try {
        release = readOsRelease(m_config.osReleasePath);
        profile = resolveProfile(release.id, m_hasProgram);
    } catch (const UnsupportedDistro &ex) {
        printStatus(Status::Error, component(), QStringLiteral("run"),
                    QStringLiteral("distro_unsupported"), ex.what(),
                    nlohmann::json{{"distroId", ex.distroId()}});
        printStatus(Status::Info, component(), QStringLiteral("run"),
                    QStringLiteral("distro_supported_list"),
                    "Supported distributions: " + joinIds(supportedDistroIds()));
        return kExitFatalPrecondition;
    } catch (const HostIdentityError &ex) {
        printStatus(Status::Error, component(), QStringLiteral("run"),
                    QStringLiteral("host_identity_missing"), ex.what());
        return kExitFatalPrecondition;
    }

    printStatus(Status::Success, component(), QStringLiteral("run"),
                QStringLiteral("distro_detected"),
                "Detected distribution: " + profile.distroId + " (using "
                    + profile.packageManager + ")",
                nlohmann::json{{"family", toFamilyString(profile.family)},
                               {"packageManager", profile.packageManager}});

    ReportContext context;
    context.host = collectHostMetadata(release);
    context.profile = profile;
    context.artifacts = m_artifacts;
    context.dotfilesRepository = m_config.dotfilesRepository;
    context.timing.start = startTime;

    // From here on every exit path leaves a report behind.
    ReportFinalizer finalizer([this, &context]() {
        context.timing.end = std::chrono::system_clock::now();
        return buildReport(m_aggregator.summary(), context);
    });

    RetryPolicy policy;
    policy.retryDelay = m_config.retryDelay;
    policy.attemptTimeout = m_config.attemptTimeout;
    RetryingInstaller installer(m_runner, profile, policy, m_sleep);

    try {
        throwIfInterrupted();
        printStatus(Status::Info, component(), QStringLiteral("run"),
                    QStringLiteral("initial_refresh"),
                    "Performing initial repository update...");
        installer.refreshRepositories();
        if (m_config.upgradeSystem) {
            installer.upgradeSystem();
        }
        installer.ensureExtraRepositories();

        processPackages(installer, profile);
        processDotfiles();
    } catch (const RunInterrupted &) {
        context.status = RunStatus::Interrupted;
        printStatus(Status::Warning, component(), QStringLiteral("run"),
                    QStringLiteral("run_interrupted"),
                    "Interrupted, writing the report for the packages processed so far",
                    nlohmann::json{{"recorded", m_aggregator.size()}});
    }

    try {
        m_report = finalizer.finalize();
    } catch (const ReportWriteError &ex) {
        printStatus(Status::Error, component(), QStringLiteral("run"),
                    QStringLiteral("report_write_failed"),
                    std::string("Failed to write provisioning report: ") + ex.what());
        return kExitReportFailure;
    }

    printSummary();

    if (context.status == RunStatus::Interrupted) {
        return kExitInterrupted;
    }
    return m_aggregator.hasFailures() ? kExitPackageFailures : kExitSuccess;
}

void ProvisioningPipeline::processPackages(RetryingInstaller &installer,
                                           const DistroProfile &profile)
{
    printStatus(Status::Info, component(), QStringLiteral("processPackages"),
                QStringLiteral("required_start"), "Installing required packages...");
    for (const PackageSpec &spec : m_config.requiredPackages) {
        throwIfInterrupted();
        processPackage(installer, spec);
    }

    printStatus(Status::Info, component(), QStringLiteral("processPackages"),
                QStringLiteral("optional_start"), "Checking optional packages...");
    for (const PackageSpec &spec : m_config.optionalPackages) {
        throwIfInterrupted();

        // Nothing to ask about when the distro cannot have the package.
        if (!mapPackageName(spec.name, profile.family).isApplicable()) {
            processPackage(installer, spec);
            continue;
        }

        if (!confirm("Want to install " + spec.name + "? (yes/y or no/n): ")) {
            printStatus(Status::Info, component(), QStringLiteral("processPackages"),
                        QStringLiteral("optional_declined"),
                        "Skipping " + spec.name + " installation",
                        nlohmann::json{{"package", spec.name}});
            recordOutcome(spec, PackageOutcome::skipped(kDeclinedReason));
            continue;
        }
        processPackage(installer, spec);
    }
}

void ProvisioningPipeline::processPackage(RetryingInstaller &installer, const PackageSpec &spec)
{
    recordOutcome(spec, installer.install(spec.name));
}

void ProvisioningPipeline::processDotfiles()
{
    const PackageSpec spec{kDotfilesPackage, false};
    const std::string &repository = m_config.dotfilesRepository;

    throwIfInterrupted();
    if (!confirm("Want to clone dotfiles from " + repository + "? (yes/y or no/n): ")) {
        printStatus(Status::Info, component(), QStringLiteral("processDotfiles"),
                    QStringLiteral("dotfiles_declined"), "Skipping dotfiles installation");
        recordOutcome(spec, PackageOutcome::skipped(kDeclinedReason));
        return;
    }

    printStatus(Status::Info, component(), QStringLiteral("processDotfiles"),
                QStringLiteral("dotfiles_clone"), "Setting up dotfiles with yadm...",
                nlohmann::json{{"repository", repository}});
    const DotfilesResult result = m_cloner.cloneDotfiles(repository);
    throwIfInterrupted();

    if (result.success) {
        recordOutcome(spec, PackageOutcome::installed(std::string(), 1));
        return;
    }

    printStatus(Status::Error, component(), QStringLiteral("processDotfiles"),
                QStringLiteral("dotfiles_failed"), "Failed to clone dotfiles repository",
                nlohmann::json{{"error", result.diagnostic}});
    printStatus(Status::Info, component(), QStringLiteral("processDotfiles"),
                QStringLiteral("dotfiles_manual_hint"),
                "You can manually run: yadm clone " + repository);
    recordOutcome(spec, PackageOutcome::failed(result.diagnostic, 1, false));
}

void ProvisioningPipeline::recordOutcome(const PackageSpec &spec, const PackageOutcome &outcome)
{
    m_aggregator.record(spec, outcome);

    if (outcome.kind == OutcomeKind::Installed) {
        printStatus(Status::Success, component(), QStringLiteral("recordOutcome"),
                    QStringLiteral("package_installed"),
                    spec.name + " installed successfully",
                    nlohmann::json{{"package", spec.name}, {"attempts", outcome.attempts}});
    }
}

bool ProvisioningPipeline::confirm(const std::string &question)
{
    if (m_config.declineOptional) {
        return false;
    }
    if (m_config.assumeYes) {
        HPLOG_INFO(component(),
                   QStringLiteral("confirm"),
                   QStringLiteral("prompt_assumed_yes"),
                   QStringLiteral("assume_yes_flag"),
                   QStringLiteral("non_interactive"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"question", question}}));
        return true;
    }
    const bool answer = m_prompter.askYesNo(question);
    // A signal that arrives while the operator is at the prompt is not an answer.
    throwIfInterrupted();
    return answer;
}

void ProvisioningPipeline::printSummary() const
{
    const LedgerSummary summary = m_aggregator.summary();

    printStatus(Status::Info, component(), QStringLiteral("printSummary"),
                QStringLiteral("summary_counts"),
                "Installed: " + std::to_string(summary.installed)
                    + ", skipped: " + std::to_string(summary.skipped)
                    + ", failed: " + std::to_string(summary.failed));

    if (summary.failed == 0) {
        printStatus(Status::Success, component(), QStringLiteral("printSummary"),
                    QStringLiteral("summary_ok"),
                    "All requested packages installed successfully!");
    } else {
        printStatus(Status::Warning, component(), QStringLiteral("printSummary"),
                    QStringLiteral("summary_failures"),
                    "Installation completed with some failures");
        for (const auto &entry : summary.ledger.entries) {
            if (entry.outcome.kind == OutcomeKind::Failed) {
                printStatus(Status::Error, component(), QStringLiteral("printSummary"),
                            QStringLiteral("summary_failed_package"),
                            "Failed: " + entry.spec.name);
            }
        }
    }

    printStatus(Status::Info, component(), QStringLiteral("printSummary"),
                QStringLiteral("summary_artifacts"),
                "Report: " + m_artifacts.reportPath + " | Log: " + m_artifacts.logPath);
}

} // namespace hostprep
