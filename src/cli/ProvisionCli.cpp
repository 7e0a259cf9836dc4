#include "cli/ProvisionCli.hpp"

#include <exception>
#include <iostream>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDir>

#include <nlohmann/json.hpp>

#include "cli/ConsolePrompter.hpp"
#include "cli/YadmDotfilesCloner.hpp"
#include "common/errors.hpp"
#include "common/hostprep_version.hpp"
#include "common/interrupt.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "provision/provisioning_pipeline.hpp"
#include "report/ReportGenerator.hpp"

namespace hostprep {

int ProvisionCli::parseArguments(const QStringList &args, ProvisionConfig &config)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Detects the Linux distribution, installs the curated package set with "
        "retries and writes a provisioning report."));
    const QCommandLineOption helpOption(QStringList() << "h" << "help",
                                        "Show this help.");
    const QCommandLineOption versionOption(QStringList() << "version",
                                           "Show the version.");
    const QCommandLineOption configOption(QStringList() << "config",
                                          "JSON configuration file.", "path");
    const QCommandLineOption outputOption(QStringList() << "output-dir",
                                          "Directory for the log and report files.", "dir");
    const QCommandLineOption timeoutOption(QStringList() << "attempt-timeout",
                                           "Seconds before a package manager call is "
                                           "stopped (0 disables).",
                                           "seconds");
    const QCommandLineOption dotfilesOption(QStringList() << "dotfiles-repo",
                                            "Dotfiles repository cloned with yadm.", "url");
    const QCommandLineOption yesOption(QStringList() << "y" << "yes",
                                       "Answer yes to every question.");
    const QCommandLineOption noOptionalOption(QStringList() << "no-optional",
                                              "Decline every optional package and "
                                              "the dotfiles clone.");
    const QCommandLineOption upgradeOption(QStringList() << "upgrade",
                                           "Upgrade installed packages after the "
                                           "initial refresh.");
    const QCommandLineOption noRootOption(QStringList() << "no-root-check",
                                          "Do not require root privileges.");
    const QCommandLineOption traceOption(QStringList() << "trace",
                                         "Write debug-level events to the log.");

    parser.addOption(helpOption);
    parser.addOption(versionOption);
    parser.addOption(configOption);
    parser.addOption(outputOption);
    parser.addOption(timeoutOption);
    parser.addOption(dotfilesOption);
    parser.addOption(yesOption);
    parser.addOption(noOptionalOption);
    parser.addOption(upgradeOption);
    parser.addOption(noRootOption);
    parser.addOption(traceOption);

    if (!parser.parse(args)) {
        std::cerr << parser.errorText().toStdString() << "\n\n"
                  << parser.helpText().toStdString();
        return kExitFatalPrecondition;
    }
    if (parser.isSet(helpOption)) {
        std::cout << parser.helpText().toStdString();
        return kExitSuccess;
    }
    if (parser.isSet(versionOption)) {
        std::cout << "hostprep " << HOSTPREP_VERSION << std::endl;
        return kExitSuccess;
    }
    if (!parser.positionalArguments().isEmpty()) {
        std::cerr << "Unexpected argument: "
                  << parser.positionalArguments().first().toStdString() << "\n\n"
                  << parser.helpText().toStdString();
        return kExitFatalPrecondition;
    }

    try {
        QString configPath = parser.value(configOption);
        if (configPath.isEmpty()) {
            configPath = qEnvironmentVariable("HOSTPREP_CONFIG");
        }
        if (!configPath.isEmpty()) {
            loadConfigFile(configPath.toStdString(), config);
        }
        applyEnvironment(config);

        if (parser.isSet(outputOption)) {
            config.outputDir = parser.value(outputOption).toStdString();
        }
        if (parser.isSet(timeoutOption)) {
            bool ok = false;
            const int seconds = parser.value(timeoutOption).toInt(&ok);
            if (!ok || seconds < 0 || seconds > kMaxDurationSeconds) {
                throw ConfigError("--attempt-timeout expects 0 to "
                                  + std::to_string(kMaxDurationSeconds) + " seconds");
            }
            config.attemptTimeout = std::chrono::seconds(seconds);
        }
        if (parser.isSet(dotfilesOption)) {
            config.dotfilesRepository = parser.value(dotfilesOption).toStdString();
        }
        config.assumeYes = config.assumeYes || parser.isSet(yesOption);
        config.declineOptional = config.declineOptional || parser.isSet(noOptionalOption);
        config.upgradeSystem = config.upgradeSystem || parser.isSet(upgradeOption);
        if (parser.isSet(noRootOption)) {
            config.requirePrivileges = false;
        }
        config.traceEnabled = config.traceEnabled || parser.isSet(traceOption);

        validateConfig(config);
    } catch (const ConfigError &ex) {
        std::cerr << "[ERROR] " << ex.what() << std::endl;
        return kExitFatalPrecondition;
    }

    return -1;
}

int ProvisionCli::runPipeline(ProvisioningPipeline &pipeline)
{
    try {
        return pipeline.run();
    } catch (const std::exception &ex) {
        std::cerr << "[ERROR] Provisioning aborted: " << ex.what() << std::endl;
        HPLOG_ERROR(QStringLiteral("ProvisionCli"),
                    QStringLiteral("runPipeline"),
                    QStringLiteral("pipeline_aborted"),
                    QStringLiteral("unexpected_exception"),
                    QStringLiteral("cli"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
    return kExitInternalError;
}

int ProvisionCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    ProvisionConfig config = defaultConfig();
    const int parseResult = parseArguments(args, config);
    if (parseResult >= 0) {
        return parseResult;
    }

    const ArtifactPaths artifacts =
        artifactPathsFor(QString::fromStdString(config.outputDir), QDateTime::currentDateTimeUtc());
    if (!QDir().mkpath(QString::fromStdString(config.outputDir))) {
        std::cerr << "[WARNING] Cannot create output directory " << config.outputDir
                  << ", log lines go to stderr" << std::endl;
    }

    logging::initLogging(QStringLiteral("hostprep"),
                         QString::fromStdString(artifacts.logPath),
                         config.traceEnabled);
    HPLOG_INFO(QStringLiteral("ProvisionCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"version", HOSTPREP_VERSION},
                               {"args", args.size()},
                               {"outputDir", config.outputDir}}));

    const InterruptGuard interruptGuard;

    QProcessRunner runner;
    ConsolePrompter prompter;
    YadmDotfilesCloner cloner(runner, config.attemptTimeout);
    ProvisioningPipeline pipeline(config, artifacts, runner, prompter, cloner);

    const int exitCode = runPipeline(pipeline);

    HPLOG_INFO(QStringLiteral("ProvisionCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_exit"),
               QStringLiteral("run_end"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"exitCode", exitCode}}));
    return exitCode;
}

} // namespace hostprep
