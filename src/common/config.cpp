#include "common/config.hpp"

#include <unordered_set>

#include <QFile>
#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace hostprep {

namespace {

const char *const kDotfilesPseudoPackage = "dotfiles";

std::vector<PackageSpec> makeSpecs(const std::vector<std::string> &names, bool required)
{
    std::vector<PackageSpec> specs;
    specs.reserve(names.size());
    for (const auto &name : names) {
        specs.push_back(PackageSpec{name, required});
    }
    return specs;
}

std::vector<PackageSpec> readPackageList(const nlohmann::json &root,
                                         const char *key, bool required)
{
    const auto &value = root.at(key);
    if (!value.is_array()) {
        throw ConfigError(std::string("config key '") + key + "' must be an array of strings");
    }
    std::vector<std::string> names;
    for (const auto &item : value) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            throw ConfigError(std::string("config key '") + key
                              + "' must only contain non-empty strings");
        }
        names.push_back(item.get<std::string>());
    }
    return makeSpecs(names, required);
}

std::string readString(const nlohmann::json &root, const char *key)
{
    const auto &value = root.at(key);
    if (!value.is_string()) {
        throw ConfigError(std::string("config key '") + key + "' must be a string");
    }
    return value.get<std::string>();
}

bool readBool(const nlohmann::json &root, const char *key)
{
    const auto &value = root.at(key);
    if (!value.is_boolean()) {
        throw ConfigError(std::string("config key '") + key + "' must be a boolean");
    }
    return value.get<bool>();
}

std::chrono::milliseconds readSeconds(const nlohmann::json &root, const char *key)
{
    const auto &value = root.at(key);
    if (!value.is_number() || value.get<double>() < 0) {
        throw ConfigError(std::string("config key '") + key
                          + "' must be a non-negative number of seconds");
    }
    if (value.get<double>() > kMaxDurationSeconds) {
        throw ConfigError(std::string("config key '") + key + "' must not exceed "
                          + std::to_string(kMaxDurationSeconds) + " seconds");
    }
    return std::chrono::milliseconds(static_cast<long long>(value.get<double>() * 1000));
}

} // namespace

ProvisionConfig defaultConfig()
{
    ProvisionConfig config;
    config.requiredPackages = makeSpecs({"git", "yadm", "curl", "wget", "cron", "htop",
                                         "tmux", "dconf", "python3", "python3-pip",
                                         "python3-psutil"},
                                        true);
    config.optionalPackages = makeSpecs({"ansible", "powertop", "tlp"}, false);
    return config;
}

void loadConfigFile(const std::string &path, ProvisionConfig &config)
{
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("cannot read config file " + path + ": "
                          + file.errorString().toStdString());
    }

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("invalid JSON in config file " + path + ": " + ex.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config file " + path + " must contain a JSON object");
    }

    if (root.contains("osReleasePath")) {
        config.osReleasePath = readString(root, "osReleasePath");
    }
    if (root.contains("outputDir")) {
        config.outputDir = readString(root, "outputDir");
    }
    if (root.contains("retryDelaySeconds")) {
        config.retryDelay = readSeconds(root, "retryDelaySeconds");
    }
    if (root.contains("attemptTimeoutSeconds")) {
        config.attemptTimeout = readSeconds(root, "attemptTimeoutSeconds");
    }
    if (root.contains("requiredPackages")) {
        config.requiredPackages = readPackageList(root, "requiredPackages", true);
    }
    if (root.contains("optionalPackages")) {
        config.optionalPackages = readPackageList(root, "optionalPackages", false);
    }
    if (root.contains("dotfilesRepository")) {
        config.dotfilesRepository = readString(root, "dotfilesRepository");
    }
    if (root.contains("upgradeSystem")) {
        config.upgradeSystem = readBool(root, "upgradeSystem");
    }
}

void applyEnvironment(ProvisionConfig &config)
{
    const QString osRelease = qEnvironmentVariable("HOSTPREP_OS_RELEASE");
    if (!osRelease.isEmpty()) {
        config.osReleasePath = osRelease.toStdString();
    }

    const QString outputDir = qEnvironmentVariable("HOSTPREP_OUTPUT_DIR");
    if (!outputDir.isEmpty()) {
        config.outputDir = outputDir.toStdString();
    }

    if (qEnvironmentVariableIsSet("HOSTPREP_ATTEMPT_TIMEOUT")) {
        bool ok = false;
        const int seconds = qEnvironmentVariableIntValue("HOSTPREP_ATTEMPT_TIMEOUT", &ok);
        if (!ok || seconds < 0 || seconds > kMaxDurationSeconds) {
            throw ConfigError("HOSTPREP_ATTEMPT_TIMEOUT must be an integer between 0 and "
                              + std::to_string(kMaxDurationSeconds));
        }
        config.attemptTimeout = std::chrono::seconds(seconds);
    }

    if (qEnvironmentVariableIntValue("HOSTPREP_TRACE") == 1) {
        config.traceEnabled = true;
    }
}

void validateConfig(const ProvisionConfig &config)
{
    if (config.assumeYes && config.declineOptional) {
        throw ConfigError("--yes and --no-optional cannot be combined");
    }
    if (config.outputDir.empty()) {
        throw ConfigError("output directory must not be empty");
    }

    std::unordered_set<std::string> seen;
    auto check = [&seen](const std::vector<PackageSpec> &specs) {
        for (const auto &spec : specs) {
            if (spec.name == kDotfilesPseudoPackage) {
                throw ConfigError("package name 'dotfiles' is reserved");
            }
            if (!seen.insert(spec.name).second) {
                throw ConfigError("package '" + spec.name + "' is listed more than once");
            }
        }
    };
    check(config.requiredPackages);
    check(config.optionalPackages);
}

} // namespace hostprep
