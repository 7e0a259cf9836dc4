#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace hostprep {

// Upper bound for every configured delay or timeout (one day).
constexpr long long kMaxDurationSeconds = 24 * 60 * 60;

struct ProvisionConfig {
    std::string osReleasePath = "/etc/os-release";
    std::string outputDir = "/var/log/hostprep";

    std::chrono::milliseconds retryDelay = std::chrono::seconds(2);
    // Per install/update/repair invocation; zero disables the limit.
    std::chrono::milliseconds attemptTimeout = std::chrono::seconds(900);

    std::vector<PackageSpec> requiredPackages;
    std::vector<PackageSpec> optionalPackages;

    std::string dotfilesRepository = "https://github.com/Bini88dev/dotfileslin.git";

    bool assumeYes = false;
    bool declineOptional = false;
    bool upgradeSystem = false;
    bool requirePrivileges = true;
    bool traceEnabled = false;
};

// Defaults with the curated package lists filled in.
ProvisionConfig defaultConfig();

/**
 * Merge a JSON config file into config. Keys that are absent keep their
 * current value. Throws ConfigError if the file cannot be read, is not
 * valid JSON, or a key has the wrong type or an out-of-range value.
 */
void loadConfigFile(const std::string &path, ProvisionConfig &config);

// HOSTPREP_OS_RELEASE, HOSTPREP_OUTPUT_DIR, HOSTPREP_ATTEMPT_TIMEOUT, HOSTPREP_TRACE.
void applyEnvironment(ProvisionConfig &config);

// Duplicate package names, the reserved "dotfiles" name, and
// --yes together with --no-optional are rejected with ConfigError.
void validateConfig(const ProvisionConfig &config);

} // namespace hostprep
