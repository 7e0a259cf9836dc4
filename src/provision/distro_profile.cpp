#include "provision/distro_profile.hpp"

#include <algorithm>
#include <cctype>

#include "common/errors.hpp"
#include "common/process_utils.hpp"

namespace hostprep {

namespace {

struct DistroEntry {
    const char *id;
    DistroFamily family;
};

const DistroEntry kDistroTable[] = {
    {"ubuntu", DistroFamily::Debian},
    {"debian", DistroFamily::Debian},
    {"alpine", DistroFamily::Alpine},
    {"rocky", DistroFamily::RHELLike},
    {"rhel", DistroFamily::RHELLike},
    {"centos", DistroFamily::RHELLike},
    {"fedora", DistroFamily::RHELLike},
    {"almalinux", DistroFamily::RHELLike},
};

std::string normalizeId(const std::string &value)
{
    std::string out;
    for (char ch : value) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
    }
    return out;
}

DistroProfile aptProfile()
{
    DistroProfile profile;
    profile.family = DistroFamily::Debian;
    profile.packageManager = "apt";
    profile.updateCommand = {"apt", {"update"}};
    profile.installCommandPrefix = {"apt", {"install", "-y"}};
    profile.repairCommands = {{"apt", {"--fix-broken", "install", "-y"}}};
    profile.upgradeCommand = {"apt", {"upgrade", "-y"}};
    return profile;
}

DistroProfile apkProfile()
{
    DistroProfile profile;
    profile.family = DistroFamily::Alpine;
    profile.packageManager = "apk";
    profile.updateCommand = {"apk", {"update"}};
    profile.installCommandPrefix = {"apk", {"add"}};
    profile.repairCommands = {{"apk", {"fix"}}};
    profile.upgradeCommand = {"apk", {"upgrade"}};
    return profile;
}

DistroProfile rpmProfile(const std::string &manager)
{
    DistroProfile profile;
    profile.family = DistroFamily::RHELLike;
    profile.packageManager = manager;
    profile.updateCommand = {manager, {"makecache"}};
    profile.installCommandPrefix = {manager, {"install", "-y"}};
    profile.repairCommands = {{manager, {"check"}}, {manager, {"autoremove", "-y"}}};
    profile.upgradeCommand = {manager, {"upgrade", "--refresh", "-y"}};
    return profile;
}

} // namespace

DistroFamily familyForDistroId(const std::string &distroId)
{
    const std::string id = normalizeId(distroId);
    const auto it = std::find_if(std::begin(kDistroTable), std::end(kDistroTable),
                                 [&id](const DistroEntry &entry) {
                                     return id == entry.id;
                                 });
    if (it == std::end(kDistroTable)) {
        return DistroFamily::Unsupported;
    }
    return it->family;
}

std::vector<std::string> supportedDistroIds()
{
    std::vector<std::string> ids;
    for (const auto &entry : kDistroTable) {
        ids.emplace_back(entry.id);
    }
    return ids;
}

DistroProfile resolveProfile(const std::string &distroId, const ProgramLookup &hasProgram)
{
    const std::string id = normalizeId(distroId);

    DistroProfile profile;
    switch (familyForDistroId(id)) {
    case DistroFamily::Debian:
        profile = aptProfile();
        break;
    case DistroFamily::Alpine:
        profile = apkProfile();
        break;
    case DistroFamily::RHELLike:
        // Older RHEL/CentOS releases ship yum only.
        profile = rpmProfile(hasProgram && !hasProgram("dnf") ? "yum" : "dnf");
        // Fedora carries the EPEL packages in its main repositories.
        profile.needsEpel = id != "fedora";
        break;
    case DistroFamily::Unsupported:
        throw UnsupportedDistro(distroId);
    }

    profile.distroId = id;
    return profile;
}

DistroProfile resolveProfile(const std::string &distroId)
{
    return resolveProfile(distroId, isProgramAvailable);
}

} // namespace hostprep
