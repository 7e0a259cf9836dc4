#include "provision/package_mapper.hpp"

#include <algorithm>

namespace hostprep {

namespace {

struct NameRule {
    const char *logicalName;
    DistroFamily family;
    // nullptr: the package does not exist for this family.
    const char *concreteName;
};

const NameRule kNameRules[] = {
    {"python3-pip", DistroFamily::Alpine, "py3-pip"},
    {"python3-psutil", DistroFamily::Alpine, "py3-psutil"},
    {"cron", DistroFamily::Alpine, "dcron"},
    {"cron", DistroFamily::RHELLike, "cronie"},
    {"dconf", DistroFamily::Debian, "dconf-cli"},
    {"tlp", DistroFamily::Alpine, nullptr},
    {"software-properties-common", DistroFamily::Alpine, nullptr},
    {"software-properties-common", DistroFamily::RHELLike, nullptr},
    {"build-essential", DistroFamily::Alpine, nullptr},
    {"build-essential", DistroFamily::RHELLike, nullptr},
};

} // namespace

ResolvedPackage mapPackageName(const std::string &logicalName, DistroFamily family)
{
    ResolvedPackage resolved;
    if (family == DistroFamily::Unsupported || logicalName.empty()) {
        return resolved;
    }

    const auto it = std::find_if(std::begin(kNameRules), std::end(kNameRules),
                                 [&](const NameRule &rule) {
                                     return rule.family == family
                                         && logicalName == rule.logicalName;
                                 });
    if (it == std::end(kNameRules)) {
        resolved.concreteName = logicalName;
    } else if (it->concreteName != nullptr) {
        resolved.concreteName = std::string(it->concreteName);
    }
    return resolved;
}

} // namespace hostprep
