#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace hostprep {

// Fields of os-release(5) the provisioner cares about.
struct OsRelease {
    std::string id;                  // ID
    std::vector<std::string> idLike; // ID_LIKE
    std::string name;                // NAME
    std::string prettyName;          // PRETTY_NAME
    std::string versionId;           // VERSION_ID
};

/**
 * Parse os-release formatted text. Blank lines, comments and malformed
 * lines are ignored; values may be single or double quoted. Never throws.
 */
OsRelease parseOsRelease(const std::string &text);

// Read and parse the file at path. Throws HostIdentityError if the file
// cannot be read or carries no ID.
OsRelease readOsRelease(const std::string &path);

// OS name from the release data; kernel, architecture and hostname from the
// running system.
HostMetadata collectHostMetadata(const OsRelease &release);

} // namespace hostprep
