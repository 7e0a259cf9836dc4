#pragma once

#include <functional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace hostprep {

// Answers "is this program on PATH?". Injected so resolution is testable.
using ProgramLookup = std::function<bool(const std::string &program)>;

// Family for an os-release ID (case-insensitive, whitespace ignored).
// Unknown or empty IDs yield DistroFamily::Unsupported.
DistroFamily familyForDistroId(const std::string &distroId);

// IDs accepted by resolveProfile, for the "supported distributions" hint.
std::vector<std::string> supportedDistroIds();

/**
 * Build the immutable profile for a host identity:
 * - Debian family uses apt
 * - Alpine uses apk
 * - RHEL-like uses dnf, or yum when dnf is not on PATH
 *
 * Throws UnsupportedDistro for anything else.
 */
DistroProfile resolveProfile(const std::string &distroId, const ProgramLookup &hasProgram);
DistroProfile resolveProfile(const std::string &distroId);

} // namespace hostprep
