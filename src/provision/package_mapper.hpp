#pragma once

#include <string>

#include "common/models.hpp"

namespace hostprep {

/**
 * Map a logical package name to the name the family's package manager
 * knows it by. Names without an alias map to themselves, so the mapping
 * is total. Packages that do not exist for a family, and every package on
 * an unsupported family, map to "not applicable".
 *
 * Pure and deterministic.
 */
ResolvedPackage mapPackageName(const std::string &logicalName, DistroFamily family);

} // namespace hostprep
