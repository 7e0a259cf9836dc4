#pragma once

namespace hostprep {

enum class DistroFamily {
    Debian,
    Alpine,
    RHELLike,
    Unsupported
};

enum class OutcomeKind {
    Installed,
    Skipped,
    Failed
};

enum class RunStatus {
    Completed,
    Interrupted
};

} // namespace hostprep
