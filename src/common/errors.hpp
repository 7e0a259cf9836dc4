#pragma once

#include <stdexcept>
#include <string>

namespace hostprep {

// Conditions that abort the run before any package is processed.
// No report is written for these.
class FatalPrecondition : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class PrivilegeError : public FatalPrecondition
{
public:
    using FatalPrecondition::FatalPrecondition;
};

class HostIdentityError : public FatalPrecondition
{
public:
    using FatalPrecondition::FatalPrecondition;
};

class ConfigError : public FatalPrecondition
{
public:
    using FatalPrecondition::FatalPrecondition;
};

class UnsupportedDistro : public FatalPrecondition
{
public:
    explicit UnsupportedDistro(const std::string &distroId)
        : FatalPrecondition("Unsupported distribution: "
                            + (distroId.empty() ? std::string("<empty>") : distroId))
        , m_distroId(distroId)
    {
    }

    const std::string &distroId() const { return m_distroId; }

private:
    std::string m_distroId;
};

class ReportWriteError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised at a checkpoint once SIGINT/SIGTERM/SIGHUP has been observed.
class RunInterrupted : public std::runtime_error
{
public:
    RunInterrupted()
        : std::runtime_error("run interrupted by signal")
    {
    }
};

} // namespace hostprep
