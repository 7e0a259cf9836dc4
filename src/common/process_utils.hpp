#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace hostprep {

struct ProcessRequest {
    QString program;
    QStringList arguments;
    QString workingDirectory;
    // "KEY=VALUE" entries layered over the inherited environment.
    QStringList environment;
    // Zero waits forever.
    std::chrono::milliseconds timeout{0};
};

struct ProcessResult {
    bool started = false;
    bool normalExit = false;
    bool timedOut = false;
    bool interrupted = false;
    int exitCode = -1;
    std::string standardOutput;
    std::string standardError;
    std::string startError;

    // Exit status is the only success signal; output is never parsed.
    bool succeeded() const
    {
        return started && normalExit && !timedOut && !interrupted && exitCode == 0;
    }

    // Best diagnostic the process left behind. May be empty for silent tools.
    std::string errorText() const;
};

// Seam between the engine and real processes; tests substitute a fake.
class ProcessRunner
{
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const ProcessRequest &request) = 0;
};

/**
 * QProcess-backed runner. Waits in short slices so that a per-request
 * timeout and the process-wide interrupt flag both stop the child
 * (SIGTERM first, SIGKILL after a grace period).
 */
class QProcessRunner : public ProcessRunner
{
public:
    ProcessResult run(const ProcessRequest &request) override;
};

ProcessRequest requestFor(const CommandTemplate &command,
                          const std::vector<std::string> &extraArguments = {},
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

// "apt install -y git": for logs, reports and manual remediation hints.
std::string describeCommand(const CommandTemplate &command,
                            const std::vector<std::string> &extraArguments = {});

bool isProgramAvailable(const std::string &program);

} // namespace hostprep
