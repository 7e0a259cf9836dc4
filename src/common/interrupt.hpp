#pragma once

#include <csignal>

namespace hostprep {

bool interruptRequested();
void requestInterrupt();
void clearInterrupt();

// Throws RunInterrupted once an interrupt has been requested.
void throwIfInterrupted();

/**
 * Installs SIGINT/SIGTERM/SIGHUP handlers for the lifetime of the guard.
 * The handlers only raise the interrupt flag; the pipeline observes it at
 * its checkpoints and the process runner stops the running child.
 */
class InterruptGuard
{
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard &) = delete;
    InterruptGuard &operator=(const InterruptGuard &) = delete;

private:
    struct sigaction m_prevInt {};
    struct sigaction m_prevTerm {};
    struct sigaction m_prevHup {};
};

} // namespace hostprep
