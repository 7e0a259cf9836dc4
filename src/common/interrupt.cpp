#include "common/interrupt.hpp"

#include <atomic>

#include "common/errors.hpp"

namespace hostprep {

namespace {

std::atomic<bool> g_interrupted{false};

static_assert(std::atomic<bool>::is_always_lock_free,
              "interrupt flag must be usable from a signal handler");

void onInterruptSignal(int)
{
    g_interrupted.store(true);
}

} // namespace

bool interruptRequested()
{
    return g_interrupted.load();
}

void requestInterrupt()
{
    g_interrupted.store(true);
}

void clearInterrupt()
{
    g_interrupted.store(false);
}

void throwIfInterrupted()
{
    if (interruptRequested()) {
        throw RunInterrupted();
    }
}

InterruptGuard::InterruptGuard()
{
    struct sigaction action {};
    action.sa_handler = onInterruptSignal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a prompt blocked on stdin has to return so the run can stop.
    action.sa_flags = 0;

    sigaction(SIGINT, &action, &m_prevInt);
    sigaction(SIGTERM, &action, &m_prevTerm);
    sigaction(SIGHUP, &action, &m_prevHup);
}

InterruptGuard::~InterruptGuard()
{
    sigaction(SIGINT, &m_prevInt, nullptr);
    sigaction(SIGTERM, &m_prevTerm, nullptr);
    sigaction(SIGHUP, &m_prevHup, nullptr);
}

} // namespace hostprep
