#pragma once

#include <atomic>
#include <signal.h>
#include <thread>

namespace qedl {

// ─── SIGINT/SIGTERM to a flag ────────────────────────────────────────
// Blocks the termination signals for the process and turns them into a
// flag that long transfers poll between chunks. The first signal only
// requests a stop; the second one exits immediately.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();
    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // False when the signal mask could not be installed
    bool isActive() const { return m_active; }
    const std::atomic_bool* flag() const { return &m_interrupted; }
    bool interrupted() const { return m_interrupted.load(); }

private:
    void watch();

    std::atomic_bool m_interrupted{false};
    std::atomic_bool m_stopping{false};
    std::thread m_watcher;
    sigset_t m_oldMask;
    bool m_active = false;
};

} // namespace qedl
