#include "interrupt_guard.h"
#include "logger.h"

#include <pthread.h>
#include <unistd.h>
#include <cstdlib>

static const QString TAG = QStringLiteral("Interrupt");

namespace qedl {

static sigset_t terminationSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGHUP);
    return set;
}

InterruptGuard::InterruptGuard()
{
    sigemptyset(&m_oldMask);
    const sigset_t set = terminationSignals();
    if (pthread_sigmask(SIG_BLOCK, &set, &m_oldMask) != 0) {
        LOG_WARNING_CAT(TAG, "Cannot block termination signals, Ctrl+C will abort mid-transfer");
        return;
    }
    m_active = true;
    m_watcher = std::thread(&InterruptGuard::watch, this);
}

InterruptGuard::~InterruptGuard()
{
    if (!m_active)
        return;

    m_stopping = true;
    // Wake the watcher; the signal is still blocked everywhere else
    pthread_kill(m_watcher.native_handle(), SIGTERM);
    m_watcher.join();
    pthread_sigmask(SIG_SETMASK, &m_oldMask, nullptr);
}

void InterruptGuard::watch()
{
    const sigset_t set = terminationSignals();
    for (;;) {
        int signo = 0;
        if (sigwait(&set, &signo) != 0)
            continue;
        if (m_stopping)
            return;

        if (m_interrupted.exchange(true)) {
            LOG_ERROR_CAT(TAG, "Second interrupt, exiting now");
            std::_Exit(130);
        }
        LOG_WARNING_CAT(TAG, QString("Signal %1 received, stopping after the current chunk").arg(signo));
    }
}

} // namespace qedl
