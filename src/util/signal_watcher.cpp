#include "util/signal_watcher.hpp"

#include <cerrno>
#include <ctime>
#include <pthread.h>

namespace {
constexpr long POLL_INTERVAL_NS = 200L * 1000L * 1000L;

sigset_t make_set(std::initializer_list<int> signals) {
    sigset_t set;
    sigemptyset(&set);
    for (int signo : signals) {
        sigaddset(&set, signo);
    }
    return set;
}
} // namespace

bool signal_watcher::block_signals(std::initializer_list<int> signals) {
    sigset_t set = make_set(signals);
    return pthread_sigmask(SIG_BLOCK, &set, nullptr) == 0;
}

signal_watcher::signal_watcher(std::initializer_list<int> signals, callback on_signal)
    : m_set(make_set(signals)), m_on_signal(std::move(on_signal)) {
    if (m_on_signal) {
        m_running.store(true);
        m_thread = std::thread([this] { run(); });
    }
}

signal_watcher::~signal_watcher() {
    stop();
}

int signal_watcher::wait() {
    int signo = 0;
    if (sigwait(&m_set, &signo) != 0) {
        return -1;
    }
    return signo;
}

void signal_watcher::stop() {
    m_running.store(false);
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void signal_watcher::run() {
    timespec timeout{};
    timeout.tv_nsec = POLL_INTERVAL_NS;
    while (m_running.load()) {
        int signo = sigtimedwait(&m_set, nullptr, &timeout);
        if (signo > 0) {
            m_on_signal(signo);
        }
    }
}
