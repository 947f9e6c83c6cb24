#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

// Turns asynchronous signals into a callback on a dedicated thread.
// block_signals() must run on the main thread before any other thread is
// created so every thread inherits the mask and only the watcher sees them.
class signal_watcher {
public:
    using callback = std::function<void(int signo)>;

    static bool block_signals(std::initializer_list<int> signals);

    signal_watcher(std::initializer_list<int> signals, callback on_signal);
    ~signal_watcher();

    signal_watcher(const signal_watcher&) = delete;
    signal_watcher& operator=(const signal_watcher&) = delete;

    // Blocks the calling thread until one of the signals arrives; -1 on error.
    int wait();
    void stop();

private:
    void run();

    sigset_t m_set;
    callback m_on_signal;
    std::atomic<bool> m_running{false};
    std::thread m_thread;
};
