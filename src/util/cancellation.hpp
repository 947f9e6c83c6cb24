#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// A single cancellation signal shared by every fetch, retry wait and poller of
// one download. cancel() may be called from any thread.
class cancellation_source {
public:
    cancellation_source() = default;

    cancellation_source(const cancellation_source&) = delete;
    cancellation_source& operator=(const cancellation_source&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled.store(true, std::memory_order_relaxed);
        }
        m_cv.notify_all();
    }

    bool is_cancelled() const {
        return m_cancelled.load(std::memory_order_relaxed);
    }

    // Sleeps for `duration` unless cancelled first. Returns true if cancelled.
    template <typename RepT, typename PeriodT>
    bool wait_for(const std::chrono::duration<RepT, PeriodT>& duration) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, duration,
                      [this] { return m_cancelled.load(std::memory_order_relaxed); });
        return m_cancelled.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};
