#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

class counting_semaphore {
public:
    explicit counting_semaphore(std::size_t count) : m_count(count) {}

    counting_semaphore(const counting_semaphore&) = delete;
    counting_semaphore& operator=(const counting_semaphore&) = delete;

    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_count > 0; });
        --m_count;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_count;
        }
        m_cv.notify_one();
    }

private:
    std::size_t m_count;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};
