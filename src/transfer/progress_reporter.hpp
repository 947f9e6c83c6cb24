#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <thread>

#include "util/cancellation.hpp"

// "[█████░░░░░] 42.0%" with `width` cells; percent is clamped to [0, 100].
std::string render_progress_bar(double percent, int width = 50);

// Samples a percentage on its own thread and redraws one console line:
//   \rDownload progress: [█████░░░░░] 42.0%
// The first sample is taken one interval after start(). A sampler that throws
// a transfer_error skips that tick.
class progress_reporter {
public:
    using sampler = std::function<double()>;

    progress_reporter(sampler sample, std::ostream& out, const cancellation_source& cancel,
                      std::chrono::milliseconds interval = std::chrono::seconds(1));
    ~progress_reporter();

    progress_reporter(const progress_reporter&) = delete;
    progress_reporter& operator=(const progress_reporter&) = delete;

    void start();
    void stop();

    // Renders one line without waiting; returns false if the sampler failed.
    bool report_once();

private:
    void run();

    sampler m_sample;
    std::ostream& m_out;
    const cancellation_source& m_cancel;
    std::chrono::milliseconds m_interval;
    cancellation_source m_stop;
    std::thread m_thread;
};
