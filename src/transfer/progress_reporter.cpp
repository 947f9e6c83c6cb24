#include "transfer/progress_reporter.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>


std::string render_progress_bar(double percent, int width) {
    percent = std::clamp(percent, 0.0, 100.0);
    int filled = static_cast<int>(percent * width / 100.0);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    char pct[16];
    std::snprintf(pct, sizeof(pct), "] %.1f%%", percent);
    bar += pct;
    return bar;
}

progress_reporter::progress_reporter(sampler sample, std::ostream& out,
                                     const cancellation_source& cancel,
                                     std::chrono::milliseconds interval)
    : m_sample(std::move(sample)), m_out(out), m_cancel(cancel), m_interval(interval) {}

progress_reporter::~progress_reporter() {
    stop();
}

void progress_reporter::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_thread = std::thread([this] { run(); });
}

void progress_reporter::stop() {
    m_stop.cancel();
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool progress_reporter::report_once() {
    double percent = 0.0;
    try {
        percent = m_sample();
    } catch (const std::exception&) {
        // A failed sample skips this tick; the download reports its own errors
        return false;
    }
    m_out << "\rDownload progress: " << render_progress_bar(percent) << std::flush;
    return true;
}

void progress_reporter::run() {
    while (!m_cancel.is_cancelled()) {
        if (m_stop.wait_for(m_interval) || m_cancel.is_cancelled()) {
            return;
        }
        report_once();
    }
}
