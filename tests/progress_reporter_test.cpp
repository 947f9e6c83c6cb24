#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "transfer/progress_reporter.hpp"
#include "transfer/transfer_error.hpp"

using namespace std::chrono_literals;

namespace {
std::size_t count_of(const std::string& text, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}
} // namespace

TEST(ProgressBarTest, RendersFiftyCells) {
    std::string bar = render_progress_bar(42.0);
    EXPECT_EQ(count_of(bar, "█"), 21u);
    EXPECT_EQ(count_of(bar, "░"), 29u);
    EXPECT_NE(bar.find("] 42.0%"), std::string::npos);
    EXPECT_EQ(bar.front(), '[');
}

TEST(ProgressBarTest, ClampsPercent) {
    EXPECT_EQ(count_of(render_progress_bar(-5.0), "░"), 50u);
    std::string full = render_progress_bar(250.0);
    EXPECT_EQ(count_of(full, "█"), 50u);
    EXPECT_NE(full.find("100.0%"), std::string::npos);
}

TEST(ProgressReporterTest, ReportOnceWritesOneLine) {
    std::ostringstream out;
    cancellation_source cancel;
    progress_reporter reporter([] { return 50.0; }, out, cancel);

    EXPECT_TRUE(reporter.report_once());
    EXPECT_EQ(out.str().rfind("\rDownload progress: [", 0), 0u);
    EXPECT_NE(out.str().find("50.0%"), std::string::npos);
}

TEST(ProgressReporterTest, SamplerErrorSkipsTick) {
    std::ostringstream out;
    cancellation_source cancel;
    progress_reporter reporter(
        []() -> double { throw transfer_error(error_kind::probe_failed, "offline"); }, out,
        cancel);

    EXPECT_FALSE(reporter.report_once());
    EXPECT_TRUE(out.str().empty());
}

TEST(ProgressReporterTest, NonTransferErrorOnSamplerThreadSkipsTick) {
    std::ostringstream out;
    cancellation_source cancel;
    std::atomic<int> samples{0};
    progress_reporter reporter(
        [&samples]() -> double {
            ++samples;
            throw std::runtime_error("Failed to initialize curl handle");
        },
        out, cancel, 10ms);

    EXPECT_FALSE(reporter.report_once());
    reporter.start();
    std::this_thread::sleep_for(60ms);
    reporter.stop();

    EXPECT_GE(samples.load(), 2);
    EXPECT_TRUE(out.str().empty());
}

TEST(ProgressReporterTest, TicksUntilStopped) {
    std::ostringstream out;
    cancellation_source cancel;
    std::atomic<int> samples{0};
    progress_reporter reporter(
        [&samples] {
            ++samples;
            return 10.0;
        },
        out, cancel, 10ms);

    reporter.start();
    std::this_thread::sleep_for(100ms);
    reporter.stop();
    int after_stop = samples.load();
    EXPECT_GE(after_stop, 2);

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(samples.load(), after_stop);
}

TEST(ProgressReporterTest, CancellationEndsLoop) {
    std::ostringstream out;
    cancellation_source cancel;
    progress_reporter reporter([] { return 1.0; }, out, cancel, 10s);

    reporter.start();
    auto start = std::chrono::steady_clock::now();
    cancel.cancel();
    reporter.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(out.str().empty());
}
