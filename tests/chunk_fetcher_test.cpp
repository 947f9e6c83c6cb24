#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

#include "test_support.hpp"
#include "transfer/chunk_fetcher.hpp"
#include "transfer/transfer_error.hpp"

using namespace std::chrono_literals;
using test_support::served_file;
using test_support::temp_dir;
using test_support::test_server;

namespace {
download_config make_config(const std::string& url, const std::string& output) {
    download_config config;
    config.url = url;
    config.output_path = output;
    config.retry_count = 2;
    config.retry_backoff = 10ms;
    return config;
}
} // namespace

class ChunkFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        file = std::make_shared<served_file>();
        file->data = test_support::make_payload(25);
        server = std::make_unique<test_server>(test_support::serve_bytes(file));
        config = make_config(server->url(), dir.file("out.bin"));
    }

    temp_dir dir;
    std::shared_ptr<served_file> file;
    std::unique_ptr<test_server> server;
    download_config config;
    cancellation_source cancel;
    null_logger log;
};

TEST_F(ChunkFetcherTest, WritesChunkAtItsOffset) {
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    fetcher.fetch(target, {1, 10, 19});

    std::string written = test_support::read_file(config.output_path);
    ASSERT_EQ(written.size(), 20u);
    EXPECT_EQ(written.substr(10), file->data.substr(10, 10));
    EXPECT_EQ(written.substr(0, 10), std::string(10, '\0'));
}

TEST_F(ChunkFetcherTest, RetriesTransientFailures) {
    std::atomic<int> failures{2};
    file->fail_with = [&](const http_request&) { return failures-- > 0 ? 500 : 0; };
    test_support::recording_logger recorder;
    chunk_fetcher fetcher(config, cancel, recorder);
    target_file target = target_file::open_for_chunks(config.output_path);

    fetcher.fetch(target, {0, 0, 9});

    EXPECT_EQ(file->get_requests.load(), 3);
    EXPECT_EQ(test_support::read_file(config.output_path), file->data.substr(0, 10));
    EXPECT_TRUE(recorder.contains("retrying chunk"));
}

TEST_F(ChunkFetcherTest, ExhaustedRetriesNameTheChunk) {
    file->fail_with = [](const http_request&) { return 503; };
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    try {
        fetcher.fetch(target, {2, 20, 24});
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_EQ(e.kind(), error_kind::retries_exhausted);
        EXPECT_NE(std::string(e.what()).find("failed to download chunk 2"), std::string::npos);
    }
    EXPECT_EQ(file->get_requests.load(), config.retry_count + 1);
}

TEST_F(ChunkFetcherTest, FullBodyResponseIsRejected) {
    file->honour_ranges = false;
    config.retry_count = 0;
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    try {
        fetcher.fetch_once(target, {1, 10, 19});
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_EQ(e.kind(), error_kind::transient);
        EXPECT_NE(std::string(e.what()).find("status code: 200"), std::string::npos);
    }
    EXPECT_EQ(target.size(), 0u);
}

TEST_F(ChunkFetcherTest, CancelledBeforeStart) {
    cancel.cancel();
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    try {
        fetcher.fetch(target, {0, 0, 9});
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_TRUE(e.cancelled());
    }
    EXPECT_EQ(file->get_requests.load(), 0);
}

TEST_F(ChunkFetcherTest, BytesPastChunkEndAreDropped) {
    file->extra_bytes = 5;
    std::string existing = file->data;
    existing.replace(10, 10, std::string(10, '\0'));
    test_support::write_file(config.output_path, existing);
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    fetcher.fetch(target, {1, 10, 19});

    std::string written = test_support::read_file(config.output_path);
    EXPECT_EQ(written, file->data);
    EXPECT_EQ(written.find(test_support::FILLER_BYTE), std::string::npos);
    EXPECT_EQ(file->get_requests.load(), 1);
}

TEST_F(ChunkFetcherTest, ShortBodyIsTransient) {
    file->truncate_to = [](const http_request&) { return std::size_t{4}; };
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    try {
        fetcher.fetch_once(target, {1, 10, 19});
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_EQ(e.kind(), error_kind::transient);
        EXPECT_NE(std::string(e.what()).find("got 4 of 10 bytes"), std::string::npos)
            << e.what();
    }
}

TEST_F(ChunkFetcherTest, ShortBodyIsRetried) {
    std::atomic<int> short_responses{1};
    file->truncate_to = [&](const http_request&) {
        return short_responses-- > 0 ? std::size_t{3} : std::string::npos;
    };
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    fetcher.fetch(target, {0, 0, 9});

    EXPECT_EQ(file->get_requests.load(), 2);
    EXPECT_EQ(test_support::read_file(config.output_path), file->data.substr(0, 10));
}

TEST_F(ChunkFetcherTest, CancelledDuringTransfer) {
    file->trickle = 100ms;
    chunk_fetcher fetcher(config, cancel, log);
    target_file target = target_file::open_for_chunks(config.output_path);

    std::thread canceller([this] {
        std::this_thread::sleep_for(150ms);
        cancel.cancel();
    });
    try {
        fetcher.fetch(target, {0, 0, 9});
        ADD_FAILURE() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_TRUE(e.cancelled()) << e.what();
    }
    canceller.join();

    EXPECT_EQ(file->get_requests.load(), 1);
    EXPECT_LT(target.size(), 10u);
}
