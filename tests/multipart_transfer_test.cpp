#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <random>
#include <thread>

#include "test_support.hpp"
#include "transfer/multipart_transfer.hpp"
#include "transfer/transfer_error.hpp"

using namespace std::chrono_literals;
using test_support::served_file;
using test_support::temp_dir;
using test_support::test_server;

class MultipartTransferTest : public ::testing::Test {
protected:
    void start(std::size_t size) {
        file = std::make_shared<served_file>();
        file->data = test_support::make_payload(size);
        server = std::make_unique<test_server>(test_support::serve_bytes(file));
        config.url = server->url();
        config.output_path = dir.file("out.bin");
        config.retry_count = 1;
        config.retry_backoff = 5ms;
        config.max_concurrency = 3;
    }

    void run(const std::vector<chunk>& chunks) {
        failure_ledger ledger(config.ledger_path());
        chunk_fetcher fetcher(config, cancel, log);
        multipart_transfer transfer(config, fetcher, ledger, cancel, log);
        target_file target = target_file::open_for_chunks(config.output_path);
        transfer.download(target, chunks);
    }

    temp_dir dir;
    std::shared_ptr<served_file> file;
    std::unique_ptr<test_server> server;
    download_config config;
    cancellation_source cancel;
    null_logger log;
};

TEST_F(MultipartTransferTest, AssemblesFileFromChunks) {
    start(1000);
    run(plan_chunks(0, 1000, 64));
    EXPECT_EQ(test_support::read_file(config.output_path), file->data);
    EXPECT_FALSE(failure_ledger(config.ledger_path()).exists());
}

TEST_F(MultipartTransferTest, NeverExceedsConcurrencyLimit) {
    start(400);
    file->delay = 30ms;
    run(plan_chunks(0, 400, 40));
    EXPECT_EQ(file->get_requests.load(), 10);
    EXPECT_LE(file->max_in_flight.load(), config.max_concurrency);
    EXPECT_GE(file->max_in_flight.load(), 2);
}

TEST_F(MultipartTransferTest, OutOfOrderCompletionKeepsOffsets) {
    start(600);
    config.max_concurrency = 6;
    auto rng = std::make_shared<std::mutex>();
    auto engine = std::make_shared<std::mt19937>(7);
    file->fail_with = [rng, engine](const http_request&) {
        int pause = 0;
        {
            std::lock_guard<std::mutex> lock(*rng);
            pause = static_cast<int>((*engine)() % 40);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(pause));
        return 0;
    };
    run(plan_chunks(0, 600, 50));
    EXPECT_EQ(test_support::read_file(config.output_path), file->data);
}

TEST_F(MultipartTransferTest, FailedChunksGoToLedgerAndOthersComplete) {
    start(25);
    config.retry_count = 0;
    file->fail_with = [](const http_request& req) {
        return req.header("Range") == "bytes=10-19" ? 500 : 0;
    };

    try {
        run(plan_chunks(0, 25, 10));
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_EQ(e.kind(), error_kind::retries_exhausted);
    }

    failure_ledger ledger(config.ledger_path());
    EXPECT_EQ(ledger.load(), (std::vector<chunk>{{1, 10, 19}}));
    std::string written = test_support::read_file(config.output_path);
    ASSERT_EQ(written.size(), 25u);
    EXPECT_EQ(written.substr(0, 10), file->data.substr(0, 10));
    EXPECT_EQ(written.substr(20), file->data.substr(20));
}

TEST_F(MultipartTransferTest, EmptyListDoesNothing) {
    start(25);
    failure_ledger ledger(config.ledger_path());
    ledger.save({{0, 0, 9}});
    run({});
    EXPECT_EQ(file->get_requests.load(), 0);
    EXPECT_TRUE(ledger.exists());
}

TEST_F(MultipartTransferTest, CancellationRecordsUndispatchedChunks) {
    start(100);
    config.max_concurrency = 2;
    file->delay = 50ms;
    std::thread canceller([this] {
        std::this_thread::sleep_for(20ms);
        cancel.cancel();
    });

    try {
        run(plan_chunks(0, 100, 10));
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_TRUE(e.cancelled());
    }
    canceller.join();

    auto pending = failure_ledger(config.ledger_path()).load();
    EXPECT_FALSE(pending.empty());
    EXPECT_EQ(pending.back().end, 99u);
}
