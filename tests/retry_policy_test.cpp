#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "transfer/retry_policy.hpp"

using namespace std::chrono_literals;

TEST(RetryPolicyTest, LinearBackoff) {
    retry_policy policy(3, 1000ms);
    EXPECT_EQ(policy.max_attempts(), 4);
    EXPECT_EQ(policy.backoff(1), 1000ms);
    EXPECT_EQ(policy.backoff(2), 2000ms);
    EXPECT_EQ(policy.backoff(3), 3000ms);
}

TEST(RetryPolicyTest, SucceedsAfterTransientFailures) {
    cancellation_source cancel;
    int calls = 0;
    std::vector<int> observed;
    int result = run_with_retry(
        retry_policy(3, 1ms), cancel,
        [&] {
            if (++calls < 3) {
                throw transfer_error(error_kind::transient, "flaky");
            }
            return 42;
        },
        [&](int retry, const transfer_error&, std::chrono::milliseconds delay) {
            observed.push_back(retry);
            EXPECT_EQ(delay, std::chrono::milliseconds(retry));
        });
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(observed, (std::vector<int>{1, 2}));
}

TEST(RetryPolicyTest, RethrowsLastErrorWhenExhausted) {
    cancellation_source cancel;
    int calls = 0;
    try {
        run_with_retry(retry_policy(2, 1ms), cancel, [&] {
            ++calls;
            throw transfer_error(error_kind::transient, "attempt " + std::to_string(calls));
        });
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_EQ(e.kind(), error_kind::transient);
        EXPECT_STREQ(e.what(), "attempt 3");
    }
    EXPECT_EQ(calls, 3);
}

TEST(RetryPolicyTest, DoesNotRetryFilesystemErrors) {
    cancellation_source cancel;
    int calls = 0;
    EXPECT_THROW(run_with_retry(retry_policy(5, 1ms), cancel,
                                [&] {
                                    ++calls;
                                    throw transfer_error(error_kind::filesystem, "disk full");
                                }),
                 transfer_error);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, ZeroRetriesRunsOnce) {
    cancellation_source cancel;
    int calls = 0;
    EXPECT_THROW(run_with_retry(retry_policy(0, 1ms), cancel,
                                [&] {
                                    ++calls;
                                    throw transfer_error(error_kind::transient, "down");
                                }),
                 transfer_error);
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, CancellationInterruptsBackoff) {
    cancellation_source cancel;
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        cancel.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    try {
        run_with_retry(retry_policy(3, 10s), cancel,
                       [] { throw transfer_error(error_kind::transient, "down"); });
        FAIL() << "expected transfer_error";
    } catch (const transfer_error& e) {
        EXPECT_TRUE(e.cancelled());
    }
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(RetryPolicyTest, CancelledBeforeFirstAttempt) {
    cancellation_source cancel;
    cancel.cancel();
    int calls = 0;
    EXPECT_THROW(run_with_retry(retry_policy(3, 1ms), cancel, [&] { ++calls; }), transfer_error);
    EXPECT_EQ(calls, 0);
}
