#pragma once

#include <chrono>
#include <functional>
#include <type_traits>

#include "transfer/transfer_error.hpp"
#include "util/cancellation.hpp"

struct retry_policy {
    int max_retries;                          // attempts after the first one
    std::chrono::milliseconds backoff_unit;   // delay before retry n is n * unit

    retry_policy() : max_retries(3), backoff_unit(1000) {}
    retry_policy(int retries, std::chrono::milliseconds unit)
        : max_retries(retries), backoff_unit(unit) {}

    int max_attempts() const {
        return max_retries + 1;
    }

    // `retry` counts from 1
    std::chrono::milliseconds backoff(int retry) const {
        return backoff_unit * retry;
    }
};

using retry_observer =
    std::function<void(int retry, const transfer_error& error, std::chrono::milliseconds delay)>;

// Runs `operation` until it returns, retrying only on retryable transfer
// errors. Waits between attempts on `cancel`; a cancellation during the wait
// or before an attempt throws a cancelled transfer_error. When retries run
// out the last error is rethrown unchanged.
template <typename OperationT>
std::invoke_result_t<OperationT&> run_with_retry(const retry_policy& policy,
                                                 const cancellation_source& cancel,
                                                 OperationT&& operation,
                                                 const retry_observer& on_retry = nullptr) {
    for (int attempt = 0;; ++attempt) {
        if (cancel.is_cancelled()) {
            throw transfer_error(error_kind::cancelled, "operation cancelled");
        }
        try {
            return operation();
        } catch (const transfer_error& e) {
            if (!e.retryable() || attempt >= policy.max_retries) {
                throw;
            }
            auto delay = policy.backoff(attempt + 1);
            if (on_retry) {
                on_retry(attempt + 1, e, delay);
            }
            if (cancel.wait_for(delay)) {
                throw transfer_error(error_kind::cancelled, "cancelled while waiting to retry");
            }
        }
    }
}
