#include "transfer/chunk_fetcher.hpp"

#include <algorithm>
#include <exception>

#include "net/http.hpp"
#include "transfer/retry_policy.hpp"
#include "transfer/transfer_error.hpp"

namespace {
constexpr long STREAM_BUFFER_SIZE = 32 * 1024;
}

chunk_fetcher::chunk_fetcher(const download_config& config, const cancellation_source& cancel,
                             logger& log)
    : m_config(config), m_cancel(cancel), m_log(log) {}

void chunk_fetcher::fetch(target_file& file, const chunk& c) const {
    auto on_retry = [&](int retry, const transfer_error& error, std::chrono::milliseconds delay) {
        m_log.warn("chunk_fetcher", "retrying chunk",
                   {{"index", c.index},
                    {"range", std::to_string(c.start) + "-" + std::to_string(c.end)},
                    {"retry", retry},
                    {"delay_ms", static_cast<long long>(delay.count())},
                    {"error", error.what()}});
    };

    try {
        run_with_retry(m_config.retry(), m_cancel, [&] { fetch_once(file, c); }, on_retry);
    } catch (const transfer_error& e) {
        if (e.kind() != error_kind::transient) {
            throw;
        }
        throw transfer_error(error_kind::retries_exhausted,
                             "failed to download chunk " + std::to_string(c.index) + ": " +
                                 e.what());
    }
}

void chunk_fetcher::fetch_once(target_file& file, const chunk& c) const {
    http_client client;
    client.set_user_agent(m_config.user_agent);
    client.set_connect_timeout(m_config.connect_timeout_seconds);
    client.set_stall_timeout(m_config.stall_timeout_seconds);
    client.set_buffer_size(STREAM_BUFFER_SIZE);
    client.set_abort_check([this] { return m_cancel.is_cancelled(); });

    http_client::request req(m_config.url);
    req.headers["Range"] = "bytes=" + std::to_string(c.start) + "-" + std::to_string(c.end);

    std::uint64_t cursor = c.start;
    bool complete = false;
    std::exception_ptr write_error;

    auto resp = client.stream(req, [&](int status_code, const char* data, std::size_t size) {
        if (status_code != 206 || complete) {
            return false;
        }
        std::uint64_t remaining = c.end + 1 - cursor;
        std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining));
        try {
            file.write_at(cursor, data, n);
        } catch (const transfer_error&) {
            write_error = std::current_exception();
            return false;
        }
        cursor += n;
        complete = cursor > c.end;
        // Excess bytes past the chunk end are never written
        return n == size;
    });

    if (write_error) {
        std::rethrow_exception(write_error);
    }
    if (resp.aborted_by_check || m_cancel.is_cancelled()) {
        throw transfer_error(error_kind::cancelled,
                             "download of chunk " + std::to_string(c.index) + " cancelled");
    }
    if (!resp.transport_ok() && !(complete && resp.stopped_by_sink)) {
        if (resp.status_code != 0 && resp.status_code != 206) {
            throw transfer_error(error_kind::transient,
                                 "server does not support Range requests, status code: " +
                                     std::to_string(resp.status_code));
        }
        throw transfer_error(error_kind::transient, "request failed: " + resp.error);
    }
    if (resp.status_code != 206) {
        throw transfer_error(error_kind::transient,
                             "server does not support Range requests, status code: " +
                                 std::to_string(resp.status_code));
    }
    if (!complete) {
        throw transfer_error(error_kind::transient,
                             "short response body: got " + std::to_string(cursor - c.start) +
                                 " of " + std::to_string(c.length()) + " bytes");
    }
}
