#include "transfer/multipart_transfer.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>

#include "transfer/transfer_error.hpp"
#include "util/defer.hpp"
#include "util/semaphore.hpp"

namespace {
// Collects terminal chunk failures from all workers.
class failure_collector {
public:
    void record(const chunk& c, const transfer_error& error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failed.push_back(c);
        if (error.cancelled()) {
            m_cancelled = true;
        }
        if (!m_first_error) {
            m_first_error = std::make_exception_ptr(error);
        }
    }

    // Only called after every worker has been joined
    std::vector<chunk>& failed() {
        return m_failed;
    }
    bool cancelled() const {
        return m_cancelled;
    }
    std::exception_ptr first_error() const {
        return m_first_error;
    }

private:
    std::mutex m_mutex;
    std::vector<chunk> m_failed;
    bool m_cancelled = false;
    std::exception_ptr m_first_error;
};
} // namespace

multipart_transfer::multipart_transfer(const download_config& config,
                                       const chunk_fetcher& fetcher,
                                       const failure_ledger& ledger,
                                       const cancellation_source& cancel, logger& log)
    : m_config(config), m_fetcher(fetcher), m_ledger(ledger), m_cancel(cancel), m_log(log) {}

void multipart_transfer::download(target_file& file, const std::vector<chunk>& chunks) {
    if (chunks.empty()) {
        return;
    }

    std::size_t slots_total = static_cast<std::size_t>(std::max(1, m_config.max_concurrency));
    m_log.debug("multipart_transfer", "dispatching chunks",
                {{"chunks", chunks.size()}, {"max_concurrency", slots_total}});

    counting_semaphore slots(slots_total);
    failure_collector failures;
    std::vector<std::future<void>> in_flight;
    in_flight.reserve(chunks.size());

    for (const auto& c : chunks) {
        slots.acquire();
        if (m_cancel.is_cancelled()) {
            slots.release();
            failures.record(c, transfer_error(error_kind::cancelled,
                                              "download of chunk " + std::to_string(c.index) +
                                                  " cancelled before dispatch"));
            continue;
        }

        in_flight.emplace_back(std::async(std::launch::async, [&, c]() {
            DEFER(slots.release(););
            try {
                m_fetcher.fetch(file, c);
            } catch (const transfer_error& e) {
                m_log.error("multipart_transfer", "chunk failed",
                            {{"index", c.index},
                             {"start", c.start},
                             {"end", c.end},
                             {"kind", to_string(e.kind())},
                             {"error", e.what()}});
                failures.record(c, e);
            } catch (const std::exception& e) {
                failures.record(c, transfer_error(error_kind::retries_exhausted,
                                                  "failed to download chunk " +
                                                      std::to_string(c.index) + ": " + e.what()));
            }
        }));
    }

    for (auto& fut : in_flight) {
        fut.get();
    }

    auto& failed = failures.failed();
    if (failed.empty()) {
        m_ledger.clear();
        m_log.debug("multipart_transfer", "all chunks completed", {{"chunks", chunks.size()}});
        return;
    }

    std::sort(failed.begin(), failed.end(),
              [](const chunk& a, const chunk& b) { return a.start < b.start; });
    m_log.warn("multipart_transfer", "chunks failed",
               {{"failed", failed.size()}, {"total", chunks.size()}});

    std::string save_failure;
    try {
        m_ledger.save(failed);
    } catch (const transfer_error& e) {
        save_failure = e.what();
        m_log.error("multipart_transfer", "failed to save failed chunks record",
                    {{"path", m_ledger.path()}, {"error", e.what()}});
    }

    if (failures.cancelled()) {
        std::string message = "download cancelled";
        if (!save_failure.empty()) {
            message += "; additionally failed to save failed chunks record: " + save_failure;
        }
        throw transfer_error(error_kind::cancelled, message);
    }

    if (save_failure.empty()) {
        std::rethrow_exception(failures.first_error());
    }
    try {
        std::rethrow_exception(failures.first_error());
    } catch (const transfer_error& e) {
        throw transfer_error(e.kind(), std::string(e.what()) +
                                           "; additionally failed to save failed chunks record: " +
                                           save_failure);
    }
}
