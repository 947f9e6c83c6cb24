#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "transfer/chunk.hpp"
#include "transfer/chunk_fetcher.hpp"
#include "transfer/download_config.hpp"
#include "transfer/failure_ledger.hpp"
#include "transfer/multipart_transfer.hpp"
#include "transfer/target_file.hpp"
#include "util/cancellation.hpp"
#include "util/logger.hpp"

// Top-level download policy for one invocation.
//
//   probe -> already complete? -> ranges && resume ? chunked : basic
//   chunked: replay failure ledger (sequentially), re-measure the file,
//            plan [current size, total) and download it sequentially
//            (max_concurrency < 2) or through multipart_transfer.
//
// "Already downloaded" is inferred from the on-disk length. A gap left by an
// out-of-order concurrent pass that was killed before it could write the
// ledger is not detected.
class downloader {
public:
    struct file_info {
        std::uint64_t size;
        bool supports_ranges;
    };

    downloader(download_config config, const cancellation_source& cancel, logger& log);

    downloader(const downloader&) = delete;
    downloader& operator=(const downloader&) = delete;

    // Throws transfer_error; see error_kind for the taxonomy.
    void download();

    // HEAD for size and Accept-Ranges, then a bytes=0-0 probe when the header
    // does not advertise byte ranges. Throws transfer_error(probe_failed).
    file_info probe();

    void download_with_resume(std::uint64_t total_size);

    // Stops at the first chunk that fails and records it in the ledger. With
    // `keep_untried` the chunks after it are recorded as well.
    void download_sequentially(target_file& file, const std::vector<chunk>& chunks,
                               bool keep_untried = false);
    void download_concurrently(target_file& file, const std::vector<chunk>& chunks);

    // Whole-file GET into a truncated output, retried as a whole.
    void basic_download();

    // Percent of the total size present on disk; probes the total when unknown.
    double get_progress();

    std::uint64_t file_size() const {
        return m_file_size.load();
    }
    const download_config& config() const {
        return m_config;
    }
    const failure_ledger& ledger() const {
        return m_ledger;
    }

private:
    void perform_basic_download();
    std::size_t basic_buffer_size() const;

    download_config m_config;
    const cancellation_source& m_cancel;
    logger& m_log;
    failure_ledger m_ledger;
    chunk_fetcher m_fetcher;
    multipart_transfer m_multipart;
    std::atomic<std::uint64_t> m_file_size{0};
};
