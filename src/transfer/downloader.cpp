#include "transfer/downloader.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>

#include "net/http.hpp"
#include "transfer/retry_policy.hpp"
#include "transfer/transfer_error.hpp"

namespace {
std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(), ::tolower);
    return r;
}

bool parse_content_length(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), ::isdigit)) {
        return false;
    }
    try {
        out = static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
} // namespace

downloader::downloader(download_config config, const cancellation_source& cancel, logger& log)
    : m_config(std::move(config)), m_cancel(cancel), m_log(log),
      m_ledger(m_config.ledger_path()), m_fetcher(m_config, m_cancel, m_log),
      m_multipart(m_config, m_fetcher, m_ledger, m_cancel, m_log) {
    m_config.validate();
}

void downloader::download() {
    file_info info = probe();
    m_log.info("downloader", "file information",
               {{"size", info.size}, {"supports_range", info.supports_ranges}});

    std::uint64_t existing = existing_file_size(m_config.output_path);
    // A pending ledger means holes inside a file that may already be full length
    if (existing == info.size && !m_ledger.exists()) {
        m_log.info("downloader", "file already completely downloaded",
                   {{"path", m_config.output_path}});
        return;
    }

    if (info.supports_ranges && m_config.enable_resume) {
        m_log.info("downloader", "starting resume download");
        download_with_resume(info.size);
        return;
    }

    m_log.info("downloader", "starting whole file download");
    basic_download();
}

downloader::file_info downloader::probe() {
    if (m_cancel.is_cancelled()) {
        throw transfer_error(error_kind::cancelled, "probe cancelled");
    }

    http_client client;
    client.set_user_agent(m_config.user_agent);
    client.set_connect_timeout(m_config.connect_timeout_seconds);
    client.set_stall_timeout(m_config.stall_timeout_seconds);
    client.set_abort_check([this] { return m_cancel.is_cancelled(); });

    http_client::request req(m_config.url);
    auto head = client.head(req);
    if (head.aborted_by_check) {
        throw transfer_error(error_kind::cancelled, "probe cancelled");
    }
    if (!head.transport_ok()) {
        throw transfer_error(error_kind::probe_failed,
                             "failed to get file information: " + head.error);
    }
    if (head.status_code != 200) {
        throw transfer_error(error_kind::probe_failed,
                             "server returned error status: " + std::to_string(head.status_code));
    }

    std::string content_length = head.header("Content-Length");
    std::uint64_t size = 0;
    if (!parse_content_length(content_length, size)) {
        throw transfer_error(error_kind::probe_failed,
                             "unable to parse file size: '" + content_length + "'");
    }
    m_file_size.store(size);

    if (to_lower_copy(head.header("Accept-Ranges")) == "bytes") {
        return {size, true};
    }

    // No advertisement: ask for the first byte and look for 206
    http_client::request range_req(m_config.url);
    range_req.headers["Range"] = "bytes=0-0";
    auto probe_resp =
        client.stream(range_req, [](int, const char*, std::size_t) { return false; });
    if (probe_resp.aborted_by_check) {
        throw transfer_error(error_kind::cancelled, "probe cancelled");
    }
    if (probe_resp.status_code == 0) {
        throw transfer_error(error_kind::probe_failed, "Range request failed: " + probe_resp.error);
    }
    return {size, probe_resp.status_code == 206};
}

void downloader::download_with_resume(std::uint64_t total_size) {
    target_file file = target_file::open_for_chunks(m_config.output_path);

    std::vector<chunk> failed = m_ledger.load();
    if (!failed.empty()) {
        m_log.info("downloader", "replaying failed chunks",
                   {{"chunks", failed.size()}, {"ledger", m_ledger.path()}});
        download_sequentially(file, failed, true);
    }

    std::uint64_t current = file.size();
    if (current >= total_size) {
        return;
    }

    std::vector<chunk> chunks = plan_chunks(current, total_size, m_config);
    m_log.info("downloader", "Starting resume download",
               {{"chunks", chunks.size()},
                {"concurrent", m_config.max_concurrency},
                {"downloaded", current},
                {"remaining", total_size - current}});

    if (m_config.max_concurrency < 2) {
        download_sequentially(file, chunks);
    } else {
        download_concurrently(file, chunks);
    }
}

void downloader::download_sequentially(target_file& file, const std::vector<chunk>& chunks,
                                       bool keep_untried) {
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        try {
            m_fetcher.fetch(file, chunks[i]);
        } catch (const transfer_error& e) {
            std::vector<chunk> pending{chunks[i]};
            if (keep_untried) {
                pending.insert(pending.end(), chunks.begin() + static_cast<std::ptrdiff_t>(i + 1),
                               chunks.end());
            }
            try {
                m_ledger.save(pending);
            } catch (const transfer_error& save_error) {
                m_log.error("downloader", "failed to save failed chunks",
                            {{"path", m_ledger.path()}, {"error", save_error.what()}});
                // The chunk error stays the primary one; the save failure rides along
                throw transfer_error(e.kind(), std::string(e.what()) +
                                                   "; additionally failed to save failed "
                                                   "chunks record: " +
                                                   save_error.what());
            }
            throw;
        }
    }
    m_ledger.clear();
}

void downloader::download_concurrently(target_file& file, const std::vector<chunk>& chunks) {
    m_multipart.download(file, chunks);
}

std::size_t downloader::basic_buffer_size() const {
    constexpr std::uint64_t MIN_BUFFER = 64 * 1024;
    constexpr std::uint64_t MAX_BUFFER = 2 * 1024 * 1024;
    return static_cast<std::size_t>(std::clamp(m_config.chunk_size, MIN_BUFFER, MAX_BUFFER));
}

void downloader::basic_download() {
    int retries = m_config.retry_count;
    auto on_retry = [&](int retry, const transfer_error& error, std::chrono::milliseconds delay) {
        m_log.info("downloader",
                   "Retry attempt " + std::to_string(retry) + "/" + std::to_string(retries),
                   {{"error", error.what()}, {"delay_ms", static_cast<long long>(delay.count())}});
    };

    try {
        run_with_retry(m_config.retry(), m_cancel, [this] { perform_basic_download(); }, on_retry);
    } catch (const transfer_error& e) {
        if (e.kind() != error_kind::transient) {
            throw;
        }
        throw transfer_error(error_kind::retries_exhausted,
                             "download failed after " + std::to_string(retries + 1) +
                                 " attempts: " + e.what());
    }
    m_ledger.clear();
}

void downloader::perform_basic_download() {
    http_client client;
    client.set_user_agent(m_config.user_agent);
    client.set_connect_timeout(m_config.connect_timeout_seconds);
    client.set_stall_timeout(m_config.stall_timeout_seconds);
    client.set_abort_check([this] { return m_cancel.is_cancelled(); });

    std::vector<char> buffer(basic_buffer_size());
    std::ofstream out;
    out.rdbuf()->pubsetbuf(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::uint64_t written = 0;
    std::exception_ptr file_error;

    // Opened on the first byte of a 200 so a failed request never truncates
    auto open_output = [&] {
        ensure_parent_directory(m_config.output_path);
        out.open(m_config.output_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw transfer_error(error_kind::filesystem,
                                 "failed to create file " + m_config.output_path);
        }
    };

    http_client::request req(m_config.url);
    auto resp = client.stream(req, [&](int status_code, const char* data, std::size_t size) {
        if (status_code != 200) {
            return false;
        }
        try {
            if (!out.is_open()) {
                open_output();
            }
            out.write(data, static_cast<std::streamsize>(size));
            if (!out.good()) {
                throw transfer_error(error_kind::filesystem,
                                     "failed to write file " + m_config.output_path);
            }
        } catch (const transfer_error&) {
            file_error = std::current_exception();
            return false;
        }
        written += size;
        return true;
    });

    if (file_error) {
        std::rethrow_exception(file_error);
    }
    if (resp.aborted_by_check || m_cancel.is_cancelled()) {
        throw transfer_error(error_kind::cancelled, "download cancelled");
    }
    if (resp.status_code != 0 && resp.status_code != 200) {
        throw transfer_error(error_kind::transient,
                             "download failed, status code: " + std::to_string(resp.status_code));
    }
    if (!resp.transport_ok()) {
        throw transfer_error(error_kind::transient, "request failed: " + resp.error);
    }

    if (!out.is_open()) {
        open_output(); // empty body
    }
    out.close();
    if (out.fail()) {
        throw transfer_error(error_kind::filesystem,
                             "failed to flush file " + m_config.output_path);
    }
    m_log.info("downloader",
               "Download completed: " + std::to_string(written) + " bytes written");
}

double downloader::get_progress() {
    std::uint64_t total = m_file_size.load();
    if (total == 0) {
        total = probe().size;
        if (total == 0) {
            return 0.0;
        }
    }
    std::uint64_t current = existing_file_size(m_config.output_path);
    return static_cast<double>(current) / static_cast<double>(total) * 100.0;
}
