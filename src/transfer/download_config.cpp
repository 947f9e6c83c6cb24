#include "transfer/download_config.hpp"

#include <stdexcept>

#include "net/http.hpp"
#include "transfer/chunk.hpp"

download_config::download_config()
    : chunk_size(1024ULL * 1024ULL), max_concurrency(1), retry_count(3), enable_resume(true),
      auto_chunk(false), retry_backoff(1000), connect_timeout_seconds(5),
      stall_timeout_seconds(10), user_agent(EZFT_USER_AGENT) {}

std::string download_config::ledger_path() const {
    if (!failed_chunks_path.empty()) {
        return failed_chunks_path;
    }
    return output_path + FAILED_CHUNKS_SUFFIX;
}

std::uint64_t download_config::effective_chunk_size(std::uint64_t total_size) const {
    return auto_chunk ? calculate_chunk_size(total_size) : chunk_size;
}

retry_policy download_config::retry() const {
    return retry_policy(retry_count, retry_backoff);
}

void download_config::validate() const {
    if (url.empty()) {
        throw std::invalid_argument("download url must not be empty");
    }
    if (output_path.empty()) {
        throw std::invalid_argument("output path must not be empty");
    }
    if (max_concurrency < 1) {
        throw std::invalid_argument("max concurrency must be at least 1");
    }
    if (!auto_chunk && chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than 0");
    }
    if (retry_count < 0) {
        throw std::invalid_argument("retry count must not be negative");
    }
}
