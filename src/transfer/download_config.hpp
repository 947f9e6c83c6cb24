#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "transfer/retry_policy.hpp"

constexpr const char* FAILED_CHUNKS_SUFFIX = ".failed_chunks.json";

struct download_config {
    std::string url;
    std::string output_path;
    std::string failed_chunks_path; // empty: output_path + FAILED_CHUNKS_SUFFIX
    std::uint64_t chunk_size;       // ignored when auto_chunk is set
    int max_concurrency;            // < 2 downloads chunks one at a time
    int retry_count;                // retries per chunk after the first attempt
    bool enable_resume;
    bool auto_chunk;
    std::chrono::milliseconds retry_backoff;
    long connect_timeout_seconds;
    long stall_timeout_seconds;
    std::string user_agent;

    download_config();

    std::string ledger_path() const;
    std::uint64_t effective_chunk_size(std::uint64_t total_size) const;
    retry_policy retry() const;

    // Throws std::invalid_argument on the first violated constraint.
    void validate() const;
};
