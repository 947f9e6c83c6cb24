#pragma once

#include <cstdint>
#include <vector>

struct download_config;

// A contiguous byte range [start, end] (both inclusive) of the remote resource.
// `index` orders chunks within one plan and never decides file placement.
struct chunk {
    std::uint64_t index;
    std::uint64_t start;
    std::uint64_t end;

    std::uint64_t length() const {
        return end - start + 1;
    }

    bool operator==(const chunk& other) const {
        return index == other.index && start == other.start && end == other.end;
    }
    bool operator!=(const chunk& other) const {
        return !(*this == other);
    }
};

// Chunk length for a download of `total_size` bytes: larger files get larger
// chunks (4MB up to 100MB, then 10/20/50/100MB bands at 1GB/10GB/100GB).
std::uint64_t calculate_chunk_size(std::uint64_t total_size);

// Tiles [range_start, range_end) left to right; the last chunk is clamped to
// range_end - 1. An empty or inverted range yields no chunks.
std::vector<chunk> plan_chunks(std::uint64_t range_start, std::uint64_t range_end,
                               std::uint64_t chunk_size);

// As above, with the chunk size derived from `config` (auto-chunking sizes by
// the remaining length range_end - range_start).
std::vector<chunk> plan_chunks(std::uint64_t range_start, std::uint64_t range_end,
                               const download_config& config);
