#include "transfer/chunk.hpp"

#include <algorithm>
#include <stdexcept>

#include "transfer/download_config.hpp"

namespace {
constexpr std::uint64_t MiB = 1024ULL * 1024ULL;
constexpr std::uint64_t GiB = 1024ULL * MiB;
} // namespace

std::uint64_t calculate_chunk_size(std::uint64_t total_size) {
    if (total_size > 100 * GiB)
        return 100 * MiB;
    if (total_size > 10 * GiB)
        return 50 * MiB;
    if (total_size > 1 * GiB)
        return 20 * MiB;
    if (total_size > 100 * MiB)
        return 10 * MiB;
    return 4 * MiB;
}

std::vector<chunk> plan_chunks(std::uint64_t range_start, std::uint64_t range_end,
                               std::uint64_t chunk_size) {
    std::vector<chunk> chunks;
    if (range_end <= range_start)
        return chunks;
    if (chunk_size == 0)
        throw std::invalid_argument("chunk size must be greater than 0");

    std::uint64_t total = range_end - range_start;
    chunks.reserve(static_cast<std::size_t>((total + chunk_size - 1) / chunk_size));

    std::uint64_t index = 0;
    for (std::uint64_t offset = range_start; offset < range_end; ++index) {
        std::uint64_t size = std::min(chunk_size, range_end - offset);
        chunks.push_back({index, offset, offset + size - 1});
        offset += size;
    }
    return chunks;
}

std::vector<chunk> plan_chunks(std::uint64_t range_start, std::uint64_t range_end,
                               const download_config& config) {
    std::uint64_t remaining = range_end > range_start ? range_end - range_start : 0;
    return plan_chunks(range_start, range_end, config.effective_chunk_size(remaining));
}
