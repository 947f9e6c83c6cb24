#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct byte_range {
    std::uint64_t start;
    std::uint64_t end; // inclusive

    std::uint64_t length() const {
        return end - start + 1;
    }
};

// Parses a `Range` header value ("bytes=0-99,200-", "bytes=-500") against a
// resource of `size` bytes. Suffix ranges are clamped to the size. Returns
// false with a message in `error` when any range is malformed or falls
// outside [0, size).
bool parse_byte_ranges(const std::string& header, std::uint64_t size,
                       std::vector<byte_range>& out, std::string& error);
