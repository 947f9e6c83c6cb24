#include "net/byte_range.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace {
constexpr const char* RANGE_UNIT_PREFIX = "bytes=";

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

bool parse_number(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), ::isdigit)) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
} // namespace

bool parse_byte_ranges(const std::string& header, std::uint64_t size,
                       std::vector<byte_range>& out, std::string& error) {
    out.clear();
    std::string prefix = RANGE_UNIT_PREFIX;
    if (header.compare(0, prefix.size(), prefix) != 0) {
        error = "invalid range format";
        return false;
    }

    std::string range_set = header.substr(prefix.size());
    size_t pos = 0;
    while (pos <= range_set.size()) {
        size_t comma = range_set.find(',', pos);
        size_t count = comma == std::string::npos ? std::string::npos : comma - pos;
        std::string part = trim(range_set.substr(pos, count));
        pos = comma == std::string::npos ? range_set.size() + 1 : comma + 1;

        size_t dash = part.find('-');
        if (dash == std::string::npos) {
            error = "invalid range: " + part;
            return false;
        }
        std::string first = trim(part.substr(0, dash));
        std::string last = trim(part.substr(dash + 1));

        byte_range range{0, 0};
        if (first.empty()) {
            // suffix range: the last n bytes
            std::uint64_t suffix = 0;
            if (!parse_number(last, suffix) || suffix == 0 || size == 0) {
                error = "invalid suffix range: " + part;
                return false;
            }
            range.start = suffix > size ? 0 : size - suffix;
            range.end = size - 1;
        } else {
            if (!parse_number(first, range.start)) {
                error = "invalid range start: " + part;
                return false;
            }
            if (last.empty()) {
                if (size == 0) {
                    error = "range out of bounds: " + part;
                    return false;
                }
                range.end = size - 1;
            } else if (!parse_number(last, range.end)) {
                error = "invalid range end: " + part;
                return false;
            }
        }

        if (range.start > range.end || range.end >= size) {
            error = "range out of bounds: " + part;
            return false;
        }
        out.push_back(range);
    }

    if (out.empty()) {
        error = "no ranges specified";
        return false;
    }
    return true;
}
