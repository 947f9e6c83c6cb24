#include "util/version.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace {
std::int64_t version_component(const std::string& version, std::size_t position) {
    std::vector<std::string> parts;
    std::istringstream stream(version);
    std::string part;
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (parts.size() < 3 || position >= parts.size()) {
        return 0;
    }
    try {
        return std::stoll(parts[position]);
    } catch (const std::exception&) {
        return 0;
    }
}
} // namespace

std::string full_version() {
    return EZFT_VERSION;
}

std::int64_t proto_version(const std::string& version) {
    return version_component(version, 0);
}

std::int64_t major_version(const std::string& version) {
    return version_component(version, 1);
}

std::int64_t minor_version(const std::string& version) {
    return version_component(version, 2);
}
