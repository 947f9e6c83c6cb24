#include "net/file_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <vector>
#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "net/byte_range.hpp"

namespace fs = std::filesystem;

namespace {
constexpr const char* DOWNLOAD_PREFIX = "/download/";
constexpr const char* INFO_PREFIX = "/info/";
constexpr const char* HEALTH_PATH = "/health";
constexpr std::size_t SEND_BUFFER_SIZE = 32 * 1024;

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

// True when `child` is `parent` or lies below it
bool is_within(const fs::path& parent, const fs::path& child) {
    auto p = parent.begin();
    auto c = child.begin();
    for (; p != parent.end(); ++p, ++c) {
        // A trailing separator shows up as an empty final element
        if (p->empty() && std::next(p) == parent.end()) {
            return true;
        }
        if (c == child.end() || *p != *c) {
            return false;
        }
    }
    return true;
}

http_response::body_provider file_range_provider(fs::path path, std::uint64_t offset,
                                                 std::uint64_t length) {
    return [path, offset, length](const http_response::body_writer& write) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return false;
        }
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in) {
            return false;
        }

        std::vector<char> buffer(SEND_BUFFER_SIZE);
        std::uint64_t remaining = length;
        while (remaining > 0) {
            auto want = static_cast<std::streamsize>(
                std::min<std::uint64_t>(buffer.size(), remaining));
            in.read(buffer.data(), want);
            std::streamsize got = in.gcount();
            if (got <= 0) {
                return false;
            }
            if (!write(buffer.data(), static_cast<std::size_t>(got))) {
                return false;
            }
            remaining -= static_cast<std::uint64_t>(got);
        }
        return true;
    };
}
} // namespace

std::string format_http_date(std::time_t time) {
    std::tm utc{};
    gmtime_r(&time, &utc);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &utc);
    return buf;
}

std::string format_rfc3339(std::time_t time) {
    std::tm utc{};
    gmtime_r(&time, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

file_server::file_server(const std::string& root, logger& log) : m_log(log) {
    std::error_code ec;
    m_root = fs::weakly_canonical(fs::absolute(root), ec);
    if (ec) {
        m_root = fs::absolute(root).lexically_normal();
    }
}

http_response file_server::handle(const http_request& req) const {
    if (req.method != "GET" && req.method != "HEAD") {
        http_response resp = http_response::text(405, "Method Not Allowed");
        resp.headers["Allow"] = "GET, HEAD";
        return resp;
    }

    if (starts_with(req.path, DOWNLOAD_PREFIX)) {
        return serve_download(req, req.path.substr(std::strlen(DOWNLOAD_PREFIX)));
    }
    if (starts_with(req.path, INFO_PREFIX)) {
        return serve_info(req.path.substr(std::strlen(INFO_PREFIX)));
    }
    if (req.path == HEALTH_PATH) {
        return serve_health();
    }
    return http_response::text(404, "Not Found");
}

bool file_server::resolve(const std::string& relative, fs::path& full, std::uint64_t& size,
                          std::time_t& modified, http_response& error) const {
    if (relative.empty()) {
        error = http_response::text(400, "file path must not be empty");
        return false;
    }

    std::error_code ec;
    full = fs::weakly_canonical(m_root / fs::path(relative).relative_path(), ec);
    if (ec || !is_within(m_root, full)) {
        m_log.warn("file_server", "rejected path outside root", {{"path", relative}});
        error = http_response::text(403, "invalid file path");
        return false;
    }

    struct stat st;
    if (::stat(full.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            error = http_response::text(404, "file not found");
        } else {
            m_log.error("file_server", "failed to stat file",
                        {{"path", full.string()}, {"error", std::strerror(errno)}});
            error = http_response::text(500, "file access error");
        }
        return false;
    }
    if (S_ISDIR(st.st_mode)) {
        error = http_response::text(400, "path is a directory");
        return false;
    }

    size = static_cast<std::uint64_t>(st.st_size);
    modified = st.st_mtime;
    return true;
}

http_response file_server::serve_download(const http_request& req,
                                          const std::string& relative) const {
    fs::path full;
    std::uint64_t size = 0;
    std::time_t modified = 0;
    http_response resp;
    if (!resolve(relative, full, size, modified, resp)) {
        return resp;
    }

    resp.headers["Accept-Ranges"] = "bytes";
    resp.headers["Content-Type"] = "application/octet-stream";
    resp.headers["Content-Disposition"] =
        "attachment; filename=\"" + full.filename().string() + "\"";
    resp.headers["Last-Modified"] = format_http_date(modified);

    std::string range_header = req.header("Range");
    if (range_header.empty()) {
        resp.status_code = 200;
        resp.content_length = size;
        resp.provider = file_range_provider(full, 0, size);
        return resp;
    }

    std::vector<byte_range> ranges;
    std::string range_error;
    if (!parse_byte_ranges(range_header, size, ranges, range_error) || ranges.size() != 1) {
        if (range_error.empty()) {
            range_error = "multiple ranges are not supported";
        }
        m_log.debug("file_server", "unsatisfiable range",
                    {{"range", range_header}, {"error", range_error}});
        http_response bad = http_response::text(416, "Range Not Satisfiable");
        bad.headers["Content-Range"] = "bytes */" + std::to_string(size);
        return bad;
    }

    const byte_range& range = ranges.front();
    resp.status_code = 206;
    resp.headers["Content-Range"] = "bytes " + std::to_string(range.start) + "-" +
                                    std::to_string(range.end) + "/" + std::to_string(size);
    resp.content_length = range.length();
    resp.provider = file_range_provider(full, range.start, range.length());
    return resp;
}

http_response file_server::serve_info(const std::string& relative) const {
    fs::path full;
    std::uint64_t size = 0;
    std::time_t modified = 0;
    http_response error;
    if (!resolve(relative, full, size, modified, error)) {
        return error;
    }

    nlohmann::json info = {
        {"name", full.filename().string()},
        {"size", size},
        {"modified", format_rfc3339(modified)},
    };
    return http_response::json(200, info.dump());
}

http_response file_server::serve_health() const {
    nlohmann::json health = {
        {"status", "ok"},
        {"timestamp", format_rfc3339(std::time(nullptr))},
    };
    return http_response::json(200, health.dump());
}
