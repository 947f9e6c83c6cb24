#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

#include "net/http_server.hpp"
#include "util/logger.hpp"

struct server_config {
    std::string root_dir = "./";
    std::string address = "0.0.0.0";
    std::uint16_t port = 8080;
    // Basic auth is enabled when auth_user is non-empty
    std::string auth_user;
    std::string auth_password;
    bool access_log = true;
};

// Serves files below a root directory:
//   GET|HEAD /download/<path>  file body, honouring a single byte range
//   GET      /info/<path>      {"name","size","modified"}
//   GET      /health           {"status":"ok","timestamp"}
class file_server {
public:
    file_server(const std::string& root, logger& log);

    http_response handle(const http_request& req) const;

    const std::filesystem::path& root() const {
        return m_root;
    }

private:
    http_response serve_download(const http_request& req, const std::string& relative) const;
    http_response serve_info(const std::string& relative) const;
    http_response serve_health() const;

    // Maps a request path below the root to a regular file. On failure returns
    // false and fills `error` with the response to send.
    bool resolve(const std::string& relative, std::filesystem::path& full,
                 std::uint64_t& size, std::time_t& modified, http_response& error) const;

    std::filesystem::path m_root;
    logger& m_log;
};

// "Wed, 21 Oct 2015 07:28:00 GMT"
std::string format_http_date(std::time_t time);
// "2015-10-21T07:28:00Z"
std::string format_rfc3339(std::time_t time);
