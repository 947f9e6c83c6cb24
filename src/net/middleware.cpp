#include "net/middleware.hpp"

#include <chrono>
#include <cstdint>

namespace {
constexpr const char* BASIC_PREFIX = "Basic ";

int base64_value(char c) {
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

bool base64_decode(const std::string& in, std::string& out) {
    if (in.size() % 4 != 0) {
        return false;
    }
    out.clear();
    std::uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '=') {
            // padding only at the end
            if (i + 2 < in.size()) {
                return false;
            }
            ++padding;
            continue;
        }
        if (padding > 0) {
            return false;
        }
        int value = base64_value(c);
        if (value < 0) {
            return false;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return true;
}
} // namespace

http_handler chain(http_handler handler, const std::vector<http_middleware>& middlewares) {
    for (auto it = middlewares.rbegin(); it != middlewares.rend(); ++it) {
        handler = (*it)(std::move(handler));
    }
    return handler;
}

http_middleware logging_middleware(logger& log) {
    return [&log](http_handler next) -> http_handler {
        return [&log, next](const http_request& req) {
            auto start = std::chrono::steady_clock::now();
            http_response resp = next(req);
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);

            std::uint64_t resp_size = req.method == "HEAD" ? 0 : resp.body_size();
            std::string req_size = req.header("Content-Length");
            log.info("access", req.method + " " + req.target,
                     {{"remote", req.remote_address},
                      {"status", resp.status_code},
                      {"req_size", req_size.empty() ? std::string("0") : req_size},
                      {"resp_size", resp_size},
                      {"duration_ms", static_cast<long long>(duration.count())},
                      {"user_agent", req.header("User-Agent")},
                      {"referer", req.header("Referer")}});
            return resp;
        };
    };
}

http_middleware basic_auth_middleware(std::string username, std::string password) {
    return [username, password](http_handler next) -> http_handler {
        return [username, password, next](const http_request& req) {
            std::string user;
            std::string pass;
            if (!parse_basic_auth(req.header("Authorization"), user, pass)) {
                http_response resp = http_response::text(401, "Unauthorized");
                resp.headers["WWW-Authenticate"] = "Basic realm=\"Restricted\"";
                return resp;
            }
            if (user != username || pass != password) {
                return http_response::text(403, "Forbidden");
            }
            return next(req);
        };
    };
}

bool parse_basic_auth(const std::string& header, std::string& username, std::string& password) {
    std::string prefix = BASIC_PREFIX;
    if (header.size() <= prefix.size() || header.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    std::string decoded;
    if (!base64_decode(header.substr(prefix.size()), decoded)) {
        return false;
    }

    size_t colon = decoded.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    username = decoded.substr(0, colon);
    password = decoded.substr(colon + 1);
    return true;
}
