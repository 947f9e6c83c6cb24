#include "net/http_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {
constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;
constexpr int ACCEPT_POLL_MS = 200;
constexpr int SOCKET_TIMEOUT_SECONDS = 30;

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

bool send_all(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t sent = ::send(fd, data, size, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        data += sent;
        size -= static_cast<std::size_t>(sent);
    }
    return true;
}

void set_socket_timeouts(int fd) {
    timeval tv{};
    tv.tv_sec = SOCKET_TIMEOUT_SECONDS;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}
} // namespace

std::string http_request::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

http_response http_response::text(int status_code, const std::string& body) {
    http_response resp;
    resp.status_code = status_code;
    resp.headers["Content-Type"] = "text/plain; charset=utf-8";
    resp.body = body + "\n";
    return resp;
}

http_response http_response::json(int status_code, const std::string& body) {
    http_response resp;
    resp.status_code = status_code;
    resp.headers["Content-Type"] = "application/json";
    resp.body = body;
    return resp;
}

const char* status_reason(int status_code) {
    switch (status_code) {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 416:
        return "Range Not Satisfiable";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}

http_server::http_server(std::string address, std::uint16_t port, http_handler handler,
                         logger& log)
    : m_address(std::move(address)), m_port(port), m_handler(std::move(handler)), m_log(log) {}

http_server::~http_server() {
    stop();
}

bool http_server::start() {
    if (m_running.load()) {
        return true;
    }

    m_listen_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_listen_fd == -1) {
        m_log.error("http_server", "failed to create socket", {{"error", std::strerror(errno)}});
        return false;
    }

    int reuse = 1;
    setsockopt(m_listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_port);
    if (inet_pton(AF_INET, m_address.c_str(), &addr.sin_addr) != 1) {
        m_log.error("http_server", "invalid bind address", {{"address", m_address}});
        ::close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    if (::bind(m_listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        m_log.error("http_server", "failed to bind socket",
                    {{"address", m_address}, {"port", m_port}, {"error", std::strerror(errno)}});
        ::close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    if (::listen(m_listen_fd, SOMAXCONN) == -1) {
        m_log.error("http_server", "failed to listen on socket", {{"error", std::strerror(errno)}});
        ::close(m_listen_fd);
        m_listen_fd = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(m_listen_fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        m_port = ntohs(bound.sin_port);
    }

    m_running.store(true);
    m_accept_thread = std::thread([this] { accept_loop(); });
    m_log.info("http_server", "listening", {{"address", m_address}, {"port", m_port}});
    return true;
}

void http_server::stop() {
    bool was_running = m_running.exchange(false);
    if (m_accept_thread.joinable()) {
        m_accept_thread.join();
    }
    if (m_listen_fd != -1) {
        ::close(m_listen_fd);
        m_listen_fd = -1;
    }
    reap_connections(true);
    if (was_running) {
        m_log.info("http_server", "stopped", {{"port", m_port}});
    }
}

std::string http_server::base_url() const {
    std::string host = m_address == "0.0.0.0" ? "127.0.0.1" : m_address;
    return "http://" + host + ":" + std::to_string(m_port);
}

void http_server::accept_loop() {
    while (m_running.load()) {
        pollfd pfd{};
        pfd.fd = m_listen_fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            m_log.error("http_server", "poll failed", {{"error", std::strerror(errno)}});
            break;
        }
        if (rc == 0) {
            reap_connections(false);
            continue;
        }

        sockaddr_in addr{};
        socklen_t addr_len = sizeof(addr);
        int client_fd = ::accept4(m_listen_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len,
                                  SOCK_CLOEXEC);
        if (client_fd == -1) {
            if (errno != EINTR && errno != EAGAIN) {
                m_log.warn("http_server", "failed to accept connection",
                           {{"error", std::strerror(errno)}});
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        std::string remote = std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(m_connections_mutex);
        m_connections.push_back(connection{std::thread([this, client_fd, remote, done] {
                                               handle_connection(client_fd, remote);
                                               done->store(true);
                                           }),
                                           done});
    }
}

void http_server::reap_connections(bool wait_all) {
    std::lock_guard<std::mutex> lock(m_connections_mutex);
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if (wait_all || it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = m_connections.erase(it);
        } else {
            ++it;
        }
    }
}

void http_server::handle_connection(int client_fd, const std::string& remote_address) {
    set_socket_timeouts(client_fd);

    http_request req;
    req.remote_address = remote_address;
    http_response resp;
    if (!read_request(client_fd, req)) {
        req.method = "GET";
        resp = http_response::text(400, "Bad Request");
    } else {
        try {
            resp = m_handler(req);
        } catch (const std::exception& e) {
            m_log.error("http_server", "handler failed",
                        {{"target", req.target}, {"error", e.what()}});
            resp = http_response::text(500, "Internal Server Error");
        }
    }

    if (!send_response(client_fd, req, resp)) {
        m_log.debug("http_server", "client went away", {{"remote", remote_address}});
    }
    ::shutdown(client_fd, SHUT_WR);
    ::close(client_fd);
}

bool http_server::read_request(int client_fd, http_request& req) {
    std::string data;
    char buf[4096];
    size_t header_end = std::string::npos;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > MAX_HEADER_BYTES) {
            return false;
        }
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        data.append(buf, static_cast<size_t>(n));
    }

    std::istringstream stream(data.substr(0, header_end));
    std::string line;
    if (!std::getline(stream, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    std::istringstream request_line(line);
    if (!(request_line >> req.method >> req.target >> req.version)) {
        return false;
    }
    if (req.target.empty() || req.version.compare(0, 5, "HTTP/") != 0) {
        return false;
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }
        req.headers[to_lower(trim(line.substr(0, colon_pos)))] = trim(line.substr(colon_pos + 1));
    }

    size_t query_pos = req.target.find('?');
    req.path = percent_decode(req.target.substr(0, query_pos));
    if (query_pos != std::string::npos) {
        req.query = req.target.substr(query_pos + 1);
    }

    // Drain a request body so closing the socket does not reset the connection
    std::string content_length = req.header("Content-Length");
    if (!content_length.empty()) {
        std::uint64_t remaining = 0;
        try {
            remaining = std::stoull(content_length);
        } catch (const std::exception&) {
            return false;
        }
        std::uint64_t already = data.size() - (header_end + 4);
        remaining = remaining > already ? remaining - already : 0;
        while (remaining > 0) {
            ssize_t n = ::recv(client_fd, buf, std::min<std::uint64_t>(sizeof(buf), remaining), 0);
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                return false;
            remaining -= static_cast<std::uint64_t>(n);
        }
    }
    return true;
}

bool http_server::send_response(int client_fd, const http_request& req,
                                const http_response& resp) {
    std::ostringstream head;
    head << "HTTP/1.1 " << resp.status_code << ' ' << status_reason(resp.status_code) << "\r\n";
    for (const auto& header : resp.headers) {
        head << header.first << ": " << header.second << "\r\n";
    }
    head << "Content-Length: " << resp.body_size() << "\r\n";
    head << "Connection: close\r\n\r\n";

    std::string head_str = head.str();
    if (!send_all(client_fd, head_str.data(), head_str.size())) {
        return false;
    }
    if (req.method == "HEAD") {
        return true;
    }
    if (resp.provider) {
        return resp.provider(
            [client_fd](const char* data, std::size_t size) { return send_all(client_fd, data, size); });
    }
    return send_all(client_fd, resp.body.data(), resp.body.size());
}
