#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "util/logger.hpp"

struct http_request {
    std::string method;
    std::string target;  // as sent, including the query
    std::string path;    // percent-decoded, without the query
    std::string query;
    std::string version;
    std::map<std::string, std::string> headers; // names lower-cased
    std::string remote_address;

    std::string header(const std::string& name) const;
};

struct http_response {
    using body_writer = std::function<bool(const char* data, std::size_t size)>;
    // Streams exactly `content_length` bytes through the writer; returns false
    // when the body could not be produced or the peer went away.
    using body_provider = std::function<bool(const body_writer& write)>;

    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;
    body_provider provider;
    std::uint64_t content_length = 0; // used only with a provider

    std::uint64_t body_size() const {
        return provider ? content_length : body.size();
    }

    static http_response text(int status_code, const std::string& body);
    static http_response json(int status_code, const std::string& body);
};

using http_handler = std::function<http_response(const http_request&)>;

const char* status_reason(int status_code);

// Minimal HTTP/1.1 server over POSIX sockets: one accept thread, one thread
// per connection, one request per connection (`Connection: close`).
class http_server {
public:
    http_server(std::string address, std::uint16_t port, http_handler handler, logger& log);
    ~http_server();

    http_server(const http_server&) = delete;
    http_server& operator=(const http_server&) = delete;

    // Binds, listens and starts accepting. Port 0 picks an ephemeral port.
    bool start();
    void stop();

    bool is_running() const {
        return m_running.load();
    }
    std::uint16_t port() const {
        return m_port;
    }
    std::string base_url() const;

private:
    struct connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(int client_fd, const std::string& remote_address);
    bool read_request(int client_fd, http_request& req);
    bool send_response(int client_fd, const http_request& req, const http_response& resp);
    void reap_connections(bool wait_all);

    std::string m_address;
    std::uint16_t m_port;
    http_handler m_handler;
    logger& m_log;

    int m_listen_fd = -1;
    std::atomic<bool> m_running{false};
    std::thread m_accept_thread;

    std::mutex m_connections_mutex;
    std::list<connection> m_connections;
};
