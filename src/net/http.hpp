#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

// Request/response tracing: define EZFT_HTTP_TRACE to dump headers to stdout
#ifdef EZFT_HTTP_TRACE
#include <iostream>
#define EZFT_HTTP_LOG(stmt)                                                                        \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define EZFT_HTTP_LOG(stmt)                                                                        \
    do {                                                                                           \
    } while (0)
#endif

constexpr const char* EZFT_USER_AGENT = "Mozilla/5.0 (compatible; ezft/1.0)";

// Thin wrapper over one libcurl easy handle. Not thread-safe: use one
// instance per thread.
class http_client {
public:
    struct response {
        int status_code;
        std::map<std::string, std::string> headers; // names lower-cased
        std::string body;
        std::string error;         // transport error text, empty on success
        bool aborted_by_check;     // the abort check stopped the transfer
        bool stopped_by_sink;      // the body sink refused more data

        response() : status_code(0), aborted_by_check(false), stopped_by_sink(false) {}

        bool transport_ok() const {
            return error.empty();
        }
        std::string header(const std::string& name) const;
    };

    struct request {
        std::string url;
        std::map<std::string, std::string> headers;

        request(const std::string& url) : url(url) {}
    };

    // Receives body bytes as they arrive together with the response status.
    // Returning false stops the transfer.
    using body_sink = std::function<bool(int status_code, const char* data, std::size_t size)>;
    // Polled during the transfer; returning true aborts it.
    using abort_check = std::function<bool()>;

    http_client();
    ~http_client();

    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    response head(const request& req);
    response get(const std::string& url);
    response get(const request& req);
    response stream(const request& req, const body_sink& sink);

    void set_user_agent(const std::string& user_agent);
    void set_connect_timeout(long timeout_seconds);
    // Aborts when fewer than 1 byte/s arrives for `timeout_seconds`.
    void set_stall_timeout(long timeout_seconds);
    void set_buffer_size(long bytes);
    void set_abort_check(abort_check check);

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    response perform_request(const request& req, bool is_head, const body_sink* sink);
    void parse_response_headers(const std::string& header_string, response& resp);
    void print_request_details(const request& req, bool is_head);
    void print_response_details(const response& resp);
};
