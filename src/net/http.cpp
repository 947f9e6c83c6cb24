#include "net/http.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <curl/curl.h>

#include "util/defer.hpp"

namespace {
// curl_global_init is not safe to race with handle creation on older libcurl
void ensure_curl_initialized() {
    static const CURLcode init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init_result != CURLE_OK) {
        throw std::runtime_error(std::string("curl_global_init failed: ") +
                                 curl_easy_strerror(init_result));
    }
}

struct body_context {
    CURL* handle;
    std::string* buffer;
    const http_client::body_sink* sink;
    bool stopped;
};

struct abort_context {
    const http_client::abort_check* check;
    bool aborted;
};

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<body_context*>(userp);
    size_t total_size = size * nmemb;
    if (ctx->sink == nullptr) {
        ctx->buffer->append(contents, total_size);
        return total_size;
    }

    long status_code = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status_code);
    if (!(*ctx->sink)(static_cast<int>(status_code), contents, total_size)) {
        ctx->stopped = true;
        return 0; // makes libcurl fail the transfer with CURLE_WRITE_ERROR
    }
    return total_size;
}

// Keeps only the header block of the final response when redirects are followed
size_t header_callback(char* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    if (total_size >= 5 && std::string(contents, 5) == "HTTP/") {
        userp->clear();
    }
    userp->append(contents, total_size);
    return total_size;
}

int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<abort_context*>(clientp);
    if (ctx->check && *ctx->check && (*ctx->check)()) {
        ctx->aborted = true;
        return 1;
    }
    return 0;
}

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
} // namespace

class http_client::impl {
public:
    impl()
        : curl_handle(nullptr), user_agent(EZFT_USER_AGENT), connect_timeout_seconds(5),
          stall_timeout_seconds(10), buffer_size(32 * 1024) {
        ensure_curl_initialized();
        curl_handle = curl_easy_init();
        if (!curl_handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }

        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl_handle, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl_handle, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, 5L);
        // Worker threads must not receive SIGALRM from the resolver timeout
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, user_agent.c_str());
        curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, connect_timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_LOW_SPEED_TIME, stall_timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_BUFFERSIZE, buffer_size);
    }

    ~impl() {
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    CURL* curl_handle;
    std::string user_agent;
    long connect_timeout_seconds;
    long stall_timeout_seconds;
    long buffer_size;
    abort_check check;
};

std::string http_client::response::header(const std::string& name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

http_client::http_client() : pimpl(std::make_unique<impl>()) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

http_client::response http_client::head(const request& req) {
    return perform_request(req, true, nullptr);
}

http_client::response http_client::get(const std::string& url) {
    request req(url);
    return get(req);
}

http_client::response http_client::get(const request& req) {
    return perform_request(req, false, nullptr);
}

http_client::response http_client::stream(const request& req, const body_sink& sink) {
    return perform_request(req, false, &sink);
}

void http_client::set_user_agent(const std::string& user_agent) {
    pimpl->user_agent = user_agent;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_USERAGENT, pimpl->user_agent.c_str());
}

void http_client::set_connect_timeout(long timeout_seconds) {
    pimpl->connect_timeout_seconds = timeout_seconds;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
}

void http_client::set_stall_timeout(long timeout_seconds) {
    pimpl->stall_timeout_seconds = timeout_seconds;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_LOW_SPEED_TIME, timeout_seconds);
}

void http_client::set_buffer_size(long bytes) {
    pimpl->buffer_size = bytes;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_BUFFERSIZE, bytes);
}

void http_client::set_abort_check(abort_check check) {
    pimpl->check = std::move(check);
}

http_client::response http_client::perform_request(const request& req, bool is_head,
                                                   const body_sink* sink) {
    response resp;
    std::string response_body;
    std::string response_headers;

    print_request_details(req, is_head);

    CURL* handle = pimpl->curl_handle;
    curl_easy_setopt(handle, CURLOPT_URL, req.url.c_str());

    body_context body_ctx{handle, &response_body, sink, false};
    abort_context abort_ctx{&pimpl->check, false};
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body_ctx);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &abort_ctx);

    if (is_head) {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 0L);
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    DEFER(curl_easy_setopt(handle, CURLOPT_HTTPHEADER, nullptr); curl_slist_free_all(header_list););

    CURLcode res = curl_easy_perform(handle);

    long status_code = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status_code);
    resp.status_code = static_cast<int>(status_code);
    resp.aborted_by_check = abort_ctx.aborted;
    resp.stopped_by_sink = body_ctx.stopped;
    parse_response_headers(response_headers, resp);

    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        EZFT_HTTP_LOG(std::cerr << "curl_easy_perform() failed: " << resp.error << std::endl);
        return resp;
    }

    resp.body = std::move(response_body);
    print_response_details(resp);
    return resp;
}

void http_client::parse_response_headers(const std::string& header_string, response& resp) {
    std::istringstream stream(header_string);
    std::string line;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string header_name = trim(line.substr(0, colon_pos));
            std::string header_value = trim(line.substr(colon_pos + 1));
            resp.headers[to_lower(header_name)] = header_value;
        }
    }
}

void http_client::print_request_details(const request& req, bool is_head) {
    EZFT_HTTP_LOG(std::cout << "\n=== HTTP REQUEST ===" << std::endl);
    EZFT_HTTP_LOG(std::cout << "Method: " << (is_head ? "HEAD" : "GET") << std::endl);
    EZFT_HTTP_LOG(std::cout << "URL: " << req.url << std::endl);
    for (const auto& header : req.headers) {
        EZFT_HTTP_LOG(std::cout << "  " << header.first << ": " << header.second << std::endl);
    }
    EZFT_HTTP_LOG(std::cout << "===================\n" << std::endl);
    (void)req;
    (void)is_head;
}

void http_client::print_response_details(const response& resp) {
    EZFT_HTTP_LOG(std::cout << "\n=== HTTP RESPONSE ===" << std::endl);
    EZFT_HTTP_LOG(std::cout << "Status Code: " << resp.status_code << std::endl);
    for (const auto& header : resp.headers) {
        EZFT_HTTP_LOG(std::cout << "  " << header.first << ": " << header.second << std::endl);
    }
    EZFT_HTTP_LOG(std::cout << "====================\n" << std::endl);
    (void)resp;
}
