#pragma once

#include <string>
#include <vector>

#include "net/http_server.hpp"
#include "util/logger.hpp"

// Wraps a handler and returns the wrapped handler.
using http_middleware = std::function<http_handler(http_handler next)>;

// The first middleware in the list sees the request first.
http_handler chain(http_handler handler, const std::vector<http_middleware>& middlewares);

// One access-log event per request: remote address, method, target, status,
// request and response sizes, duration, user agent and referer.
http_middleware logging_middleware(logger& log);

// Requires HTTP basic credentials. Missing or malformed credentials get 401
// with a `WWW-Authenticate` challenge; wrong ones get 403.
http_middleware basic_auth_middleware(std::string username, std::string password);

// Decodes `Basic <base64(user:pass)>`. Returns false when the header is not
// a well-formed basic credential.
bool parse_basic_auth(const std::string& header, std::string& username, std::string& password);
