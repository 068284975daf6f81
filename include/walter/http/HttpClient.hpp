//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: Blocking HTTP POST abstraction used by the JSON-RPC transport
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace walter {
namespace http {

struct HeaderKV {
    std::string name;
    std::string value;
};

//==========================================================================================================
// HttpRequest
// Purpose: One POST to the configured endpoint.
//==========================================================================================================
struct HttpRequest {
    std::vector<HeaderKV> headers;
    std::string body;
};

//==========================================================================================================
// HttpResponse
// Purpose: Status line, headers and body of a completed exchange.
// Methods:
//   header(name): Case-insensitive lookup of the first header with that name.
//   ok(): True for 2xx statuses.
//==========================================================================================================
struct HttpResponse {
    int status{0};
    std::string reason;
    std::vector<HeaderKV> headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    bool ok() const { return status >= 200 && status < 300; }
};

//==========================================================================================================
// IHttpClient
// Purpose: POSTs a request and blocks until the first of {response, timeout, cancellation}.
// Throws:
//   errors::CancelledError when stopToken fires before the response arrives.
//   errors::TimeoutError when the timeout elapses first.
//   errors::TransportError (status 0) when no HTTP response could be obtained.
// Notes:
//   Non-2xx responses are returned, not thrown; classification belongs to the caller.
//==========================================================================================================
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse Post(const HttpRequest& request,
                              std::chrono::milliseconds timeout,
                              std::stop_token stopToken) = 0;
};

} // namespace http
} // namespace walter
