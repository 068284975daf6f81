//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpClient.hpp
// Purpose: Coroutine-based HTTP/HTTPS client using Boost.Beast on a private io_context thread
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "walter/http/HttpClient.hpp"

namespace walter {
namespace http {

//==========================================================================================================
// BeastHttpClient
// Purpose: IHttpClient over Boost.Beast. One connection per request ("Connection: close").
//==========================================================================================================
class BeastHttpClient : public IHttpClient {
public:
    //======================================================================================================
    // Options
    // Purpose: Endpoint and TLS configuration.
    // Fields:
    //   url: Full endpoint URL, e.g. https://walterops.com/mcp
    //   caFile/caPath: Optional CA bundle/path for trust store (https only)
    //   connectTimeoutMs: Upper bound for resolve + connect + TLS handshake
    //======================================================================================================
    struct Options {
        std::string url;
        std::string caFile;
        std::string caPath;
        unsigned int connectTimeoutMs{10000};
    };

    explicit BeastHttpClient(const Options& opts);
    ~BeastHttpClient() override;

    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    HttpResponse Post(const HttpRequest& request,
                      std::chrono::milliseconds timeout,
                      std::stop_token stopToken) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace http
} // namespace walter
