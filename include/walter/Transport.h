//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: JSON-RPC over HTTP request/notification transport bound to one Walter session
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "walter/JSONRPCTypes.h"
#include "walter/Protocol.h"
#include "walter/auth/IAuth.hpp"
#include "walter/http/HttpClient.hpp"

namespace walter {

class Session;

// Raw-body bytes quoted in protocol-shape errors
constexpr std::size_t kBodySnippetLength = 200;

//==========================================================================================================
// RpcTransport
// Purpose: Frames JSON-RPC envelopes over one POST endpoint and maps failures to typed errors.
//          Request headers come from the auth provider plus the current session.
//==========================================================================================================
class RpcTransport {
public:
    //======================================================================================================
    // Options
    // Fields:
    //   requestTimeout: Fixed per-call timeout, raced against the caller's stop_token.
    //   clientInfo: Name and version sent as "<name>/<version>" in User-Agent.
    //======================================================================================================
    struct Options {
        std::chrono::milliseconds requestTimeout{30000};
        Implementation clientInfo;
    };

    RpcTransport(std::shared_ptr<http::IHttpClient> httpClient,
                 std::shared_ptr<auth::IAuth> authProvider,
                 Session& session,
                 Options opts);

    //======================================================================================================
    // Send
    // Purpose: Issues a JSON-RPC call and returns its result (null when the server omitted it).
    // Throws:
    //   errors::TransportError on non-2xx status (status attached) or connection failure (status 0).
    //   errors::ProtocolError when the body is not a JSON-RPC object.
    //   errors::RpcError when the envelope carries an error.
    //   errors::CancelledError / errors::TimeoutError from the HTTP layer.
    //======================================================================================================
    JSONValue Send(const std::string& method, const JSONValue& params, std::stop_token stopToken);

    // Same as Send without an id; only the status code is checked.
    void Notify(const std::string& method, const std::optional<JSONValue>& params, std::stop_token stopToken);

private:
    http::HttpRequest buildRequest(std::string body, const std::optional<std::string>& sessionId) const;
    void captureSession(const http::HttpResponse& res, uint64_t generation);

    std::shared_ptr<http::IHttpClient> httpClient;
    std::shared_ptr<auth::IAuth> authProvider;
    Session& session;
    Options opts;
};

} // namespace walter
