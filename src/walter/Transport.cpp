//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: JSON-RPC over HTTP transport implementation
//==========================================================================================================

#include "walter/Transport.h"
#include "walter/Session.h"
#include "walter/errors/Errors.h"
#include "logging/Logger.h"

namespace walter {

namespace {
std::string snippet(const std::string& body) {
    if (body.size() <= kBodySnippetLength) {
        return body;
    }
    return body.substr(0, kBodySnippetLength) + "...";
}
} // namespace

RpcTransport::RpcTransport(std::shared_ptr<http::IHttpClient> httpClient,
                           std::shared_ptr<auth::IAuth> authProvider,
                           Session& session,
                           Options opts)
    : httpClient(std::move(httpClient)), authProvider(std::move(authProvider)), session(session), opts(std::move(opts)) {}

http::HttpRequest RpcTransport::buildRequest(std::string body, const std::optional<std::string>& sessionId) const {
    http::HttpRequest req;
    req.body = std::move(body);
    if (authProvider) {
        for (auto& h : authProvider->headers()) {
            req.headers.push_back(std::move(h));
        }
    }
    req.headers.push_back({ Headers::ContentType, "application/json" });
    req.headers.push_back({ Headers::Accept, "application/json" });
    req.headers.push_back({ Headers::UserAgent, opts.clientInfo.name + "/" + opts.clientInfo.version });
    if (sessionId.has_value()) {
        req.headers.push_back({ Headers::SessionId, sessionId.value() });
    }
    return req;
}

void RpcTransport::captureSession(const http::HttpResponse& res, uint64_t generation) {
    auto sid = res.header(Headers::SessionId);
    if (sid.has_value() && !sid->empty()) {
        session.captureSessionId(sid.value(), generation);
    }
}

JSONValue RpcTransport::Send(const std::string& method, const JSONValue& params, std::stop_token stopToken) {
    FUNC_SCOPE();
    const auto snap = session.snapshot();
    JSONRPCRequest request(JSONRPCId{session.nextRequestId()}, method, params);
    LOG_DEBUG("RPC -> {} id={}", method, std::get<int64_t>(request.id));

    http::HttpResponse res = httpClient->Post(buildRequest(request.Serialize(), snap.sessionId),
                                              opts.requestTimeout, stopToken);
    if (!res.ok()) {
        throw errors::TransportError(res.status, fmt::format("Walter API error: {} {}", res.status, res.reason));
    }
    captureSession(res, snap.generation);

    JSONRPCResponse response;
    if (!response.Deserialize(res.body)) {
        throw errors::ProtocolError(fmt::format("Walter returned a malformed JSON-RPC response: {}", snippet(res.body)));
    }
    if (response.IsError()) {
        auto err = errors::rpcErrorFromErrorValue(response.error.value());
        if (!err.has_value()) {
            throw errors::ProtocolError(fmt::format("Walter returned a malformed JSON-RPC error: {}", snippet(res.body)));
        }
        LOG_DEBUG("RPC <- {} error: {}", method, err->serverMessage());
        throw err.value();
    }
    if (!response.result.has_value()) {
        return JSONValue();
    }
    return std::move(response.result.value());
}

void RpcTransport::Notify(const std::string& method, const std::optional<JSONValue>& params, std::stop_token stopToken) {
    FUNC_SCOPE();
    const auto snap = session.snapshot();
    JSONRPCNotification notification(method, params);
    LOG_DEBUG("RPC -> {} (notification)", method);

    http::HttpResponse res = httpClient->Post(buildRequest(notification.Serialize(), snap.sessionId),
                                              opts.requestTimeout, stopToken);
    if (!res.ok()) {
        throw errors::TransportError(res.status,
            fmt::format("Walter notification '{}' failed: {} {}", method, res.status, res.reason));
    }
    captureSession(res, snap.generation);
}

} // namespace walter
