//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session state and single-flight handshake implementation
//==========================================================================================================

#include <chrono>

#include "walter/Session.h"
#include "walter/Transport.h"
#include "walter/errors/Errors.h"
#include "logging/Logger.h"

namespace walter {

//----------------------------------------------------------------------------------------------------------
// Session
//----------------------------------------------------------------------------------------------------------
Session::Session(int64_t requestIdCeiling)
    : ceiling(requestIdCeiling > 0 ? requestIdCeiling : kDefaultRequestIdCeiling) {}

Session::Snapshot Session::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx);
    return Snapshot{ id, gen };
}

std::optional<std::string> Session::sessionId() const {
    std::lock_guard<std::mutex> lk(mtx);
    return id;
}

uint64_t Session::generation() const {
    std::lock_guard<std::mutex> lk(mtx);
    return gen;
}

InitState Session::state() const {
    std::lock_guard<std::mutex> lk(mtx);
    return initState;
}

void Session::setState(InitState s) {
    std::lock_guard<std::mutex> lk(mtx);
    initState = s;
}

int64_t Session::nextRequestId() {
    std::lock_guard<std::mutex> lk(mtx);
    if (requestCounter >= ceiling) {
        requestCounter = 0;
    }
    return ++requestCounter;
}

void Session::captureSessionId(const std::string& newId, uint64_t observedGeneration) {
    std::lock_guard<std::mutex> lk(mtx);
    if (observedGeneration != gen) {
        LOG_DEBUG("Session: ignoring session id from stale generation {} (current {})", observedGeneration, gen);
        return;
    }
    if (!id.has_value() || id.value() != newId) {
        LOG_DEBUG("Session: session id updated");
    }
    id = newId;
}

bool Session::invalidate(uint64_t observedGeneration) {
    std::lock_guard<std::mutex> lk(mtx);
    if (observedGeneration != gen) {
        return false;
    }
    id.reset();
    requestCounter = 0;
    ++gen;
    initState = InitState::Uninitialized;
    return true;
}

//----------------------------------------------------------------------------------------------------------
// SessionManager
//----------------------------------------------------------------------------------------------------------
SessionManager::SessionManager(Session& session, RpcTransport& transport, Implementation clientInfo)
    : session(session), transport(transport), clientInfo(std::move(clientInfo)) {}

SessionManager::~SessionManager() {
    // jthread requests stop (cancelling any in-flight handshake I/O) and joins
    std::jthread w;
    {
        std::lock_guard<std::mutex> lk(mtx);
        w = std::move(worker);
    }
}

void SessionManager::runHandshake(std::stop_token workerStop, std::promise<uint64_t> promise) {
    try {
        const uint64_t gen = session.generation();
        LOG_INFO("Session: initialize handshake starting (protocol {})", PROTOCOL_VERSION);

        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(clientInfo.name);
        info["version"] = std::make_shared<JSONValue>(clientInfo.version);
        JSONValue::Object params;
        params["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        params["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        params["clientInfo"] = std::make_shared<JSONValue>(std::move(info));

        (void)transport.Send(Methods::Initialize, JSONValue{std::move(params)}, workerStop);
        transport.Notify(Methods::Initialized, std::nullopt, workerStop);

        {
            std::lock_guard<std::mutex> lk(mtx);
            session.setState(InitState::Ready);
            promise.set_value(gen);
        }
        LOG_INFO("Session: ready");
    } catch (const std::exception& e) {
        LOG_WARN("Session: initialize handshake failed: {}", e.what());
        std::lock_guard<std::mutex> lk(mtx);
        session.setState(InitState::Uninitialized);
        promise.set_exception(std::current_exception());
    }
    handshakeCv.notify_all();
}

uint64_t SessionManager::EnsureReady(std::stop_token stopToken) {
    FUNC_SCOPE();
    std::unique_lock<std::mutex> lk(mtx);
    if (session.state() == InitState::Ready) {
        return session.generation();
    }
    if (stopToken.stop_requested()) {
        throw errors::CancelledError();
    }

    if (session.state() == InitState::Uninitialized) {
        // The previous worker (if any) has already left its locked section
        if (worker.joinable()) {
            worker.join();
        }
        session.setState(InitState::Initializing);
        std::promise<uint64_t> promise;
        pending = promise.get_future().share();
        worker = std::jthread([this, pr = std::move(promise)](std::stop_token st) mutable {
            runHandshake(st, std::move(pr));
        });
    }

    std::shared_future<uint64_t> mine = pending;
    const bool done = handshakeCv.wait(lk, stopToken, [&mine]() {
        return mine.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
    if (!done) {
        throw errors::CancelledError();
    }
    lk.unlock();
    return mine.get();
}

void SessionManager::Invalidate(uint64_t observedGeneration) {
    std::lock_guard<std::mutex> lk(mtx);
    if (session.state() != InitState::Ready) {
        return;
    }
    if (session.invalidate(observedGeneration)) {
        LOG_WARN("Session: server reported session not found; re-initializing");
    }
}

} // namespace walter
