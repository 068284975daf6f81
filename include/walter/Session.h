//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: MCP session state and the single-flight initialize handshake
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <cstdint>
#include <future>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "walter/Protocol.h"

namespace walter {

class RpcTransport;

enum class InitState {
    Uninitialized,
    Initializing,
    Ready
};

// Request ids wrap back to 1 once they reach this value
constexpr int64_t kDefaultRequestIdCeiling = 2147483647;

//==========================================================================================================
// Session
// Purpose: Thread-safe holder of the server-issued session id, the request-id counter and the
//          handshake state. A generation number increments on every invalidation so that work
//          started against an older session cannot write into the new one.
//==========================================================================================================
class Session {
public:
    struct Snapshot {
        std::optional<std::string> sessionId;
        uint64_t generation{0};
    };

    explicit Session(int64_t requestIdCeiling = kDefaultRequestIdCeiling);

    Snapshot snapshot() const;
    std::optional<std::string> sessionId() const;
    uint64_t generation() const;
    InitState state() const;
    void setState(InitState s);

    // Atomically allocates the next request id (1, 2, ... ceiling, 1, ...)
    int64_t nextRequestId();

    // Stores a session id returned by the server unless the session was invalidated since observedGeneration
    void captureSessionId(const std::string& id, uint64_t observedGeneration);

    //======================================================================================================
    // invalidate
    // Purpose: Drops the session id, resets the request counter and returns to Uninitialized.
    // Returns:
    //   false when observedGeneration is stale (someone else already invalidated).
    //======================================================================================================
    bool invalidate(uint64_t observedGeneration);

private:
    mutable std::mutex mtx;
    std::optional<std::string> id;
    int64_t requestCounter{0};
    int64_t ceiling;
    uint64_t gen{0};
    InitState initState{InitState::Uninitialized};
};

//==========================================================================================================
// SessionManager
// Purpose: Ensures at most one initialize handshake is in flight. Concurrent callers attach to the
//          same pending result. The handshake runs on an owned worker thread so one caller's
//          cancellation does not fail the other waiters; a failed handshake reverts to
//          Uninitialized and the error reaches every current waiter.
//==========================================================================================================
class SessionManager {
public:
    SessionManager(Session& session, RpcTransport& transport, Implementation clientInfo);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //======================================================================================================
    // EnsureReady
    // Purpose: Blocks until the session is Ready, starting the handshake if needed.
    // Returns:
    //   Generation of the ready session (pass it back to Invalidate).
    // Throws:
    //   errors::CancelledError when stopToken fires while waiting; the handshake error otherwise.
    //======================================================================================================
    uint64_t EnsureReady(std::stop_token stopToken);

    // Session-loss handling. Ignored when observedGeneration is no longer current.
    void Invalidate(uint64_t observedGeneration);

private:
    void runHandshake(std::stop_token workerStop, std::promise<uint64_t> promise);

    Session& session;
    RpcTransport& transport;
    Implementation clientInfo;

    std::mutex mtx;
    std::condition_variable_any handshakeCv;
    std::shared_future<uint64_t> pending;
    std::jthread worker;
};

} // namespace walter
