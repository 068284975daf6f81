//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_manager.cpp
// Purpose: GoogleTests for session state, request ids and the coalesced initialize handshake
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include "walter/Session.h"
#include "walter/Transport.h"
#include "walter/auth/BearerAuth.hpp"
#include "walter/errors/Errors.h"
#include "support/FakeHttpClient.h"

using namespace walter;
using walter::testing::FakeHttpClient;
using walter::testing::RecordedRequest;
using walter::testing::makeResponse;
using walter::testing::rpcResultBody;

namespace {

struct SessionFixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    Session session;
    RpcTransport transport{ http, std::make_shared<auth::BearerAuth>("tok"), session,
                            RpcTransport::Options{ std::chrono::milliseconds(1000), Implementation("walter-test", "1.0.0") } };
    SessionManager manager{ session, transport, Implementation("walter-test", "1.0.0") };
};

const JSONValue& member(const JSONValue& v, const std::string& key) {
    return *std::get<JSONValue::Object>(v.value).at(key);
}

} // namespace

TEST(Session, RequestIdsAreMonotonicAndResetOnInvalidate) {
    Session s;
    EXPECT_EQ(s.nextRequestId(), 1);
    EXPECT_EQ(s.nextRequestId(), 2);
    EXPECT_EQ(s.nextRequestId(), 3);
    ASSERT_TRUE(s.invalidate(s.generation()));
    EXPECT_EQ(s.nextRequestId(), 1);
}

TEST(Session, RequestIdsWrapAtCeiling) {
    Session s(3);
    EXPECT_EQ(s.nextRequestId(), 1);
    EXPECT_EQ(s.nextRequestId(), 2);
    EXPECT_EQ(s.nextRequestId(), 3);
    EXPECT_EQ(s.nextRequestId(), 1);
}

TEST(Session, ConcurrentRequestIdsAreUnique) {
    Session s;
    std::vector<std::thread> threads;
    std::vector<std::vector<int64_t>> seen(4);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&s, &seen, t]() {
            for (int i = 0; i < 250; ++i) seen[t].push_back(s.nextRequestId());
        });
    }
    for (auto& th : threads) th.join();
    std::vector<bool> hit(1001, false);
    for (const auto& v : seen) {
        for (auto id : v) {
            ASSERT_GE(id, 1);
            ASSERT_LE(id, 1000);
            EXPECT_FALSE(hit[static_cast<std::size_t>(id)]) << "duplicate id " << id;
            hit[static_cast<std::size_t>(id)] = true;
        }
    }
}

TEST(Session, StaleInvalidateIsIgnored) {
    Session s;
    const auto gen = s.generation();
    s.captureSessionId("abc", gen);
    ASSERT_TRUE(s.invalidate(gen));
    s.captureSessionId("fresh", s.generation());
    EXPECT_FALSE(s.invalidate(gen));
    EXPECT_EQ(s.sessionId().value_or(""), "fresh");
}

TEST(SessionManager, HandshakeSendsInitializeThenInitialized) {
    SessionFixture f;
    ASSERT_NO_THROW((void)f.manager.EnsureReady({}));
    EXPECT_EQ(f.session.state(), InitState::Ready);
    EXPECT_EQ(f.session.sessionId().value_or(""), "session-1");

    auto reqs = f.http->requests();
    ASSERT_EQ(reqs.size(), 2u);
    EXPECT_EQ(reqs[0].method, "initialize");
    EXPECT_EQ(std::get<std::string>(member(reqs[0].params, "protocolVersion").value), PROTOCOL_VERSION);
    EXPECT_TRUE(member(reqs[0].params, "capabilities").isObject());
    EXPECT_EQ(std::get<std::string>(member(member(reqs[0].params, "clientInfo"), "name").value), "walter-test");
    EXPECT_EQ(reqs[1].method, "notifications/initialized");
    EXPECT_FALSE(reqs[1].id.has_value());
    EXPECT_EQ(reqs[1].header("Mcp-Session-Id").value_or(""), "session-1");

    // Already ready: no more traffic
    (void)f.manager.EnsureReady({});
    EXPECT_EQ(f.http->requests().size(), 2u);
}

TEST(SessionManager, ConcurrentCallersShareOneHandshake) {
    SessionFixture f;
    f.http->setInitializeHandler([](const RecordedRequest& r) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return makeResponse(200, rpcResultBody(r.id, "{}"), std::string("shared"));
    });

    std::vector<std::future<uint64_t>> futs;
    for (int i = 0; i < 8; ++i) {
        futs.push_back(std::async(std::launch::async, [&f]() { return f.manager.EnsureReady({}); }));
    }
    std::vector<uint64_t> gens;
    for (auto& fut : futs) {
        ASSERT_EQ(fut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        gens.push_back(fut.get());
    }
    EXPECT_EQ(f.http->countMethod("initialize"), 1u);
    EXPECT_EQ(f.http->countMethod("notifications/initialized"), 1u);
    for (auto g : gens) EXPECT_EQ(g, gens.front());
}

TEST(SessionManager, FailedHandshakeRejectsAllWaitersAndReverts) {
    SessionFixture f;
    std::atomic<bool> failing{true};
    f.http->setInitializeHandler([&failing](const RecordedRequest& r) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (failing.load()) {
            return makeResponse(500, "oops");
        }
        return makeResponse(200, rpcResultBody(r.id, "{}"), std::string("recovered"));
    });

    std::vector<std::future<uint64_t>> futs;
    for (int i = 0; i < 4; ++i) {
        futs.push_back(std::async(std::launch::async, [&f]() { return f.manager.EnsureReady({}); }));
    }
    for (auto& fut : futs) {
        EXPECT_THROW(fut.get(), errors::TransportError);
    }
    EXPECT_EQ(f.session.state(), InitState::Uninitialized);
    EXPECT_EQ(f.http->countMethod("initialize"), 1u);

    // Next call starts a fresh attempt
    failing = false;
    ASSERT_NO_THROW((void)f.manager.EnsureReady({}));
    EXPECT_EQ(f.session.state(), InitState::Ready);
    EXPECT_EQ(f.session.sessionId().value_or(""), "recovered");
    EXPECT_EQ(f.http->countMethod("initialize"), 2u);
}

TEST(SessionManager, CancelledWaiterDoesNotFailOthers) {
    SessionFixture f;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    f.http->setInitializeHandler([opened](const RecordedRequest& r) {
        opened.wait();
        return makeResponse(200, rpcResultBody(r.id, "{}"), std::string("s"));
    });

    auto patient = std::async(std::launch::async, [&f]() { return f.manager.EnsureReady({}); });
    std::stop_source src;
    auto impatient = std::async(std::launch::async, [&f, tok = src.get_token()]() { return f.manager.EnsureReady(tok); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    src.request_stop();
    EXPECT_THROW(impatient.get(), errors::CancelledError);

    gate.set_value();
    ASSERT_EQ(patient.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_NO_THROW((void)patient.get());
    EXPECT_EQ(f.session.state(), InitState::Ready);
    EXPECT_EQ(f.http->countMethod("initialize"), 1u);
}

TEST(SessionManager, InvalidateTriggersNewHandshakeOnce) {
    SessionFixture f;
    const auto gen = f.manager.EnsureReady({});
    EXPECT_EQ(f.session.sessionId().value_or(""), "session-1");

    f.manager.Invalidate(gen);
    EXPECT_EQ(f.session.state(), InitState::Uninitialized);
    EXPECT_FALSE(f.session.sessionId().has_value());

    // A second report of the same loss is stale
    f.manager.Invalidate(gen);
    const auto gen2 = f.manager.EnsureReady({});
    EXPECT_NE(gen2, gen);
    f.manager.Invalidate(gen);
    EXPECT_EQ(f.session.state(), InitState::Ready);
    EXPECT_EQ(f.session.sessionId().value_or(""), "session-2");
    EXPECT_EQ(f.http->countMethod("initialize"), 2u);

    // Request counter restarted with the new session
    auto reqs = f.http->requests();
    ASSERT_EQ(reqs.size(), 4u);
    EXPECT_EQ(reqs[2].id.value_or(0), 1);
}
