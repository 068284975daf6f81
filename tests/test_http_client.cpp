//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_client.cpp
// Purpose: BeastHttpClient loopback tests over plain HTTP and HTTPS
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "walter/errors/Errors.h"
#include "walter/http/BeastHttpClient.hpp"

using namespace walter;

namespace {

namespace bhttp = boost::beast::http;

struct MiniServer {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> running{false};
    std::atomic<bool> released{false};
    std::atomic<int> accepted{0};
    unsigned short port{0};

    static void writeResponse(boost::beast::tcp_stream& stream,
                              const bhttp::request<bhttp::string_body>& req,
                              bhttp::status statusCode,
                              const std::string& body) {
        bhttp::response<bhttp::string_body> res{ statusCode, req.version() };
        res.set(bhttp::field::server, "mini-server");
        res.set(bhttp::field::content_type, "application/json");
        res.set("Mcp-Session-Id", "srv-session");
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        bhttp::write(stream, res);
    }

    // Holds a slow request until the deadline passes or stop() releases it
    void stall() {
        const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!released.load() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void runOnce() {
        using boost::asio::ip::tcp;
        try {
            tcp::socket socket{io};
            acceptor.accept(socket);
            if (!running.load()) {
                return;
            }
            ++accepted;
            boost::beast::tcp_stream stream{std::move(socket)};
            boost::beast::flat_buffer buffer;
            bhttp::request<bhttp::string_body> req;
            bhttp::read(stream, buffer, req);
            const std::string target = std::string(req.target());
            if (target == "/mcp") {
                // Echo what the client sent so the test can inspect it
                std::string echo = std::string("{\"method\":\"") + std::string(req.method_string())
                    + "\",\"auth\":\"" + std::string(req[bhttp::field::authorization])
                    + "\",\"ctype\":\"" + std::string(req[bhttp::field::content_type])
                    + "\",\"body\":" + req.body() + "}";
                writeResponse(stream, req, bhttp::status::ok, echo);
            } else if (target == "/missing/mcp") {
                writeResponse(stream, req, bhttp::status::not_found, "{\"error\":\"Session not found\"}");
            } else if (target == "/slow/mcp") {
                stall();
                writeResponse(stream, req, bhttp::status::ok, "{}");
            } else {
                writeResponse(stream, req, bhttp::status::internal_server_error, "oops");
            }
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const std::exception&) {
            // Client hung up or stop() poked the acceptor
        }
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        running.store(true);
        thr = std::thread([this]() {
            while (running.load()) {
                runOnce();
            }
        });
    }

    void stop() {
        running.store(false);
        released.store(true);
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket pokeSock{io};
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), port};
        pokeSock.connect(ep, ec);
        pokeSock.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }
};

struct ServerGuard {
    MiniServer& s;
    explicit ServerGuard(MiniServer& server) : s(server) { s.start(); }
    ~ServerGuard() { s.stop(); }
};

//==========================================================================================================
// SelfSignedCert
// Purpose: Throwaway RSA key and certificate for "localhost", written to a PEM file the client trusts.
//==========================================================================================================
struct SelfSignedCert {
    EVP_PKEY* key{nullptr};
    X509* cert{nullptr};
    std::filesystem::path pemPath;

    SelfSignedCert() {
        key = EVP_RSA_gen(2048);
        cert = X509_new();
        X509_set_version(cert, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert), -60);
        X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
        X509_set_pubkey(cert, key);
        X509_NAME* name = X509_get_subject_name(cert);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(cert, name);
        addExtension(NID_basic_constraints, "critical,CA:TRUE");
        addExtension(NID_subject_alt_name, "DNS:localhost");
        X509_sign(cert, key, EVP_sha256());

        pemPath = std::filesystem::temp_directory_path() / ("walter_test_cert_" + std::to_string(::getpid()) + ".pem");
        if (FILE* f = std::fopen(pemPath.c_str(), "w")) {
            PEM_write_X509(f, cert);
            std::fclose(f);
        }
    }

    ~SelfSignedCert() {
        std::error_code ec;
        std::filesystem::remove(pemPath, ec);
        X509_free(cert);
        EVP_PKEY_free(key);
    }

    void addExtension(int nid, const char* value) {
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
        X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value);
        if (ext != nullptr) {
            X509_add_ext(cert, ext, -1);
            X509_EXTENSION_free(ext);
        }
    }
};

//==========================================================================================================
// TlsServer
// Purpose: Single-shot HTTPS endpoint that answers and then holds the connection without sending
//          close_notify, the way many servers treat "Connection: close".
//==========================================================================================================
struct TlsServer {
    boost::asio::io_context io;
    boost::asio::ssl::context ctx{boost::asio::ssl::context::tls_server};
    boost::asio::ip::tcp::acceptor acceptor{io};
    std::thread thr;
    std::atomic<bool> released{false};
    unsigned short port{0};

    explicit TlsServer(const SelfSignedCert& identity) {
        SSL_CTX_use_certificate(ctx.native_handle(), identity.cert);
        SSL_CTX_use_PrivateKey(ctx.native_handle(), identity.key);
    }

    void start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor.open(ep.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen();
        port = acceptor.local_endpoint().port();
        thr = std::thread([this]() { serveOnce(); });
    }

    void serveOnce() {
        try {
            boost::asio::ssl::stream<boost::asio::ip::tcp::socket> tls{io, ctx};
            acceptor.accept(tls.next_layer());
            if (released.load()) {
                return;
            }
            tls.handshake(boost::asio::ssl::stream_base::server);
            boost::beast::flat_buffer buffer;
            bhttp::request<bhttp::string_body> req;
            bhttp::read(tls, buffer, req);
            bhttp::response<bhttp::string_body> res{ bhttp::status::ok, req.version() };
            res.set(bhttp::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = "{\"ok\":true}";
            res.prepare_payload();
            bhttp::write(tls, res);

            const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!released.load() && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        } catch (const std::exception&) {
            // Client hung up or stop() poked the acceptor
        }
    }

    void stop() {
        released.store(true);
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket pokeSock{io};
        pokeSock.connect({ boost::asio::ip::make_address("127.0.0.1"), port }, ec);
        pokeSock.close(ec);
        if (thr.joinable()) {
            thr.join();
        }
        acceptor.close(ec);
    }
};

http::HttpRequest jsonRequest(const std::string& body) {
    http::HttpRequest req;
    req.headers.push_back({ "Authorization", "Bearer t" });
    req.headers.push_back({ "Content-Type", "application/json" });
    req.body = body;
    return req;
}

} // namespace

TEST(BeastHttpClient, PostsBodyAndHeaders) {
    MiniServer server;
    ServerGuard guard(server);
    http::BeastHttpClient client(http::BeastHttpClient::Options{ server.url("/mcp"), "", "", 2000 });

    http::HttpResponse res = client.Post(jsonRequest("{\"x\":1}"), std::chrono::milliseconds(3000), {});
    EXPECT_EQ(res.status, 200);
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.header("mcp-session-id").value_or(""), "srv-session");
    EXPECT_NE(res.body.find("\"method\":\"POST\""), std::string::npos);
    EXPECT_NE(res.body.find("\"auth\":\"Bearer t\""), std::string::npos);
    EXPECT_NE(res.body.find("\"ctype\":\"application/json\""), std::string::npos);
    EXPECT_NE(res.body.find("\"body\":{\"x\":1}"), std::string::npos);
}

TEST(BeastHttpClient, NonSuccessStatusIsReturnedNotThrown) {
    MiniServer server;
    ServerGuard guard(server);
    http::BeastHttpClient client(http::BeastHttpClient::Options{ server.url("/missing/mcp"), "", "", 2000 });

    http::HttpResponse res = client.Post(jsonRequest("{}"), std::chrono::milliseconds(3000), {});
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.reason, "Not Found");
    EXPECT_FALSE(res.ok());
}

TEST(BeastHttpClient, DeadlineBecomesTimeoutError) {
    MiniServer server;
    ServerGuard guard(server);
    http::BeastHttpClient client(http::BeastHttpClient::Options{ server.url("/slow/mcp"), "", "", 2000 });

    const auto start = std::chrono::steady_clock::now();
    try {
        (void)client.Post(jsonRequest("{}"), std::chrono::milliseconds(200), {});
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_STREQ(e.what(), "Walter request timed out after 200 ms");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST(BeastHttpClient, StopTokenCancelsInFlightRequest) {
    MiniServer server;
    ServerGuard guard(server);
    http::BeastHttpClient client(http::BeastHttpClient::Options{ server.url("/slow/mcp"), "", "", 2000 });

    std::stop_source src;
    auto fut = std::async(std::launch::async, [&client, tok = src.get_token()]() {
        return client.Post(jsonRequest("{}"), std::chrono::milliseconds(5000), tok);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    src.request_stop();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::CancelledError);
}

TEST(BeastHttpClient, AlreadyCancelledTokenSkipsNetwork) {
    http::BeastHttpClient client(http::BeastHttpClient::Options{ "http://127.0.0.1:9/mcp", "", "", 2000 });
    std::stop_source src;
    src.request_stop();
    EXPECT_THROW((void)client.Post(jsonRequest("{}"), std::chrono::milliseconds(1000), src.get_token()), errors::CancelledError);
}

TEST(BeastHttpClient, ConnectionRefusedIsTransportError) {
    unsigned short port = 0;
    {
        boost::asio::io_context io;
        boost::asio::ip::tcp::acceptor probe{io, { boost::asio::ip::make_address("127.0.0.1"), 0 }};
        port = probe.local_endpoint().port();
    }
    http::BeastHttpClient client(http::BeastHttpClient::Options{
        "http://127.0.0.1:" + std::to_string(port) + "/mcp", "", "", 2000 });
    try {
        (void)client.Post(jsonRequest("{}"), std::chrono::milliseconds(2000), {});
        FAIL() << "expected TransportError";
    } catch (const errors::TransportError& e) {
        EXPECT_EQ(e.httpStatus(), 0);
        EXPECT_EQ(std::string(e.what()).rfind("Walter connection error: ", 0), 0u);
    }
}

TEST(BeastHttpClient, ResolutionCountsAgainstTheDeadline) {
    MiniServer server;
    ServerGuard guard(server);
    http::BeastHttpClient client(http::BeastHttpClient::Options{ server.url("/mcp"), "", "", 2000 });

    const auto start = std::chrono::steady_clock::now();
    try {
        (void)client.Post(jsonRequest("{}"), std::chrono::milliseconds(0), {});
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_STREQ(e.what(), "Walter request timed out after 0 ms");
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_EQ(server.accepted.load(), 0);
}

TEST(BeastHttpClient, HttpsResponseIsNotHeldByMissingCloseNotify) {
    SelfSignedCert identity;
    TlsServer server(identity);
    server.start();
    http::BeastHttpClient client(http::BeastHttpClient::Options{
        "https://localhost:" + std::to_string(server.port) + "/mcp", identity.pemPath.string(), "", 2000 });

    const auto start = std::chrono::steady_clock::now();
    http::HttpResponse res = client.Post(jsonRequest("{}"), std::chrono::milliseconds(5000), {});
    const auto elapsed = std::chrono::steady_clock::now() - start;
    server.stop();

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, "{\"ok\":true}");
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
}
