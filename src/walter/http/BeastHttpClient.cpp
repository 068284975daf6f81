//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/walter/http/BeastHttpClient.cpp
// Purpose: HTTP/HTTPS POST client using Boost.Beast coroutines with deadline and stop_token racing
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "walter/errors/Errors.h"
#include "walter/http/BeastHttpClient.hpp"

namespace walter {
namespace http {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

// Bound on the TLS close_notify exchange once the response has been read
constexpr std::chrono::milliseconds kShutdownGrace{250};
// Extra time Post waits past the deadline for the exchange to unwind before giving up on it
constexpr std::chrono::milliseconds kCompletionGrace{250};
constexpr std::chrono::milliseconds kWaitSlice{50};

// ------------------------------------------------------------------------------------------------------
// URL parsing helpers (very small, adequate for https://host[:port]/path)
// ------------------------------------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }

    std::size_t slash = url.find('/', pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = std::string("/");
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
    }

    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = parts.scheme == "https" ? std::string("443") : std::string("80");
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

//==========================================================================================================
// Exchange
// Purpose: I/O objects of one in-flight POST, shared with the stop callback so it can cancel them.
//          Touched only from the io_context thread.
//==========================================================================================================
struct Exchange {
    explicit Exchange(net::io_context& ioc) : resolver(ioc), watchdog(ioc) {}

    tcp::resolver resolver;
    net::steady_timer watchdog; // bounds the resolve step, which tcp_stream expiry does not cover
    std::optional<beast::tcp_stream> plain;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls;
    bool cancelled{false};
    bool timedOut{false};

    void cancel() {
        cancelled = true;
        resolver.cancel();
        watchdog.cancel();
        if (plain) { plain->cancel(); }
        if (tls) { beast::get_lowest_layer(*tls).cancel(); }
    }

    void throwIfCancelled() const {
        if (cancelled) {
            throw boost::system::system_error(net::error::operation_aborted);
        }
    }
};

HttpResponse toHttpResponse(const bhttp::response<bhttp::string_body>& res) {
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.reason = std::string(res.reason());
    for (const auto& field : res) {
        out.headers.push_back(HeaderKV{ std::string(field.name_string()), std::string(field.value()) });
    }
    out.body = res.body();
    return out;
}

} // namespace

class BeastHttpClient::Impl {
public:
    BeastHttpClient::Options opts;
    UrlParts url;

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    bool caInitOk{true};

    explicit Impl(const BeastHttpClient::Options& o) : opts(o), url(parseUrl(o.url)) {
        if (url.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_2_VERSION);
            ::ERR_clear_error();
            const bool userProvidedCA = !opts.caFile.empty() || !opts.caPath.empty();
            if (userProvidedCA) {
                try {
                    if (!opts.caFile.empty()) { sslCtx->load_verify_file(opts.caFile); }
                    if (!opts.caPath.empty()) { sslCtx->add_verify_path(opts.caPath); }
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTPS: failed to load user-provided CA file/path: {}", e.what());
                    caInitOk = false;
                }
            } else {
                try {
                    sslCtx->set_default_verify_paths();
                } catch (const std::exception& e) {
                    LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
                }
            }
            sslCtx->set_verify_mode(ssl::verify_peer);
        }

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("BeastHttpClient: io_context terminated: {}", e.what());
            }
        });
    }

    ~Impl() {
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    void applyHeaders(bhttp::request<bhttp::string_body>& req, const HttpRequest& request) const {
        req.set(bhttp::field::connection, "close");
        for (const auto& h : request.headers) {
            req.set(h.name, h.value);
        }
    }

    // Coroutine: POST the body and return the raw response (any status)
    net::awaitable<HttpResponse> coPost(std::shared_ptr<Exchange> ex, HttpRequest request,
                                        std::chrono::steady_clock::time_point deadline) {
        bhttp::request<bhttp::string_body> req{bhttp::verb::post, url.path, 11};
        req.set(bhttp::field::host, url.host);
        applyHeaders(req, request);
        req.body() = std::move(request.body);
        req.prepare_payload();

        const auto connectDeadline = std::min(deadline,
            std::chrono::steady_clock::now() + std::chrono::milliseconds(opts.connectTimeoutMs));

        ex->watchdog.expires_at(connectDeadline);
        ex->watchdog.async_wait([ex](const boost::system::error_code& ec) {
            if (!ec) {
                ex->timedOut = true;
                ex->resolver.cancel();
            }
        });
        boost::system::error_code resolveEc;
        auto results = co_await ex->resolver.async_resolve(url.host, url.port,
                                                           net::redirect_error(net::use_awaitable, resolveEc));
        ex->watchdog.cancel();
        ex->throwIfCancelled();
        if (ex->timedOut || std::chrono::steady_clock::now() >= connectDeadline) {
            LOG_DEBUG("HTTP: resolving {} did not finish before the deadline", url.host);
            throw boost::system::system_error(beast::error::timeout);
        }
        if (resolveEc) {
            throw boost::system::system_error(resolveEc);
        }
        LOG_DEBUG("HTTP: resolved {}:{} path={}", url.host, url.port, url.path);

        beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> res;

        if (url.scheme == "https") {
            ex->tls.emplace(ioc, *sslCtx);
            auto& stream = *ex->tls;
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
                LOG_WARN("HTTPS: failed to set SNI hostname {}", url.host);
            }
            (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());

            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_at(connectDeadline);
            co_await lowest.async_connect(results, net::use_awaitable);
            ex->throwIfCancelled();
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            ex->throwIfCancelled();

            lowest.expires_at(deadline);
            co_await bhttp::async_write(stream, req, net::use_awaitable);
            ex->throwIfCancelled();
            co_await bhttp::async_read(stream, buffer, res, net::use_awaitable);
            LOG_DEBUG("HTTP: https read status={} bytes={}", res.result_int(), res.body().size());

            // Peers often skip close_notify on "Connection: close"; the response is already complete
            lowest.expires_at(std::min(deadline, std::chrono::steady_clock::now() + kShutdownGrace));
            boost::system::error_code ec;
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                LOG_DEBUG("HTTPS: shutdown ended with {}", ec.message());
            }
        } else {
            ex->plain.emplace(ioc);
            auto& stream = *ex->plain;
            stream.expires_at(connectDeadline);
            co_await stream.async_connect(results, net::use_awaitable);
            ex->throwIfCancelled();

            stream.expires_at(deadline);
            co_await bhttp::async_write(stream, req, net::use_awaitable);
            ex->throwIfCancelled();
            co_await bhttp::async_read(stream, buffer, res, net::use_awaitable);
            LOG_DEBUG("HTTP: http read status={} bytes={}", res.result_int(), res.body().size());

            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toHttpResponse(res);
    }
};

BeastHttpClient::BeastHttpClient(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

BeastHttpClient::~BeastHttpClient() = default;

HttpResponse BeastHttpClient::Post(const HttpRequest& request,
                                   std::chrono::milliseconds timeout,
                                   std::stop_token stopToken) {
    FUNC_SCOPE();
    if (stopToken.stop_requested()) {
        throw errors::CancelledError();
    }
    if (!pImpl->caInitOk) {
        throw errors::TransportError(0, "HTTPS: CA initialization failed (bad caFile/caPath)");
    }

    auto ex = std::make_shared<Exchange>(pImpl->ioc);
    auto promise = std::make_shared<std::promise<HttpResponse>>();
    auto fut = promise->get_future();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const long long timeoutMs = static_cast<long long>(timeout.count());

    net::co_spawn(pImpl->ioc, pImpl->coPost(ex, request, deadline),
        [promise, ex, timeoutMs](std::exception_ptr eptr, HttpResponse res) {
            if (!eptr) {
                promise->set_value(std::move(res));
                return;
            }
            try {
                std::rethrow_exception(eptr);
            } catch (const boost::system::system_error& e) {
                if (ex->cancelled) {
                    promise->set_exception(std::make_exception_ptr(errors::CancelledError()));
                } else if (e.code() == beast::error::timeout) {
                    promise->set_exception(std::make_exception_ptr(errors::TimeoutError(
                        fmt::format("Walter request timed out after {} ms", timeoutMs))));
                } else {
                    promise->set_exception(std::make_exception_ptr(errors::TransportError(
                        0, fmt::format("Walter connection error: {}", e.code().message()))));
                }
            } catch (const std::exception& e) {
                promise->set_exception(std::make_exception_ptr(errors::TransportError(
                    0, fmt::format("Walter connection error: {}", e.what()))));
            }
        });

    // First of {response, deadline, caller cancellation} wins; the callback is unregistered on return
    std::stop_callback onStop(stopToken, [this, ex]() {
        net::post(pImpl->ioc, [ex]() { ex->cancel(); });
    });

    // A blocked system resolver can outlive cancellation, so the wait itself is bounded too
    const auto waitLimit = deadline + kCompletionGrace;
    std::optional<std::chrono::steady_clock::time_point> stopSeenAt;
    while (fut.wait_for(kWaitSlice) != std::future_status::ready) {
        const auto now = std::chrono::steady_clock::now();
        if (stopToken.stop_requested()) {
            if (!stopSeenAt) {
                stopSeenAt = now;
            } else if (now - *stopSeenAt >= kCompletionGrace) {
                LOG_WARN("HTTP: abandoning cancelled request still in flight");
                throw errors::CancelledError();
            }
        }
        if (now >= waitLimit) {
            net::post(pImpl->ioc, [ex]() { ex->cancel(); });
            LOG_WARN("HTTP: abandoning request after {} ms", timeoutMs);
            throw errors::TimeoutError(fmt::format("Walter request timed out after {} ms", timeoutMs));
        }
    }
    return fut.get();
}

} // namespace http
} // namespace walter
