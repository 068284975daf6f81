//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: Walter client interface - COM-style abstraction over the Walter MCP tools
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "walter/Config.h"
#include "walter/StreamingPoller.h"
#include "walter/Types.h"
#include "walter/async/Clock.h"
#include "walter/http/HttpClient.hpp"

namespace walter {

//==========================================================================================================
// Walter Client interface
// Purpose: One operation per Walter tool plus the streaming chat. Every operation runs on a
//          background thread, honours the optional stop token and reports failures as
//          errors::WalterError subclasses through the returned future.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Chats ///////////////////////////////////////////////////////////
    //==========================================================================================================
    // Creates a new chat.
    // Returns:
    //   A future with the new chat id.
    //==========================================================================================================
    virtual std::future<std::string> CreateChat(std::stop_token st = {}) = 0;

    //==========================================================================================================
    // Lists the caller's chats.
    //==========================================================================================================
    virtual std::future<std::vector<Chat>> ListChats(std::stop_token st = {}) = 0;

    //==========================================================================================================
    // Submits a message without waiting for the answer.
    // Args:
    //   chatId: Chat to post into.
    //   message: User text.
    // Returns:
    //   A future with the request id to poll and the chat id the server resolved.
    //==========================================================================================================
    virtual std::future<PendingExchange> SendMessage(const std::string& chatId,
                                                     const std::string& message,
                                                     std::stop_token st = {}) = 0;

    //==========================================================================================================
    // Polls a previously submitted message once.
    //==========================================================================================================
    virtual std::future<ResponseStatus> GetResponse(const std::string& requestId, std::stop_token st = {}) = 0;

    //==========================================================================================================
    // Asks the server to stop active processing in a chat.
    //==========================================================================================================
    virtual std::future<CancelResult> CancelProcessing(const std::string& chatId, std::stop_token st = {}) = 0;

    ////////////////////////////////////////// Turfs ///////////////////////////////////////////////////////////
    virtual std::future<std::vector<Turf>> ListTurfs(std::stop_token st = {}) = 0;

    //==========================================================================================================
    // Searches turfs. Only the filters that are set are sent.
    //==========================================================================================================
    virtual std::future<TurfSearchResult> SearchTurfs(const TurfSearchFilters& filters, std::stop_token st = {}) = 0;

    ////////////////////////////////////////// Streaming ///////////////////////////////////////////////////////
    //==========================================================================================================
    // Sends a message and waits for the complete answer, reporting distinct partials as they arrive.
    // Args:
    //   chatId: Chat to post into.
    //   message: User text.
    //   onPartial: Optional callback, invoked on the worker thread.
    // Returns:
    //   A future with the final response and resolved chat id.
    //==========================================================================================================
    virtual std::future<ChatReply> ChatStreaming(const std::string& chatId,
                                                 const std::string& message,
                                                 PartialCallback onPartial,
                                                 std::stop_token st = {}) = 0;

    //==========================================================================================================
    // ChatStreaming that first creates a chat when chatId is absent or blank.
    // Throws (via future):
    //   std::invalid_argument when message is blank.
    //==========================================================================================================
    virtual std::future<ChatReply> Converse(const std::string& message,
                                            const std::optional<std::string>& chatId,
                                            PartialCallback onPartial,
                                            std::stop_token st = {}) = 0;
};

// Standard Walter client implementation
class Client : public IClient {
public:
    //==========================================================================================================
    // Constructs a client talking to <opts.baseUrl>/mcp over Boost.Beast. Options are validated.
    //==========================================================================================================
    explicit Client(const ClientOptions& opts);

    //==========================================================================================================
    // Constructs a client over caller-supplied HTTP and clock implementations (tests, custom stacks).
    //==========================================================================================================
    Client(const ClientOptions& opts,
           std::shared_ptr<http::IHttpClient> httpClient,
           std::shared_ptr<async::IClock> clock,
           const PollOptions& pollOpts = {});
    virtual ~Client();

    ////////////////////////////////////////// IClient implementation //////////////////////////////////////////
    std::future<std::string> CreateChat(std::stop_token st = {}) override;
    std::future<std::vector<Chat>> ListChats(std::stop_token st = {}) override;
    std::future<PendingExchange> SendMessage(const std::string& chatId,
                                             const std::string& message,
                                             std::stop_token st = {}) override;
    std::future<ResponseStatus> GetResponse(const std::string& requestId, std::stop_token st = {}) override;
    std::future<CancelResult> CancelProcessing(const std::string& chatId, std::stop_token st = {}) override;
    std::future<std::vector<Turf>> ListTurfs(std::stop_token st = {}) override;
    std::future<TurfSearchResult> SearchTurfs(const TurfSearchFilters& filters, std::stop_token st = {}) override;
    std::future<ChatReply> ChatStreaming(const std::string& chatId,
                                         const std::string& message,
                                         PartialCallback onPartial,
                                         std::stop_token st = {}) override;
    std::future<ChatReply> Converse(const std::string& message,
                                    const std::optional<std::string>& chatId,
                                    PartialCallback onPartial,
                                    std::stop_token st = {}) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Client factory interface
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient(const ClientOptions& opts) = 0;
};

// Standard client factory
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient(const ClientOptions& opts) override;
};

} // namespace walter
