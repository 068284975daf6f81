//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: Walter client implementation wiring transport, session, invoker, decoder and poller
//==========================================================================================================

#include <stdexcept>

#include "walter/Client.h"
#include "walter/Decoder.h"
#include "walter/Protocol.h"
#include "walter/Session.h"
#include "walter/ToolInvoker.h"
#include "walter/Transport.h"
#include "walter/auth/BearerAuth.hpp"
#include "walter/http/BeastHttpClient.hpp"
#include "logging/Logger.h"

namespace walter {

namespace {

std::shared_ptr<http::IHttpClient> makeBeastClient(const ClientOptions& opts) {
    http::BeastHttpClient::Options hopts;
    hopts.url = opts.baseUrl + MCP_ENDPOINT_PATH;
    hopts.caFile = opts.caFile;
    hopts.caPath = opts.caPath;
    hopts.connectTimeoutMs = opts.connectTimeoutMs;
    return std::make_shared<http::BeastHttpClient>(hopts);
}

JSONValue::Object::value_type field(const char* key, const std::string& value) {
    return { key, std::make_shared<JSONValue>(value) };
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

class Client::Impl : public IResponseSource {
public:
    ClientOptions opts;
    std::shared_ptr<http::IHttpClient> httpClient;
    std::shared_ptr<async::IClock> clock;
    std::shared_ptr<auth::IAuth> authProvider;
    Session session;
    RpcTransport transport;
    SessionManager sessions;
    ToolInvoker invoker;
    StreamingPoller poller;

    Impl(const ClientOptions& o,
         std::shared_ptr<http::IHttpClient> http,
         std::shared_ptr<async::IClock> clk,
         const PollOptions& pollOpts)
        : opts(o),
          httpClient(std::move(http)),
          clock(std::move(clk)),
          authProvider(std::make_shared<auth::BearerAuth>(o.token)),
          session(o.requestIdCeiling),
          transport(httpClient, authProvider, session,
                    RpcTransport::Options{ std::chrono::milliseconds(o.requestTimeoutMs),
                                           Implementation(o.clientName, o.clientVersion) }),
          sessions(session, transport, Implementation(o.clientName, o.clientVersion)),
          invoker(transport, sessions),
          poller(*this, *clock, pollOpts) {}

    JSONValue callForPayload(const char* tool, JSONValue::Object args, std::stop_token st) {
        LOG_DEBUG("Calling tool: {}", tool);
        ToolCallResult result = invoker.Invoke(tool, JSONValue{std::move(args)}, st);
        return decode::parsePayload(result);
    }

    std::string createChat(std::stop_token st) {
        return decode::decodeStartChat(callForPayload(Tools::StartChat, {}, st));
    }

    std::vector<Chat> listChats(std::stop_token st) {
        return decode::decodeChatList(callForPayload(Tools::ListChats, {}, st));
    }

    PendingExchange SubmitMessage(const std::string& chatId, const std::string& message, std::stop_token st) override {
        JSONValue::Object args{ field("chat_id", chatId), field("message", message) };
        return decode::decodeSendMessage(callForPayload(Tools::SendMessage, std::move(args), st));
    }

    ResponseStatus FetchResponse(const std::string& requestId, std::stop_token st) override {
        JSONValue::Object args{ field("request_id", requestId) };
        return decode::decodeResponseStatus(callForPayload(Tools::GetResponse, std::move(args), st));
    }

    CancelResult cancelProcessing(const std::string& chatId, std::stop_token st) {
        JSONValue::Object args{ field("chat_id", chatId) };
        return decode::decodeCancel(callForPayload(Tools::Cancel, std::move(args), st));
    }

    std::vector<Turf> listTurfs(std::stop_token st) {
        return decode::decodeTurfList(callForPayload(Tools::ListTurfs, {}, st));
    }

    TurfSearchResult searchTurfs(const TurfSearchFilters& filters, std::stop_token st) {
        JSONValue::Object args;
        if (filters.name.has_value()) args.insert(field("name", filters.name.value()));
        if (filters.type.has_value()) args.insert(field("type", filters.type.value()));
        if (filters.os.has_value()) args.insert(field("os", filters.os.value()));
        if (filters.status.has_value()) args.insert(field("status", filters.status.value()));
        return decode::decodeTurfSearch(callForPayload(Tools::SearchTurfs, std::move(args), st));
    }

    ChatReply converse(const std::string& message, const std::optional<std::string>& chatId,
                       const PartialCallback& onPartial, std::stop_token st) {
        if (isBlank(message)) {
            throw std::invalid_argument("message is required");
        }
        std::string id = chatId.has_value() && !isBlank(chatId.value()) ? chatId.value() : std::string();
        if (id.empty()) {
            id = createChat(st);
            LOG_INFO("Created chat {}", id);
        }
        return poller.Stream(id, message, onPartial, st);
    }
};

Client::Client(const ClientOptions& opts) {
    ClientOptions valid = ValidateClientOptions(opts);
    pImpl = std::make_unique<Impl>(valid, makeBeastClient(valid), std::make_shared<async::SteadyClock>(), PollOptions{});
}

Client::Client(const ClientOptions& opts,
               std::shared_ptr<http::IHttpClient> httpClient,
               std::shared_ptr<async::IClock> clock,
               const PollOptions& pollOpts)
    : pImpl(std::make_unique<Impl>(ValidateClientOptions(opts), std::move(httpClient), std::move(clock), pollOpts)) {}

Client::~Client() = default;

std::future<std::string> Client::CreateChat(std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, st]() { return pImpl->createChat(st); });
}

std::future<std::vector<Chat>> Client::ListChats(std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, st]() { return pImpl->listChats(st); });
}

std::future<PendingExchange> Client::SendMessage(const std::string& chatId, const std::string& message, std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, chatId, message, st]() {
        return pImpl->SubmitMessage(chatId, message, st);
    });
}

std::future<ResponseStatus> Client::GetResponse(const std::string& requestId, std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, requestId, st]() { return pImpl->FetchResponse(requestId, st); });
}

std::future<CancelResult> Client::CancelProcessing(const std::string& chatId, std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, chatId, st]() { return pImpl->cancelProcessing(chatId, st); });
}

std::future<std::vector<Turf>> Client::ListTurfs(std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, st]() { return pImpl->listTurfs(st); });
}

std::future<TurfSearchResult> Client::SearchTurfs(const TurfSearchFilters& filters, std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, filters, st]() { return pImpl->searchTurfs(filters, st); });
}

std::future<ChatReply> Client::ChatStreaming(const std::string& chatId,
                                             const std::string& message,
                                             PartialCallback onPartial,
                                             std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, chatId, message, cb = std::move(onPartial), st]() {
        return pImpl->poller.Stream(chatId, message, cb, st);
    });
}

std::future<ChatReply> Client::Converse(const std::string& message,
                                        const std::optional<std::string>& chatId,
                                        PartialCallback onPartial,
                                        std::stop_token st) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [this, message, chatId, cb = std::move(onPartial), st]() {
        return pImpl->converse(message, chatId, cb, st);
    });
}

std::unique_ptr<IClient> ClientFactory::CreateClient(const ClientOptions& opts) {
    FUNC_SCOPE();
    return std::make_unique<Client>(opts);
}

} // namespace walter
