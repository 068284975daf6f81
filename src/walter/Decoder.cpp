//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Decoder.cpp
// Purpose: Domain payload decoding with field-scoped diagnostics
//==========================================================================================================

#include <cmath>

#include "walter/Decoder.h"
#include "walter/errors/Errors.h"
#include "walter/validation/Validators.h"

namespace walter {
namespace decode {

using validation::optionalNumber;
using validation::optionalString;
using validation::requireObject;
using validation::requireString;

std::string joinText(const ToolCallResult& result) {
    std::string out;
    bool first = true;
    for (const auto& c : result.content) {
        if (c.type != "text" || !c.text.has_value()) {
            continue;
        }
        if (!first) {
            out += "\n";
        }
        out += c.text.value();
        first = false;
    }
    return out;
}

JSONValue parsePayload(const ToolCallResult& result) {
    const std::string text = joinText(result);
    try {
        return parseJSON(text);
    } catch (const std::runtime_error&) {
        const std::string preview = text.size() > kPreviewLength ? text.substr(0, kPreviewLength) + "..." : text;
        throw errors::DecodeError("Expected JSON from Walter, got: " + preview);
    }
}

Chat decodeChat(const JSONValue& raw) {
    const auto& obj = requireObject(raw, "Chat");
    Chat chat;
    chat.id = requireString(obj, "id", "Chat");
    chat.displayName = optionalString(obj, "name");
    chat.firstMessage = optionalString(obj, "first_message");
    chat.lastMessage = optionalString(obj, "last_message");
    chat.lastActivityAt = optionalString(obj, "last_activity_at");
    chat.status = requireString(obj, "status", "Chat");
    return chat;
}

Turf decodeTurf(const JSONValue& raw) {
    const auto& obj = requireObject(raw, "Turf");
    Turf turf;
    turf.id = requireString(obj, "turf_id", "Turf");
    turf.name = requireString(obj, "name", "Turf");
    turf.kind = requireString(obj, "type", "Turf");
    turf.status = requireString(obj, "status", "Turf");
    turf.os = optionalString(obj, "os");
    turf.hostname = optionalString(obj, "hostname");
    turf.arch = optionalString(obj, "arch");
    turf.version = optionalString(obj, "version");
    return turf;
}

ResponseStatus decodeResponseStatus(const JSONValue& raw) {
    const auto& obj = requireObject(raw, "ResponseStatus");
    const std::string status = requireString(obj, "status", "ResponseStatus");

    if (status == "processing") {
        ResponseProcessing p;
        p.partial = optionalString(obj, "partial");
        auto retry = optionalNumber(obj, "retry_after_seconds");
        p.retryAfterSeconds = (retry.has_value() && std::isfinite(retry.value())) ? retry.value() : kDefaultRetryAfterSeconds;
        return p;
    }
    if (status == "complete") {
        return ResponseComplete{ requireString(obj, "response", "ResponseStatus") };
    }
    if (status == "error") {
        return ResponseError{ requireString(obj, "error", "ResponseStatus") };
    }
    throw errors::DecodeError("ResponseStatus: unknown status '" + status + "'");
}

std::string decodeStartChat(const JSONValue& payload) {
    const auto& obj = requireObject(payload, "createChat");
    return requireString(obj, "chat_id", "createChat");
}

std::vector<Chat> decodeChatList(const JSONValue& payload) {
    const auto& obj = requireObject(payload, "listChats");
    return validation::decodeArray(obj, "chats", "listChats", decodeChat);
}

PendingExchange decodeSendMessage(const JSONValue& payload) {
    const auto& obj = requireObject(payload, "sendMessage");
    PendingExchange ex;
    ex.requestId = requireString(obj, "request_id", "sendMessage");
    ex.chatId = requireString(obj, "chat_id", "sendMessage");
    return ex;
}

CancelResult decodeCancel(const JSONValue& payload) {
    const auto& obj = requireObject(payload, "cancelProcessing");
    CancelResult r;
    r.status = requireString(obj, "status", "cancelProcessing");
    r.message = optionalString(obj, "message");
    return r;
}

std::vector<Turf> decodeTurfList(const JSONValue& payload) {
    const auto& obj = requireObject(payload, "listTurfs");
    return validation::decodeArray(obj, "turfs", "listTurfs", decodeTurf);
}

TurfSearchResult decodeTurfSearch(const JSONValue& payload) {
    const auto& obj = requireObject(payload, "searchTurfs");
    TurfSearchResult r;
    r.turfs = validation::decodeArray(obj, "turfs", "searchTurfs", decodeTurf);
    r.count = validation::requireInteger(obj, "count", "searchTurfs");
    return r;
}

} // namespace decode
} // namespace walter
