//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Types.h
// Purpose: Typed domain records decoded from Walter tool payloads
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace walter {

//==========================================================================================================
// Chat
// Purpose: Server-owned conversation. The client only observes it (create, list).
//==========================================================================================================
struct Chat {
    std::string id;
    std::optional<std::string> displayName;
    std::optional<std::string> firstMessage;
    std::optional<std::string> lastMessage;
    std::optional<std::string> lastActivityAt;
    std::string status;
};

//==========================================================================================================
// Turf
// Purpose: A connected managed system (server, cloud account) the Walter service can act on.
//==========================================================================================================
struct Turf {
    std::string id;
    std::string name;
    std::string kind;
    std::string status;
    std::optional<std::string> os;
    std::optional<std::string> hostname;
    std::optional<std::string> arch;
    std::optional<std::string> version;
};

///////////////////////////////////////// ResponseStatus ///////////////////////////////////////////
struct ResponseProcessing {
    std::optional<std::string> partial;
    double retryAfterSeconds{4.0};
};

struct ResponseComplete {
    std::string response;
};

struct ResponseError {
    std::string error;
};

// Exactly one alternative is active; unknown discriminators never decode.
using ResponseStatus = std::variant<ResponseProcessing, ResponseComplete, ResponseError>;

//==========================================================================================================
// PendingExchange
// Purpose: Result of send_message; lives only for one streaming call.
//==========================================================================================================
struct PendingExchange {
    std::string requestId;
    std::string chatId;
};

struct CancelResult {
    std::string status;
    std::optional<std::string> message;
};

struct TurfSearchFilters {
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<std::string> os;
    std::optional<std::string> status;
};

struct TurfSearchResult {
    std::vector<Turf> turfs;
    int64_t count{0};
};

//==========================================================================================================
// ChatReply
// Purpose: Final outcome of a streaming chat call.
//==========================================================================================================
struct ChatReply {
    std::string response;
    std::string chatId;
};

} // namespace walter
