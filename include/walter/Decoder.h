//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Decoder.h
// Purpose: Converts tool result text into typed Walter domain records
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "walter/JSONRPCTypes.h"
#include "walter/ToolInvoker.h"
#include "walter/Types.h"

namespace walter {
namespace decode {

// Characters of offending text quoted in a payload parse error
constexpr std::size_t kPreviewLength = 200;

// Default poll interval when get_response omits retry_after_seconds
constexpr double kDefaultRetryAfterSeconds = 4.0;

// Text fragments of a tool result joined with "\n"
std::string joinText(const ToolCallResult& result);

//==========================================================================================================
// parsePayload
// Purpose: Strict JSON parse of the joined text fragments.
// Throws:
//   errors::DecodeError quoting at most kPreviewLength characters of the text.
//==========================================================================================================
JSONValue parsePayload(const ToolCallResult& result);

// Record validators. Required fields throw errors::DecodeError naming the field and record kind;
// optional fields of the wrong type read as absent.
Chat decodeChat(const JSONValue& raw);
Turf decodeTurf(const JSONValue& raw);

//==========================================================================================================
// decodeResponseStatus
// Purpose: The "status" discriminator selects the variant ("processing", "complete", "error").
//          Any other value is a DecodeError.
//==========================================================================================================
ResponseStatus decodeResponseStatus(const JSONValue& raw);

// Tool payload decoders
std::string decodeStartChat(const JSONValue& payload);
std::vector<Chat> decodeChatList(const JSONValue& payload);
PendingExchange decodeSendMessage(const JSONValue& payload);
CancelResult decodeCancel(const JSONValue& payload);
std::vector<Turf> decodeTurfList(const JSONValue& payload);
TurfSearchResult decodeTurfSearch(const JSONValue& payload);

} // namespace decode
} // namespace walter
