//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: tools/call wrapper with envelope unwrapping and one retry on session loss
//==========================================================================================================

#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "walter/JSONRPCTypes.h"

namespace walter {

class RpcTransport;
class SessionManager;

//==========================================================================================================
// ContentItem
// Purpose: One fragment of a tool result. Non-text kinds are kept verbatim in raw.
//==========================================================================================================
struct ContentItem {
    std::string type;
    std::optional<std::string> text;
    JSONValue raw;
};

struct ToolCallResult {
    std::vector<ContentItem> content;
    bool isError{false};
};

//==========================================================================================================
// ToolInvoker
// Purpose: Invokes a named tool once the session is ready. A 404 (session lost) invalidates the
//          session, re-runs the handshake and retries exactly once; a second 404 propagates.
//==========================================================================================================
class ToolInvoker {
public:
    ToolInvoker(RpcTransport& transport, SessionManager& sessions);

    // Throws errors::ToolError when the result has isError set (message = first text fragment)
    ToolCallResult Invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken);

    // Unwraps a tools/call result envelope; exposed for tests
    static ToolCallResult decodeToolResult(const std::string& name, const JSONValue& result);

private:
    ToolCallResult callOnce(const std::string& name, const JSONValue& params, std::stop_token stopToken);

    RpcTransport& transport;
    SessionManager& sessions;
};

} // namespace walter
