//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Walter MCP endpoint constants: protocol version, method names, tool names and headers
//==========================================================================================================

#pragma once

#include <string>

namespace walter {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version sent in initialize
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

// Client identity reported in clientInfo and the User-Agent header
constexpr const char* DEFAULT_CLIENT_NAME = "walter-cpp-client";

// Path appended to the configured base URL
constexpr const char* MCP_ENDPOINT_PATH = "/mcp";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* CallTool = "tools/call";
}

///////////////////////////////////////// Tool names ///////////////////////////////////////////
namespace Tools {
    constexpr const char* StartChat = "start_chat";
    constexpr const char* ListChats = "list_chats";
    constexpr const char* SendMessage = "send_message";
    constexpr const char* GetResponse = "get_response";
    constexpr const char* Cancel = "cancel";
    constexpr const char* ListTurfs = "list_turfs";
    constexpr const char* SearchTurfs = "search_turfs";
}

///////////////////////////////////////// Header names ///////////////////////////////////////////
namespace Headers {
    constexpr const char* SessionId = "Mcp-Session-Id";
    constexpr const char* Authorization = "Authorization";
    constexpr const char* UserAgent = "User-Agent";
    constexpr const char* ContentType = "Content-Type";
    constexpr const char* Accept = "Accept";
}

} // namespace walter
