//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Client configuration, validation and loaders (config string, environment)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>

#include "walter/Protocol.h"
#include "walter/Session.h"

namespace walter {

constexpr const char* DEFAULT_BASE_URL = "https://walterops.com";

//==========================================================================================================
// ClientOptions
// Fields:
//   baseUrl: Service root; requests go to <baseUrl>/mcp (default: https://walterops.com)
//   token: Walter API token sent as a bearer credential (required)
//   clientName/clientVersion: Identity for clientInfo and User-Agent (version defaults to the library's)
//   requestTimeoutMs: Per-call timeout for every HTTP exchange
//   connectTimeoutMs: Resolve + connect + TLS handshake bound
//   requestIdCeiling: Request ids wrap back to 1 at this value
//   caFile/caPath: Optional trust store overrides for https
//==========================================================================================================
struct ClientOptions {
    std::string baseUrl{DEFAULT_BASE_URL};
    std::string token;
    std::string clientName{DEFAULT_CLIENT_NAME};
    std::string clientVersion;
    unsigned int requestTimeoutMs{30000};
    unsigned int connectTimeoutMs{10000};
    int64_t requestIdCeiling{kDefaultRequestIdCeiling};
    std::string caFile;
    std::string caPath;
};

//==========================================================================================================
// ValidateClientOptions
// Purpose: Returns a normalized copy: token trimmed, URL trimmed with trailing slashes removed,
//          empty URL replaced by the default, empty clientVersion replaced by the library version.
// Throws:
//   errors::ConfigError for a missing token, a non-http(s) URL, or zero timeouts.
//==========================================================================================================
ClientOptions ValidateClientOptions(const ClientOptions& opts);

//==========================================================================================================
// ClientOptionsFromConfigString
// Purpose: Parses "key=value; key=value" (keys: url, token, clientName, clientVersion, timeoutMs,
//          connectTimeoutMs, requestIdCeiling, caFile, caPath). The result is validated.
// Throws:
//   errors::ConfigError on unknown keys, malformed numbers or failed validation.
//==========================================================================================================
ClientOptions ClientOptionsFromConfigString(const std::string& config);

// Reads WALTER_URL, WALTER_TOKEN and WALTER_TIMEOUT_MS; the result is validated.
ClientOptions ClientOptionsFromEnv();

} // namespace walter
