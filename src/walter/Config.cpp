//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Client option validation and loaders
//==========================================================================================================

#include <limits>
#include <stdexcept>

#include "walter/Config.h"
#include "walter/errors/Errors.h"
#include "walter/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace walter {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) {
        --e;
    }
    return s.substr(b, e - b);
}

unsigned int parseUnsigned(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        unsigned long v = std::stoul(val, &used);
        if (used != val.size() || v > std::numeric_limits<unsigned int>::max() || val[0] == '-') {
            throw std::invalid_argument(val);
        }
        return static_cast<unsigned int>(v);
    } catch (const std::exception&) {
        throw errors::ConfigError("Walter config '" + key + "' is not a valid number: " + val);
    }
}

int64_t parseInt64(const std::string& key, const std::string& val) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(val, &used);
        if (used != val.size()) {
            throw std::invalid_argument(val);
        }
        return static_cast<int64_t>(v);
    } catch (const std::exception&) {
        throw errors::ConfigError("Walter config '" + key + "' is not a valid number: " + val);
    }
}

} // namespace

ClientOptions ValidateClientOptions(const ClientOptions& in) {
    ClientOptions opts = in;

    opts.token = trim(opts.token);
    if (opts.token.empty()) {
        throw errors::ConfigError("Walter config requires 'token' (your Walter API token)");
    }

    std::string url = trim(opts.baseUrl);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (url.empty()) {
        url = DEFAULT_BASE_URL;
    }
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else {
        throw errors::ConfigError("Walter config 'url' is not a valid URL: must use http or https");
    }
    if (rest.empty() || rest[0] == '/' || rest[0] == ':') {
        throw errors::ConfigError("Walter config 'url' is not a valid URL: missing host");
    }
    opts.baseUrl = url;

    opts.clientName = trim(opts.clientName);
    if (opts.clientName.empty()) {
        opts.clientName = DEFAULT_CLIENT_NAME;
    }
    opts.clientVersion = trim(opts.clientVersion);
    if (opts.clientVersion.empty()) {
        opts.clientVersion = getVersionString();
    }
    if (opts.requestTimeoutMs == 0) {
        throw errors::ConfigError("Walter config 'timeoutMs' must be positive");
    }
    if (opts.connectTimeoutMs == 0) {
        throw errors::ConfigError("Walter config 'connectTimeoutMs' must be positive");
    }
    if (opts.requestIdCeiling <= 0) {
        throw errors::ConfigError("Walter config 'requestIdCeiling' must be positive");
    }
    return opts;
}

ClientOptions ClientOptionsFromConfigString(const std::string& config) {
    ClientOptions opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            throw errors::ConfigError("Walter config entry is not key=value: " + kv);
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "url") {
            opts.baseUrl = val;
        }
        else if (key == "token") {
            opts.token = val;
        }
        else if (key == "clientName") {
            opts.clientName = val;
        }
        else if (key == "clientVersion") {
            opts.clientVersion = val;
        }
        else if (key == "timeoutMs") {
            opts.requestTimeoutMs = parseUnsigned(key, val);
        }
        else if (key == "connectTimeoutMs") {
            opts.connectTimeoutMs = parseUnsigned(key, val);
        }
        else if (key == "requestIdCeiling") {
            opts.requestIdCeiling = parseInt64(key, val);
        }
        else if (key == "caFile") {
            opts.caFile = val;
        }
        else if (key == "caPath") {
            opts.caPath = val;
        }
        else {
            throw errors::ConfigError("Walter config has unknown key '" + key + "'");
        }
    }
    return ValidateClientOptions(opts);
}

ClientOptions ClientOptionsFromEnv() {
    ClientOptions opts;
    opts.baseUrl = GetEnvOrDefault("WALTER_URL", DEFAULT_BASE_URL);
    opts.token = GetEnvOrDefault("WALTER_TOKEN", "");
    auto timeout = GetEnvOptional("WALTER_TIMEOUT_MS");
    if (timeout.has_value()) {
        opts.requestTimeoutMs = parseUnsigned("WALTER_TIMEOUT_MS", trim(timeout.value()));
    }
    LOG_DEBUG("Config: loaded from environment (url={})", opts.baseUrl);
    return ValidateClientOptions(opts);
}

} // namespace walter
