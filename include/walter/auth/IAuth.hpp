//==========================================================================================================
// SPDX-License-Identifier: MIT 
// Copyright (c) 2025 Vinny Parla
// File: include/walter/auth/IAuth.hpp
// Purpose: Authentication interface for the JSON-RPC transport
//==========================================================================================================
#pragma once

#include <vector>

#include "walter/http/HttpClient.hpp"

namespace walter::auth {

using HeaderKV = walter::http::HeaderKV;

class IAuth {
public:
    virtual ~IAuth() = default;

    // Return headers to apply to an outgoing HTTP request
    virtual std::vector<HeaderKV> headers() const = 0;
};

} // namespace walter::auth
