//==========================================================================================================
// SPDX-License-Identifier: MIT 
// Copyright (c) 2025 Vinny Parla
// File: include/walter/auth/BearerAuth.hpp
// Purpose: Static bearer token auth implementing IAuth
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "walter/auth/IAuth.hpp"
#include "walter/Protocol.h"

namespace walter::auth {

class BearerAuth final : public IAuth {
public:
    explicit BearerAuth(std::string token) : token(std::move(token)) {}

    std::vector<HeaderKV> headers() const override {
        if (token.empty()) return {};
        return { HeaderKV{ Headers::Authorization, std::string("Bearer ") + token } };
    }

private:
    std::string token;
};

using BearerAuthPtr = std::shared_ptr<BearerAuth>;

} // namespace walter::auth
