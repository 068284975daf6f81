//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Clock.h
// Purpose: Time source and cancellable sleep used by polling loops
//==========================================================================================================

#pragma once

#include <chrono>
#include <stop_token>

namespace walter {
namespace async {

//==========================================================================================================
// IClock
// Purpose: Abstract monotonic clock.
// Methods:
//   now(): Current monotonic time.
//   sleepFor(d, st): Blocks for d or until st fires. Returns false when cancelled.
//==========================================================================================================
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
    virtual bool sleepFor(std::chrono::milliseconds d, std::stop_token stopToken) = 0;
};

// std::chrono::steady_clock with a condition_variable_any wait that wakes on stop requests
class SteadyClock final : public IClock {
public:
    TimePoint now() const override;
    bool sleepFor(std::chrono::milliseconds d, std::stop_token stopToken) override;
};

} // namespace async
} // namespace walter
