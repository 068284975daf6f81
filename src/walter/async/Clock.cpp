//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Clock.cpp
// Purpose: SteadyClock implementation
//==========================================================================================================

#include <condition_variable>
#include <mutex>

#include "walter/async/Clock.h"

namespace walter {
namespace async {

IClock::TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

bool SteadyClock::sleepFor(std::chrono::milliseconds d, std::stop_token stopToken) {
    if (stopToken.stop_requested()) {
        return false;
    }
    if (d.count() <= 0) {
        return true;
    }
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    (void)cv.wait_for(lk, stopToken, d, []() { return false; });
    return !stopToken.stop_requested();
}

} // namespace async
} // namespace walter
