//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamingPoller.h
// Purpose: Turns send_message + get_response polling into one blocking, cancellable streaming call
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <stop_token>
#include <string>

#include "walter/Types.h"
#include "walter/async/Clock.h"

namespace walter {

//==========================================================================================================
// PollOptions
// Fields:
//   settleDelay: Wait after submission before the first poll.
//   maxPollDuration: Wall-clock bound measured from submission.
//   minRetryAfter: Floor applied to the server's retry_after_seconds (zero/negative values included).
//   initialBackoff: First delay after a failed poll; doubles on each consecutive failure.
//   maxConsecutiveErrors: Consecutive failures at which the last error is rethrown.
//==========================================================================================================
struct PollOptions {
    std::chrono::milliseconds settleDelay{2000};
    std::chrono::milliseconds maxPollDuration{5 * 60 * 1000};
    std::chrono::milliseconds minRetryAfter{1000};
    std::chrono::milliseconds initialBackoff{2000};
    int maxConsecutiveErrors{3};
};

// Called with each new, distinct partial response
using PartialCallback = std::function<void(const std::string&)>;

//==========================================================================================================
// IResponseSource
// Purpose: The two domain calls the poller drives.
//==========================================================================================================
class IResponseSource {
public:
    virtual ~IResponseSource() = default;
    virtual PendingExchange SubmitMessage(const std::string& chatId, const std::string& message, std::stop_token stopToken) = 0;
    virtual ResponseStatus FetchResponse(const std::string& requestId, std::stop_token stopToken) = 0;
};

//==========================================================================================================
// StreamingPoller
// Purpose: Submit, settle, then poll until Complete/Error, the deadline, or cancellation.
// Throws:
//   errors::CancelledError once the stop token is observed; no further calls are made after that.
//   errors::TimeoutError when maxPollDuration elapses without a terminal status.
//   errors::RemoteTaskError when the server reports status "error".
//   The last poll error after maxConsecutiveErrors consecutive failures.
//==========================================================================================================
class StreamingPoller {
public:
    StreamingPoller(IResponseSource& source, async::IClock& clock, PollOptions opts = {});

    ChatReply Stream(const std::string& chatId,
                     const std::string& message,
                     const PartialCallback& onPartial,
                     std::stop_token stopToken);

private:
    // Sleeps for d, cut short at the deadline. Throws CancelledError when interrupted.
    void sleepUntilNext(std::chrono::milliseconds d, async::IClock::TimePoint deadline, std::stop_token stopToken);

    IResponseSource& source;
    async::IClock& clock;
    PollOptions opts;
};

} // namespace walter
