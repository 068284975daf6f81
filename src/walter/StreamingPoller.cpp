//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StreamingPoller.cpp
// Purpose: Submit-then-poll loop with settle delay, deadline, bounded retries and exponential backoff
//==========================================================================================================

#include <algorithm>
#include <cmath>

#include "walter/StreamingPoller.h"
#include "walter/errors/Errors.h"
#include "logging/Logger.h"

namespace walter {

namespace {

std::string describeDuration(std::chrono::milliseconds d) {
    const auto ms = d.count();
    if (ms % 60000 == 0) {
        const auto minutes = ms / 60000;
        return fmt::format("{} minute{}", minutes, minutes == 1 ? "" : "s");
    }
    if (ms % 1000 == 0) {
        const auto seconds = ms / 1000;
        return fmt::format("{} second{}", seconds, seconds == 1 ? "" : "s");
    }
    return fmt::format("{} ms", ms);
}

} // namespace

StreamingPoller::StreamingPoller(IResponseSource& source, async::IClock& clock, PollOptions opts)
    : source(source), clock(clock), opts(opts) {}

void StreamingPoller::sleepUntilNext(std::chrono::milliseconds d, async::IClock::TimePoint deadline, std::stop_token stopToken) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock.now());
    const auto wait = std::max(std::chrono::milliseconds(0), std::min(d, remaining));
    if (!clock.sleepFor(wait, stopToken)) {
        throw errors::CancelledError();
    }
}

ChatReply StreamingPoller::Stream(const std::string& chatId,
                                  const std::string& message,
                                  const PartialCallback& onPartial,
                                  std::stop_token stopToken) {
    FUNC_SCOPE();
    const PendingExchange exchange = source.SubmitMessage(chatId, message, stopToken);
    const auto deadline = clock.now() + opts.maxPollDuration;
    LOG_DEBUG("Stream: submitted request {} on chat {}", exchange.requestId, exchange.chatId);

    if (!clock.sleepFor(opts.settleDelay, stopToken)) {
        throw errors::CancelledError();
    }

    std::string lastPartial;
    int consecutiveErrors = 0;
    auto backoff = opts.initialBackoff;

    while (true) {
        if (stopToken.stop_requested()) {
            LOG_INFO("Stream: request {} cancelled", exchange.requestId);
            throw errors::CancelledError();
        }
        if (clock.now() >= deadline) {
            LOG_WARN("Stream: request {} produced no result within {}", exchange.requestId, describeDuration(opts.maxPollDuration));
            throw errors::TimeoutError("Walter response timed out after " + describeDuration(opts.maxPollDuration));
        }

        ResponseStatus status;
        try {
            status = source.FetchResponse(exchange.requestId, stopToken);
            consecutiveErrors = 0;
            backoff = opts.initialBackoff;
        } catch (const errors::CancelledError&) {
            throw;
        } catch (const errors::WalterError& e) {
            if (stopToken.stop_requested()) {
                throw errors::CancelledError();
            }
            ++consecutiveErrors;
            if (consecutiveErrors >= opts.maxConsecutiveErrors) {
                LOG_ERROR("Stream: giving up after {} consecutive poll failures: {}", consecutiveErrors, e.what());
                throw;
            }
            LOG_WARN("Stream: poll failed ({} of {}), retrying in {} ms: {}",
                     consecutiveErrors, opts.maxConsecutiveErrors, backoff.count(), e.what());
            sleepUntilNext(backoff, deadline, stopToken);
            backoff *= 2;
            continue;
        }

        if (auto* processing = std::get_if<ResponseProcessing>(&status)) {
            if (processing->partial.has_value() && !processing->partial->empty() && processing->partial.value() != lastPartial) {
                lastPartial = processing->partial.value();
                LOG_DEBUG("Stream: partial update ({} chars)", lastPartial.size());
                if (onPartial) {
                    onPartial(lastPartial);
                }
            }
            const double requestedMs = std::clamp(processing->retryAfterSeconds * 1000.0,
                static_cast<double>(opts.minRetryAfter.count()), static_cast<double>(opts.maxPollDuration.count()));
            const auto interval = std::chrono::milliseconds(std::llround(requestedMs));
            sleepUntilNext(interval, deadline, stopToken);
        } else if (auto* complete = std::get_if<ResponseComplete>(&status)) {
            LOG_INFO("Stream: request {} complete", exchange.requestId);
            return ChatReply{ complete->response, exchange.chatId };
        } else {
            const auto& err = std::get<ResponseError>(status);
            LOG_WARN("Stream: request {} failed remotely: {}", exchange.requestId, err.error);
            throw errors::RemoteTaskError(err.error);
        }
    }
}

} // namespace walter
