//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.cpp
// Purpose: tools/call invocation and result envelope decoding
//==========================================================================================================

#include "walter/ToolInvoker.h"
#include "walter/Protocol.h"
#include "walter/Session.h"
#include "walter/Transport.h"
#include "walter/errors/Errors.h"
#include "walter/validation/Validators.h"
#include "logging/Logger.h"

namespace walter {

namespace {

ToolCallResult unwrapEnvelope(const std::string& context, const JSONValue& result) {
    const std::string itemContext = context + ".content[]";
    const auto& obj = validation::requireObject(result, context);

    ToolCallResult out;
    const auto& arr = validation::requireArray(obj, "content", context);
    out.content.reserve(arr.size());
    const JSONValue nullValue;
    for (const auto& p : arr) {
        const JSONValue& item = p ? *p : nullValue;
        const auto& itemObj = validation::requireObject(item, itemContext);
        ContentItem c;
        c.type = validation::requireString(itemObj, "type", itemContext);
        if (c.type == "text") {
            c.text = validation::requireString(itemObj, "text", itemContext);
        } else {
            c.text = validation::optionalString(itemObj, "text");
        }
        c.raw = item;
        out.content.push_back(std::move(c));
    }

    const JSONValue* isErr = validation::findField(obj, "isError");
    out.isError = isErr != nullptr && std::holds_alternative<bool>(isErr->value) && std::get<bool>(isErr->value);
    return out;
}

} // namespace

ToolInvoker::ToolInvoker(RpcTransport& transport, SessionManager& sessions)
    : transport(transport), sessions(sessions) {}

ToolCallResult ToolInvoker::decodeToolResult(const std::string& name, const JSONValue& result) {
    // A malformed envelope is a protocol violation, not a payload decode failure
    try {
        return unwrapEnvelope("tools/call(" + name + ")", result);
    } catch (const errors::DecodeError& e) {
        throw errors::ProtocolError(e.what());
    }
}

ToolCallResult ToolInvoker::callOnce(const std::string& name, const JSONValue& params, std::stop_token stopToken) {
    JSONValue raw = transport.Send(Methods::CallTool, params, stopToken);
    ToolCallResult result = decodeToolResult(name, raw);
    if (result.isError) {
        std::string message = "Unknown error";
        for (const auto& c : result.content) {
            if (c.type == "text" && c.text.has_value()) {
                message = c.text.value();
                break;
            }
        }
        LOG_DEBUG("Tool {} reported error: {}", name, message);
        throw errors::ToolError(name, message);
    }
    return result;
}

ToolCallResult ToolInvoker::Invoke(const std::string& name, const JSONValue& arguments, std::stop_token stopToken) {
    FUNC_SCOPE();
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(name);
    params["arguments"] = std::make_shared<JSONValue>(arguments);
    const JSONValue paramsValue{std::move(params)};

    const uint64_t generation = sessions.EnsureReady(stopToken);
    try {
        return callOnce(name, paramsValue, stopToken);
    } catch (const errors::TransportError& e) {
        if (!errors::isSessionLoss(e)) {
            throw;
        }
        LOG_WARN("Tool {}: session lost ({}); retrying once", name, e.what());
    }
    sessions.Invalidate(generation);
    sessions.EnsureReady(stopToken);
    return callOnce(name, paramsValue, stopToken);
}

} // namespace walter
