//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_decoder.cpp
// Purpose: GoogleTests for tool payload parsing and domain record validation
//==========================================================================================================

#include <gtest/gtest.h>
#include <functional>
#include "walter/Decoder.h"
#include "walter/errors/Errors.h"

using namespace walter;

namespace {

ToolCallResult textResult(std::initializer_list<std::string> parts) {
    ToolCallResult r;
    for (const auto& p : parts) {
        ContentItem c;
        c.type = "text";
        c.text = p;
        r.content.push_back(c);
    }
    return r;
}

std::string decodeMessage(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const errors::DecodeError& e) {
        return e.what();
    }
    return std::string();
}

} // namespace

TEST(Decoder, JoinTextSkipsNonTextItems) {
    ToolCallResult r = textResult({ "{\"a\":", "1}" });
    ContentItem image;
    image.type = "image";
    r.content.insert(r.content.begin() + 1, image);
    EXPECT_EQ(decode::joinText(r), "{\"a\":\n1}");
    JSONValue v = decode::parsePayload(r);
    EXPECT_TRUE(v.isObject());
}

TEST(Decoder, NonJsonPayloadIsDecodeErrorWithPreview) {
    const std::string text = "Sorry, something went wrong " + std::string(300, 'z');
    const std::string msg = decodeMessage([&text]() { (void)decode::parsePayload(textResult({ text })); });
    ASSERT_FALSE(msg.empty());
    EXPECT_EQ(msg.rfind("Expected JSON from Walter, got: Sorry, something went wrong", 0), 0u);
    EXPECT_EQ(msg.size(), std::string("Expected JSON from Walter, got: ").size() + 200 + 3);
    EXPECT_EQ(msg.substr(msg.size() - 3), "...");

    const std::string shortMsg = decodeMessage([]() { (void)decode::parsePayload(textResult({ "nope" })); });
    EXPECT_EQ(shortMsg, "Expected JSON from Walter, got: nope");
}

TEST(Decoder, ChatRequiresIdAndStatus) {
    Chat c = decode::decodeChat(parseJSON(R"({"id":"c1","name":"Deploy","status":"idle","last_message":7})"));
    EXPECT_EQ(c.id, "c1");
    EXPECT_EQ(c.displayName.value_or(""), "Deploy");
    EXPECT_EQ(c.status, "idle");
    // Optional field of the wrong type reads as absent
    EXPECT_FALSE(c.lastMessage.has_value());
    EXPECT_FALSE(c.firstMessage.has_value());

    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeChat(parseJSON(R"({"id":"c1"})")); }),
              "Chat: expected string for 'status', got missing");
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeChat(parseJSON(R"({"id":5,"status":"idle"})")); }),
              "Chat: expected string for 'id', got number");
}

TEST(Decoder, TurfFieldNames) {
    Turf t = decode::decodeTurf(parseJSON(
        R"({"turf_id":"t1","name":"web-1","type":"server","status":"online","os":"linux","arch":"x86_64"})"));
    EXPECT_EQ(t.id, "t1");
    EXPECT_EQ(t.kind, "server");
    EXPECT_EQ(t.os.value_or(""), "linux");
    EXPECT_EQ(t.arch.value_or(""), "x86_64");
    EXPECT_FALSE(t.hostname.has_value());
    EXPECT_THROW((void)decode::decodeTurf(parseJSON(R"({"id":"t1","name":"n","type":"x","status":"s"})")), errors::DecodeError);
}

TEST(Decoder, ResponseStatusVariants) {
    ResponseStatus p = decode::decodeResponseStatus(parseJSON(R"({"status":"processing","partial":"Thin","retry_after_seconds":2})"));
    ASSERT_TRUE(std::holds_alternative<ResponseProcessing>(p));
    EXPECT_EQ(std::get<ResponseProcessing>(p).partial.value_or(""), "Thin");
    EXPECT_DOUBLE_EQ(std::get<ResponseProcessing>(p).retryAfterSeconds, 2.0);

    ResponseStatus d = decode::decodeResponseStatus(parseJSON(R"({"status":"processing"})"));
    EXPECT_FALSE(std::get<ResponseProcessing>(d).partial.has_value());
    EXPECT_DOUBLE_EQ(std::get<ResponseProcessing>(d).retryAfterSeconds, decode::kDefaultRetryAfterSeconds);

    ResponseStatus c = decode::decodeResponseStatus(parseJSON(R"({"status":"complete","response":"Done."})"));
    ASSERT_TRUE(std::holds_alternative<ResponseComplete>(c));
    EXPECT_EQ(std::get<ResponseComplete>(c).response, "Done.");

    ResponseStatus e = decode::decodeResponseStatus(parseJSON(R"({"status":"error","error":"quota exceeded"})"));
    ASSERT_TRUE(std::holds_alternative<ResponseError>(e));
    EXPECT_EQ(std::get<ResponseError>(e).error, "quota exceeded");
}

TEST(Decoder, ResponseStatusRejectsUnknownOrIncomplete) {
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeResponseStatus(parseJSON(R"({"status":"bogus"})")); }),
              "ResponseStatus: unknown status 'bogus'");
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeResponseStatus(parseJSON(R"({"partial":"x"})")); }),
              "ResponseStatus: expected string for 'status', got missing");
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeResponseStatus(parseJSON(R"({"status":"complete"})")); }),
              "ResponseStatus: expected string for 'response', got missing");
    EXPECT_THROW((void)decode::decodeResponseStatus(parseJSON(R"({"status":"error","error":null})")), errors::DecodeError);
}

TEST(Decoder, ToolPayloads) {
    EXPECT_EQ(decode::decodeStartChat(parseJSON(R"({"chat_id":"abc"})")), "abc");
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeStartChat(parseJSON(R"({"id":"abc"})")); }),
              "createChat: expected string for 'chat_id', got missing");

    auto chats = decode::decodeChatList(parseJSON(R"({"chats":[{"id":"a","status":"idle"},{"id":"b","status":"processing"}]})"));
    ASSERT_EQ(chats.size(), 2u);
    EXPECT_EQ(chats[1].status, "processing");
    EXPECT_THROW((void)decode::decodeChatList(parseJSON(R"({"chats":[{"id":"a"}]})")), errors::DecodeError);

    PendingExchange ex = decode::decodeSendMessage(parseJSON(R"({"request_id":"r9","chat_id":"c9"})"));
    EXPECT_EQ(ex.requestId, "r9");
    EXPECT_EQ(ex.chatId, "c9");

    CancelResult cr = decode::decodeCancel(parseJSON(R"({"status":"cancelled","message":"Stopped"})"));
    EXPECT_EQ(cr.status, "cancelled");
    EXPECT_EQ(cr.message.value_or(""), "Stopped");

    auto turfs = decode::decodeTurfList(parseJSON(R"({"turfs":[]})"));
    EXPECT_TRUE(turfs.empty());

    TurfSearchResult sr = decode::decodeTurfSearch(parseJSON(
        R"({"turfs":[{"turf_id":"t1","name":"db","type":"server","status":"offline"}],"count":1})"));
    ASSERT_EQ(sr.turfs.size(), 1u);
    EXPECT_EQ(sr.count, 1);
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeTurfSearch(parseJSON(R"({"turfs":[]})")); }),
              "searchTurfs: expected integer for 'count', got missing");
}

TEST(Decoder, TurfSearchCountMustBeIntegral) {
    EXPECT_EQ(decode::decodeTurfSearch(parseJSON(R"({"turfs":[],"count":3.0})")).count, 3);

    const std::string expected = "searchTurfs: expected integer for 'count', got number";
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeTurfSearch(parseJSON(R"({"turfs":[],"count":1.5})")); }), expected);
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeTurfSearch(parseJSON(R"({"turfs":[],"count":1e30})")); }), expected);
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeTurfSearch(parseJSON(R"({"turfs":[],"count":-1e19})")); }), expected);
    EXPECT_EQ(decodeMessage([]() { (void)decode::decodeTurfSearch(parseJSON(R"({"turfs":[],"count":"3"})")); }),
              "searchTurfs: expected integer for 'count', got string");
}
