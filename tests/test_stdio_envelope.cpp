//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_envelope.cpp
// Purpose: GoogleTests for stdio envelope construction and reply interpretation
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolgw/StdioEnvelope.h"

using namespace toolgw;

namespace {
int64_t codeOf(const JSONRPCResponse& r) {
    return r.error ? GetInteger(*r.error, "code").value_or(0) : 0;
}
} // namespace

TEST(StdioEnvelope, CallToolEnvelopeCarriesIdTypeAndParams) {
    JSONValue env = MakeCallToolEnvelope("srv_1", "sum", ParseJSON(R"({"a":1})"));
    EXPECT_EQ(GetString(env, "id").value_or(""), "srv_1");
    EXPECT_EQ(GetString(env, "type").value_or(""), "callTool");
    EXPECT_EQ(GetString(env, "tool").value_or(""), "sum");
    EXPECT_EQ(GetInteger(*FindMember(env, "parameters"), "a").value_or(0), 1);
}

TEST(StdioEnvelope, ReplyIdAcceptsLegacyRequestId) {
    EXPECT_EQ(ReplyId(ParseJSON(R"({"id":"x"})")).value_or(""), "x");
    EXPECT_EQ(ReplyId(ParseJSON(R"({"requestId":"y"})")).value_or(""), "y");
    EXPECT_EQ(ReplyId(ParseJSON(R"({"id":12})")).value_or(""), "12");
    EXPECT_FALSE(ReplyId(ParseJSON(R"({"result":1})")).has_value());
}

TEST(StdioEnvelope, ServerErrorCodeIsKept) {
    auto r = ResponseFromReply("a", ParseJSON(R"({"id":"a","error":{"code":-32601,"message":"nope"}})"));
    ASSERT_TRUE(r->IsError());
    EXPECT_EQ(codeOf(*r), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(GetString(*r->error, "message").value_or(""), "nope");
}

TEST(StdioEnvelope, ServerCannotClaimGatewayCodes) {
    for (int code : {JSONRPCErrorCodes::ConfigNotFound, JSONRPCErrorCodes::Timeout, JSONRPCErrorCodes::ProcessExited,
                     JSONRPCErrorCodes::ResourceNotFound}) {
        JSONValue::Object err;
        SetMember(err, "code", JSONValue(static_cast<int64_t>(code)));
        SetMember(err, "message", JSONValue("spoofed"));
        JSONValue::Object reply;
        SetMember(reply, "id", JSONValue("a"));
        SetMember(reply, "error", JSONValue(std::move(err)));
        auto r = ResponseFromReply("a", JSONValue(std::move(reply)));
        ASSERT_TRUE(r->IsError());
        EXPECT_EQ(codeOf(*r), JSONRPCErrorCodes::ProtocolError) << "upstream code " << code;
        EXPECT_EQ(GetString(*r->error, "message").value_or(""), "spoofed");
    }
}

TEST(StdioEnvelope, CodelessAndLegacyErrorsAreProtocolErrors) {
    auto str = ResponseFromReply("a", ParseJSON(R"({"id":"a","error":"boom"})"));
    EXPECT_EQ(codeOf(*str), JSONRPCErrorCodes::ProtocolError);
    auto obj = ResponseFromReply("a", ParseJSON(R"({"id":"a","error":{"message":"no code"}})"));
    EXPECT_EQ(codeOf(*obj), JSONRPCErrorCodes::ProtocolError);
    auto legacy = ResponseFromReply("a", ParseJSON(R"({"requestId":"a","status":"error","message":"old"})"));
    EXPECT_EQ(codeOf(*legacy), JSONRPCErrorCodes::ProtocolError);
    EXPECT_EQ(GetString(*legacy->error, "message").value_or(""), "old");
}

TEST(StdioEnvelope, ResultOrWholeReply) {
    auto r = ResponseFromReply("a", ParseJSON(R"({"id":"a","result":{"v":2}})"));
    ASSERT_FALSE(r->IsError());
    EXPECT_EQ(GetInteger(*r->result, "v").value_or(0), 2);
    auto whole = ResponseFromReply("a", ParseJSON(R"({"id":"a","status":"ok","data":3})"));
    ASSERT_FALSE(whole->IsError());
    EXPECT_EQ(GetInteger(*whole->result, "data").value_or(0), 3);
}
