//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the gateway error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolgw/JSONRPCTypes.h"
#include "toolgw/errors/Errors.h"

using namespace toolgw;
using toolgw::errors::ErrorCategory;

TEST(Errors, CategoryMapping) {
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ConfigNotFound), ErrorCategory::ConfigNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ServerDisabled), ErrorCategory::ServerDisabled);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::Timeout), ErrorCategory::Timeout);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ProcessExited), ErrorCategory::ProcessExited);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::UnknownTool);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::ProtocolError);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::InvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Internal);
}

TEST(Errors, CodesRoundTripThroughCategories) {
    for (ErrorCategory c : {ErrorCategory::ConfigNotFound, ErrorCategory::ServerDisabled,
                            ErrorCategory::ConnectionFailed, ErrorCategory::Timeout, ErrorCategory::ProtocolError,
                            ErrorCategory::ProcessExited, ErrorCategory::UnknownAction, ErrorCategory::UnknownTool,
                            ErrorCategory::SessionNotFound, ErrorCategory::InvalidRequest,
                            ErrorCategory::InvalidParams, ErrorCategory::ResourceNotFound, ErrorCategory::Internal}) {
        EXPECT_EQ(errors::errorCategoryFromCode(errors::codeForCategory(c)), c) << errors::categoryName(c);
    }
}

TEST(Errors, StatusClasses) {
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::SessionNotFound), 404);
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::ConfigNotFound), 404);
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::InvalidRequest), 400);
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::UnknownAction), 400);
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::ConnectionFailed), 502);
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::Timeout), 504);
    EXPECT_EQ(errors::statusClassFor(ErrorCategory::Internal), 500);
}

TEST(Errors, InternalMessagesAreScrubbed) {
    auto internal = errors::makeError(ErrorCategory::Internal, "std::bad_alloc at 0xdeadbeef");
    EXPECT_EQ(errors::publicMessage(internal), "Internal error");
    auto visible = errors::makeError(ErrorCategory::SessionNotFound, "Session not found: s1");
    EXPECT_EQ(errors::publicMessage(visible), "Session not found: s1");
}

TEST(Errors, FromErrorValue) {
    JSONValue obj = ParseJSON(R"({"code":-32013,"message":"slow","data":{"after":5}})");
    auto e = errors::gatewayErrorFromErrorValue(obj);
    ASSERT_TRUE(e.has_value());
    EXPECT_EQ(e->category, ErrorCategory::Timeout);
    EXPECT_EQ(e->message, "slow");
    ASSERT_TRUE(e->data.has_value());
    EXPECT_EQ(GetInteger(*e->data, "after").value_or(0), 5);

    // Upstream errors without a code are protocol errors
    auto bare = errors::gatewayErrorFromErrorValue(ParseJSON(R"({"message":"boom"})"));
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->code, JSONRPCErrorCodes::ProtocolError);
    EXPECT_EQ(bare->category, ErrorCategory::ProtocolError);

    auto text = errors::gatewayErrorFromErrorValue(JSONValue("plain failure"));
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text->message, "plain failure");

    EXPECT_FALSE(errors::gatewayErrorFromErrorValue(JSONValue(static_cast<int64_t>(3))).has_value());
}

TEST(Errors, ExceptionCarriesTypedError) {
    try {
        throw errors::GatewayException(ErrorCategory::ServerDisabled, "Server is disabled: fs");
    } catch (const errors::GatewayException& e) {
        EXPECT_STREQ(e.what(), "Server is disabled: fs");
        EXPECT_EQ(e.category(), ErrorCategory::ServerDisabled);
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::ServerDisabled);
        EXPECT_EQ(e.statusClass(), 400);
    }
}

TEST(Errors, ErrorResponseShape) {
    auto resp = errors::makeErrorResponse(JSONRPCId{std::string("gateway")},
                                          errors::makeError(ErrorCategory::ConfigNotFound, "missing"));
    ASSERT_TRUE(resp->IsError());
    auto back = errors::gatewayErrorFromResponse(*resp);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->category, ErrorCategory::ConfigNotFound);
    EXPECT_EQ(back->message, "missing");
}
