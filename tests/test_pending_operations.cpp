//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_pending_operations.cpp
// Purpose: GoogleTests for request/response correlation and timeout expiry
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include "toolgw/PendingOperations.h"

using namespace toolgw;
using namespace std::chrono_literals;

TEST(PendingOperations, CompleteResolvesMatchingFuture) {
    PendingOperations ops;
    auto a = ops.Add("req_a", "callTool", 0ms);
    auto b = ops.Add("req_b", "readResource", 0ms);
    EXPECT_EQ(ops.Size(), 2u);
    EXPECT_EQ(ops.RequestType("req_b"), "readResource");

    // Out of order completion
    EXPECT_TRUE(ops.Complete("req_b", std::make_unique<JSONRPCResponse>(JSONRPCId{std::string("x")},
                                                                        JSONValue("B"))));
    ASSERT_EQ(b.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(a.wait_for(0ms), std::future_status::timeout);
    auto rb = b.get();
    EXPECT_EQ(IdToString(rb->id), "req_b");
    EXPECT_EQ(std::get<std::string>(rb->result->value), "B");

    EXPECT_TRUE(ops.Complete("req_a", std::make_unique<JSONRPCResponse>(JSONRPCId{std::string("req_a")},
                                                                        JSONValue("A"))));
    EXPECT_EQ(std::get<std::string>(a.get()->result->value), "A");
    EXPECT_EQ(ops.Size(), 0u);
}

TEST(PendingOperations, LateCompletionIsIgnored) {
    PendingOperations ops;
    auto f = ops.Add("r1", "callTool", 0ms);
    EXPECT_TRUE(ops.Fail("r1", JSONRPCErrorCodes::Timeout, "late"));
    EXPECT_FALSE(ops.Complete("r1", std::make_unique<JSONRPCResponse>(JSONRPCId{std::string("r1")},
                                                                      JSONValue("ok"))));
    auto resp = f.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(*resp->error, "code").value_or(0), JSONRPCErrorCodes::Timeout);
}

TEST(PendingOperations, DuplicateIdGetsImmediateError) {
    PendingOperations ops;
    auto first = ops.Add("dup", "callTool", 0ms);
    auto second = ops.Add("dup", "callTool", 0ms);
    ASSERT_EQ(second.wait_for(0ms), std::future_status::ready);
    EXPECT_TRUE(second.get()->IsError());
    EXPECT_TRUE(ops.Contains("dup"));
    EXPECT_EQ(ops.Size(), 1u);
}

TEST(PendingOperations, ExpireDueFailsOnlyOverdueEntries) {
    PendingOperations ops;
    auto quick = ops.Add("quick", "callTool", 10ms);
    auto slow = ops.Add("slow", "callTool", 60000ms);
    auto never = ops.Add("never", "callTool", 0ms);
    EXPECT_EQ(ops.ExpireDue(PendingOperations::Clock::now() + 1s), 1u);
    auto resp = quick.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(*resp->error, "code").value_or(0), JSONRPCErrorCodes::Timeout);
    EXPECT_EQ(GetString(*resp->error, "message").value_or(""), "Request timed out after 10ms");
    EXPECT_TRUE(ops.Contains("slow"));
    EXPECT_TRUE(ops.Contains("never"));
}

TEST(PendingOperations, FailAllDrainsEverything) {
    PendingOperations ops;
    auto a = ops.Add("a", "callTool", 0ms);
    auto b = ops.Add("b", "getCapabilities", 0ms);
    EXPECT_EQ(ops.FailAll(JSONRPCErrorCodes::ProcessExited, "Process exited with code 3"), 2u);
    EXPECT_EQ(ops.Size(), 0u);
    EXPECT_EQ(GetString(*a.get()->error, "message").value_or(""), "Process exited with code 3");
    EXPECT_EQ(GetInteger(*b.get()->error, "code").value_or(0), JSONRPCErrorCodes::ProcessExited);
}

TEST(PendingOperations, DestructorFailsOutstandingEntries) {
    std::future<std::unique_ptr<JSONRPCResponse>> f;
    {
        PendingOperations ops;
        f = ops.Add("left", "callTool", 0ms);
    }
    ASSERT_EQ(f.wait_for(0ms), std::future_status::ready);
    EXPECT_TRUE(f.get()->IsError());
}
