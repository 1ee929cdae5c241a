//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_process_manager.cpp
// Purpose: GoogleTests for stdio tool server lifecycle and request correlation against the stub server
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>
#include "toolgw/StdioProcessManager.hpp"

using namespace toolgw;
using namespace std::chrono_literals;

namespace {
ServerConfig stubConfig(const std::string& id, const std::string& mode = "echo") {
    ServerConfig config;
    config.id = id;
    config.name = id + " stub";
    StdioSettings s;
    s.command = TOOLGW_STUB_SERVER_PATH;
    s.args = {mode};
    config.settings = s;
    return config;
}

ProcessManagerOptions fastOptions(std::chrono::milliseconds timeout = 5000ms) {
    ProcessManagerOptions o;
    o.requestTimeout = timeout;
    o.readyDelay = 2000ms;
    o.stopGrace = 500ms;
    return o;
}

std::unique_ptr<JSONRPCResponse> await(std::future<std::unique_ptr<JSONRPCResponse>>& fut) {
    if (fut.wait_for(10s) != std::future_status::ready) {
        ADD_FAILURE() << "response did not arrive";
        return nullptr;
    }
    return fut.get();
}

int64_t errorCode(const JSONRPCResponse& r) {
    return r.error ? GetInteger(*r.error, "code").value_or(0) : 0;
}

std::string errorMessage(const JSONRPCResponse& r) {
    return r.error ? GetString(*r.error, "message").value_or("") : std::string();
}
} // namespace

TEST(StdioProcessManager, StartIsIdempotent) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("a")));
    EXPECT_TRUE(mgr.IsRunning("a"));
    EXPECT_TRUE(mgr.StartProcess(stubConfig("a")));
    EXPECT_EQ(mgr.ListServers(), std::vector<std::string>{"a"});
    auto before = mgr.CallTool("a", "ping", JSONValue(JSONValue::Object{}));
    auto ok = await(before);
    ASSERT_TRUE(ok && !ok->IsError());

    EXPECT_TRUE(mgr.StopProcess("a"));
    EXPECT_FALSE(mgr.IsRunning("a"));
    EXPECT_FALSE(mgr.StopProcess("a"));

    auto after = mgr.CallTool("a", "ping", JSONValue(JSONValue::Object{}));
    auto failed = await(after);
    ASSERT_TRUE(failed && failed->IsError());
    EXPECT_EQ(errorCode(*failed), JSONRPCErrorCodes::ProcessExited);
}

TEST(StdioProcessManager, RejectsRemoteConfigAndBadCommand) {
    StdioProcessManager mgr(fastOptions());
    ServerConfig remote;
    remote.id = "r";
    remote.settings = RemoteSettings{"http://localhost:1/"};
    EXPECT_FALSE(mgr.StartProcess(remote));

    ServerConfig missing;
    missing.id = "ghost";
    missing.settings = StdioSettings{"/nonexistent/toolgw-no-such-binary", {}, "", {}};
    EXPECT_FALSE(mgr.StartProcess(missing));
    EXPECT_FALSE(mgr.IsRunning("ghost"));
}

TEST(StdioProcessManager, UnknownServerFailsImmediately) {
    StdioProcessManager mgr(fastOptions());
    auto fut = mgr.CallTool("nobody", "echo", JSONValue(JSONValue::Object{}));
    ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::ProcessExited);
    EXPECT_EQ(errorMessage(*resp), "Process for server nobody is not running");
}

TEST(StdioProcessManager, CapabilitiesResourceAndTool) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("s")));

    auto capsFut = mgr.GetCapabilities("s");
    auto caps = await(capsFut);
    ASSERT_TRUE(caps && !caps->IsError());
    EXPECT_EQ(GetString(*caps->result, "name").value_or(""), "stub-server");
    EXPECT_EQ(GetString(*caps->result, "version").value_or(""), "1.2.3");

    auto resFut = mgr.ReadResource("s", "resource://file/a.txt");
    auto res = await(resFut);
    ASSERT_TRUE(res && !res->IsError());
    EXPECT_EQ(GetString(*res->result, "uri").value_or(""), "resource://file/a.txt");
    EXPECT_EQ(GetString(*res->result, "contents").value_or(""), "stub contents");

    auto toolFut = mgr.CallTool("s", "sum", ParseJSON(R"({"a":1,"b":2})"));
    auto tool = await(toolFut);
    ASSERT_TRUE(tool && !tool->IsError());
    EXPECT_EQ(GetString(*tool->result, "tool").value_or(""), "sum");
    EXPECT_TRUE(JSONEquals(*FindMember(*tool->result, "parameters"), ParseJSON(R"({"a":1,"b":2})")));
    EXPECT_EQ(mgr.PendingCount("s"), 0u);
}

TEST(StdioProcessManager, SendRequestRoundTrip) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("fs1")));
    auto fut = mgr.SendRequest("fs1", "echo", ParseJSON(R"({"text":"ping"})"));
    auto resp = await(fut);
    ASSERT_TRUE(resp && !resp->IsError());
    EXPECT_TRUE(JSONEquals(*resp->result, ParseJSON(R"({"text":"ping"})")));

    auto unknown = mgr.SendRequest("fs1", "teleport");
    auto err = await(unknown);
    ASSERT_TRUE(err && err->IsError());
    EXPECT_EQ(errorMessage(*err), "Unknown request type: teleport");
}

TEST(StdioProcessManager, ServerErrorsBecomeErrorResponses) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("s")));
    auto fut = mgr.CallTool("s", "fail", JSONValue(JSONValue::Object{}));
    auto resp = await(fut);
    ASSERT_TRUE(resp && resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::ProtocolError);
    EXPECT_EQ(errorMessage(*resp), "Tool failed on purpose");
}

TEST(StdioProcessManager, ChildSeesItsServerId) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("env-check")));
    auto fut = mgr.CallTool("env-check", "env", JSONValue(JSONValue::Object{}));
    auto resp = await(fut);
    ASSERT_TRUE(resp && !resp->IsError());
    EXPECT_EQ(GetString(*resp->result, "serverId").value_or(""), "env-check");
}

TEST(StdioProcessManager, LegacyRequestIdReplies) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("s")));
    auto okFut = mgr.CallTool("s", "legacy", ParseJSON(R"({"x":1})"));
    auto ok = await(okFut);
    ASSERT_TRUE(ok && !ok->IsError());
    EXPECT_EQ(GetString(*ok->result, "status").value_or(""), "success");
    EXPECT_EQ(GetInteger(*FindMember(*ok->result, "echo"), "x").value_or(0), 1);

    auto errFut = mgr.CallTool("s", "legacy_error", JSONValue(JSONValue::Object{}));
    auto err = await(errFut);
    ASSERT_TRUE(err && err->IsError());
    EXPECT_EQ(errorMessage(*err), "legacy failure");
}

TEST(StdioProcessManager, OutOfOrderRepliesReachTheirCallers) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("rev", "reverse")));
    auto first = mgr.CallTool("rev", "first", JSONValue(JSONValue::Object{}));
    auto second = mgr.CallTool("rev", "second", JSONValue(JSONValue::Object{}));
    auto r1 = await(first);
    auto r2 = await(second);
    ASSERT_TRUE(r1 && r2);
    EXPECT_EQ(GetString(*r1->result, "tool").value_or(""), "first");
    EXPECT_EQ(GetString(*r2->result, "tool").value_or(""), "second");
}

TEST(StdioProcessManager, NonJsonOutputIsIgnored) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("noisy", "junk")));
    auto fut = mgr.CallTool("noisy", "ping", JSONValue(JSONValue::Object{}));
    auto resp = await(fut);
    ASSERT_TRUE(resp && !resp->IsError());
    EXPECT_EQ(GetString(*resp->result, "tool").value_or(""), "ping");
    EXPECT_TRUE(mgr.IsRunning("noisy"));
}

TEST(StdioProcessManager, SilentServerTimesOut) {
    StdioProcessManager mgr(fastOptions(200ms));
    ASSERT_TRUE(mgr.StartProcess(stubConfig("quiet", "silent")));
    auto fut = mgr.CallTool("quiet", "anything", JSONValue(JSONValue::Object{}));
    auto resp = await(fut);
    ASSERT_TRUE(resp && resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::Timeout);
    EXPECT_EQ(errorMessage(*resp), "Request timed out after 200ms");
    EXPECT_EQ(mgr.PendingCount("quiet"), 0u);
    EXPECT_TRUE(mgr.IsRunning("quiet"));
}

TEST(StdioProcessManager, StopFailsPendingOperations) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("quiet", "silent")));
    auto fut = mgr.CallTool("quiet", "anything", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(mgr.PendingCount("quiet"), 1u);
    EXPECT_TRUE(mgr.StopProcess("quiet"));
    auto resp = await(fut);
    ASSERT_TRUE(resp && resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::ProcessExited);
    EXPECT_EQ(errorMessage(*resp), "Process terminated");
}

TEST(StdioProcessManager, ExitFailsPendingWithExitCode) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("brief", "exit-after=1")));
    auto okFut = mgr.CallTool("brief", "one", JSONValue(JSONValue::Object{}));
    auto ok = await(okFut);
    ASSERT_TRUE(ok && !ok->IsError());

    auto lostFut = mgr.CallTool("brief", "two", JSONValue(JSONValue::Object{}));
    auto lost = await(lostFut);
    ASSERT_TRUE(lost && lost->IsError());
    EXPECT_EQ(errorCode(*lost), JSONRPCErrorCodes::ProcessExited);
    EXPECT_EQ(errorMessage(*lost), "Process exited with code 3");

    for (int i = 0; i < 100 && mgr.IsRunning("brief"); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(mgr.IsRunning("brief"));
    // A later start spawns a fresh process
    EXPECT_TRUE(mgr.StartProcess(stubConfig("brief", "exit-after=1")));
}

TEST(StdioProcessManager, KilledChildFailsEveryPendingCall) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("victim", "silent")));
    std::vector<std::future<std::unique_ptr<JSONRPCResponse>>> calls;
    for (int i = 0; i < 4; ++i) {
        calls.push_back(mgr.CallTool("victim", "wait", JSONValue(JSONValue::Object{})));
    }
    EXPECT_EQ(mgr.PendingCount("victim"), 4u);

    auto pid = mgr.ProcessId("victim");
    ASSERT_TRUE(pid.has_value());
    ASSERT_EQ(::kill(*pid, SIGKILL), 0);

    for (auto& call : calls) {
        auto resp = await(call);
        ASSERT_TRUE(resp && resp->IsError());
        EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::ProcessExited);
        EXPECT_EQ(errorMessage(*resp), "Process killed by signal 9");
    }
    for (int i = 0; i < 100 && mgr.IsRunning("victim"); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(mgr.IsRunning("victim"));
    EXPECT_EQ(mgr.PendingCount("victim"), 0u);
    EXPECT_FALSE(mgr.ProcessId("victim").has_value());

    ASSERT_TRUE(mgr.StartProcess(stubConfig("victim")));
    auto fresh = mgr.CallTool("victim", "again", JSONValue(JSONValue::Object{}));
    auto ok = await(fresh);
    ASSERT_TRUE(ok && !ok->IsError());
}

TEST(StdioProcessManager, CleanupStopsIdleServers) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("idle")));
    EXPECT_EQ(mgr.CleanupIdleProcesses(60000ms), 0u);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(mgr.CleanupIdleProcesses(20ms), 1u);
    EXPECT_FALSE(mgr.IsRunning("idle"));
}

TEST(StdioProcessManager, StopAllStopsEverything) {
    StdioProcessManager mgr(fastOptions());
    ASSERT_TRUE(mgr.StartProcess(stubConfig("x")));
    ASSERT_TRUE(mgr.StartProcess(stubConfig("y")));
    EXPECT_EQ(mgr.ListServers().size(), 2u);
    mgr.StopAllProcesses();
    EXPECT_TRUE(mgr.ListServers().empty());
}
