//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transport_client_manager.cpp
// Purpose: GoogleTests for RemoteClient and the remote client registry over an in-process transport
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "FakeTransport.h"
#include "toolgw/RemoteClient.h"
#include "toolgw/TransportClientManager.h"
#include "toolgw/errors/Errors.h"

using namespace toolgw;
using namespace toolgw::testing_support;

namespace {
ServerConfig remoteConfig(const std::string& id, bool enabled = true) {
    ServerConfig c;
    c.id = id;
    c.name = id;
    c.enabled = enabled;
    c.settings = RemoteSettings{"http://127.0.0.1:8080/rpc"};
    return c;
}

struct Fixture {
    std::shared_ptr<FakeServerState> state = std::make_shared<FakeServerState>();
    std::shared_ptr<RemoteClientFactory> clients =
        std::make_shared<RemoteClientFactory>(std::make_shared<FakeTransportFactory>(state));
};
} // namespace

TEST(RemoteClient, ConnectPerformsHandshake) {
    auto state = std::make_shared<FakeServerState>();
    RemoteClient client("r1", std::make_unique<FakeTransport>(state));
    EXPECT_FALSE(client.IsConnected());
    ASSERT_TRUE(client.Connect().get());
    EXPECT_TRUE(client.IsConnected());
    EXPECT_EQ(state->Methods(), std::vector<std::string>{"initialize"});
    ASSERT_EQ(state->notifications.size(), 1u);
    EXPECT_EQ(state->notifications[0], "notifications/initialized");

    auto caps = client.GetCapabilities().get();
    ASSERT_FALSE(caps->IsError());
    EXPECT_EQ(GetString(*FindMember(*caps->result, "serverInfo"), "name").value_or(""), "fake-remote");
}

TEST(RemoteClient, RequestsUseStandardMethods) {
    auto state = std::make_shared<FakeServerState>();
    RemoteClient client("r1", std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(client.Connect().get());

    auto tool = client.CallTool("sum", ParseJSON(R"({"a":1})")).get();
    ASSERT_FALSE(tool->IsError());
    EXPECT_EQ(GetString(*tool->result, "method").value_or(""), "tools/call");
    const JSONValue* params = FindMember(*tool->result, "params");
    EXPECT_EQ(GetString(*params, "name").value_or(""), "sum");
    EXPECT_EQ(GetInteger(*FindMember(*params, "arguments"), "a").value_or(0), 1);

    auto res = client.ReadResource("resource://x").get();
    ASSERT_FALSE(res->IsError());
    EXPECT_EQ(GetString(*res->result, "method").value_or(""), "resources/read");
    EXPECT_EQ(GetString(*FindMember(*res->result, "params"), "uri").value_or(""), "resource://x");
}

TEST(RemoteClient, UndeliveredInitializedNotificationStillConnects) {
    auto state = std::make_shared<FakeServerState>();
    state->failNotifications = true;
    RemoteClient client("r1", std::make_unique<FakeTransport>(state));
    ASSERT_TRUE(client.Connect().get());
    EXPECT_TRUE(client.IsConnected());
    ASSERT_EQ(state->notifications.size(), 1u);
    EXPECT_EQ(state->closes.load(), 0);

    auto tool = client.CallTool("sum", JSONValue(JSONValue::Object{})).get();
    EXPECT_FALSE(tool->IsError());
}

TEST(RemoteClient, FailedInitializeLeavesClientDisconnected) {
    auto state = std::make_shared<FakeServerState>();
    state->failInitialize = true;
    RemoteClient client("r1", std::make_unique<FakeTransport>(state));
    EXPECT_FALSE(client.Connect().get());
    EXPECT_FALSE(client.IsConnected());
    EXPECT_EQ(state->closes.load(), 1);

    auto resp = client.CallTool("sum", JSONValue(JSONValue::Object{})).get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(*resp->error, "code").value_or(0), JSONRPCErrorCodes::ConnectionFailed);
    EXPECT_TRUE(client.GetCapabilities().get()->IsError());
}

TEST(RemoteClientFactory, RejectsStdioConfig) {
    Fixture f;
    ServerConfig stdio;
    stdio.id = "local";
    stdio.settings = StdioSettings{"echo", {}, "", {}};
    EXPECT_EQ(f.clients->CreateClient(stdio), nullptr);
    auto client = f.clients->CreateClient(remoteConfig("r"));
    ASSERT_NE(client, nullptr);
    ASSERT_EQ(f.state->configs.size(), 1u);
    EXPECT_EQ(f.state->configs[0], "http://127.0.0.1:8080/rpc");
}

TEST(TransportClientManager, ConnectIsIdempotent) {
    Fixture f;
    TransportClientManager mgr(f.clients);
    ASSERT_TRUE(mgr.ConnectServer(remoteConfig("r1")));
    auto first = mgr.GetServer("r1");
    ASSERT_TRUE(first);
    ASSERT_TRUE(mgr.ConnectServer(remoteConfig("r1")));
    EXPECT_EQ(mgr.GetServer("r1").get(), first.get());
    EXPECT_EQ(f.state->configs.size(), 1u);
    EXPECT_EQ(mgr.ListServers(), std::vector<std::string>{"r1"});
}

TEST(TransportClientManager, DisabledAndStdioConfigs) {
    Fixture f;
    TransportClientManager mgr(f.clients);
    EXPECT_FALSE(mgr.ConnectServer(remoteConfig("off", false)));
    EXPECT_EQ(mgr.GetServer("off"), nullptr);

    ServerConfig stdio;
    stdio.id = "local";
    stdio.settings = StdioSettings{"echo", {}, "", {}};
    EXPECT_THROW(mgr.ConnectServer(stdio), errors::GatewayException);
}

TEST(TransportClientManager, FailedConnectIsNotRegistered) {
    Fixture f;
    f.state->failInitialize = true;
    TransportClientManager mgr(f.clients);
    EXPECT_FALSE(mgr.ConnectServer(remoteConfig("r1")));
    EXPECT_TRUE(mgr.ListServers().empty());
}

TEST(TransportClientManager, UnknownServerIsNotConnected) {
    Fixture f;
    TransportClientManager mgr(f.clients);
    auto resp = mgr.CallTool("nobody", "x", JSONValue(JSONValue::Object{})).get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(*resp->error, "code").value_or(0), JSONRPCErrorCodes::ConnectionFailed);
    EXPECT_EQ(GetString(*resp->error, "message").value_or(""), "Server not connected: nobody");
    EXPECT_TRUE(mgr.ReadResource("nobody", "resource://x").get()->IsError());
    EXPECT_TRUE(mgr.GetCapabilities("nobody").get()->IsError());
}

TEST(TransportClientManager, ForwardsToClient) {
    Fixture f;
    TransportClientManager mgr(f.clients);
    ASSERT_TRUE(mgr.ConnectServer(remoteConfig("r1")));
    auto tool = mgr.CallTool("r1", "missing", JSONValue(JSONValue::Object{})).get();
    ASSERT_TRUE(tool->IsError());
    EXPECT_EQ(errors::gatewayErrorFromResponse(*tool)->category, errors::ErrorCategory::UnknownTool);
    auto caps = mgr.GetCapabilities("r1").get();
    EXPECT_FALSE(caps->IsError());
}

TEST(TransportClientManager, DisconnectAndSetConfigurations) {
    Fixture f;
    TransportClientManager mgr(f.clients);
    ServerConfig stdio;
    stdio.id = "local";
    stdio.settings = StdioSettings{"echo", {}, "", {}};
    const std::size_t connected =
        mgr.SetConfigurations({remoteConfig("a"), remoteConfig("b"), remoteConfig("off", false), stdio});
    EXPECT_EQ(connected, 2u);
    EXPECT_EQ(mgr.ListServers(), (std::vector<std::string>{"a", "b"}));

    auto client = mgr.GetServer("a");
    mgr.DisconnectServer("a");
    EXPECT_FALSE(client->IsConnected());
    EXPECT_EQ(mgr.GetServer("a"), nullptr);
    mgr.DisconnectServer("a");

    mgr.DisconnectAll();
    EXPECT_TRUE(mgr.ListServers().empty());
}
