//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_transport.cpp
// Purpose: GoogleTests for HTTP transport option parsing and connection failure reporting
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <stdexcept>
#include "toolgw/HTTPTransport.hpp"
#include "toolgw/JSONRPCTypes.h"

using namespace toolgw;
using namespace std::chrono_literals;

TEST(HTTPTransportOptions, FromUrlParsesParts) {
    auto opts = HTTPTransport::Options::FromUrl("https://tools.example.com:8443/api/rpc");
    ASSERT_TRUE(opts.has_value());
    EXPECT_EQ(opts->scheme, "https");
    EXPECT_EQ(opts->host, "tools.example.com");
    EXPECT_EQ(opts->port, "8443");
    EXPECT_EQ(opts->path, "/api/rpc");
    EXPECT_EQ(opts->serverName, "tools.example.com");
}

TEST(HTTPTransportOptions, FromUrlDefaultsPortAndPath) {
    auto http = HTTPTransport::Options::FromUrl("http://localhost");
    ASSERT_TRUE(http.has_value());
    EXPECT_EQ(http->port, "80");
    EXPECT_EQ(http->path, "/");
    auto https = HTTPTransport::Options::FromUrl("https://localhost/x");
    ASSERT_TRUE(https.has_value());
    EXPECT_EQ(https->port, "443");
}

TEST(HTTPTransportOptions, FromUrlRejectsBadInput) {
    EXPECT_FALSE(HTTPTransport::Options::FromUrl("ftp://host/x").has_value());
    EXPECT_FALSE(HTTPTransport::Options::FromUrl("http:///path").has_value());
    EXPECT_FALSE(HTTPTransport::Options::FromUrl("http://host:99999/").has_value());
    EXPECT_FALSE(HTTPTransport::Options::FromUrl("http://host:abc/").has_value());
}

TEST(HTTPTransportFactory, BuildsFromUrl) {
    HTTPTransportFactory factory;
    auto transport = factory.CreateTransport("http://127.0.0.1:9000/rpc");
    ASSERT_NE(transport, nullptr);
    auto* http = dynamic_cast<HTTPTransport*>(transport.get());
    ASSERT_NE(http, nullptr);
    EXPECT_EQ(http->GetOptions().host, "127.0.0.1");
    EXPECT_EQ(http->GetOptions().port, "9000");
    EXPECT_EQ(factory.CreateTransport("gopher://nowhere/"), nullptr);
}

TEST(HTTPTransportFactory, BuildsFromKeyValues) {
    HTTPTransportFactory factory;
    auto transport = factory.CreateTransport(
        "scheme=http; host=10.0.0.5; port=8081; path=/api; connectTimeoutMs=250; readTimeoutMs=oops");
    ASSERT_NE(transport, nullptr);
    const auto& opts = dynamic_cast<HTTPTransport&>(*transport).GetOptions();
    EXPECT_EQ(opts.scheme, "http");
    EXPECT_EQ(opts.host, "10.0.0.5");
    EXPECT_EQ(opts.port, "8081");
    EXPECT_EQ(opts.path, "/api");
    EXPECT_EQ(opts.connectTimeoutMs, 250u);
    EXPECT_EQ(opts.readTimeoutMs, 30000u);
}

TEST(HTTPTransportFactory, UrlOptionKeepsTimeouts) {
    HTTPTransportFactory factory;
    auto transport = factory.CreateTransport("readTimeoutMs=1500; url=https://tools.local/v1");
    ASSERT_NE(transport, nullptr);
    const auto& opts = dynamic_cast<HTTPTransport&>(*transport).GetOptions();
    EXPECT_EQ(opts.scheme, "https");
    EXPECT_EQ(opts.host, "tools.local");
    EXPECT_EQ(opts.port, "443");
    EXPECT_EQ(opts.path, "/v1");
    EXPECT_EQ(opts.readTimeoutMs, 1500u);
}

TEST(HTTPTransport, RequestBeforeStartFails) {
    HTTPTransport::Options opts;
    opts.scheme = "http";
    HTTPTransport transport(opts);
    EXPECT_FALSE(transport.IsConnected());
    auto resp = transport.SendRequest(std::make_unique<JSONRPCRequest>(JSONRPCId{int64_t{1}}, "tools/list")).get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(*resp->error, "code").value_or(0), JSONRPCErrorCodes::ConnectionFailed);
}

TEST(HTTPTransport, UnreachableEndpointReportsConnectionFailed) {
    HTTPTransport::Options opts;
    opts.scheme = "http";
    opts.host = "127.0.0.1";
    opts.port = "1";
    opts.connectTimeoutMs = 1000;
    opts.readTimeoutMs = 1000;
    HTTPTransport transport(opts);
    transport.Start().get();
    EXPECT_TRUE(transport.IsConnected());
    auto fut = transport.SendRequest(std::make_unique<JSONRPCRequest>(JSONRPCId{int64_t{7}}, "tools/list"));
    ASSERT_EQ(fut.wait_for(10s), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(GetInteger(*resp->error, "code").value_or(0), JSONRPCErrorCodes::ConnectionFailed);

    auto notified = transport.SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized"));
    ASSERT_EQ(notified.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(notified.get(), std::runtime_error);

    transport.Close().get();
    EXPECT_FALSE(transport.IsConnected());
}
