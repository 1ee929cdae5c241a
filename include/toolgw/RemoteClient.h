//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RemoteClient.h
// Purpose: Client abstraction for remote tool servers reached over an ITransport
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>

#include "toolgw/JSONRPCTypes.h"
#include "toolgw/ServerConfig.h"
#include "toolgw/Transport.h"

namespace toolgw {

//==========================================================================================================
// IRemoteClient
// Purpose: One connection to one remote tool server. Request multiplexing belongs to the transport.
//          Every request method completes with a result or an error object; none of them throw.
//==========================================================================================================
class IRemoteClient {
public:
    using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

    virtual ~IRemoteClient() = default;

    //==========================================================================================================
    // Connect
    // Purpose: Starts the transport and performs the initialize handshake.
    // Returns:
    //   Future resolving to true when the server answered initialize successfully.
    //==========================================================================================================
    virtual std::future<bool> Connect() = 0;

    virtual std::future<void> Disconnect() = 0;

    virtual bool IsConnected() const = 0;

    // resources/read with {uri}
    virtual ResponseFuture ReadResource(const std::string& uri) = 0;

    // tools/call with {name, arguments}
    virtual ResponseFuture CallTool(const std::string& name, const JSONValue& arguments) = 0;

    // Capabilities cached from initialize.
    virtual ResponseFuture GetCapabilities() = 0;
};

//==========================================================================================================
// IRemoteClientFactory
// Purpose: Creates (unconnected) clients for remote server configurations. Returns nullptr when the
//          configuration cannot be turned into a transport.
//==========================================================================================================
class IRemoteClientFactory {
public:
    virtual ~IRemoteClientFactory() = default;
    virtual std::unique_ptr<IRemoteClient> CreateClient(const ServerConfig& config) = 0;
};

//==========================================================================================================
// RemoteClient
// Purpose: Default IRemoteClient speaking JSON-RPC (initialize, tools/call, resources/read).
//==========================================================================================================
class RemoteClient : public IRemoteClient {
public:
    RemoteClient(std::string serverId, std::unique_ptr<ITransport> transport);
    ~RemoteClient() override;

    std::future<bool> Connect() override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;

    ResponseFuture ReadResource(const std::string& uri) override;
    ResponseFuture CallTool(const std::string& name, const JSONValue& arguments) override;
    ResponseFuture GetCapabilities() override;

    // initialize result, when connected.
    std::optional<JSONValue> ServerCapabilities() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// RemoteClientFactory
// Purpose: Builds RemoteClients whose transport comes from an ITransportFactory fed with the config URL.
//==========================================================================================================
class RemoteClientFactory : public IRemoteClientFactory {
public:
    // Uses HTTPTransportFactory when no factory is given.
    explicit RemoteClientFactory(std::shared_ptr<ITransportFactory> transportFactory = nullptr);

    std::unique_ptr<IRemoteClient> CreateClient(const ServerConfig& config) override;

private:
    std::shared_ptr<ITransportFactory> transportFactory_;
};

} // namespace toolgw
