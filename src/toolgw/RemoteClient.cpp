//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RemoteClient.cpp
// Purpose: JSON-RPC client for remote tool servers
//==========================================================================================================

#include <atomic>
#include <format>
#include <mutex>

#include "logging/Logger.h"
#include "toolgw/HTTPTransport.hpp"
#include "toolgw/Protocol.h"
#include "toolgw/RemoteClient.h"
#include "toolgw/StdioEnvelope.h"
#include "toolgw/async/Task.h"
#include "toolgw/version.h"

namespace toolgw {

class RemoteClient::Impl {
public:
    std::string serverId;
    std::unique_ptr<ITransport> transport;
    std::atomic<bool> connected{false};
    std::atomic<uint64_t> requestCounter{0};

    mutable std::mutex capsMutex;
    std::optional<JSONValue> serverCapabilities;

    Impl(std::string id, std::unique_ptr<ITransport> t) : serverId(std::move(id)), transport(std::move(t)) {}

    std::string nextRequestId() {
        return std::format("{}-rpc-{}", serverId, ++requestCounter);
    }

    JSONValue initializeParams() const {
        JSONValue::Object clientInfo;
        SetMember(clientInfo, "name", JSONValue(CLIENT_NAME));
        SetMember(clientInfo, "version", JSONValue(getVersionString()));
        JSONValue::Object params;
        SetMember(params, "protocolVersion", JSONValue(PROTOCOL_VERSION));
        SetMember(params, "capabilities", JSONValue(JSONValue::Object{}));
        SetMember(params, "clientInfo", JSONValue(std::move(clientInfo)));
        return JSONValue(std::move(params));
    }

    async::Task<bool> coConnect();
    async::Task<void> coDisconnect();

    ResponseFuture send(const std::string& method, JSONValue params) {
        if (!connected || !transport->IsConnected()) {
            return MakeErrorFuture(method, JSONRPCErrorCodes::ConnectionFailed,
                                   std::format("Server {} is not connected", serverId));
        }
        LOG_DEBUG("[{}] -> {}", serverId, method);
        return transport->SendRequest(std::make_unique<JSONRPCRequest>(nextRequestId(), method, std::move(params)));
    }
};

async::Task<bool> RemoteClient::Impl::coConnect() {
    FUNC_SCOPE();
    if (!transport) {
        co_return false;
    }
    const std::string id = serverId;
    transport->SetErrorHandler([id](const std::string& err) {
        LOG_DEBUG("[{}] transport: {}", id, err);
    });
    try {
        co_await async::makeFutureAwaitable(transport->Start());
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] transport start failed: {}", serverId, e.what());
        co_return false;
    }

    LOG_INFO("[{}] initializing remote client", serverId);
    auto request = std::make_unique<JSONRPCRequest>(nextRequestId(), Methods::Initialize, initializeParams());
    auto response = co_await async::makeFutureAwaitable(transport->SendRequest(std::move(request)));
    if (!response || response->IsError() || !response->result.has_value()) {
        std::string reason = "missing result";
        if (response && response->error.has_value()) {
            reason = GetString(response->error.value(), "message").value_or("unknown error");
        }
        LOG_ERROR("[{}] initialize failed: {}", serverId, reason);
        co_await async::makeFutureAwaitable(transport->Close());
        co_return false;
    }
    {
        std::lock_guard<std::mutex> lk(capsMutex);
        serverCapabilities = response->result;
    }
    connected = true;
    try {
        co_await async::makeFutureAwaitable(
            transport->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized)));
    } catch (const std::exception& e) {
        // The session is usable without the acknowledgement; the server may still reject later calls
        LOG_WARN("[{}] {} notification failed: {}", serverId, Methods::Initialized, e.what());
    }
    co_return true;
}

async::Task<void> RemoteClient::Impl::coDisconnect() {
    FUNC_SCOPE();
    connected = false;
    if (!transport) {
        co_return;
    }
    try {
        co_await async::makeFutureAwaitable(transport->Close());
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] disconnect failed: {}", serverId, e.what());
    }
    co_return;
}

RemoteClient::RemoteClient(std::string serverId, std::unique_ptr<ITransport> transport)
    : pImpl(std::make_unique<Impl>(std::move(serverId), std::move(transport))) {}

RemoteClient::~RemoteClient() {
    if (pImpl->connected) {
        Disconnect().get();
    }
}

std::future<bool> RemoteClient::Connect() {
    FUNC_SCOPE();
    return pImpl->coConnect().toFuture();
}

std::future<void> RemoteClient::Disconnect() {
    FUNC_SCOPE();
    return pImpl->coDisconnect().toFuture();
}

bool RemoteClient::IsConnected() const {
    return pImpl->connected && pImpl->transport && pImpl->transport->IsConnected();
}

RemoteClient::ResponseFuture RemoteClient::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    JSONValue::Object params;
    SetMember(params, "uri", JSONValue(uri));
    return pImpl->send(Methods::ReadResource, JSONValue(std::move(params)));
}

RemoteClient::ResponseFuture RemoteClient::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    JSONValue::Object params;
    SetMember(params, "name", JSONValue(name));
    SetMember(params, "arguments", arguments);
    return pImpl->send(Methods::CallTool, JSONValue(std::move(params)));
}

RemoteClient::ResponseFuture RemoteClient::GetCapabilities() {
    auto caps = ServerCapabilities();
    if (!caps) {
        return MakeErrorFuture(EnvelopeTypes::GetCapabilities, JSONRPCErrorCodes::ConnectionFailed,
                               std::format("Server {} is not connected", pImpl->serverId));
    }
    return MakeResultFuture(EnvelopeTypes::GetCapabilities, std::move(*caps));
}

std::optional<JSONValue> RemoteClient::ServerCapabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->capsMutex);
    if (!pImpl->connected) {
        return std::nullopt;
    }
    return pImpl->serverCapabilities;
}

//////////////////////////////////////////// RemoteClientFactory ////////////////////////////////////////////

RemoteClientFactory::RemoteClientFactory(std::shared_ptr<ITransportFactory> transportFactory)
    : transportFactory_(transportFactory ? std::move(transportFactory) : std::make_shared<HTTPTransportFactory>()) {}

std::unique_ptr<IRemoteClient> RemoteClientFactory::CreateClient(const ServerConfig& config) {
    const RemoteSettings* remote = config.Remote();
    if (!remote) {
        LOG_ERROR("RemoteClientFactory: server '{}' is not a remote server", config.id);
        return nullptr;
    }
    auto transport = transportFactory_->CreateTransport(remote->url);
    if (!transport) {
        LOG_ERROR("RemoteClientFactory: no transport for '{}' ({})", config.id, remote->url);
        return nullptr;
    }
    return std::make_unique<RemoteClient>(config.id, std::move(transport));
}

} // namespace toolgw
