//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportClientManager.cpp
// Purpose: Remote client registry
//==========================================================================================================

#include <algorithm>
#include <format>

#include "logging/Logger.h"
#include "toolgw/StdioEnvelope.h"
#include "toolgw/TransportClientManager.h"
#include "toolgw/errors/Errors.h"

namespace toolgw {

using errors::ErrorCategory;
using errors::GatewayException;

namespace {
std::future<std::unique_ptr<JSONRPCResponse>> notConnected(const std::string& serverId) {
    return MakeErrorFuture(serverId, JSONRPCErrorCodes::ConnectionFailed,
                           std::format("Server not connected: {}", serverId));
}
} // namespace

TransportClientManager::TransportClientManager(std::shared_ptr<IRemoteClientFactory> factory)
    : factory_(factory ? std::move(factory) : std::make_shared<RemoteClientFactory>()) {}

TransportClientManager::~TransportClientManager() {
    DisconnectAll();
}

bool TransportClientManager::ConnectServer(const ServerConfig& config) {
    FUNC_SCOPE();
    if (!config.enabled) {
        LOG_WARN("ServerDisabled: remote server '{}' is disabled", config.id);
        return false;
    }
    if (config.Kind() != TransportKind::Remote) {
        throw GatewayException(ErrorCategory::InvalidRequest,
                               std::format("Server {} is not a remote server", config.id));
    }

    std::lock_guard<std::mutex> connectLock(connectMutex_);
    if (auto existing = GetServer(config.id)) {
        if (existing->IsConnected()) {
            return true;
        }
        DisconnectServer(config.id);
    }

    std::shared_ptr<IRemoteClient> client = factory_->CreateClient(config);
    if (!client) {
        LOG_ERROR("ConnectionFailed: no client could be created for '{}'", config.id);
        return false;
    }
    bool ok = false;
    try {
        ok = client->Connect().get();
    } catch (const std::exception& e) {
        LOG_ERROR("ConnectionFailed: connecting '{}' threw: {}", config.id, e.what());
    }
    if (!ok) {
        LOG_ERROR("ConnectionFailed: could not connect remote server '{}'", config.id);
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients_[config.id] = client;
    }
    LOG_INFO("Connected remote server '{}'", config.id);
    return true;
}

void TransportClientManager::DisconnectServer(const std::string& serverId) {
    FUNC_SCOPE();
    std::shared_ptr<IRemoteClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clients_.find(serverId);
        if (it == clients_.end()) {
            return;
        }
        client = std::move(it->second);
        clients_.erase(it);
    }
    try {
        client->Disconnect().get();
    } catch (const std::exception& e) {
        LOG_WARN("Disconnecting '{}' failed: {}", serverId, e.what());
    }
    LOG_INFO("Disconnected remote server '{}'", serverId);
}

std::shared_ptr<IRemoteClient> TransportClientManager::GetServer(const std::string& serverId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(serverId);
    return it == clients_.end() ? nullptr : it->second;
}

TransportClientManager::ResponseFuture TransportClientManager::ReadResource(const std::string& serverId,
                                                                            const std::string& uri) {
    auto client = GetServer(serverId);
    if (!client) {
        return notConnected(serverId);
    }
    return client->ReadResource(uri);
}

TransportClientManager::ResponseFuture TransportClientManager::CallTool(const std::string& serverId,
                                                                        const std::string& name,
                                                                        const JSONValue& params) {
    auto client = GetServer(serverId);
    if (!client) {
        return notConnected(serverId);
    }
    return client->CallTool(name, params);
}

TransportClientManager::ResponseFuture TransportClientManager::GetCapabilities(const std::string& serverId) {
    auto client = GetServer(serverId);
    if (!client) {
        return notConnected(serverId);
    }
    return client->GetCapabilities();
}

std::size_t TransportClientManager::SetConfigurations(const std::vector<ServerConfig>& configs) {
    FUNC_SCOPE();
    std::size_t connected = 0;
    for (const auto& config : configs) {
        if (!config.enabled || config.Kind() != TransportKind::Remote) {
            continue;
        }
        if (ConnectServer(config)) {
            ++connected;
        }
    }
    return connected;
}

void TransportClientManager::DisconnectAll() {
    for (const auto& id : ListServers()) {
        DisconnectServer(id);
    }
}

std::vector<std::string> TransportClientManager::ListServers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(clients_.size());
    for (const auto& kv : clients_) {
        ids.push_back(kv.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace toolgw
