//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportClientManager.h
// Purpose: Registry of live clients for remote tool servers (at most one per server id)
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolgw/RemoteClient.h"
#include "toolgw/ServerConfig.h"

namespace toolgw {

//==========================================================================================================
// TransportClientManager
// Purpose: Connect/disconnect policy for remote servers. Correlation is the client's business; this class
//          only decides when a client exists.
// Notes:
//   - Clients are created through the injected IRemoteClientFactory (RemoteClientFactory by default).
//   - ConnectServer() for the same id is serialized so two callers never create two clients.
//==========================================================================================================
class TransportClientManager {
public:
    using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

    explicit TransportClientManager(std::shared_ptr<IRemoteClientFactory> factory = nullptr);
    ~TransportClientManager();

    TransportClientManager(const TransportClientManager&) = delete;
    TransportClientManager& operator=(const TransportClientManager&) = delete;

    //==========================================================================================================
    // ConnectServer
    // Purpose: Ensures a connected client exists for the config.
    // Returns:
    //   true when connected (immediately when already connected); false for a disabled config or a
    //   failed connect.
    // Throws:
    //   errors::GatewayException(InvalidRequest) for a non-remote config.
    //==========================================================================================================
    bool ConnectServer(const ServerConfig& config);

    // Disconnects and forgets the client. Unknown ids are a no-op.
    void DisconnectServer(const std::string& serverId);

    // Live client or nullptr.
    std::shared_ptr<IRemoteClient> GetServer(const std::string& serverId) const;

    // Unknown ids complete with ConnectionFailed ("Server not connected").
    ResponseFuture ReadResource(const std::string& serverId, const std::string& uri);
    ResponseFuture CallTool(const std::string& serverId, const std::string& name, const JSONValue& params);
    ResponseFuture GetCapabilities(const std::string& serverId);

    // Connects every enabled remote config; returns the number connected.
    std::size_t SetConfigurations(const std::vector<ServerConfig>& configs);

    void DisconnectAll();

    std::vector<std::string> ListServers() const;

private:
    std::shared_ptr<IRemoteClientFactory> factory_;
    std::mutex connectMutex_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IRemoteClient>> clients_;
};

} // namespace toolgw
