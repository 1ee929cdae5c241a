//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Tool server configuration records, JSON mapping, and the configuration store interface
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {

enum class TransportKind {
    Stdio,
    Remote
};

const char* TransportKindName(TransportKind kind);

// Settings for a locally spawned server speaking line-delimited JSON over stdin/stdout.
struct StdioSettings {
    std::string command;
    std::vector<std::string> args;
    std::string workingDirectory;
    std::vector<std::pair<std::string, std::string>> env;
};

// Settings for a remote server reached over HTTP(S).
struct RemoteSettings {
    std::string url;
};

using ServerSettings = std::variant<StdioSettings, RemoteSettings>;

//==========================================================================================================
// ServerConfig
// Purpose: One configured tool server. The transport kind is derived from the settings alternative, so
//          exactly one settings set exists and the kind cannot drift from it.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    bool enabled{true};
    ServerSettings settings;

    TransportKind Kind() const {
        return std::holds_alternative<RemoteSettings>(settings) ? TransportKind::Remote : TransportKind::Stdio;
    }
    const StdioSettings* Stdio() const { return std::get_if<StdioSettings>(&settings); }
    const RemoteSettings* Remote() const { return std::get_if<RemoteSettings>(&settings); }
};

//==========================================================================================================
// ParseServerConfig
// Purpose: Builds a ServerConfig from {id, name, type:"stdio"|"remote"|"sse", command, args,
//          workingDirectory, env, url, enabled}.
// Throws:
//   errors::GatewayException (InvalidRequest) when required members are missing or the type is unknown.
//==========================================================================================================
ServerConfig ParseServerConfig(const JSONValue& json);

// Inverse of ParseServerConfig ("type" is "stdio" or "remote").
JSONValue ServerConfigToJSON(const ServerConfig& config);

//==========================================================================================================
// IServerConfigStore
// Purpose: Read side of the configuration persistence layer consumed by the gateway.
//==========================================================================================================
class IServerConfigStore {
public:
    virtual ~IServerConfigStore() = default;
    virtual std::optional<ServerConfig> Find(const std::string& id) const = 0;
    virtual std::vector<ServerConfig> List() const = 0;
};

//==========================================================================================================
// InMemoryServerConfigStore
// Purpose: Thread-safe in-process store with add/update/remove.
// Notes:
//   - Add returns false when the id already exists.
//   - Update returns false for unknown ids and throws GatewayException(InvalidRequest) when the new record
//     would change the transport kind.
//==========================================================================================================
class InMemoryServerConfigStore : public IServerConfigStore {
public:
    std::optional<ServerConfig> Find(const std::string& id) const override;
    std::vector<ServerConfig> List() const override;

    bool Add(ServerConfig config);
    bool Update(ServerConfig config);
    bool Remove(const std::string& id);
    std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ServerConfig> configs_;
    std::vector<std::string> order_;
};

//==========================================================================================================
// LoadServerConfigs
// Purpose: Reads a {"servers":[...]} document (or a bare array) into the store. Existing ids are updated.
// Returns:
//   Number of records loaded.
// Throws:
//   std::runtime_error on malformed JSON, errors::GatewayException on invalid records.
//==========================================================================================================
std::size_t LoadServerConfigs(const std::string& json, InMemoryServerConfigStore& store);

} // namespace toolgw
