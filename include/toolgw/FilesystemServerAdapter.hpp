//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FilesystemServerAdapter.hpp
// Purpose: Adapter for the filesystem tool server, whose stdout mixes diagnostics with JSON objects
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "toolgw/JSONRPCTypes.h"
#include "toolgw/ServerConfig.h"

namespace toolgw {

//==========================================================================================================
// FilesystemAdapterOptions
// Fields:
//   requestTimeout: Deadline for operations forwarded to the subprocess (0 disables).
//   readyDelay: Fixed grace period after spawning; the server never announces readiness.
//   stopGrace: Time between SIGTERM and SIGKILL.
//   maxBufferBytes: Cap on the raw output accumulator.
//==========================================================================================================
struct FilesystemAdapterOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds readyDelay{2000};
    std::chrono::milliseconds stopGrace{2000};
    std::size_t maxBufferBytes{1024 * 1024};
};

// True when the stdio command or any argument mentions "server-filesystem".
bool IsFilesystemServer(const ServerConfig& config);

// Allowed root: the working directory, else the last argument naming an existing directory, else the
// current directory. The result is canonical.
std::string ResolveFilesystemRoot(const StdioSettings& settings);

//==========================================================================================================
// FilesystemServerAdapter
// Purpose: Runs one filesystem server process and exposes it through the resource/tool contract.
// Notes:
//   - readFile, writeFile and listFiles are served from the local filesystem inside the allowed root;
//     other tool names are forwarded to the subprocess as {jsonrpc, id, method, params}.
//   - Replies are recovered by brace-balanced object scanning and correlated by id or requestId.
//   - Resources: resource://status, resource://directory/{path}, resource://file/{path}.
//==========================================================================================================
class FilesystemServerAdapter {
public:
    using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

    explicit FilesystemServerAdapter(ServerConfig config,
                                     FilesystemAdapterOptions options = FilesystemAdapterOptions{});
    ~FilesystemServerAdapter();

    FilesystemServerAdapter(const FilesystemServerAdapter&) = delete;
    FilesystemServerAdapter& operator=(const FilesystemServerAdapter&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Spawns the server (no-op when already running) and waits out the readiness grace delay.
    // Returns:
    //   false when spawning failed or the process exited during the grace delay.
    //==========================================================================================================
    bool Start();

    // Fails pending operations with "Process terminated" and terminates the process.
    bool Stop();

    bool IsRunning() const;

    // Static filesystem capabilities (three tools, three resource templates).
    ResponseFuture GetCapabilities();
    ResponseFuture ReadResource(const std::string& uri);
    ResponseFuture CallTool(const std::string& toolName, const JSONValue& params);

    const std::string& ServerId() const;
    const std::string& RootDirectory() const;
    std::size_t PendingCount() const;

    static JSONValue DefaultCapabilities();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// FilesystemServerRegistry
// Purpose: Owns the running filesystem adapters keyed by server id.
//==========================================================================================================
class FilesystemServerRegistry {
public:
    explicit FilesystemServerRegistry(FilesystemAdapterOptions options = FilesystemAdapterOptions{});
    ~FilesystemServerRegistry();

    FilesystemServerRegistry(const FilesystemServerRegistry&) = delete;
    FilesystemServerRegistry& operator=(const FilesystemServerRegistry&) = delete;

    // Creates the adapter on first use and starts it. Idempotent for a running id.
    bool StartServer(const ServerConfig& config);
    std::shared_ptr<FilesystemServerAdapter> GetServer(const std::string& serverId) const;
    bool StopServer(const std::string& serverId);
    void StopAllServers();
    std::vector<std::string> ListServers() const;

private:
    FilesystemAdapterOptions options_;
    std::mutex startMutex_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<FilesystemServerAdapter>> servers_;
};

} // namespace toolgw
