//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioProcessManager.hpp
// Purpose: Supervises local tool-server processes and correlates line-delimited JSON requests/responses
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "toolgw/JSONRPCTypes.h"
#include "toolgw/ServerConfig.h"

namespace toolgw {

//==========================================================================================================
// ProcessManagerOptions
// Purpose: Tunables for spawned stdio servers.
// Fields:
//   requestTimeout: Per-operation deadline (0 disables).
//   readyDelay: Upper bound on the startup wait; the first stdout line ends it early.
//   stopGrace: Time between SIGTERM and SIGKILL.
//   maxLineBytes: Longest accepted output line; longer lines are discarded.
//==========================================================================================================
struct ProcessManagerOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds readyDelay{2000};
    std::chrono::milliseconds stopGrace{2000};
    std::size_t maxLineBytes{1024 * 1024};
};

//==========================================================================================================
// StdioProcessManager
// Purpose: Registry of running stdio servers keyed by server id. Each entry owns its child process, its
//          output framer, and its table of pending operations. One sweeper thread expires deadlines for
//          all entries.
// Notes:
//   - Every request method returns a future that completes exactly once with a result or error object.
//   - A server that exits fails all of its outstanding operations and is removed, so a later
//     StartProcess() spawns a fresh child.
//==========================================================================================================
class StdioProcessManager {
public:
    using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

    explicit StdioProcessManager(ProcessManagerOptions options = ProcessManagerOptions{});
    ~StdioProcessManager();

    StdioProcessManager(const StdioProcessManager&) = delete;
    StdioProcessManager& operator=(const StdioProcessManager&) = delete;

    //==========================================================================================================
    // StartProcess
    // Purpose: Spawns the configured command (idempotent for a running id) and waits for readiness.
    // Args:
    //   config: A stdio ServerConfig.
    // Returns:
    //   true when the server is running; false when the config is not stdio, the spawn failed, or the
    //   process exited during startup.
    //==========================================================================================================
    bool StartProcess(const ServerConfig& config);

    bool IsRunning(const std::string& serverId) const;

    //==========================================================================================================
    // Request operations
    // Purpose: Build an envelope with a fresh operation id, write it as one line, and register a deadline.
    //   ReadResource:    {id, type:"readResource", resource}
    //   CallTool:        {id, type:"callTool", tool, parameters}
    //   GetCapabilities: {id, type:"getCapabilities"}; a server-reported error yields default
    //                    capabilities, a timeout stays an error.
    //   SendRequest:     {id, method, params}
    //==========================================================================================================
    ResponseFuture ReadResource(const std::string& serverId, const std::string& uri);
    ResponseFuture CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& params);
    ResponseFuture GetCapabilities(const std::string& serverId);
    ResponseFuture SendRequest(const std::string& serverId, const std::string& method,
                               const std::optional<JSONValue>& params = std::nullopt);

    //==========================================================================================================
    // StopProcess
    // Purpose: Fails pending operations with "Process terminated", then SIGTERM/SIGKILL the child.
    // Returns:
    //   false when no such server is running.
    //==========================================================================================================
    bool StopProcess(const std::string& serverId);
    void StopAllProcesses();

    std::vector<std::string> ListServers() const;

    // Stops servers with no request or output activity for at least maxIdle. Returns the count stopped.
    std::size_t CleanupIdleProcesses(std::chrono::milliseconds maxIdle);

    // Number of in-flight operations for a server (0 when unknown).
    std::size_t PendingCount(const std::string& serverId) const;

    // Pid of the running child, if any.
    std::optional<pid_t> ProcessId(const std::string& serverId) const;

    const ProcessManagerOptions& Options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolgw
