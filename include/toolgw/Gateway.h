//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.h
// Purpose: Thin boundary: resolves configuration, routes calls to the right manager, and applies agent
//          results to sessions
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "toolgw/FilesystemServerAdapter.hpp"
#include "toolgw/ServerConfig.h"
#include "toolgw/SessionManager.h"
#include "toolgw/StdioProcessManager.hpp"
#include "toolgw/TransportClientManager.h"
#include "toolgw/agent/Agent.h"
#include "toolgw/agent/ContextProcessor.h"
#include "toolgw/errors/Errors.h"

namespace toolgw {

struct ResourceRef {
    std::string uri;
};

struct ToolCall {
    std::string name;
    JSONValue params{JSONValue::Object{}};
};

using DispatchRequest = std::variant<ResourceRef, ToolCall>;

struct SessionInfo {
    std::string sessionId;
    bool created{false};
};

//==========================================================================================================
// ExecuteActionResponse
// Fields:
//   statusClass: 200 on success, otherwise errors::statusClassFor() of the failure category.
//   error: Typed failure; its message is already scrubbed for Internal failures.
//==========================================================================================================
struct ExecuteActionResponse {
    bool success{false};
    int statusClass{500};
    std::string message;
    std::vector<agent::Artifact> artifacts;
    std::optional<JSONValue> output;
    std::optional<errors::GatewayError> error;
};

// {success, statusClass, message, artifacts, output?, error?}
JSONValue ExecuteActionResponseToJSON(const ExecuteActionResponse& response);

//==========================================================================================================
// Gateway
// Purpose: Wires the registries together. Every registry is owned by the caller and must outlive the
//          gateway.
// Notes:
//   - Dispatch() starts or connects a server lazily on first use and never throws; configuration errors
//     arrive as error responses in the future.
//   - ExecuteAction() holds the session's action lock from the agent's context snapshot until its
//     updatedContext has been merged, so concurrent actions on one session compose.
//==========================================================================================================
class Gateway {
public:
    using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

    Gateway(const IServerConfigStore& configs,
            StdioProcessManager& processes,
            FilesystemServerRegistry& filesystems,
            TransportClientManager& remotes,
            SessionManager& sessions,
            agent::IAgent& agent,
            agent::ContextProcessor contextProcessor = agent::ContextProcessor{});

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    //==========================================================================================================
    // ResolveServer
    // Throws:
    //   errors::GatewayException with ConfigNotFound for unknown ids or ServerDisabled for disabled ones.
    //==========================================================================================================
    ServerConfig ResolveServer(const std::string& serverId) const;

    // Routes a resource read or tool call by transport kind.
    ResponseFuture Dispatch(const std::string& serverId, const DispatchRequest& request);

    ResponseFuture GetCapabilities(const std::string& serverId);

    // Stops or disconnects the server on whichever manager holds it. Returns false when none did.
    bool StopServer(const std::string& serverId);

    // Returns the session for sessionId, creating it when absent or when no id is given.
    SessionInfo OpenSession(const std::optional<std::string>& sessionId = std::nullopt);

    //==========================================================================================================
    // ExecuteAction
    // Purpose: Validates the request, runs the agent against the session, records the action and merges the
    //          context delta.
    // Returns:
    //   ExecuteActionResponse; statusClass 400 for malformed requests and 404 for unknown sessions.
    //==========================================================================================================
    ExecuteActionResponse ExecuteAction(const JSONValue& request);
    ExecuteActionResponse ExecuteAction(const agent::ActionRequest& request);

    // Throws errors::GatewayException(SessionNotFound).
    std::vector<agent::CandidateAction> AvailableActions(const std::string& sessionId) const;

    //==========================================================================================================
    // ProcessContext
    // Purpose: Enriches rawContext and stores it as the session's context.
    // Returns:
    //   The enriched context.
    // Throws:
    //   errors::GatewayException: SessionNotFound, or InvalidParams for an invalid raw context.
    //==========================================================================================================
    JSONValue ProcessContext(const std::string& sessionId, const JSONValue& rawContext);

    // Stops every stdio server and disconnects every remote client.
    void Shutdown();

private:
    // The lazily started target for a stdio config; nullptr from startFilesystem() means start failed.
    std::shared_ptr<FilesystemServerAdapter> startFilesystem(const ServerConfig& config);
    bool ensureStdio(const ServerConfig& config);
    bool ensureRemote(const ServerConfig& config);

    const IServerConfigStore& configs_;
    StdioProcessManager& processes_;
    FilesystemServerRegistry& filesystems_;
    TransportClientManager& remotes_;
    SessionManager& sessions_;
    agent::IAgent& agent_;
    agent::ContextProcessor contextProcessor_;
};

} // namespace toolgw
