//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.cpp
// Purpose: Gateway routing and session plumbing
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "toolgw/Gateway.h"
#include "toolgw/StdioEnvelope.h"
#include "toolgw/validation/Validators.h"

namespace toolgw {

namespace {
constexpr const char* kGatewayId = "gateway";

Gateway::ResponseFuture errorFuture(const errors::GatewayError& err) {
    return MakeReadyFuture(errors::makeErrorResponse(JSONRPCId{std::string(kGatewayId)}, err));
}

Gateway::ResponseFuture errorFuture(errors::ErrorCategory category, const std::string& message) {
    return errorFuture(errors::makeError(category, message));
}

ExecuteActionResponse failedResponse(errors::ErrorCategory category, const std::string& message) {
    ExecuteActionResponse r;
    r.success = false;
    r.statusClass = errors::statusClassFor(category);
    errors::GatewayError err = errors::makeError(category, message);
    err.message = errors::publicMessage(err);
    r.message = err.message;
    r.error = std::move(err);
    return r;
}
} // namespace

JSONValue ExecuteActionResponseToJSON(const ExecuteActionResponse& response) {
    JSONValue::Array artifacts;
    for (const auto& a : response.artifacts) {
        JSONValue::Object obj;
        SetMember(obj, "type", JSONValue(a.type));
        SetMember(obj, "data", a.data);
        artifacts.push_back(std::make_shared<JSONValue>(std::move(obj)));
    }
    JSONValue::Object obj;
    SetMember(obj, "success", JSONValue(response.success));
    SetMember(obj, "statusClass", JSONValue(response.statusClass));
    SetMember(obj, "message", JSONValue(response.message));
    SetMember(obj, "artifacts", JSONValue(std::move(artifacts)));
    if (response.output) {
        SetMember(obj, "output", *response.output);
    }
    if (response.error) {
        SetMember(obj, "error", errors::makeErrorValue(*response.error));
    }
    return JSONValue(std::move(obj));
}

Gateway::Gateway(const IServerConfigStore& configs,
                 StdioProcessManager& processes,
                 FilesystemServerRegistry& filesystems,
                 TransportClientManager& remotes,
                 SessionManager& sessions,
                 agent::IAgent& agent,
                 agent::ContextProcessor contextProcessor)
    : configs_(configs),
      processes_(processes),
      filesystems_(filesystems),
      remotes_(remotes),
      sessions_(sessions),
      agent_(agent),
      contextProcessor_(std::move(contextProcessor)) {}

ServerConfig Gateway::ResolveServer(const std::string& serverId) const {
    auto config = configs_.Find(serverId);
    if (!config) {
        throw errors::GatewayException(errors::ErrorCategory::ConfigNotFound,
                                       std::format("Server configuration not found: {}", serverId));
    }
    if (!config->enabled) {
        throw errors::GatewayException(errors::ErrorCategory::ServerDisabled,
                                       std::format("Server is disabled: {}", serverId));
    }
    return *config;
}

std::shared_ptr<FilesystemServerAdapter> Gateway::startFilesystem(const ServerConfig& config) {
    if (auto adapter = filesystems_.GetServer(config.id); adapter && adapter->IsRunning()) {
        return adapter;
    }
    if (!filesystems_.StartServer(config)) {
        return nullptr;
    }
    return filesystems_.GetServer(config.id);
}

bool Gateway::ensureStdio(const ServerConfig& config) {
    return processes_.IsRunning(config.id) || processes_.StartProcess(config);
}

bool Gateway::ensureRemote(const ServerConfig& config) {
    auto client = remotes_.GetServer(config.id);
    return (client && client->IsConnected()) || remotes_.ConnectServer(config);
}

Gateway::ResponseFuture Gateway::Dispatch(const std::string& serverId, const DispatchRequest& request) {
    FUNC_SCOPE();
    ServerConfig config;
    try {
        config = ResolveServer(serverId);
    } catch (const errors::GatewayException& e) {
        LOG_WARN("Dispatch to '{}' rejected: {}", serverId, e.what());
        return errorFuture(e.error());
    }

    const ResourceRef* resource = std::get_if<ResourceRef>(&request);
    const ToolCall* tool = std::get_if<ToolCall>(&request);

    if (config.Kind() == TransportKind::Remote) {
        if (!ensureRemote(config)) {
            return errorFuture(errors::ErrorCategory::ConnectionFailed,
                               std::format("Failed to connect to server: {}", serverId));
        }
        return resource ? remotes_.ReadResource(serverId, resource->uri)
                        : remotes_.CallTool(serverId, tool->name, tool->params);
    }

    if (IsFilesystemServer(config)) {
        auto adapter = startFilesystem(config);
        if (!adapter) {
            return errorFuture(errors::ErrorCategory::ConnectionFailed,
                               std::format("Failed to start filesystem server: {}", serverId));
        }
        return resource ? adapter->ReadResource(resource->uri) : adapter->CallTool(tool->name, tool->params);
    }

    if (!ensureStdio(config)) {
        return errorFuture(errors::ErrorCategory::ConnectionFailed,
                           std::format("Failed to start process for server: {}", serverId));
    }
    return resource ? processes_.ReadResource(serverId, resource->uri)
                    : processes_.CallTool(serverId, tool->name, tool->params);
}

Gateway::ResponseFuture Gateway::GetCapabilities(const std::string& serverId) {
    ServerConfig config;
    try {
        config = ResolveServer(serverId);
    } catch (const errors::GatewayException& e) {
        return errorFuture(e.error());
    }

    if (config.Kind() == TransportKind::Remote) {
        if (!ensureRemote(config)) {
            return errorFuture(errors::ErrorCategory::ConnectionFailed,
                               std::format("Failed to connect to server: {}", serverId));
        }
        return remotes_.GetCapabilities(serverId);
    }
    if (IsFilesystemServer(config)) {
        auto adapter = startFilesystem(config);
        if (!adapter) {
            return errorFuture(errors::ErrorCategory::ConnectionFailed,
                               std::format("Failed to start filesystem server: {}", serverId));
        }
        return adapter->GetCapabilities();
    }
    if (!ensureStdio(config)) {
        return errorFuture(errors::ErrorCategory::ConnectionFailed,
                           std::format("Failed to start process for server: {}", serverId));
    }
    return processes_.GetCapabilities(serverId);
}

bool Gateway::StopServer(const std::string& serverId) {
    bool stopped = processes_.StopProcess(serverId);
    stopped = filesystems_.StopServer(serverId) || stopped;
    if (remotes_.GetServer(serverId)) {
        remotes_.DisconnectServer(serverId);
        stopped = true;
    }
    return stopped;
}

SessionInfo Gateway::OpenSession(const std::optional<std::string>& sessionId) {
    auto [session, created] = sessions_.GetOrCreateSession(sessionId.value_or(""));
    return SessionInfo{session->Id(), created};
}

ExecuteActionResponse Gateway::ExecuteAction(const JSONValue& request) {
    if (auto problem = validation::ValidateActionRequest(request)) {
        return failedResponse(errors::ErrorCategory::InvalidRequest, *problem);
    }
    agent::ActionRequest typed;
    typed.sessionId = GetString(request, "sessionId").value_or("");
    typed.action = GetString(request, "action").value_or("");
    typed.parameters = *FindMember(request, "parameters");
    return ExecuteAction(typed);
}

ExecuteActionResponse Gateway::ExecuteAction(const agent::ActionRequest& request) {
    FUNC_SCOPE();
    if (request.action.empty()) {
        return failedResponse(errors::ErrorCategory::InvalidRequest, "action is required in action request");
    }
    if (!request.parameters.IsObject()) {
        return failedResponse(errors::ErrorCategory::InvalidRequest, "parameters must be an object");
    }
    auto session = sessions_.GetSession(request.sessionId);
    if (!session) {
        return failedResponse(errors::ErrorCategory::SessionNotFound,
                              std::format("Session not found: {}", request.sessionId));
    }

    agent::ActionResult result;
    {
        // The agent's delta is computed from the context it saw; no other action may land in between.
        auto actionLock = session->LockActions();
        result = agent_.ExecuteAction(request, *session);
        session->RecordAction(request.action, request.parameters, agent::ActionResultToJSON(result));
        if (result.success && result.updatedContext) {
            if (result.updatedContext->IsObject()) {
                session->MergeContext(*result.updatedContext);
            } else {
                LOG_WARN("Action '{}' returned a non-object context update; ignored", request.action);
            }
        }
    }

    if (!result.success) {
        ExecuteActionResponse r =
            failedResponse(result.failure.value_or(errors::ErrorCategory::Internal), result.message);
        r.artifacts = std::move(result.artifacts);
        return r;
    }

    ExecuteActionResponse r;
    r.success = true;
    r.statusClass = 200;
    r.message = std::move(result.message);
    r.artifacts = std::move(result.artifacts);
    r.output = std::move(result.output);
    return r;
}

std::vector<agent::CandidateAction> Gateway::AvailableActions(const std::string& sessionId) const {
    auto session = sessions_.GetSession(sessionId);
    if (!session) {
        throw errors::GatewayException(errors::ErrorCategory::SessionNotFound,
                                       std::format("Session not found: {}", sessionId));
    }
    return agent_.GetAvailableActions(*session);
}

JSONValue Gateway::ProcessContext(const std::string& sessionId, const JSONValue& rawContext) {
    auto session = sessions_.GetSession(sessionId);
    if (!session) {
        throw errors::GatewayException(errors::ErrorCategory::SessionNotFound,
                                       std::format("Session not found: {}", sessionId));
    }
    JSONValue enriched = contextProcessor_.Process(rawContext);
    auto actionLock = session->LockActions();
    session->UpdateContext(enriched);
    return enriched;
}

void Gateway::Shutdown() {
    LOG_INFO("Gateway shutting down");
    processes_.StopAllProcesses();
    filesystems_.StopAllServers();
    remotes_.DisconnectAll();
}

} // namespace toolgw
