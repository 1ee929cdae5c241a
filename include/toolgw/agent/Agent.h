//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Agent.h
// Purpose: Agent contract: enumerate admissible actions from a context snapshot and execute one
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "toolgw/JSONRPCTypes.h"
#include "toolgw/Session.h"
#include "toolgw/agent/ActionSchema.h"
#include "toolgw/errors/Errors.h"

namespace toolgw {
namespace agent {

struct ActionRequest {
    std::string sessionId;
    std::string action;
    JSONValue parameters{JSONValue::Object{}};
};

struct Artifact {
    std::string type;   // "simulation_log", "brep", "gcode", ...
    JSONValue data;
};

//==========================================================================================================
// ActionResult
// Purpose: Uniform outcome of an action. Agents never touch the session; updatedContext is a delta the
//          caller merges.
// Fields:
//   failure: Category of a failed execution (UnknownAction, InvalidParams, Internal, ...); unset on
//            success.
//   output: Action-specific payload (created component, analysis report, ...).
//==========================================================================================================
struct ActionResult {
    bool success{false};
    std::string message;
    std::optional<JSONValue> updatedContext;
    std::vector<Artifact> artifacts;
    std::optional<JSONValue> output;
    std::optional<errors::ErrorCategory> failure;
};

// {success, message, artifacts:[{type, data}], output?}
JSONValue ActionResultToJSON(const ActionResult& result);

//==========================================================================================================
// IAgent
// Purpose: Domain plug-in consulted by the gateway.
// Notes:
//   - GetAvailableActions depends only on the session's context snapshot.
//   - ExecuteAction never throws; unknown names and handler failures come back as success=false.
//==========================================================================================================
class IAgent {
public:
    virtual ~IAgent() = default;
    virtual std::vector<CandidateAction> GetAvailableActions(const Session& session) const = 0;
    virtual ActionResult ExecuteAction(const ActionRequest& request, const Session& session) = 0;
};

} // namespace agent
} // namespace toolgw
