//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CadCamAgent.h
// Purpose: Default agent: simulated modelling actions plus the action catalog
//==========================================================================================================

#pragma once

#include <vector>

#include "toolgw/agent/ActionCatalog.h"
#include "toolgw/agent/Agent.h"

namespace toolgw {
namespace agent {

//==========================================================================================================
// CadCamAgent
// Purpose: Offers "Create Block" always, "Create Cylinder" when a plane is selected and "Generate G-code"
//          once the context reports elements, followed by the catalog actions admitted by the context.
// Notes:
//   - Base actions are simulated: the summary gains "; Executed: <name>", Create* actions bump
//     statistics.elementCount and emit a brep artifact, and every base action emits a simulation_log.
//   - Catalog actions run through ActionCatalog::Execute.
//==========================================================================================================
class CadCamAgent : public IAgent {
public:
    static constexpr const char* kCreateBlock = "Create Block";
    static constexpr const char* kCreateCylinder = "Create Cylinder";
    static constexpr const char* kGenerateGCode = "Generate G-code";

    std::vector<CandidateAction> GetAvailableActions(const Session& session) const override;
    ActionResult ExecuteAction(const ActionRequest& request, const Session& session) override;

    // Context-snapshot forms of the two operations above.
    std::vector<CandidateAction> ActionsForContext(const JSONValue& context) const;
    ActionResult ExecuteWithContext(const ActionRequest& request, const JSONValue& context) const;

    const ActionCatalog& Catalog() const { return catalog_; }

private:
    ActionResult simulate(const std::string& name, const JSONValue& params, const JSONValue& context) const;

    ActionCatalog catalog_;
};

} // namespace agent
} // namespace toolgw
