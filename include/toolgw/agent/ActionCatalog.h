//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionCatalog.h
// Purpose: Fixed catalog of CAD/CAM/G-code actions with context filtering and execution
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "toolgw/agent/Agent.h"

namespace toolgw {
namespace agent {

//==========================================================================================================
// ActionCatalog
// Purpose: generateCADComponent, modifyElement, createExtrusion, createHole, generateToolpath,
//          optimizeGCode and analyzeModel.
// Notes:
//   - ForContext() filters by mode (cad, cam, gcode; anything else keeps all), then by the selected
//     element types, and attaches hints for the current context.
//   - Execute() validates parameters before running the action.
//==========================================================================================================
class ActionCatalog {
public:
    ActionCatalog();

    const std::vector<CandidateAction>& All() const { return actions_; }
    const CandidateAction* Find(const std::string& name) const;

    //==========================================================================================================
    // ForContext
    // Args:
    //   mode: Application mode; empty or unrecognized keeps every action.
    //   selectedElements: Array of {id, type, name?}; a non-array counts as no selection.
    //==========================================================================================================
    std::vector<CandidateAction> ForContext(const std::string& mode, const JSONValue& selectedElements) const;

    //==========================================================================================================
    // Execute
    // Purpose: Runs a catalog action against a context snapshot.
    // Returns:
    //   A successful ActionResult with the action payload in `output`.
    // Throws:
    //   errors::GatewayException: UnknownAction for names outside the catalog, InvalidParams for schema
    //   violations or elements missing from the context.
    //==========================================================================================================
    ActionResult Execute(const std::string& name, const JSONValue& params, const JSONValue& context) const;

private:
    std::vector<CandidateAction> actions_;
};

} // namespace agent
} // namespace toolgw
