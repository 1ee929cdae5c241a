//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextProcessor.h
// Purpose: Enrich raw application context into the structured context agents consume
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "toolgw/JSONRPCTypes.h"
#include "toolgw/agent/ActionCatalog.h"

namespace toolgw {
namespace agent {

// Looks up stored details {name?, description?, dimensions?, position?, material?} for an element.
using ElementDetailsLookup = std::function<std::optional<JSONValue>(const std::string& id, const std::string& type)>;

//==========================================================================================================
// ContextProcessor
// Purpose: Turns {mode, activeView, selectedElements, activeTool?, currentProject?, recentOperations?} into
//          {mode, activeView, summary, selectedElements, availableActions, constraints, statistics,
//           preferences}.
// Notes:
//   - Selected elements are expanded with the lookup's details; when the lookup is absent or throws the
//     element keeps its id, type, a generated name and its raw properties.
//   - availableActions come from the action catalog filtered for the context.
//==========================================================================================================
class ContextProcessor {
public:
    explicit ContextProcessor(ElementDetailsLookup lookup = nullptr);

    //==========================================================================================================
    // Process
    // Returns:
    //   Enriched context object.
    // Throws:
    //   errors::GatewayException(InvalidParams) when the raw context fails validation.
    //==========================================================================================================
    JSONValue Process(const JSONValue& rawContext) const;

    // "User is in CAD mode with 3d view active. ..." for an already processed selection.
    static std::string Summarize(const JSONValue& rawContext, const JSONValue::Array& processedElements);

private:
    JSONValue::Array processSelectedElements(const JSONValue& rawContext) const;

    ElementDetailsLookup lookup_;
    ActionCatalog catalog_;
};

} // namespace agent
} // namespace toolgw
