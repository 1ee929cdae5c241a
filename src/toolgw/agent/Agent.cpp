//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Agent.cpp
// Purpose: ActionResult serialization
//==========================================================================================================

#include "toolgw/agent/Agent.h"

namespace toolgw {
namespace agent {

JSONValue ActionResultToJSON(const ActionResult& result) {
    JSONValue::Array artifacts;
    artifacts.reserve(result.artifacts.size());
    for (const auto& a : result.artifacts) {
        JSONValue::Object obj;
        SetMember(obj, "type", JSONValue(a.type));
        SetMember(obj, "data", a.data);
        artifacts.push_back(std::make_shared<JSONValue>(std::move(obj)));
    }
    JSONValue::Object obj;
    SetMember(obj, "success", JSONValue(result.success));
    SetMember(obj, "message", JSONValue(result.message));
    SetMember(obj, "artifacts", JSONValue(std::move(artifacts)));
    if (result.output) {
        SetMember(obj, "output", *result.output);
    }
    return JSONValue(std::move(obj));
}

} // namespace agent
} // namespace toolgw
