//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Shape checks for inbound action requests and raw application context
//==========================================================================================================

#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {
namespace validation {

inline constexpr std::array<const char*, 5> kContextModes{"cad", "cam", "gcode", "toolpath", "analysis"};
inline constexpr std::array<const char*, 4> kActiveViews{"2d", "3d", "split", "code"};

namespace detail {
template <std::size_t N>
inline bool oneOf(const std::array<const char*, N>& allowed, const std::string& s) {
    return std::any_of(allowed.begin(), allowed.end(), [&](const char* a) { return s == a; });
}

inline bool nonEmptyString(const JSONValue& obj, const std::string& key) {
    auto s = GetString(obj, key);
    return s.has_value() && !s->empty();
}
} // namespace detail

//------------------------------ Action requests ------------------------------
// {sessionId, action, parameters}. Returns the first problem found, or nullopt when valid.
inline std::optional<std::string> ValidateActionRequest(const JSONValue& request) {
    if (!request.IsObject()) return std::string("Action request is required");
    if (!detail::nonEmptyString(request, "sessionId")) {
        return std::string("sessionId is required in action request");
    }
    const JSONValue* action = FindMember(request, "action");
    if (!action || action->IsNull()) return std::string("action is required in action request");
    if (!action->IsString()) return std::string("action must be a string");
    if (std::get<std::string>(action->value).empty()) return std::string("action is required in action request");
    const JSONValue* params = FindMember(request, "parameters");
    if (!params || params->IsNull()) return std::string("parameters are required in action request");
    if (!params->IsObject()) return std::string("parameters must be an object");
    return std::nullopt;
}

//------------------------------ Raw application context ------------------------------
// {mode, activeView, selectedElements?[{id, type, properties?}], activeTool?, currentProject?,
//  recentOperations?}. A missing selectedElements is accepted and treated as empty.
inline std::optional<std::string> ValidateRawContext(const JSONValue& context) {
    if (!context.IsObject()) return std::string("Context is required");

    auto mode = GetString(context, "mode");
    if (!mode || mode->empty()) return std::string("Mode is required in context");
    if (!detail::oneOf(kContextModes, *mode)) return "Invalid mode: " + *mode;

    auto view = GetString(context, "activeView");
    if (!view || view->empty()) return std::string("activeView is required in context");
    if (!detail::oneOf(kActiveViews, *view)) return "Invalid activeView: " + *view;

    const JSONValue* selected = FindMember(context, "selectedElements");
    if (selected && !selected->IsNull()) {
        if (!selected->IsArray()) return std::string("selectedElements must be an array");
        const auto& arr = std::get<JSONValue::Array>(selected->value);
        for (std::size_t i = 0; i < arr.size(); ++i) {
            const JSONValue& el = arr[i] ? *arr[i] : JSONValue();
            if (!detail::nonEmptyString(el, "id")) {
                return "selectedElements[" + std::to_string(i) + "] is missing id";
            }
            if (!detail::nonEmptyString(el, "type")) {
                return "selectedElements[" + std::to_string(i) + "] is missing type";
            }
        }
    }
    return std::nullopt;
}

} // namespace validation
} // namespace toolgw
