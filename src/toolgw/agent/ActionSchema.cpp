//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionSchema.cpp
// Purpose: Example rendering and validation for action parameter schemas
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <format>
#include <type_traits>

#include "toolgw/agent/ActionSchema.h"

namespace toolgw {
namespace agent {

namespace {
// Integral values render as JSON integers.
JSONValue numberValue(double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15) {
        return JSONValue(static_cast<int64_t>(v));
    }
    return JSONValue(v);
}

JSONValue stringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue(std::move(arr));
}

JSONValue objectExample(const ObjectParam& p) {
    JSONValue::Object obj;
    for (const auto& [field, value] : p.fields) {
        SetMember(obj, field, numberValue(value));
    }
    return JSONValue(std::move(obj));
}

// Example value for one parameter; nullopt when the schema has nothing representative to offer.
std::optional<JSONValue> exampleFor(const ParamSchema& schema) {
    return std::visit([](const auto& p) -> std::optional<JSONValue> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, NumberParam>) {
            if (p.defaultValue) return numberValue(*p.defaultValue);
            if (p.min) return numberValue(*p.min);
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, StringParam>) {
            if (p.defaultValue) return JSONValue(*p.defaultValue);
            if (!p.options.empty()) return JSONValue(p.options.front());
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, BooleanParam>) {
            if (p.defaultValue) return JSONValue(*p.defaultValue);
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, ArrayParam>) {
            return std::nullopt;
        } else {
            return objectExample(p);
        }
    }, schema);
}

JSONValue placeholderFor(const ParamSchema& schema) {
    return std::visit([](const auto& p) -> JSONValue {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, NumberParam>) {
            return JSONValue(static_cast<int64_t>(0));
        } else if constexpr (std::is_same_v<T, StringParam>) {
            return JSONValue(std::string());
        } else if constexpr (std::is_same_v<T, BooleanParam>) {
            return JSONValue(false);
        } else if constexpr (std::is_same_v<T, ArrayParam>) {
            return JSONValue(JSONValue::Array{});
        } else {
            return objectExample(p);
        }
    }, schema);
}

std::string joinOptions(const std::vector<std::string>& options) {
    std::string out;
    for (std::size_t i = 0; i < options.size(); ++i) {
        if (i) out += ", ";
        out += options[i];
    }
    return out;
}
} // namespace

const char* ParamTypeName(const ParamSchema& schema) {
    switch (schema.index()) {
        case 0: return "number";
        case 1: return "string";
        case 2: return "boolean";
        case 3: return "array";
        default: return "object";
    }
}

const char* ActionCategoryName(ActionCategory category) {
    switch (category) {
        case ActionCategory::Cad: return "cad";
        case ActionCategory::Cam: return "cam";
        case ActionCategory::GCode: return "gcode";
        case ActionCategory::General: return "general";
    }
    return "general";
}

JSONValue ExampleValues(const CandidateAction& action) {
    JSONValue::Object obj;
    for (const auto& param : action.parameters) {
        if (auto ex = exampleFor(param.schema)) {
            SetMember(obj, param.name, std::move(*ex));
        } else if (param.required) {
            SetMember(obj, param.name, placeholderFor(param.schema));
        }
    }
    return JSONValue(std::move(obj));
}

JSONValue ActionParameterToJSON(const ActionParameter& parameter) {
    JSONValue::Object obj;
    SetMember(obj, "name", JSONValue(parameter.name));
    SetMember(obj, "type", JSONValue(ParamTypeName(parameter.schema)));
    SetMember(obj, "description", JSONValue(parameter.description));
    SetMember(obj, "required", JSONValue(parameter.required));
    if (auto ex = exampleFor(parameter.schema)) {
        // For numbers only an explicit default counts; min is not a default.
        const auto* num = std::get_if<NumberParam>(&parameter.schema);
        if (!num || num->defaultValue) {
            SetMember(obj, "defaultValue", std::move(*ex));
        }
    }
    if (const auto* s = std::get_if<StringParam>(&parameter.schema); s && !s->options.empty()) {
        SetMember(obj, "enum", stringArray(s->options));
    }
    if (const auto* n = std::get_if<NumberParam>(&parameter.schema)) {
        if (n->min) SetMember(obj, "min", numberValue(*n->min));
        if (n->max) SetMember(obj, "max", numberValue(*n->max));
    }
    return JSONValue(std::move(obj));
}

JSONValue CandidateActionToJSON(const CandidateAction& action) {
    JSONValue::Array schema;
    for (const auto& p : action.parameters) {
        schema.push_back(std::make_shared<JSONValue>(ActionParameterToJSON(p)));
    }
    JSONValue::Object obj;
    SetMember(obj, "name", JSONValue(action.name));
    SetMember(obj, "description", JSONValue(action.description));
    SetMember(obj, "category", JSONValue(ActionCategoryName(action.category)));
    SetMember(obj, "parameters", ExampleValues(action));
    SetMember(obj, "parameterSchema", JSONValue(std::move(schema)));
    SetMember(obj, "contextualHints", stringArray(action.contextualHints));
    SetMember(obj, "applicableElementTypes", stringArray(action.applicableElementTypes));
    return JSONValue(std::move(obj));
}

std::optional<std::string> ValidateParameters(const CandidateAction& action, const JSONValue& params) {
    if (!params.IsObject()) {
        return std::string("parameters must be an object");
    }
    for (const auto& def : action.parameters) {
        const JSONValue* value = FindMember(params, def.name);
        if (!value || value->IsNull()) {
            if (def.required) {
                return "Missing required parameter: " + def.name;
            }
            continue;
        }

        std::optional<std::string> problem = std::visit([&](const auto& p) -> std::optional<std::string> {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, NumberParam>) {
                auto n = AsNumber(*value);
                if (!n) return std::format("Parameter {} must be a number", def.name);
                if (p.min && *n < *p.min) return std::format("Parameter {} must be at least {}", def.name, *p.min);
                if (p.max && *n > *p.max) return std::format("Parameter {} must be at most {}", def.name, *p.max);
            } else if constexpr (std::is_same_v<T, StringParam>) {
                if (!value->IsString()) return std::format("Parameter {} must be a string", def.name);
                const auto& s = std::get<std::string>(value->value);
                if (!p.options.empty() && std::find(p.options.begin(), p.options.end(), s) == p.options.end()) {
                    return std::format("Parameter {} must be one of: {}", def.name, joinOptions(p.options));
                }
            } else if constexpr (std::is_same_v<T, BooleanParam>) {
                if (!value->IsBool()) return std::format("Parameter {} must be a boolean", def.name);
            } else if constexpr (std::is_same_v<T, ArrayParam>) {
                if (!value->IsArray()) return std::format("Parameter {} must be an array", def.name);
            } else {
                if (!value->IsObject()) return std::format("Parameter {} must be an object", def.name);
            }
            return std::nullopt;
        }, def.schema);

        if (problem) {
            return problem;
        }
    }
    return std::nullopt;
}

} // namespace agent
} // namespace toolgw
