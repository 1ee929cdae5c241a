//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionSchema.h
// Purpose: Typed description of domain actions and their parameters
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "toolgw/JSONRPCTypes.h"

namespace toolgw {
namespace agent {

//------------------------------ Parameter schema ------------------------------
struct NumberParam {
    std::optional<double> defaultValue;
    std::optional<double> min;
    std::optional<double> max;
};

struct StringParam {
    std::optional<std::string> defaultValue;
    std::vector<std::string> options;   // empty: any string
};

struct BooleanParam {
    std::optional<bool> defaultValue;
};

struct ArrayParam {};

// Object whose example value is a fixed set of numeric fields (dimensions, positions, ...).
struct ObjectParam {
    std::vector<std::pair<std::string, double>> fields;
};

using ParamSchema = std::variant<NumberParam, StringParam, BooleanParam, ArrayParam, ObjectParam>;

struct ActionParameter {
    std::string name;
    std::string description;
    bool required{false};
    ParamSchema schema;
};

// "number", "string", "boolean", "array", "object"
const char* ParamTypeName(const ParamSchema& schema);

enum class ActionCategory {
    Cad,
    Cam,
    GCode,
    General
};

// "cad", "cam", "gcode", "general"
const char* ActionCategoryName(ActionCategory category);

//==========================================================================================================
// CandidateAction
// Purpose: One action an agent offers for the current context. `name` is the identifier the caller passes
//          back on execution.
//==========================================================================================================
struct CandidateAction {
    std::string name;
    std::string description;
    ActionCategory category{ActionCategory::General};
    std::vector<ActionParameter> parameters;
    std::vector<std::string> contextualHints;
    std::vector<std::string> applicableElementTypes;   // empty: applies regardless of selection
};

// Object of representative values, one member per parameter. Parameters without a usable default are
// omitted unless required.
JSONValue ExampleValues(const CandidateAction& action);

// {name, type, description, required, defaultValue?, enum?, min?, max?}
JSONValue ActionParameterToJSON(const ActionParameter& parameter);

// {name, description, category, parameters (example values), parameterSchema, contextualHints,
//  applicableElementTypes}
JSONValue CandidateActionToJSON(const CandidateAction& action);

//==========================================================================================================
// ValidateParameters
// Purpose: Checks params against the action's schema: required members, JSON type, numeric range and
//          string options. Members the schema does not name are ignored.
// Returns:
//   The first violation as a message, or std::nullopt.
//==========================================================================================================
std::optional<std::string> ValidateParameters(const CandidateAction& action, const JSONValue& params);

} // namespace agent
} // namespace toolgw
