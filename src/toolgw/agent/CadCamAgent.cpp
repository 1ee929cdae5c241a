//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CadCamAgent.cpp
// Purpose: Default agent implementation
//==========================================================================================================

#include <algorithm>
#include <format>

#include "logging/Logger.h"
#include "toolgw/agent/CadCamAgent.h"

namespace toolgw {
namespace agent {

namespace {

CandidateAction createBlockAction() {
    return CandidateAction{
        CadCamAgent::kCreateBlock,
        "Creates a simple rectangular block.",
        ActionCategory::Cad,
        {
            {"featureName", "Feature name", false, StringParam{std::string("Block"), {}}},
            {"dimensions", "Block dimensions", false,
             ObjectParam{{{"length", 10}, {"width", 5}, {"height", 2}}}},
            {"position", "Block origin", false, ObjectParam{{{"x", 0}, {"y", 0}, {"z", 0}}}},
        },
        {"Creates a new block at the origin."},
        {}};
}

CandidateAction createCylinderAction(bool planeSelected) {
    return CandidateAction{
        CadCamAgent::kCreateCylinder,
        "Creates a cylinder.",
        ActionCategory::Cad,
        {
            {"featureName", "Feature name", false, StringParam{std::string("Cylinder"), {}}},
            {"dimensions", "Cylinder dimensions", false, ObjectParam{{{"radius", 3}, {"height", 5}}}},
            {"position", "Base position", false, ObjectParam{{{"x", 0}, {"y", 0}, {"z", 0}}}},
        },
        {planeSelected ? "Creates a cylinder, likely on the selected plane."
                       : "Creates a cylinder. Select a plane first for precise placement."},
        planeSelected ? std::vector<std::string>{"plane"} : std::vector<std::string>{}};
}

CandidateAction generateGCodeAction() {
    return CandidateAction{
        CadCamAgent::kGenerateGCode,
        "Generates G-code for the current geometry based on CAM setup.",
        ActionCategory::Cam,
        {
            {"toolId", "Tool to machine with", false, StringParam{std::string("default-tool"), {}}},
            {"operationType", "Machining operation", false, StringParam{std::string("milling"), {}}},
            {"tolerance", "Path tolerance", false, NumberParam{0.01, 0.0, std::nullopt}},
        },
        {"Requires existing geometry and a CAM setup."},
        {}};
}

bool planeSelected(const JSONValue& context) {
    const JSONValue* sel = FindMember(context, "selectedElements");
    if (!sel || !sel->IsArray()) return false;
    const auto& arr = std::get<JSONValue::Array>(sel->value);
    return std::any_of(arr.begin(), arr.end(), [](const std::shared_ptr<JSONValue>& el) {
        return el && GetString(*el, "type").value_or("") == "plane";
    });
}

double elementCount(const JSONValue& context) {
    const JSONValue* stats = FindMember(context, "statistics");
    return stats ? GetNumber(*stats, "elementCount").value_or(0.0) : 0.0;
}

bool isBaseAction(const std::string& name) {
    return name == CadCamAgent::kCreateBlock || name == CadCamAgent::kCreateCylinder ||
           name == CadCamAgent::kGenerateGCode;
}

const CandidateAction& baseDefinition(const std::string& name) {
    static const CandidateAction block = createBlockAction();
    static const CandidateAction cylinder = createCylinderAction(false);
    static const CandidateAction gcode = generateGCodeAction();
    if (name == CadCamAgent::kCreateBlock) return block;
    if (name == CadCamAgent::kCreateCylinder) return cylinder;
    return gcode;
}

} // namespace

std::vector<CandidateAction> CadCamAgent::GetAvailableActions(const Session& session) const {
    return ActionsForContext(session.Context());
}

std::vector<CandidateAction> CadCamAgent::ActionsForContext(const JSONValue& context) const {
    std::vector<CandidateAction> actions;
    actions.push_back(createBlockAction());
    if (planeSelected(context)) {
        actions.push_back(createCylinderAction(true));
    }
    if (elementCount(context) > 0) {
        actions.push_back(generateGCodeAction());
    }

    const JSONValue* selected = FindMember(context, "selectedElements");
    auto catalogActions = catalog_.ForContext(GetString(context, "mode").value_or(""),
                                              selected ? *selected : JSONValue());
    for (auto& a : catalogActions) {
        actions.push_back(std::move(a));
    }
    return actions;
}

ActionResult CadCamAgent::ExecuteAction(const ActionRequest& request, const Session& session) {
    return ExecuteWithContext(request, session.Context());
}

ActionResult CadCamAgent::ExecuteWithContext(const ActionRequest& request, const JSONValue& context) const {
    const std::string& name = request.action;
    LOG_INFO("Executing action \"{}\" with params: {}", name, SerializeJSON(request.parameters));

    const bool base = isBaseAction(name);
    if (!base && !catalog_.Find(name)) {
        LOG_ERROR("Unknown action ID: {}", name);
        ActionResult result;
        result.message = std::format("Action \"{}\" is not implemented.", name);
        result.failure = errors::ErrorCategory::UnknownAction;
        return result;
    }

    ActionResult result;
    try {
        if (base) {
            if (auto problem = ValidateParameters(baseDefinition(name), request.parameters)) {
                throw errors::GatewayException(errors::ErrorCategory::InvalidParams, *problem);
            }
            result = simulate(name, request.parameters, context);
        } else {
            result = catalog_.Execute(name, request.parameters, context);
        }
    } catch (const errors::GatewayException& e) {
        LOG_ERROR("Error executing action \"{}\": {}", name, e.what());
        result = ActionResult{};
        result.message = std::format("Failed to execute action \"{}\": {}", name, e.what());
        result.failure = e.category();
    } catch (const std::exception& e) {
        LOG_ERROR("Error executing action \"{}\": {}", name, e.what());
        result = ActionResult{};
        result.message = std::format("Failed to execute action \"{}\": {}", name, e.what());
        result.failure = errors::ErrorCategory::Internal;
    }
    return result;
}

ActionResult CadCamAgent::simulate(const std::string& name, const JSONValue& params, const JSONValue& context) const {
    const bool creates = name.rfind("Create", 0) == 0;

    JSONValue::Object delta;
    std::string summary = GetString(context, "summary").value_or("");
    if (summary.empty()) summary = "Context";
    SetMember(delta, "summary", JSONValue(summary + "; Executed: " + name));
    if (creates) {
        JSONValue::Object stats;
        if (const JSONValue* existing = FindMember(context, "statistics"); existing && existing->IsObject()) {
            stats = std::get<JSONValue::Object>(existing->value);
        }
        const double count = elementCount(context);
        SetMember(stats, "elementCount", JSONValue(static_cast<int64_t>(count) + 1));
        SetMember(delta, "statistics", JSONValue(std::move(stats)));
    }

    ActionResult result;
    result.success = true;
    result.message = std::format("Action \"{}\" simulated successfully.", name);
    result.updatedContext = JSONValue(std::move(delta));
    result.artifacts.push_back(
        Artifact{"simulation_log", JSONValue(std::format("Simulated {} with {}", name, SerializeJSON(params)))});
    if (creates) {
        result.artifacts.push_back(Artifact{"brep", JSONValue(std::format("<simulated_geometry_for_{}>", name))});
    }
    if (name == kGenerateGCode) {
        result.artifacts.push_back(Artifact{"gcode", JSONValue("G0 X0 Y0 Z10\nG1 X10 F100\nM2")});
        result.message = "G-code generated successfully.";
    }
    return result;
}

} // namespace agent
} // namespace toolgw
