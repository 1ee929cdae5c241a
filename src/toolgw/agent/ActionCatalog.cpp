//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ActionCatalog.cpp
// Purpose: Catalog action definitions, context filtering and execution
//==========================================================================================================

#include <algorithm>
#include <chrono>
#include <ctime>
#include <format>
#include <random>
#include <set>
#include <sstream>

#include "logging/Logger.h"
#include "toolgw/agent/ActionCatalog.h"
#include "toolgw/errors/Errors.h"

namespace toolgw {
namespace agent {

namespace {

using errors::ErrorCategory;
using errors::GatewayException;

std::mt19937& rng() {
    thread_local std::mt19937 gen{std::random_device{}()};
    return gen;
}

int randomInt(int lo, int hi) {
    std::uniform_int_distribution<int> dis(lo, hi);
    return dis(rng());
}

std::string newEntityId(const std::string& prefix) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string suffix;
    for (int i = 0; i < 7; ++i) {
        suffix.push_back(kAlphabet[randomInt(0, 35)]);
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::format("{}_{}_{}", prefix, static_cast<long long>(ms), suffix);
}

std::string isoNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::format("{}.{:03}Z", buf, static_cast<int>(ms));
}

JSONValue point(std::initializer_list<std::pair<const char*, double>> fields) {
    JSONValue::Object obj;
    for (const auto& [k, v] : fields) {
        SetMember(obj, k, JSONValue(v));
    }
    return JSONValue(std::move(obj));
}

JSONValue memberOr(const JSONValue& params, const std::string& key, JSONValue fallback) {
    const JSONValue* v = FindMember(params, key);
    return (v && !v->IsNull()) ? *v : std::move(fallback);
}

const JSONValue::Array* selectedArray(const JSONValue& context) {
    const JSONValue* sel = FindMember(context, "selectedElements");
    if (!sel || !sel->IsArray()) return nullptr;
    return &std::get<JSONValue::Array>(sel->value);
}

bool contextHasElement(const JSONValue& context, const std::string& id, const char* requiredType = nullptr) {
    const auto* arr = selectedArray(context);
    if (!arr) return false;
    return std::any_of(arr->begin(), arr->end(), [&](const std::shared_ptr<JSONValue>& el) {
        if (!el || GetString(*el, "id").value_or("") != id) return false;
        return !requiredType || GetString(*el, "type").value_or("") == requiredType;
    });
}

void requireContext(const JSONValue& context, const char* what) {
    if (!context.IsObject() || std::get<JSONValue::Object>(context.value).empty()) {
        throw GatewayException(ErrorCategory::InvalidParams, std::format("No context available for {}", what));
    }
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (lines.empty() || (!text.empty() && text.back() == '\n')) {
        lines.emplace_back();
    }
    return lines;
}

std::vector<CandidateAction> buildCatalog() {
    std::vector<CandidateAction> actions;

    actions.push_back(CandidateAction{
        "generateCADComponent",
        "Generate a CAD component based on a description",
        ActionCategory::Cad,
        {
            {"description", "Detailed description of the component to generate", true, StringParam{}},
            {"type", "Type of component to generate", true,
             StringParam{std::nullopt, {"cube", "cylinder", "sphere", "cone", "torus", "custom"}}},
            {"dimensions", "Dimensions of the component", false,
             ObjectParam{{{"width", 100}, {"height", 100}, {"depth", 100}}}},
            {"position", "Position of the component", false, ObjectParam{{{"x", 0}, {"y", 0}, {"z", 0}}}},
            {"material", "Material of the component", false, StringParam{std::string("aluminum"), {}}},
        },
        {},
        {}});

    actions.push_back(CandidateAction{
        "modifyElement",
        "Modify properties of an existing element",
        ActionCategory::Cad,
        {
            {"elementId", "ID of the element to modify", true, StringParam{}},
            {"properties", "Properties to modify", true, ObjectParam{}},
        },
        {},
        {"cube", "cylinder", "sphere", "cone", "torus", "model"}});

    actions.push_back(CandidateAction{
        "createExtrusion",
        "Create an extrusion from a selected face or sketch",
        ActionCategory::Cad,
        {
            {"elementId", "ID of the face or sketch to extrude", true, StringParam{}},
            {"distance", "Extrusion distance", true, NumberParam{std::nullopt, 0.1, 1000}},
            {"direction", "Extrusion direction", false,
             StringParam{std::string("normal"), {"normal", "reverse", "both"}}},
        },
        {},
        {"face", "sketch"}});

    actions.push_back(CandidateAction{
        "createHole",
        "Create a hole in a selected face",
        ActionCategory::Cad,
        {
            {"faceId", "ID of the face to create the hole in", true, StringParam{}},
            {"diameter", "Diameter of the hole", true, NumberParam{std::nullopt, 0.1, 1000}},
            {"depth", "Depth of the hole", true, NumberParam{std::nullopt, 0.1, 1000}},
            {"position", "Position of the hole relative to the face", false, ObjectParam{{{"x", 0}, {"y", 0}}}},
        },
        {},
        {"face"}});

    actions.push_back(CandidateAction{
        "generateToolpath",
        "Generate a toolpath for machining",
        ActionCategory::Cam,
        {
            {"elementIds", "IDs of elements to include in the toolpath", true, ArrayParam{}},
            {"toolDiameter", "Diameter of the cutting tool", true, NumberParam{std::nullopt, 0.1, 50}},
            {"stepover", "Step-over percentage for the toolpath", false, NumberParam{40, 10, 90}},
            {"strategy", "Machining strategy", false,
             StringParam{std::string("pocket"), {"contour", "pocket", "drill", "adaptive"}}},
        },
        {},
        {"model", "mesh", "solid"}});

    actions.push_back(CandidateAction{
        "optimizeGCode",
        "Optimize G-code for a specific machine",
        ActionCategory::GCode,
        {
            {"gcode", "G-code to optimize", true, StringParam{}},
            {"machineType", "Type of CNC machine", true, StringParam{std::nullopt, {"3-axis", "4-axis", "5-axis"}}},
            {"optimizationGoal", "Optimization goal", false,
             StringParam{std::string("balanced"), {"speed", "quality", "tool-life", "balanced"}}},
        },
        {},
        {}});

    actions.push_back(CandidateAction{
        "analyzeModel",
        "Analyze a model for machining issues",
        ActionCategory::Cam,
        {
            {"elementIds", "IDs of elements to analyze", true, ArrayParam{}},
            {"analysisType", "Type of analysis to perform", false,
             StringParam{std::string("manufacturability"),
                         {"manufacturability", "structural", "thin-walls", "undercuts"}}},
        },
        {},
        {"model", "mesh", "solid"}});

    return actions;
}

bool modeAdmits(const std::string& mode, const std::string& name) {
    auto in = [&](std::initializer_list<const char*> names) {
        return std::any_of(names.begin(), names.end(), [&](const char* n) { return name == n; });
    };
    if (mode == "cad") return in({"generateCADComponent", "modifyElement", "createExtrusion", "createHole"});
    if (mode == "cam") return in({"generateToolpath", "analyzeModel"});
    if (mode == "gcode") return in({"optimizeGCode"});
    return true;
}

std::vector<std::string> hintsFor(const std::string& name, const std::string& mode,
                                  const JSONValue::Array& selected, const std::set<std::string>& selectedTypes) {
    std::vector<std::string> hints;
    if (name == "generateCADComponent") {
        hints.emplace_back("Provide a detailed description for best results.");
        if (mode == "cad") {
            hints.emplace_back("The component will be created at the origin unless a position is specified.");
        }
    } else if (name == "modifyElement") {
        if (selected.size() == 1 && selected.front()) {
            const JSONValue& el = *selected.front();
            auto label = GetString(el, "name");
            if (!label || label->empty()) label = GetString(el, "id");
            hints.push_back(std::format("Element {} is currently selected.", label.value_or("")));
        } else if (selected.size() > 1) {
            hints.push_back(std::format("{} elements are currently selected. This action only works on one element.",
                                        selected.size()));
        }
    } else if (name == "createExtrusion") {
        if (selectedTypes.count("face") || selectedTypes.count("sketch")) {
            hints.emplace_back("A face or sketch is selected that can be extruded.");
        }
    } else if (name == "generateToolpath") {
        if (mode == "cam") {
            hints.emplace_back("Make sure to select appropriate machining parameters for your material.");
        }
    }
    return hints;
}

//------------------------------ Action bodies ------------------------------

ActionResult runGenerateComponent(const JSONValue& params) {
    const std::string type = GetString(params, "type").value_or("custom");
    const std::string id = newEntityId("component");
    JSONValue::Object component;
    SetMember(component, "id", JSONValue(id));
    SetMember(component, "type", JSONValue(type));
    SetMember(component, "name", JSONValue(type + "_" + id.substr(id.size() - 7)));
    SetMember(component, "description", memberOr(params, "description", JSONValue("")));
    SetMember(component, "dimensions", memberOr(params, "dimensions",
                                                point({{"width", 100}, {"height", 100}, {"depth", 100}})));
    SetMember(component, "position", memberOr(params, "position", point({{"x", 0}, {"y", 0}, {"z", 0}})));
    SetMember(component, "material", memberOr(params, "material", JSONValue("aluminum")));
    SetMember(component, "created", JSONValue(isoNow()));
    LOG_INFO("Created CAD component: {} ({})", id, type);

    ActionResult result;
    result.success = true;
    result.message = std::format("Successfully created {} component.", type);
    JSONValue::Object out;
    SetMember(out, "component", JSONValue(std::move(component)));
    result.output = JSONValue(std::move(out));
    return result;
}

ActionResult runModifyElement(const JSONValue& params, const JSONValue& context) {
    const std::string elementId = GetString(params, "elementId").value_or("");
    if (!contextHasElement(context, elementId)) {
        throw GatewayException(ErrorCategory::InvalidParams,
                               std::format("Element with ID {} not found in current context", elementId));
    }
    LOG_INFO("Modified element: {}", elementId);
    ActionResult result;
    result.success = true;
    result.message = std::format("Successfully modified element {}.", elementId);
    JSONValue::Object out;
    SetMember(out, "elementId", JSONValue(elementId));
    SetMember(out, "properties", memberOr(params, "properties", JSONValue(JSONValue::Object{})));
    result.output = JSONValue(std::move(out));
    return result;
}

ActionResult runCreateExtrusion(const JSONValue& params, const JSONValue& context) {
    const std::string elementId = GetString(params, "elementId").value_or("");
    if (!contextHasElement(context, elementId)) {
        throw GatewayException(ErrorCategory::InvalidParams,
                               std::format("Element with ID {} not found in current context", elementId));
    }
    const std::string id = newEntityId("extrusion");
    LOG_INFO("Created extrusion: {} from {}", id, elementId);
    ActionResult result;
    result.success = true;
    result.message = std::format("Successfully created extrusion from element {}.", elementId);
    JSONValue::Object out;
    SetMember(out, "id", JSONValue(id));
    SetMember(out, "sourceElementId", JSONValue(elementId));
    SetMember(out, "distance", memberOr(params, "distance", JSONValue()));
    SetMember(out, "direction", memberOr(params, "direction", JSONValue("normal")));
    result.output = JSONValue(std::move(out));
    return result;
}

ActionResult runCreateHole(const JSONValue& params, const JSONValue& context) {
    const std::string faceId = GetString(params, "faceId").value_or("");
    if (!contextHasElement(context, faceId, "face")) {
        throw GatewayException(ErrorCategory::InvalidParams,
                               std::format("Face with ID {} not found in current context", faceId));
    }
    const double diameter = GetNumber(params, "diameter").value_or(0.0);
    const double depth = GetNumber(params, "depth").value_or(0.0);
    const std::string id = newEntityId("hole");
    LOG_INFO("Created hole: {} in face {}", id, faceId);
    ActionResult result;
    result.success = true;
    result.message = std::format("Successfully created {}mm hole with depth {}mm.", diameter, depth);
    JSONValue::Object out;
    SetMember(out, "id", JSONValue(id));
    SetMember(out, "faceId", JSONValue(faceId));
    SetMember(out, "diameter", JSONValue(diameter));
    SetMember(out, "depth", JSONValue(depth));
    SetMember(out, "position", memberOr(params, "position", point({{"x", 0}, {"y", 0}})));
    result.output = JSONValue(std::move(out));
    return result;
}

ActionResult runGenerateToolpath(const JSONValue& params, const JSONValue& context) {
    requireContext(context, "generating toolpath");
    const double toolDiameter = GetNumber(params, "toolDiameter").value_or(0.0);
    const std::string strategy = GetString(params, "strategy").value_or("pocket");
    const std::string id = newEntityId("toolpath");
    LOG_INFO("Generated toolpath: {} ({}, {}mm)", id, strategy, toolDiameter);
    ActionResult result;
    result.success = true;
    result.message = std::format("Successfully generated {} toolpath with {}mm tool.", strategy, toolDiameter);
    JSONValue::Object out;
    SetMember(out, "id", JSONValue(id));
    SetMember(out, "elementIds", memberOr(params, "elementIds", JSONValue(JSONValue::Array{})));
    SetMember(out, "toolDiameter", JSONValue(toolDiameter));
    SetMember(out, "stepover", memberOr(params, "stepover", JSONValue(static_cast<int64_t>(40))));
    SetMember(out, "strategy", JSONValue(strategy));
    // Seconds; a placeholder estimate until a CAM kernel is attached.
    SetMember(out, "estimatedMachiningTime", JSONValue(static_cast<int64_t>(randomInt(300, 1499))));
    result.output = JSONValue(std::move(out));
    return result;
}

ActionResult runOptimizeGCode(const JSONValue& params) {
    const std::string gcode = GetString(params, "gcode").value_or("");
    const std::string machineType = GetString(params, "machineType").value_or("");
    const std::string goal = GetString(params, "optimizationGoal").value_or("balanced");

    const auto lines = splitLines(gcode);
    std::string sample;
    for (std::size_t i = 0; i < lines.size() && i < 3; ++i) {
        if (i) sample += '\n';
        sample += lines[i];
    }
    if (lines.size() > 3) sample += "\n...";

    const int timeReduction = randomInt(5, 24);
    JSONValue::Object metrics;
    SetMember(metrics, "originalLines", JSONValue(static_cast<int64_t>(lines.size())));
    SetMember(metrics, "optimizedLines", JSONValue(static_cast<int64_t>(lines.size() * 9 / 10)));
    SetMember(metrics, "timeReduction", JSONValue(static_cast<int64_t>(timeReduction)));
    SetMember(metrics, "feedRateImprovement", JSONValue(static_cast<int64_t>(randomInt(5, 19))));

    const std::string optimized = std::format("; Optimized for {} with goal: {}\n{}", machineType, goal, gcode);
    LOG_INFO("Optimized G-code for {} ({} chars, goal {})", machineType, gcode.size(), goal);

    ActionResult result;
    result.success = true;
    result.message = std::format("Successfully optimized G-code for {}. {}% reduction in machining time.",
                                 machineType, timeReduction);
    JSONValue::Object out;
    SetMember(out, "sampleInput", JSONValue(sample));
    SetMember(out, "optimizedGcode", JSONValue(optimized));
    SetMember(out, "machineType", JSONValue(machineType));
    SetMember(out, "optimizationGoal", JSONValue(goal));
    SetMember(out, "metrics", JSONValue(std::move(metrics)));
    result.output = JSONValue(std::move(out));
    result.artifacts.push_back(Artifact{"gcode", JSONValue(optimized)});
    return result;
}

JSONValue issue(const char* type, const char* severity, JSONValue location, const char* description,
                const char* recommendation) {
    JSONValue::Object obj;
    SetMember(obj, "type", JSONValue(type));
    SetMember(obj, "severity", JSONValue(severity));
    SetMember(obj, "location", std::move(location));
    SetMember(obj, "description", JSONValue(description));
    SetMember(obj, "recommendation", JSONValue(recommendation));
    return JSONValue(std::move(obj));
}

ActionResult runAnalyzeModel(const JSONValue& params, const JSONValue& context) {
    requireContext(context, "model analysis");
    const std::string analysisType = GetString(params, "analysisType").value_or("manufacturability");

    JSONValue::Array issues;
    issues.push_back(std::make_shared<JSONValue>(issue(
        "thin_wall", "warning", point({{"x", 10}, {"y", 20}, {"z", 30}}),
        "Wall thickness below recommended minimum (0.8mm)", "Increase wall thickness to at least 1.5mm")));
    issues.push_back(std::make_shared<JSONValue>(issue(
        "sharp_corner", "info", point({{"x", 50}, {"y", 60}, {"z", 70}}),
        "Sharp internal corner", "Add fillet to internal corner for better tool access")));
    const std::size_t issueCount = issues.size();

    JSONValue::Object metrics;
    SetMember(metrics, "volumetricComplexity", JSONValue(0.7));
    SetMember(metrics, "thinWallsCount", JSONValue(1));
    SetMember(metrics, "sharpCornersCount", JSONValue(1));
    SetMember(metrics, "undercuts", JSONValue(0));

    JSONValue::Object report;
    SetMember(report, "analysisType", JSONValue(analysisType));
    SetMember(report, "elementIds", memberOr(params, "elementIds", JSONValue(JSONValue::Array{})));
    SetMember(report, "timestamp", JSONValue(isoNow()));
    SetMember(report, "issues", JSONValue(std::move(issues)));
    SetMember(report, "metrics", JSONValue(std::move(metrics)));
    LOG_INFO("Analyzed model ({})", analysisType);

    ActionResult result;
    result.success = true;
    result.message = std::format("Analysis complete. Found {} issues.", issueCount);
    JSONValue::Object out;
    SetMember(out, "analysisResults", JSONValue(std::move(report)));
    result.output = JSONValue(std::move(out));
    return result;
}

} // namespace

ActionCatalog::ActionCatalog() : actions_(buildCatalog()) {}

const CandidateAction* ActionCatalog::Find(const std::string& name) const {
    auto it = std::find_if(actions_.begin(), actions_.end(), [&](const CandidateAction& a) { return a.name == name; });
    return it == actions_.end() ? nullptr : &*it;
}

std::vector<CandidateAction> ActionCatalog::ForContext(const std::string& mode,
                                                       const JSONValue& selectedElements) const {
    static const JSONValue::Array kNone;
    const JSONValue::Array& selected =
        selectedElements.IsArray() ? std::get<JSONValue::Array>(selectedElements.value) : kNone;

    std::set<std::string> selectedTypes;
    for (const auto& el : selected) {
        if (el) {
            if (auto t = GetString(*el, "type")) selectedTypes.insert(*t);
        }
    }

    std::vector<CandidateAction> out;
    for (const auto& action : actions_) {
        if (!modeAdmits(mode, action.name)) continue;
        if (!selected.empty() && !action.applicableElementTypes.empty()) {
            const bool applies = std::any_of(action.applicableElementTypes.begin(), action.applicableElementTypes.end(),
                                             [&](const std::string& t) { return selectedTypes.count(t) > 0; });
            if (!applies) continue;
        }
        CandidateAction copy = action;
        copy.contextualHints = hintsFor(action.name, mode, selected, selectedTypes);
        out.push_back(std::move(copy));
    }
    return out;
}

ActionResult ActionCatalog::Execute(const std::string& name, const JSONValue& params, const JSONValue& context) const {
    const CandidateAction* def = Find(name);
    if (!def) {
        throw GatewayException(ErrorCategory::UnknownAction, "Unknown action: " + name);
    }
    if (auto problem = ValidateParameters(*def, params)) {
        throw GatewayException(ErrorCategory::InvalidParams, *problem);
    }
    LOG_DEBUG("Executing catalog action: {}", name);

    if (name == "generateCADComponent") return runGenerateComponent(params);
    if (name == "modifyElement") return runModifyElement(params, context);
    if (name == "createExtrusion") return runCreateExtrusion(params, context);
    if (name == "createHole") return runCreateHole(params, context);
    if (name == "generateToolpath") return runGenerateToolpath(params, context);
    if (name == "optimizeGCode") return runOptimizeGCode(params);
    return runAnalyzeModel(params, context);
}

} // namespace agent
} // namespace toolgw
