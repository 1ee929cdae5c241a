//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContextProcessor.cpp
// Purpose: Context enrichment
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "toolgw/agent/ContextProcessor.h"
#include "toolgw/errors/Errors.h"
#include "toolgw/validation/Validators.h"

namespace toolgw {
namespace agent {

namespace {

JSONValue origin() {
    JSONValue::Object obj;
    SetMember(obj, "x", JSONValue(0));
    SetMember(obj, "y", JSONValue(0));
    SetMember(obj, "z", JSONValue(0));
    return JSONValue(std::move(obj));
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

void mergeProperties(JSONValue::Object& target, const JSONValue& element) {
    const JSONValue* props = FindMember(element, "properties");
    if (!props || !props->IsObject()) return;
    for (const auto& [key, value] : std::get<JSONValue::Object>(props->value)) {
        target[key] = value;
    }
}

JSONValue constraint(const char* type, const char* description, JSONValue value) {
    JSONValue::Object obj;
    SetMember(obj, "type", JSONValue(type));
    SetMember(obj, "description", JSONValue(description));
    SetMember(obj, "value", std::move(value));
    return JSONValue(std::move(obj));
}

JSONValue constraintsFor(const std::string& mode) {
    JSONValue::Array out;
    if (mode == "cad") {
        out.push_back(std::make_shared<JSONValue>(constraint("design_rules", "Minimum wall thickness", JSONValue(1.0))));
    } else if (mode == "cam") {
        out.push_back(std::make_shared<JSONValue>(
            constraint("machining_constraints", "Maximum tool diameter", JSONValue(12.0))));
    } else if (mode == "gcode") {
        out.push_back(std::make_shared<JSONValue>(
            constraint("machine_constraints", "Maximum feed rate", JSONValue(static_cast<int64_t>(5000)))));
    }
    out.push_back(std::make_shared<JSONValue>(
        constraint("application_constraint", "Maximum elements", JSONValue(static_cast<int64_t>(10000)))));
    return JSONValue(std::move(out));
}

JSONValue preferences() {
    JSONValue::Object obj;
    SetMember(obj, "defaultMaterial", JSONValue("aluminum"));
    SetMember(obj, "defaultUnits", JSONValue("mm"));
    SetMember(obj, "defaultTolerance", JSONValue(0.01));
    SetMember(obj, "colorScheme", JSONValue("default"));
    return JSONValue(std::move(obj));
}

} // namespace

ContextProcessor::ContextProcessor(ElementDetailsLookup lookup) : lookup_(std::move(lookup)) {}

JSONValue::Array ContextProcessor::processSelectedElements(const JSONValue& rawContext) const {
    JSONValue::Array out;
    const JSONValue* selected = FindMember(rawContext, "selectedElements");
    if (!selected || !selected->IsArray()) {
        return out;
    }
    for (const auto& el : std::get<JSONValue::Array>(selected->value)) {
        if (!el) continue;
        const std::string id = GetString(*el, "id").value_or("");
        const std::string type = GetString(*el, "type").value_or("");
        const std::string fallbackName = type + "_" + id.substr(0, 8);

        JSONValue::Object obj;
        SetMember(obj, "id", JSONValue(id));
        SetMember(obj, "type", JSONValue(type));

        std::optional<JSONValue> details;
        bool lookupFailed = false;
        if (lookup_) {
            try {
                details = lookup_(id, type);
            } catch (const std::exception& e) {
                LOG_WARN("Failed to get details for element {}: {}", id, e.what());
                lookupFailed = true;
            }
        }

        if (lookupFailed) {
            SetMember(obj, "name", JSONValue(fallbackName));
        } else {
            const JSONValue empty;
            const JSONValue& d = details ? *details : empty;
            auto name = GetString(d, "name");
            SetMember(obj, "name", JSONValue(name && !name->empty() ? *name : fallbackName));
            if (auto desc = GetString(d, "description")) {
                SetMember(obj, "description", JSONValue(*desc));
            }
            const JSONValue* dims = FindMember(d, "dimensions");
            SetMember(obj, "dimensions", dims ? *dims : JSONValue(JSONValue::Object{}));
            const JSONValue* pos = FindMember(d, "position");
            SetMember(obj, "position", pos ? *pos : origin());
            if (auto material = GetString(d, "material")) {
                SetMember(obj, "material", JSONValue(*material));
            }
        }
        mergeProperties(obj, *el);
        out.push_back(std::make_shared<JSONValue>(std::move(obj)));
    }
    return out;
}

std::string ContextProcessor::Summarize(const JSONValue& rawContext, const JSONValue::Array& processedElements) {
    std::vector<std::string> parts;
    parts.push_back(std::format("User is in {} mode with {} view active.",
                                upper(GetString(rawContext, "mode").value_or("")),
                                GetString(rawContext, "activeView").value_or("")));

    if (const JSONValue* tool = FindMember(rawContext, "activeTool")) {
        if (auto name = GetString(*tool, "name")) {
            parts.push_back(std::format("The active tool is {}.", *name));
        }
    }
    if (const JSONValue* project = FindMember(rawContext, "currentProject")) {
        if (auto name = GetString(*project, "name")) {
            parts.push_back(std::format("Working on project: {}.", *name));
        }
    }

    if (processedElements.size() == 1 && processedElements.front()) {
        const JSONValue& el = *processedElements.front();
        auto label = GetString(el, "name");
        if (!label || label->empty()) label = GetString(el, "id");
        parts.push_back(std::format("Selected: 1 {} ({}).", GetString(el, "type").value_or(""), label.value_or("")));
    } else if (processedElements.size() > 1) {
        // Counts per type in first-seen order.
        std::vector<std::pair<std::string, int>> byType;
        for (const auto& el : processedElements) {
            if (!el) continue;
            const std::string type = GetString(*el, "type").value_or("");
            auto it = std::find_if(byType.begin(), byType.end(), [&](const auto& p) { return p.first == type; });
            if (it == byType.end()) {
                byType.emplace_back(type, 1);
            } else {
                ++it->second;
            }
        }
        std::string joined;
        for (const auto& [type, count] : byType) {
            if (!joined.empty()) joined += ", ";
            joined += std::format("{} {}{}", count, type, count > 1 ? "s" : "");
        }
        parts.push_back(std::format("Selected: {}.", joined));
    } else {
        parts.emplace_back("No elements are currently selected.");
    }

    if (const JSONValue* ops = FindMember(rawContext, "recentOperations"); ops && ops->IsArray()) {
        const auto& arr = std::get<JSONValue::Array>(ops->value);
        if (!arr.empty() && arr.front()) {
            if (auto type = GetString(*arr.front(), "type")) {
                parts.push_back(std::format("Last operation: {}.", *type));
            }
        }
    }

    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

JSONValue ContextProcessor::Process(const JSONValue& rawContext) const {
    if (auto problem = validation::ValidateRawContext(rawContext)) {
        throw errors::GatewayException(errors::ErrorCategory::InvalidParams, *problem);
    }
    const std::string mode = GetString(rawContext, "mode").value_or("");
    LOG_DEBUG("Processing context (mode {})", mode);

    JSONValue::Array elements = processSelectedElements(rawContext);
    const std::size_t rawCount = [&]() -> std::size_t {
        const JSONValue* sel = FindMember(rawContext, "selectedElements");
        return (sel && sel->IsArray()) ? std::get<JSONValue::Array>(sel->value).size() : 0;
    }();

    const JSONValue selection{elements};
    JSONValue::Array actions;
    for (const auto& a : catalog_.ForContext(mode, selection)) {
        actions.push_back(std::make_shared<JSONValue>(CandidateActionToJSON(a)));
    }

    JSONValue::Object stats;
    SetMember(stats, "elementCount", JSONValue(static_cast<int64_t>(rawCount)));
    SetMember(stats, "complexityScore", JSONValue(0.5));

    JSONValue::Object enriched;
    SetMember(enriched, "mode", JSONValue(mode));
    SetMember(enriched, "activeView", JSONValue(GetString(rawContext, "activeView").value_or("")));
    SetMember(enriched, "summary", JSONValue(Summarize(rawContext, elements)));
    SetMember(enriched, "selectedElements", selection);
    SetMember(enriched, "availableActions", JSONValue(std::move(actions)));
    SetMember(enriched, "constraints", constraintsFor(mode));
    SetMember(enriched, "statistics", JSONValue(std::move(stats)));
    SetMember(enriched, "preferences", preferences());
    return JSONValue(std::move(enriched));
}

} // namespace agent
} // namespace toolgw
