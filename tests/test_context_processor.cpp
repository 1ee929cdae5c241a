//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_context_processor.cpp
// Purpose: GoogleTests for raw application context enrichment and summaries
//==========================================================================================================

#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include "toolgw/agent/ContextProcessor.h"
#include "toolgw/errors/Errors.h"

using namespace toolgw;
using namespace toolgw::agent;

namespace {
const JSONValue::Array& arrayAt(const JSONValue& v, const char* key) {
    return std::get<JSONValue::Array>(FindMember(v, key)->value);
}
} // namespace

TEST(ContextProcessor, RejectsInvalidContext) {
    ContextProcessor processor;
    try {
        processor.Process(ParseJSON(R"({"mode":"sculpt","activeView":"3d"})"));
        FAIL() << "expected exception";
    } catch (const errors::GatewayException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::InvalidParams);
        EXPECT_STREQ(e.what(), "Invalid mode: sculpt");
    }
}

TEST(ContextProcessor, EnrichesMinimalContext) {
    ContextProcessor processor;
    JSONValue out = processor.Process(ParseJSON(R"({"mode":"cad","activeView":"3d"})"));
    EXPECT_EQ(GetString(out, "mode").value_or(""), "cad");
    EXPECT_EQ(GetString(out, "activeView").value_or(""), "3d");
    EXPECT_EQ(GetString(out, "summary").value_or(""),
              "User is in CAD mode with 3d view active. No elements are currently selected.");
    EXPECT_TRUE(arrayAt(out, "selectedElements").empty());
    EXPECT_EQ(arrayAt(out, "availableActions").size(), 4u);

    const auto& constraints = arrayAt(out, "constraints");
    ASSERT_EQ(constraints.size(), 2u);
    EXPECT_EQ(GetString(*constraints[0], "type").value_or(""), "design_rules");
    EXPECT_EQ(GetString(*constraints[1], "type").value_or(""), "application_constraint");

    const JSONValue* stats = FindMember(out, "statistics");
    EXPECT_EQ(GetInteger(*stats, "elementCount").value_or(-1), 0);
    const JSONValue* prefs = FindMember(out, "preferences");
    EXPECT_EQ(GetString(*prefs, "defaultUnits").value_or(""), "mm");
}

TEST(ContextProcessor, ElementsGetDefaultsAndProperties) {
    ContextProcessor processor;
    JSONValue out = processor.Process(ParseJSON(R"({"mode":"cam","activeView":"split",
        "selectedElements":[{"id":"abcdef123456","type":"model","properties":{"color":"red"}}]})"));
    const auto& elements = arrayAt(out, "selectedElements");
    ASSERT_EQ(elements.size(), 1u);
    const JSONValue& el = *elements[0];
    EXPECT_EQ(GetString(el, "name").value_or(""), "model_abcdef12");
    EXPECT_EQ(GetString(el, "color").value_or(""), "red");
    EXPECT_TRUE(FindMember(el, "dimensions")->IsObject());
    EXPECT_EQ(GetInteger(*FindMember(el, "position"), "z").value_or(-1), 0);
    EXPECT_EQ(GetString(*arrayAt(out, "constraints")[0], "type").value_or(""), "machining_constraints");
    EXPECT_EQ(GetString(out, "summary").value_or(""),
              "User is in CAM mode with split view active. Selected: 1 model (model_abcdef12).");
}

TEST(ContextProcessor, LookupSuppliesDetails) {
    ContextProcessor processor([](const std::string& id, const std::string&) -> std::optional<JSONValue> {
        if (id == "f1") {
            return ParseJSON(R"({"name":"Top face","dimensions":{"area":40},"material":"steel"})");
        }
        return std::nullopt;
    });
    JSONValue out = processor.Process(ParseJSON(R"({"mode":"cad","activeView":"3d",
        "selectedElements":[{"id":"f1","type":"face"},{"id":"f2","type":"face"},{"id":"e1","type":"edge"}]})"));
    const auto& elements = arrayAt(out, "selectedElements");
    ASSERT_EQ(elements.size(), 3u);
    EXPECT_EQ(GetString(*elements[0], "name").value_or(""), "Top face");
    EXPECT_EQ(GetString(*elements[0], "material").value_or(""), "steel");
    EXPECT_EQ(GetString(*elements[1], "name").value_or(""), "face_f2");
    EXPECT_EQ(GetString(out, "summary").value_or(""),
              "User is in CAD mode with 3d view active. Selected: 2 faces, 1 edge.");
    EXPECT_EQ(GetInteger(*FindMember(out, "statistics"), "elementCount").value_or(0), 3);
}

TEST(ContextProcessor, FailingLookupFallsBackToName) {
    ContextProcessor processor([](const std::string&, const std::string&) -> std::optional<JSONValue> {
        throw std::runtime_error("geometry kernel offline");
    });
    JSONValue out = processor.Process(ParseJSON(R"({"mode":"cad","activeView":"3d",
        "selectedElements":[{"id":"s1","type":"sketch"}]})"));
    const auto& elements = arrayAt(out, "selectedElements");
    ASSERT_EQ(elements.size(), 1u);
    EXPECT_EQ(GetString(*elements[0], "name").value_or(""), "sketch_s1");
}

TEST(ContextProcessor, SummaryMentionsToolProjectAndLastOperation) {
    JSONValue raw = ParseJSON(R"({"mode":"gcode","activeView":"code","activeTool":{"name":"Pocket"},
        "currentProject":{"name":"Bracket v2"},"recentOperations":[{"type":"extrude"},{"type":"fillet"}]})");
    EXPECT_EQ(ContextProcessor::Summarize(raw, JSONValue::Array{}),
              "User is in GCODE mode with code view active. The active tool is Pocket. "
              "Working on project: Bracket v2. No elements are currently selected. Last operation: extrude.");
}

TEST(ContextProcessor, AvailableActionsFollowSelection) {
    ContextProcessor processor;
    JSONValue out = processor.Process(ParseJSON(R"({"mode":"cad","activeView":"3d",
        "selectedElements":[{"id":"e1","type":"edge"}]})"));
    const auto& actions = arrayAt(out, "availableActions");
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(GetString(*actions[0], "name").value_or(""), "generateCADComponent");
    EXPECT_TRUE(FindMember(*actions[0], "parameterSchema")->IsArray());
}
