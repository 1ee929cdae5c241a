//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_action_catalog.cpp
// Purpose: GoogleTests for the CAD/CAM action catalog, its parameter schemas and context filtering
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "toolgw/agent/ActionCatalog.h"
#include "toolgw/errors/Errors.h"

using namespace toolgw;
using namespace toolgw::agent;

namespace {
std::vector<std::string> names(const std::vector<CandidateAction>& actions) {
    std::vector<std::string> out;
    for (const auto& a : actions) out.push_back(a.name);
    return out;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

JSONValue faceContext() {
    return ParseJSON(R"({"mode":"cad","selectedElements":[{"id":"face_1","type":"face"},
        {"id":"body_1","type":"model"}]})");
}
} // namespace

TEST(ActionCatalog, HoldsSevenActions) {
    ActionCatalog catalog;
    EXPECT_EQ(catalog.All().size(), 7u);
    ASSERT_NE(catalog.Find("createHole"), nullptr);
    EXPECT_EQ(catalog.Find("createHole")->category, ActionCategory::Cad);
    EXPECT_EQ(catalog.Find("generateToolpath")->category, ActionCategory::Cam);
    EXPECT_EQ(catalog.Find("optimizeGCode")->category, ActionCategory::GCode);
    EXPECT_EQ(catalog.Find("teleport"), nullptr);
}

TEST(ActionCatalog, FiltersByMode) {
    ActionCatalog catalog;
    auto cad = names(catalog.ForContext("cad", JSONValue()));
    EXPECT_EQ(cad, (std::vector<std::string>{"generateCADComponent", "modifyElement", "createExtrusion", "createHole"}));
    auto cam = names(catalog.ForContext("cam", JSONValue()));
    EXPECT_EQ(cam, (std::vector<std::string>{"generateToolpath", "analyzeModel"}));
    auto gcode = names(catalog.ForContext("gcode", JSONValue()));
    EXPECT_EQ(gcode, (std::vector<std::string>{"optimizeGCode"}));
    EXPECT_EQ(catalog.ForContext("analysis", JSONValue()).size(), 7u);
}

TEST(ActionCatalog, FiltersBySelectedElementTypes) {
    ActionCatalog catalog;
    auto faceOnly = names(catalog.ForContext("cad", ParseJSON(R"([{"id":"f","type":"face"}])")));
    EXPECT_TRUE(contains(faceOnly, "generateCADComponent"));
    EXPECT_TRUE(contains(faceOnly, "createExtrusion"));
    EXPECT_TRUE(contains(faceOnly, "createHole"));
    EXPECT_FALSE(contains(faceOnly, "modifyElement"));

    auto edgeOnly = names(catalog.ForContext("cad", ParseJSON(R"([{"id":"e","type":"edge"}])")));
    EXPECT_EQ(edgeOnly, (std::vector<std::string>{"generateCADComponent"}));
}

TEST(ActionCatalog, AddsContextualHints) {
    ActionCatalog catalog;
    auto actions = catalog.ForContext("cad", ParseJSON(R"([{"id":"c1","type":"cube","name":"Bracket"}])"));
    auto it = std::find_if(actions.begin(), actions.end(), [](const auto& a) { return a.name == "modifyElement"; });
    ASSERT_NE(it, actions.end());
    ASSERT_EQ(it->contextualHints.size(), 1u);
    EXPECT_EQ(it->contextualHints[0], "Element Bracket is currently selected.");

    auto gen = catalog.ForContext("cad", JSONValue()).front();
    ASSERT_EQ(gen.contextualHints.size(), 2u);
    EXPECT_EQ(gen.contextualHints[0], "Provide a detailed description for best results.");
}

TEST(ActionSchema, ExampleValuesAndSchemaJSON) {
    ActionCatalog catalog;
    JSONValue json = CandidateActionToJSON(*catalog.Find("generateToolpath"));
    EXPECT_EQ(GetString(json, "category").value_or(""), "cam");
    const JSONValue* examples = FindMember(json, "parameters");
    ASSERT_NE(examples, nullptr);
    EXPECT_EQ(GetInteger(*examples, "stepover").value_or(0), 40);
    EXPECT_EQ(GetString(*examples, "strategy").value_or(""), "pocket");
    EXPECT_DOUBLE_EQ(GetNumber(*examples, "toolDiameter").value_or(0.0), 0.1);
    const JSONValue* ids = FindMember(*examples, "elementIds");
    ASSERT_NE(ids, nullptr);
    EXPECT_TRUE(ids->IsArray());

    const JSONValue* schema = FindMember(json, "parameterSchema");
    ASSERT_NE(schema, nullptr);
    const auto& params = std::get<JSONValue::Array>(schema->value);
    ASSERT_EQ(params.size(), 4u);
    EXPECT_EQ(GetString(*params[1], "type").value_or(""), "number");
    EXPECT_FALSE(FindMember(*params[1], "defaultValue"));
    EXPECT_EQ(GetInteger(*params[1], "max").value_or(0), 50);
    EXPECT_TRUE(FindMember(*params[3], "enum"));
}

TEST(ActionSchema, ValidateParametersReportsViolations) {
    ActionCatalog catalog;
    const CandidateAction& hole = *catalog.Find("createHole");
    EXPECT_FALSE(ValidateParameters(hole, ParseJSON(R"({"faceId":"f","diameter":5,"depth":2})")));
    EXPECT_EQ(ValidateParameters(hole, ParseJSON(R"({"faceId":"f","diameter":5})")).value_or(""),
              "Missing required parameter: depth");
    EXPECT_EQ(ValidateParameters(hole, ParseJSON(R"({"faceId":"f","diameter":"5","depth":2})")).value_or(""),
              "Parameter diameter must be a number");
    EXPECT_EQ(ValidateParameters(hole, ParseJSON(R"({"faceId":"f","diameter":0.01,"depth":2})")).value_or(""),
              "Parameter diameter must be at least 0.1");
    EXPECT_EQ(ValidateParameters(hole, ParseJSON(R"({"faceId":"f","diameter":5,"depth":5000})")).value_or(""),
              "Parameter depth must be at most 1000");
    EXPECT_EQ(ValidateParameters(*catalog.Find("optimizeGCode"),
                                 ParseJSON(R"({"gcode":"G0","machineType":"7-axis"})")).value_or(""),
              "Parameter machineType must be one of: 3-axis, 4-axis, 5-axis");
    EXPECT_EQ(ValidateParameters(hole, ParseJSON("[]")).value_or(""), "parameters must be an object");
}

TEST(ActionCatalog, UnknownActionThrows) {
    ActionCatalog catalog;
    try {
        catalog.Execute("teleport", JSONValue(JSONValue::Object{}), JSONValue(JSONValue::Object{}));
        FAIL() << "expected exception";
    } catch (const errors::GatewayException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::UnknownAction);
        EXPECT_STREQ(e.what(), "Unknown action: teleport");
    }
}

TEST(ActionCatalog, GenerateComponentFillsDefaults) {
    ActionCatalog catalog;
    ActionResult r = catalog.Execute("generateCADComponent",
                                     ParseJSON(R"({"description":"mounting plate","type":"cube"})"),
                                     JSONValue(JSONValue::Object{}));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "Successfully created cube component.");
    ASSERT_TRUE(r.output.has_value());
    const JSONValue* component = FindMember(*r.output, "component");
    ASSERT_NE(component, nullptr);
    EXPECT_EQ(GetString(*component, "id").value_or("").rfind("component_", 0), 0u);
    EXPECT_EQ(GetString(*component, "material").value_or(""), "aluminum");
    EXPECT_DOUBLE_EQ(GetNumber(*FindMember(*component, "dimensions"), "width").value_or(0), 100.0);
    EXPECT_FALSE(r.updatedContext.has_value());
}

TEST(ActionCatalog, CreateHoleRequiresSelectedFace) {
    ActionCatalog catalog;
    ActionResult r = catalog.Execute("createHole", ParseJSON(R"({"faceId":"face_1","diameter":5,"depth":10})"),
                                     faceContext());
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "Successfully created 5mm hole with depth 10mm.");
    EXPECT_EQ(GetString(*r.output, "faceId").value_or(""), "face_1");

    EXPECT_THROW(catalog.Execute("createHole", ParseJSON(R"({"faceId":"body_1","diameter":5,"depth":10})"),
                                 faceContext()),
                 errors::GatewayException);
    EXPECT_THROW(catalog.Execute("createHole", ParseJSON(R"({"faceId":"face_1","diameter":5})"), faceContext()),
                 errors::GatewayException);
}

TEST(ActionCatalog, ModifyAndExtrudeRequireElementInContext) {
    ActionCatalog catalog;
    ActionResult m = catalog.Execute("modifyElement", ParseJSON(R"({"elementId":"body_1","properties":{"r":2}})"),
                                     faceContext());
    EXPECT_EQ(m.message, "Successfully modified element body_1.");
    ActionResult e = catalog.Execute("createExtrusion", ParseJSON(R"({"elementId":"face_1","distance":12})"),
                                     faceContext());
    EXPECT_EQ(GetString(*e.output, "direction").value_or(""), "normal");
    try {
        catalog.Execute("modifyElement", ParseJSON(R"({"elementId":"ghost","properties":{}})"), faceContext());
        FAIL() << "expected exception";
    } catch (const errors::GatewayException& ex) {
        EXPECT_EQ(ex.category(), errors::ErrorCategory::InvalidParams);
        EXPECT_STREQ(ex.what(), "Element with ID ghost not found in current context");
    }
}

TEST(ActionCatalog, ToolpathNeedsContext) {
    ActionCatalog catalog;
    JSONValue params = ParseJSON(R"({"elementIds":["body_1"],"toolDiameter":6})");
    EXPECT_THROW(catalog.Execute("generateToolpath", params, JSONValue(JSONValue::Object{})),
                 errors::GatewayException);
    ActionResult r = catalog.Execute("generateToolpath", params, faceContext());
    EXPECT_EQ(r.message, "Successfully generated pocket toolpath with 6mm tool.");
    auto seconds = GetInteger(*r.output, "estimatedMachiningTime").value_or(0);
    EXPECT_GE(seconds, 300);
    EXPECT_LT(seconds, 1500);
}

TEST(ActionCatalog, OptimizeGCodeProducesArtifact) {
    ActionCatalog catalog;
    ActionResult r = catalog.Execute("optimizeGCode",
                                     ParseJSON(R"({"gcode":"G0 X0\nG1 X5\nG1 Y5\nM2","machineType":"3-axis"})"),
                                     JSONValue(JSONValue::Object{}));
    EXPECT_EQ(r.message.rfind("Successfully optimized G-code for 3-axis. ", 0), 0u);
    ASSERT_EQ(r.artifacts.size(), 1u);
    EXPECT_EQ(r.artifacts[0].type, "gcode");
    const std::string optimized = std::get<std::string>(r.artifacts[0].data.value);
    EXPECT_EQ(optimized.rfind("; Optimized for 3-axis with goal: balanced\n", 0), 0u);
    EXPECT_EQ(GetString(*r.output, "sampleInput").value_or(""), "G0 X0\nG1 X5\nG1 Y5\n...");
    EXPECT_EQ(GetInteger(*FindMember(*r.output, "metrics"), "originalLines").value_or(0), 4);
}

TEST(ActionCatalog, AnalyzeModelReportsIssues) {
    ActionCatalog catalog;
    ActionResult r = catalog.Execute("analyzeModel", ParseJSON(R"({"elementIds":["body_1"]})"), faceContext());
    EXPECT_EQ(r.message, "Analysis complete. Found 2 issues.");
    const JSONValue* report = FindMember(*r.output, "analysisResults");
    ASSERT_NE(report, nullptr);
    EXPECT_EQ(GetString(*report, "analysisType").value_or(""), "manufacturability");
    EXPECT_EQ(std::get<JSONValue::Array>(FindMember(*report, "issues")->value).size(), 2u);
}
