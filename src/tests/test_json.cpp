#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "test_helpers.h"
#include "yeon_json_export.h"
#include "yeon_json_import.h"
#include "yeon_node_registry.h"
#include <string>

using json = nlohmann::json;
using namespace Yeon;
using namespace YeonTest;

static bool hasError(const std::vector<std::string>& errors, const std::string& fragment) {
    for (const auto& e : errors) {
        if (e.find(fragment) != std::string::npos) return true;
    }
    return false;
}

static const char* STORY_JSON = R"({
  "graphId": "tavern",
  "graphName": "Tavern",
  "description": "A short visit",
  "viewState": { "offset": { "x": 10, "y": 20 }, "scale": 1.5 },
  "variables": [
    { "name": "gold", "type": "Int", "defaultValue": 30 },
    { "name": "drunk", "type": "Bool", "defaultValue": false },
    { "name": "mood", "type": "Float", "defaultValue": "0.5" }
  ],
  "nodes": [
    { "nodeId": "start", "nodeType": "Start", "position": { "x": 0, "y": 0 } },
    { "nodeId": "greet", "nodeType": "Dialogue", "nodeName": "Greeting",
      "data": { "speakerName": "Barkeep", "text": "You have {gold} gold.", "waitForInput": false } },
    { "nodeId": "order", "nodeType": "Choice",
      "data": { "prompt": "Order?", "timeout": 5, "defaultIndex": 1,
                "choices": [
                  { "id": "ale", "text": "Ale", "setVariable": "drunk", "setValue": true },
                  { "id": "water", "text": "Water" }
                ] } },
    { "nodeId": "pay", "nodeType": "Variable",
      "data": { "operations": [ { "variableName": "gold", "operation": "Subtract", "value": "5" } ] } },
    { "nodeId": "check", "nodeType": "Condition",
      "data": { "logic": "And",
                "conditions": [ { "variableName": "drunk", "operator": "IsTrue", "compareValue": "" } ] } },
    { "nodeId": "tipsy", "nodeType": "Dialogue", "data": { "text": "Hic!", "waitForInput": false } },
    { "nodeId": "sober", "nodeType": "Dialogue", "data": { "text": "Refreshing.", "waitForInput": false } },
    { "nodeId": "end", "nodeType": "End", "data": { "endType": "Complete" } }
  ],
  "connections": [
    { "connectionId": "c1", "outputNodeId": "start", "outputPortId": "output", "inputNodeId": "greet", "inputPortId": "input" },
    { "connectionId": "c2", "outputNodeId": "greet", "outputPortId": "output", "inputNodeId": "order", "inputPortId": "input" },
    { "connectionId": "c3", "outputNodeId": "order", "outputPortId": "ale", "inputNodeId": "pay", "inputPortId": "input" },
    { "connectionId": "c4", "outputNodeId": "order", "outputPortId": "water", "inputNodeId": "check", "inputPortId": "input" },
    { "connectionId": "c5", "outputNodeId": "pay", "outputPortId": "output", "inputNodeId": "check", "inputPortId": "input" },
    { "connectionId": "c6", "outputNodeId": "check", "outputPortId": "true", "inputNodeId": "tipsy", "inputPortId": "input" },
    { "connectionId": "c7", "outputNodeId": "check", "outputPortId": "false", "inputNodeId": "sober", "inputPortId": "input" },
    { "connectionId": "c8", "outputNodeId": "tipsy", "outputPortId": "output", "inputNodeId": "end", "inputPortId": "input" },
    { "connectionId": "c9", "outputNodeId": "sober", "outputPortId": "output", "inputNodeId": "end", "inputPortId": "input" }
  ]
})";

class JsonTest : public ::testing::Test {
protected:
    std::unique_ptr<Graph> import(const std::string& text) {
        errors.clear();
        return JsonImport::fromString(text, registry, errors);
    }

    NodeRegistry registry;
    std::vector<std::string> errors;
};

// ============================================================
// Import
// ============================================================

TEST_F(JsonTest, ImportStory) {
    auto graph = import(STORY_JSON);
    ASSERT_NE(graph, nullptr) << (errors.empty() ? "" : errors[0]);

    EXPECT_EQ(graph->getId(), "tavern");
    EXPECT_EQ(graph->getName(), "Tavern");
    EXPECT_FLOAT_EQ(graph->getViewOffsetY(), 20.0f);
    EXPECT_FLOAT_EQ(graph->getViewScale(), 1.5f);
    EXPECT_EQ(graph->getNodes().size(), 8u);
    EXPECT_EQ(graph->getConnections().size(), 9u);

    // 선언 타입으로 변환된 기본값
    EXPECT_EQ(graph->getVariable("mood")->defaultValue, Value::Float(0.5f));

    auto* greet = static_cast<const DialogueNode*>(graph->getNode("greet"));
    EXPECT_EQ(greet->getName(), "Greeting");
    EXPECT_EQ(greet->getSpeakerName(), "Barkeep");
    EXPECT_FALSE(greet->getWaitForInput());
    EXPECT_FLOAT_EQ(greet->getTextSpeed(), 0.05f);  // 없는 필드는 기본값

    auto* order = static_cast<const ChoiceNode*>(graph->getNode("order"));
    ASSERT_EQ(order->getChoices().size(), 2u);
    EXPECT_EQ(order->getChoices()[0].setValue, Value::Bool(true));
    EXPECT_EQ(order->getDefaultIndex(), 1);
    EXPECT_NE(order->getOutputPort("water"), nullptr);

    EXPECT_TRUE(graph->validate().empty());
}

TEST_F(JsonTest, ImportedStoryPlays) {
    auto graph = import(STORY_JSON);
    ASSERT_NE(graph, nullptr);

    Player player;
    RecordingListener listener;
    player.addListener(&listener);
    player.play(*graph);
    ASSERT_EQ(player.getState(), PlayerState::WaitingForInput);

    player.selectChoice(0);
    EXPECT_EQ(player.getContext()->getInt("gold"), 25);
    EXPECT_EQ(listener.count("enter:tipsy"), 1);
    EXPECT_TRUE(listener.lastSuccess);
}

TEST_F(JsonTest, ImportGeneratesMissingGraphId) {
    auto graph = import(R"({ "nodes": [ { "nodeId": "s", "nodeType": "Start" } ] })");
    ASSERT_NE(graph, nullptr);
    EXPECT_EQ(graph->getId().size(), 36u);
}

TEST_F(JsonTest, ImportReportsStructuralErrors) {
    auto graph = import(R"({
      "graphId": "bad",
      "nodes": [
        { "nodeId": "start", "nodeType": "Start" },
        { "nodeId": "start", "nodeType": "Dialogue" },
        { "nodeType": "End" },
        { "nodeId": "tp", "nodeType": "Teleport" }
      ],
      "connections": [
        { "connectionId": "c1", "outputNodeId": "start", "outputPortId": "output", "inputNodeId": "ghost", "inputPortId": "input" }
      ],
      "variables": [
        { "name": "x", "type": "Int" },
        { "name": "x", "type": "Int" },
        { "name": "y", "type": "Vector3" }
      ]
    })");
    EXPECT_EQ(graph, nullptr);
    EXPECT_TRUE(hasError(errors, "Duplicate node id: start"));
    EXPECT_TRUE(hasError(errors, "Node without nodeId"));
    EXPECT_TRUE(hasError(errors, "Unknown node type 'Teleport' for node tp"));
    EXPECT_TRUE(hasError(errors, "Invalid connection c1"));
    EXPECT_TRUE(hasError(errors, "Duplicate variable name: x"));
    EXPECT_TRUE(hasError(errors, "Unknown variable type 'Vector3'"));
}

TEST_F(JsonTest, ImportRejectsUnknownEnumName) {
    auto graph = import(R"({
      "nodes": [ { "nodeId": "w", "nodeType": "Wait", "data": { "waitType": "Forever" } } ]
    })");
    EXPECT_EQ(graph, nullptr);
    EXPECT_TRUE(hasError(errors, "Unknown waitType 'Forever' on node w"));
}

TEST_F(JsonTest, ImportParseAndTypeErrors) {
    EXPECT_EQ(import("{ not json"), nullptr);
    EXPECT_TRUE(hasError(errors, "JSON parse error"));

    EXPECT_EQ(import("[1, 2]"), nullptr);
    EXPECT_TRUE(hasError(errors, "must be an object"));

    EXPECT_EQ(import(R"({ "graphId": 42 })"), nullptr);
    EXPECT_TRUE(hasError(errors, "Malformed graph JSON"));
}

TEST_F(JsonTest, ImportMissingFile) {
    EXPECT_EQ(JsonImport::fromFile("no_such_graph.json", registry, errors), nullptr);
    EXPECT_TRUE(hasError(errors, "Cannot open file"));
}

// ============================================================
// Export
// ============================================================

TEST_F(JsonTest, ExportStructure) {
    auto graph = makeChoiceGraph();
    graph->addVariable({"gold", VariableType::Int, Value::Int(7)});
    json j = JsonExport::toJson(*graph);

    EXPECT_EQ(j["graphId"], "choices");
    EXPECT_EQ(j["graphName"], "Choices");
    EXPECT_TRUE(j["nodes"].is_array());
    EXPECT_EQ(j["nodes"].size(), graph->getNodes().size());
    EXPECT_EQ(j["connections"].size(), graph->getConnections().size());
    EXPECT_EQ(j["viewState"]["scale"], 1.0);

    ASSERT_EQ(j["variables"].size(), 1u);
    EXPECT_EQ(j["variables"][0]["type"], "Int");
    EXPECT_EQ(j["variables"][0]["defaultValue"], 7);
}

TEST_F(JsonTest, ExportNodePayloads) {
    Graph graph("g", "Graph");
    addNode<StartNode>(graph, "start");
    auto* wait = addNode<WaitNode>(graph, "wait");
    wait->setWaitType(WaitType::Condition);
    wait->setConditionVariable("ready");
    auto* ev = addNode<EventNode>(graph, "ev");
    ev->setEventName("Shake");
    ev->addParam("strength", "3");
    graph.getNode("wait")->setBreakpoint(true);

    json j = JsonExport::toJson(graph);
    json waitJson;
    json evJson;
    json startJson;
    for (const auto& n : j["nodes"]) {
        if (n["nodeId"] == "wait") waitJson = n;
        if (n["nodeId"] == "ev") evJson = n;
        if (n["nodeId"] == "start") startJson = n;
    }

    EXPECT_EQ(waitJson["nodeType"], "Wait");
    EXPECT_EQ(waitJson["breakpoint"], true);
    EXPECT_EQ(waitJson["data"]["waitType"], "Condition");
    EXPECT_EQ(waitJson["data"]["conditionVariable"], "ready");
    EXPECT_EQ(waitJson["data"]["conditionOperator"], "IsTrue");

    EXPECT_EQ(evJson["data"]["eventName"], "Shake");
    ASSERT_EQ(evJson["data"]["parameters"].size(), 1u);
    EXPECT_EQ(evJson["data"]["parameters"][0]["value"], "3");

    EXPECT_FALSE(startJson.contains("breakpoint"));
    EXPECT_EQ(startJson["data"]["isDefault"], true);
}

TEST_F(JsonTest, ExportThenImportPreservesGraph) {
    auto original = import(STORY_JSON);
    ASSERT_NE(original, nullptr);

    std::string text = JsonExport::toJsonString(*original);
    auto copy = import(text);
    ASSERT_NE(copy, nullptr) << (errors.empty() ? "" : errors[0]);

    EXPECT_EQ(JsonExport::toJson(*copy), JsonExport::toJson(*original));
}
