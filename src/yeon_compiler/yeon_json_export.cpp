#include "yeon_json_export.h"
#include "yeon_nodes.h"

using json = nlohmann::json;

namespace Yeon {

// ============================================================
// Value serialization
// ============================================================

json JsonExport::serializeValue(const Value& value) {
    switch (value.type) {
    case Value::BOOL:   return json(value.b);
    case Value::INT:    return json(value.i);
    case Value::FLOAT:  return json(value.f);
    case Value::STRING: return json(value.s);
    default:            return nullptr;
    }
}

// ============================================================
// Node payload serialization
// ============================================================

json JsonExport::serializeNodeData(const Node& node) {
    json data = json::object();

    switch (node.getType()) {
    case NodeType::Start: {
        auto& n = static_cast<const StartNode&>(node);
        data["label"] = n.getLabel();
        data["isDefault"] = n.isDefaultStart();
        break;
    }

    case NodeType::Dialogue: {
        auto& n = static_cast<const DialogueNode&>(node);
        data["speakerName"] = n.getSpeakerName();
        data["speakerId"] = n.getSpeakerId();
        data["speakerEmotion"] = n.getSpeakerEmotion();
        data["text"] = n.getText();
        data["localizedKey"] = n.getLocalizedKey();
        data["textSpeed"] = n.getTextSpeed();
        data["waitForInput"] = n.getWaitForInput();
        data["autoAdvanceDelay"] = n.getAutoAdvanceDelay();
        break;
    }

    case NodeType::Choice: {
        auto& n = static_cast<const ChoiceNode&>(node);
        data["prompt"] = n.getPrompt();
        data["timeout"] = n.getTimeout();
        data["defaultIndex"] = n.getDefaultIndex();
        data["shuffle"] = n.getShuffle();
        json choices = json::array();
        for (const auto& choice : n.getChoices()) {
            json obj;
            obj["id"] = choice.id;
            obj["text"] = choice.text;
            if (!choice.localizedKey.empty()) obj["localizedKey"] = choice.localizedKey;
            if (!choice.conditionVariable.empty()) obj["conditionVariable"] = choice.conditionVariable;
            if (!choice.setVariable.empty()) {
                obj["setVariable"] = choice.setVariable;
                obj["setValue"] = serializeValue(choice.setValue);
            }
            choices.push_back(obj);
        }
        data["choices"] = choices;
        break;
    }

    case NodeType::Condition: {
        auto& n = static_cast<const ConditionNode&>(node);
        data["logic"] = conditionLogicName(n.getLogic());
        json conditions = json::array();
        for (const auto& cond : n.getConditions()) {
            conditions.push_back(json{
                {"variableName", cond.variableName},
                {"operator", conditionOperatorName(cond.op)},
                {"compareValue", cond.compareValue}
            });
        }
        data["conditions"] = conditions;
        break;
    }

    case NodeType::Variable: {
        auto& n = static_cast<const VariableNode&>(node);
        json operations = json::array();
        for (const auto& op : n.getOperations()) {
            operations.push_back(json{
                {"variableName", op.variableName},
                {"operation", variableOpTypeName(op.op)},
                {"value", op.value}
            });
        }
        data["operations"] = operations;
        break;
    }

    case NodeType::Wait: {
        auto& n = static_cast<const WaitNode&>(node);
        data["waitType"] = waitTypeName(n.getWaitType());
        data["waitTime"] = n.getWaitTime();
        if (n.getWaitType() == WaitType::Condition) {
            data["conditionVariable"] = n.getConditionVariable();
            data["conditionOperator"] = conditionOperatorName(n.getConditionOperator());
            data["conditionValue"] = n.getConditionValue();
        }
        break;
    }

    case NodeType::Cutscene: {
        auto& n = static_cast<const CutsceneNode&>(node);
        data["cutsceneId"] = n.getCutsceneId();
        data["cutsceneName"] = n.getCutsceneName();
        data["cutsceneType"] = cutsceneTypeName(n.getCutsceneType());
        data["skippable"] = n.isSkippable();
        data["skipHoldTime"] = n.getSkipHoldTime();
        data["pauseGameplay"] = n.getPauseGameplay();
        data["hideUI"] = n.getHideUI();
        break;
    }

    case NodeType::Audio: {
        auto& n = static_cast<const AudioNode&>(node);
        data["clipPath"] = n.getClipPath();
        data["audioType"] = audioTypeName(n.getAudioType());
        data["action"] = audioActionName(n.getAction());
        data["volume"] = n.getVolume();
        data["fadeTime"] = n.getFadeTime();
        data["loop"] = n.getLoop();
        data["waitForCompletion"] = n.getWaitForCompletion();
        data["clipLength"] = n.getClipLength();
        data["channel"] = n.getChannel();
        break;
    }

    case NodeType::Event: {
        auto& n = static_cast<const EventNode&>(node);
        data["eventName"] = n.getEventName();
        data["category"] = n.getEventCategory();
        json params = json::array();
        for (const auto& param : n.getParams()) {
            params.push_back(json{{"name", param.name}, {"value", param.value}});
        }
        data["parameters"] = params;
        data["waitForCompletion"] = n.getWaitForCompletion();
        data["timeout"] = n.getTimeout();
        break;
    }

    case NodeType::End: {
        auto& n = static_cast<const EndNode&>(node);
        data["label"] = n.getLabel();
        data["endType"] = endTypeName(n.getEndType());
        break;
    }

    case NodeType::Custom:
        break;
    }

    return data;
}

// ============================================================
// Node serialization
// ============================================================

json JsonExport::serializeNode(const Node& node) {
    json obj;
    obj["nodeId"] = node.getId();
    obj["nodeType"] = node.getTypeName();
    obj["nodeName"] = node.getName();
    if (!node.getDescription().empty()) {
        obj["nodeDescription"] = node.getDescription();
    }
    obj["position"] = json{{"x", node.getX()}, {"y", node.getY()}};
    if (node.isBreakpoint()) {
        obj["breakpoint"] = true;
    }
    obj["data"] = serializeNodeData(node);
    return obj;
}

// ============================================================
// Top-level Graph serialization
// ============================================================

json JsonExport::toJson(const Graph& graph) {
    json root;

    // Metadata
    root["graphId"] = graph.getId();
    root["graphName"] = graph.getName();
    root["description"] = graph.getDescription();
    root["viewState"] = json{
        {"offset", json{{"x", graph.getViewOffsetX()}, {"y", graph.getViewOffsetY()}}},
        {"scale", graph.getViewScale()}
    };

    // Nodes
    json nodes = json::array();
    for (const auto& node : graph.getNodes()) {
        nodes.push_back(serializeNode(*node));
    }
    root["nodes"] = nodes;

    // Connections
    json connections = json::array();
    for (const auto& c : graph.getConnections()) {
        connections.push_back(json{
            {"connectionId", c.id},
            {"outputNodeId", c.outputNodeId},
            {"outputPortId", c.outputPortId},
            {"inputNodeId", c.inputNodeId},
            {"inputPortId", c.inputPortId}
        });
    }
    root["connections"] = connections;

    // Variables
    json variables = json::array();
    for (const auto& v : graph.getVariables()) {
        variables.push_back(json{
            {"name", v.name},
            {"type", variableTypeName(v.type)},
            {"defaultValue", serializeValue(v.defaultValue)}
        });
    }
    root["variables"] = variables;

    return root;
}

std::string JsonExport::toJsonString(const Graph& graph, int indent) {
    return toJson(graph).dump(indent);
}

} // namespace Yeon
