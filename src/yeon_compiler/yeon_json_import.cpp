#include "yeon_json_import.h"
#include "yeon_nodes.h"
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace Yeon {

// 문자열 필드 (없거나 null이면 fallback)
static std::string str(const json& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    return it->get<std::string>();
}

template <typename T>
static T field(const json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    return it->get<T>();
}

// enum 이름 필드. 모르는 이름은 에러로 기록하고 기존 값 유지
template <typename E>
static E enumField(const json& obj, const char* key, E fallback,
                   bool (*parse)(const std::string&, E&),
                   const Node& node, std::vector<std::string>& errors) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    E value = fallback;
    std::string name = it->get<std::string>();
    if (!parse(name, value)) {
        errors.push_back("Unknown " + std::string(key) + " '" + name + "' on node " + node.getId());
        return fallback;
    }
    return value;
}

// ============================================================
// Value
// ============================================================

Value JsonImport::readValue(const json& value) {
    if (value.is_boolean())         return Value::Bool(value.get<bool>());
    if (value.is_number_integer())  return Value::Int(value.get<int32_t>());
    if (value.is_number_float())    return Value::Float(value.get<float>());
    if (value.is_string())          return Value::String(value.get<std::string>());
    return Value::None();
}

// ============================================================
// Node payload
// ============================================================

void JsonImport::readNodeData(const json& data, Node& node, std::vector<std::string>& errors) {
    switch (node.getType()) {
    case NodeType::Start: {
        auto& n = static_cast<StartNode&>(node);
        n.setLabel(str(data, "label", n.getLabel()));
        n.setDefaultStart(field(data, "isDefault", n.isDefaultStart()));
        break;
    }

    case NodeType::Dialogue: {
        auto& n = static_cast<DialogueNode&>(node);
        n.setSpeakerName(str(data, "speakerName"));
        n.setSpeakerId(str(data, "speakerId"));
        n.setSpeakerEmotion(str(data, "speakerEmotion"));
        n.setText(str(data, "text"));
        n.setLocalizedKey(str(data, "localizedKey"));
        n.setTextSpeed(field(data, "textSpeed", n.getTextSpeed()));
        n.setWaitForInput(field(data, "waitForInput", n.getWaitForInput()));
        n.setAutoAdvanceDelay(field(data, "autoAdvanceDelay", n.getAutoAdvanceDelay()));
        break;
    }

    case NodeType::Choice: {
        auto& n = static_cast<ChoiceNode&>(node);
        n.setPrompt(str(data, "prompt"));
        n.setTimeout(field(data, "timeout", n.getTimeout()));
        n.setDefaultIndex(field(data, "defaultIndex", n.getDefaultIndex()));
        n.setShuffle(field(data, "shuffle", n.getShuffle()));

        std::vector<ChoiceOption> choices;
        auto it = data.find("choices");
        if (it != data.end() && it->is_array()) {
            for (const auto& obj : *it) {
                ChoiceOption choice;
                choice.id = str(obj, "id");
                choice.text = str(obj, "text");
                choice.localizedKey = str(obj, "localizedKey");
                choice.conditionVariable = str(obj, "conditionVariable");
                choice.setVariable = str(obj, "setVariable");
                auto sv = obj.find("setValue");
                if (sv != obj.end()) choice.setValue = readValue(*sv);
                choices.push_back(std::move(choice));
            }
        }
        n.setChoices(choices);
        break;
    }

    case NodeType::Condition: {
        auto& n = static_cast<ConditionNode&>(node);
        n.setLogic(enumField(data, "logic", n.getLogic(), parseConditionLogic, node, errors));

        std::vector<Condition> conditions;
        auto it = data.find("conditions");
        if (it != data.end() && it->is_array()) {
            for (const auto& obj : *it) {
                Condition cond;
                cond.variableName = str(obj, "variableName");
                cond.op = enumField(obj, "operator", cond.op, parseConditionOperator, node, errors);
                cond.compareValue = str(obj, "compareValue");
                conditions.push_back(std::move(cond));
            }
        }
        n.setConditions(conditions);
        break;
    }

    case NodeType::Variable: {
        auto& n = static_cast<VariableNode&>(node);
        std::vector<VariableOperation> operations;
        auto it = data.find("operations");
        if (it != data.end() && it->is_array()) {
            for (const auto& obj : *it) {
                VariableOperation op;
                op.variableName = str(obj, "variableName");
                op.op = enumField(obj, "operation", op.op, parseVariableOpType, node, errors);
                op.value = str(obj, "value");
                operations.push_back(std::move(op));
            }
        }
        n.setOperations(operations);
        break;
    }

    case NodeType::Wait: {
        auto& n = static_cast<WaitNode&>(node);
        n.setWaitType(enumField(data, "waitType", n.getWaitType(), parseWaitType, node, errors));
        n.setWaitTime(field(data, "waitTime", n.getWaitTime()));
        n.setConditionVariable(str(data, "conditionVariable"));
        n.setConditionOperator(enumField(data, "conditionOperator", n.getConditionOperator(),
                                         parseConditionOperator, node, errors));
        n.setConditionValue(str(data, "conditionValue"));
        break;
    }

    case NodeType::Cutscene: {
        auto& n = static_cast<CutsceneNode&>(node);
        n.setCutsceneId(str(data, "cutsceneId"));
        n.setCutsceneName(str(data, "cutsceneName"));
        n.setCutsceneType(enumField(data, "cutsceneType", n.getCutsceneType(), parseCutsceneType, node, errors));
        n.setSkippable(field(data, "skippable", n.isSkippable()));
        n.setSkipHoldTime(field(data, "skipHoldTime", n.getSkipHoldTime()));
        n.setPauseGameplay(field(data, "pauseGameplay", n.getPauseGameplay()));
        n.setHideUI(field(data, "hideUI", n.getHideUI()));
        break;
    }

    case NodeType::Audio: {
        auto& n = static_cast<AudioNode&>(node);
        n.setClipPath(str(data, "clipPath"));
        n.setAudioType(enumField(data, "audioType", n.getAudioType(), parseAudioType, node, errors));
        n.setAction(enumField(data, "action", n.getAction(), parseAudioAction, node, errors));
        n.setVolume(field(data, "volume", n.getVolume()));
        n.setFadeTime(field(data, "fadeTime", n.getFadeTime()));
        n.setLoop(field(data, "loop", n.getLoop()));
        n.setWaitForCompletion(field(data, "waitForCompletion", n.getWaitForCompletion()));
        n.setClipLength(field(data, "clipLength", n.getClipLength()));
        n.setChannel(str(data, "channel"));
        break;
    }

    case NodeType::Event: {
        auto& n = static_cast<EventNode&>(node);
        n.setEventName(str(data, "eventName"));
        n.setEventCategory(str(data, "category"));
        n.setWaitForCompletion(field(data, "waitForCompletion", n.getWaitForCompletion()));
        n.setTimeout(field(data, "timeout", n.getTimeout()));

        std::vector<EventParam> params;
        auto it = data.find("parameters");
        if (it != data.end() && it->is_array()) {
            for (const auto& obj : *it) {
                params.push_back({str(obj, "name"), str(obj, "value")});
            }
        }
        n.setParams(params);
        break;
    }

    case NodeType::End: {
        auto& n = static_cast<EndNode&>(node);
        n.setLabel(str(data, "label"));
        n.setEndType(enumField(data, "endType", n.getEndType(), parseEndType, node, errors));
        break;
    }

    case NodeType::Custom:
        break;
    }
}

// ============================================================
// Node
// ============================================================

void JsonImport::readNode(const json& obj, Graph& graph,
                          const NodeRegistry& registry, std::vector<std::string>& errors) {
    std::string id = str(obj, "nodeId");
    std::string typeName = str(obj, "nodeType");
    if (id.empty()) {
        errors.push_back("Node without nodeId (type '" + typeName + "')");
        return;
    }

    auto node = registry.create(typeName, id);
    if (!node) {
        errors.push_back("Unknown node type '" + typeName + "' for node " + id);
        return;
    }

    node->setName(str(obj, "nodeName"));
    node->setDescription(str(obj, "nodeDescription"));
    auto pos = obj.find("position");
    if (pos != obj.end() && pos->is_object()) {
        node->setPosition(field(*pos, "x", 0.0f), field(*pos, "y", 0.0f));
    }
    node->setBreakpoint(field(obj, "breakpoint", false));

    auto data = obj.find("data");
    if (data != obj.end() && data->is_object()) {
        readNodeData(*data, *node, errors);
    }

    if (!graph.addNode(std::move(node))) {
        errors.push_back("Duplicate node id: " + id);
    }
}

// ============================================================
// Graph
// ============================================================

std::unique_ptr<Graph> JsonImport::fromJson(const json& doc, const NodeRegistry& registry,
                                            std::vector<std::string>& errors) {
    if (!doc.is_object()) {
        errors.push_back("Graph JSON must be an object");
        return nullptr;
    }

    size_t errorCount = errors.size();
    auto graph = std::make_unique<Graph>();

    try {
        graph->setId(str(doc, "graphId"));
        if (graph->getId().empty()) graph->setId(generateId());
        graph->setName(str(doc, "graphName"));
        graph->setDescription(str(doc, "description"));

        auto view = doc.find("viewState");
        if (view != doc.end() && view->is_object()) {
            auto offset = view->find("offset");
            if (offset != view->end() && offset->is_object()) {
                graph->setViewOffset(field(*offset, "x", 0.0f), field(*offset, "y", 0.0f));
            }
            graph->setViewScale(field(*view, "scale", 1.0f));
        }

        auto nodes = doc.find("nodes");
        if (nodes != doc.end() && nodes->is_array()) {
            for (const auto& obj : *nodes) {
                readNode(obj, *graph, registry, errors);
            }
        }

        // 노드를 모두 만든 뒤 연결
        auto connections = doc.find("connections");
        if (connections != doc.end() && connections->is_array()) {
            for (const auto& obj : *connections) {
                std::string id = str(obj, "connectionId");
                std::string outNode = str(obj, "outputNodeId");
                std::string outPort = str(obj, "outputPortId");
                std::string inNode = str(obj, "inputNodeId");
                std::string inPort = str(obj, "inputPortId");
                if (!graph->addConnection(outNode, outPort, inNode, inPort, id)) {
                    errors.push_back("Invalid connection " + id + ": " + outNode + "." + outPort +
                                     " -> " + inNode + "." + inPort);
                }
            }
        }

        auto variables = doc.find("variables");
        if (variables != doc.end() && variables->is_array()) {
            for (const auto& obj : *variables) {
                VariableDecl decl;
                decl.name = str(obj, "name");
                std::string typeName = str(obj, "type", "String");
                if (!parseVariableType(typeName, decl.type)) {
                    errors.push_back("Unknown variable type '" + typeName + "' for variable " + decl.name);
                    continue;
                }
                // 기본값은 선언 타입으로 변환. 실패하면 타입 기본값
                decl.defaultValue = defaultValueFor(decl.type);
                auto dv = obj.find("defaultValue");
                if (dv != obj.end()) {
                    Value coerced;
                    if (coerceValue(readValue(*dv), valueTypeFor(decl.type), coerced)) {
                        decl.defaultValue = coerced;
                    }
                }
                if (!graph->addVariable(decl)) {
                    errors.push_back("Duplicate variable name: " + decl.name);
                }
            }
        }
    } catch (const json::exception& e) {
        errors.push_back(std::string("Malformed graph JSON: ") + e.what());
        return nullptr;
    }

    if (errors.size() != errorCount) return nullptr;
    return graph;
}

std::unique_ptr<Graph> JsonImport::fromString(const std::string& text, const NodeRegistry& registry,
                                              std::vector<std::string>& errors) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        errors.push_back(std::string("JSON parse error: ") + e.what());
        return nullptr;
    }
    return fromJson(doc, registry, errors);
}

std::unique_ptr<Graph> JsonImport::fromFile(const std::string& filepath, const NodeRegistry& registry,
                                            std::vector<std::string>& errors) {
    std::ifstream ifs(filepath);
    if (!ifs.is_open()) {
        errors.push_back("Cannot open file: " + filepath);
        return nullptr;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return fromString(ss.str(), registry, errors);
}

} // namespace Yeon
