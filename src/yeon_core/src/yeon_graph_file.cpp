#include "yeon_graph_file.h"
#include "yeon_nodes.h"
#include "yeon_node_registry.h"
#include "yeon_generated.h"
#include <fstream>
#include <iostream>

namespace fb = ICPDev::Yeon::Schema;

namespace Yeon {

const char* const GRAPH_FORMAT_VERSION = "1.0";

// --- Value <-> ValueData ---
static void writeValue(const Value& v, fb::ValueDataUnion& out) {
    switch (v.type) {
        case Value::BOOL: {
            fb::BoolValueT bv;
            bv.val = v.b;
            out.Set(std::move(bv));
            break;
        }
        case Value::INT: {
            fb::IntValueT iv;
            iv.val = v.i;
            out.Set(std::move(iv));
            break;
        }
        case Value::FLOAT: {
            fb::FloatValueT fv;
            fv.val = v.f;
            out.Set(std::move(fv));
            break;
        }
        case Value::STRING: {
            fb::StringValueT sv;
            sv.val = v.s;
            out.Set(std::move(sv));
            break;
        }
        case Value::NONE:
            out.Reset();
            break;
    }
}

static Value readValue(const fb::ValueDataUnion& in) {
    switch (in.type) {
        case fb::ValueData::BoolValue:   return Value::Bool(in.AsBoolValue()->val);
        case fb::ValueData::IntValue:    return Value::Int(in.AsIntValue()->val);
        case fb::ValueData::FloatValue:  return Value::Float(in.AsFloatValue()->val);
        case fb::ValueData::StringValue: return Value::String(in.AsStringValue()->val);
        default:                         return Value::None();
    }
}

// --- Node payload 쓰기 ---
static void writeNodeData(const Node& node, fb::NodeDataUnion& out) {
    switch (node.getType()) {
        case NodeType::Start: {
            auto& n = static_cast<const StartNode&>(node);
            fb::StartDataT d;
            d.label = n.getLabel();
            d.is_default = n.isDefaultStart();
            out.Set(std::move(d));
            break;
        }
        case NodeType::Dialogue: {
            auto& n = static_cast<const DialogueNode&>(node);
            fb::DialogueDataT d;
            d.speaker_name = n.getSpeakerName();
            d.speaker_id = n.getSpeakerId();
            d.speaker_emotion = n.getSpeakerEmotion();
            d.text = n.getText();
            d.localized_key = n.getLocalizedKey();
            d.text_speed = n.getTextSpeed();
            d.wait_for_input = n.getWaitForInput();
            d.auto_advance_delay = n.getAutoAdvanceDelay();
            out.Set(std::move(d));
            break;
        }
        case NodeType::Choice: {
            auto& n = static_cast<const ChoiceNode&>(node);
            fb::ChoiceDataT d;
            d.prompt = n.getPrompt();
            d.timeout = n.getTimeout();
            d.default_index = n.getDefaultIndex();
            d.shuffle = n.getShuffle();
            for (const auto& choice : n.getChoices()) {
                auto opt = std::make_unique<fb::ChoiceOptionT>();
                opt->id = choice.id;
                opt->text = choice.text;
                opt->localized_key = choice.localizedKey;
                opt->condition_variable = choice.conditionVariable;
                opt->set_variable = choice.setVariable;
                writeValue(choice.setValue, opt->set_value);
                d.choices.push_back(std::move(opt));
            }
            out.Set(std::move(d));
            break;
        }
        case NodeType::Condition: {
            auto& n = static_cast<const ConditionNode&>(node);
            fb::ConditionDataT d;
            d.logic = static_cast<fb::ConditionLogic>(n.getLogic());
            for (const auto& cond : n.getConditions()) {
                auto c = std::make_unique<fb::ConditionDefT>();
                c->variable_name = cond.variableName;
                c->op = static_cast<fb::ConditionOperator>(cond.op);
                c->compare_value = cond.compareValue;
                d.conditions.push_back(std::move(c));
            }
            out.Set(std::move(d));
            break;
        }
        case NodeType::Variable: {
            auto& n = static_cast<const VariableNode&>(node);
            fb::VariableDataT d;
            for (const auto& op : n.getOperations()) {
                auto o = std::make_unique<fb::VariableOperationT>();
                o->variable_name = op.variableName;
                o->op = static_cast<fb::VariableOpType>(op.op);
                o->value = op.value;
                d.operations.push_back(std::move(o));
            }
            out.Set(std::move(d));
            break;
        }
        case NodeType::Wait: {
            auto& n = static_cast<const WaitNode&>(node);
            fb::WaitDataT d;
            d.wait_type = static_cast<fb::WaitType>(n.getWaitType());
            d.wait_time = n.getWaitTime();
            d.condition_variable = n.getConditionVariable();
            d.condition_op = static_cast<fb::ConditionOperator>(n.getConditionOperator());
            d.condition_value = n.getConditionValue();
            out.Set(std::move(d));
            break;
        }
        case NodeType::Cutscene: {
            auto& n = static_cast<const CutsceneNode&>(node);
            fb::CutsceneDataT d;
            d.cutscene_id = n.getCutsceneId();
            d.cutscene_name = n.getCutsceneName();
            d.cutscene_type = static_cast<fb::CutsceneType>(n.getCutsceneType());
            d.skippable = n.isSkippable();
            d.skip_hold_time = n.getSkipHoldTime();
            d.pause_gameplay = n.getPauseGameplay();
            d.hide_ui = n.getHideUI();
            out.Set(std::move(d));
            break;
        }
        case NodeType::Audio: {
            auto& n = static_cast<const AudioNode&>(node);
            fb::AudioDataT d;
            d.clip_path = n.getClipPath();
            d.audio_type = static_cast<fb::AudioType>(n.getAudioType());
            d.action = static_cast<fb::AudioAction>(n.getAction());
            d.volume = n.getVolume();
            d.fade_time = n.getFadeTime();
            d.loop = n.getLoop();
            d.wait_for_completion = n.getWaitForCompletion();
            d.clip_length = n.getClipLength();
            d.channel = n.getChannel();
            out.Set(std::move(d));
            break;
        }
        case NodeType::Event: {
            auto& n = static_cast<const EventNode&>(node);
            fb::EventDataT d;
            d.event_name = n.getEventName();
            d.category = n.getEventCategory();
            d.wait_for_completion = n.getWaitForCompletion();
            d.timeout = n.getTimeout();
            for (const auto& param : n.getParams()) {
                auto p = std::make_unique<fb::EventParamT>();
                p->name = param.name;
                p->value = param.value;
                d.params.push_back(std::move(p));
            }
            out.Set(std::move(d));
            break;
        }
        case NodeType::End: {
            auto& n = static_cast<const EndNode&>(node);
            fb::EndDataT d;
            d.label = n.getLabel();
            d.end_type = static_cast<fb::EndType>(n.getEndType());
            out.Set(std::move(d));
            break;
        }
        case NodeType::Custom:
            // 커스텀 노드는 공통 필드만 저장
            out.Reset();
            break;
    }
}

// 스키마 enum 바이트 범위 검사. Verifier는 enum 값을 검사하지 않는다.
template <typename FbEnum, typename E>
static bool readEnum(FbEnum raw, const char* what, const std::string& owner,
                     std::vector<std::string>& errors, E& out) {
    if (raw < FbEnum::MIN || raw > FbEnum::MAX) {
        errors.push_back(std::string("Invalid ") + what + " value " +
                         std::to_string(static_cast<int>(raw)) + " for " + owner);
        return false;
    }
    out = static_cast<E>(raw);
    return true;
}

// --- Node payload 읽기 ---
static void readNodeData(const fb::NodeDataUnion& in, Node& node, std::vector<std::string>& errors) {
    if (!in.value) return;
    const std::string owner = "node " + node.getId();
    switch (in.type) {
        case fb::NodeData::StartData: {
            auto* n = dynamic_cast<StartNode*>(&node);
            if (!n) return;
            auto* d = in.AsStartData();
            n->setLabel(d->label);
            n->setDefaultStart(d->is_default);
            break;
        }
        case fb::NodeData::DialogueData: {
            auto* n = dynamic_cast<DialogueNode*>(&node);
            if (!n) return;
            auto* d = in.AsDialogueData();
            n->setSpeakerName(d->speaker_name);
            n->setSpeakerId(d->speaker_id);
            n->setSpeakerEmotion(d->speaker_emotion);
            n->setText(d->text);
            n->setLocalizedKey(d->localized_key);
            n->setTextSpeed(d->text_speed);
            n->setWaitForInput(d->wait_for_input);
            n->setAutoAdvanceDelay(d->auto_advance_delay);
            break;
        }
        case fb::NodeData::ChoiceData: {
            auto* n = dynamic_cast<ChoiceNode*>(&node);
            if (!n) return;
            auto* d = in.AsChoiceData();
            n->setPrompt(d->prompt);
            n->setTimeout(d->timeout);
            n->setDefaultIndex(d->default_index);
            n->setShuffle(d->shuffle);
            std::vector<ChoiceOption> choices;
            for (const auto& opt : d->choices) {
                if (!opt) continue;
                ChoiceOption choice;
                choice.id = opt->id;
                choice.text = opt->text;
                choice.localizedKey = opt->localized_key;
                choice.conditionVariable = opt->condition_variable;
                choice.setVariable = opt->set_variable;
                choice.setValue = readValue(opt->set_value);
                choices.push_back(std::move(choice));
            }
            n->setChoices(choices);
            break;
        }
        case fb::NodeData::ConditionData: {
            auto* n = dynamic_cast<ConditionNode*>(&node);
            if (!n) return;
            auto* d = in.AsConditionData();
            ConditionLogic logic = ConditionLogic::And;
            if (readEnum(d->logic, "ConditionLogic", owner, errors, logic)) n->setLogic(logic);
            std::vector<Condition> conditions;
            for (const auto& c : d->conditions) {
                if (!c) continue;
                ConditionOperator op = ConditionOperator::Equals;
                if (!readEnum(c->op, "ConditionOperator", owner, errors, op)) continue;
                conditions.push_back({c->variable_name, op, c->compare_value});
            }
            n->setConditions(conditions);
            break;
        }
        case fb::NodeData::VariableData: {
            auto* n = dynamic_cast<VariableNode*>(&node);
            if (!n) return;
            auto* d = in.AsVariableData();
            std::vector<VariableOperation> ops;
            for (const auto& o : d->operations) {
                if (!o) continue;
                VariableOpType op = VariableOpType::Set;
                if (!readEnum(o->op, "VariableOpType", owner, errors, op)) continue;
                ops.push_back({o->variable_name, op, o->value});
            }
            n->setOperations(ops);
            break;
        }
        case fb::NodeData::WaitData: {
            auto* n = dynamic_cast<WaitNode*>(&node);
            if (!n) return;
            auto* d = in.AsWaitData();
            WaitType waitType = WaitType::Time;
            if (readEnum(d->wait_type, "WaitType", owner, errors, waitType)) n->setWaitType(waitType);
            n->setWaitTime(d->wait_time);
            n->setConditionVariable(d->condition_variable);
            ConditionOperator op = ConditionOperator::IsTrue;
            if (readEnum(d->condition_op, "ConditionOperator", owner, errors, op)) n->setConditionOperator(op);
            n->setConditionValue(d->condition_value);
            break;
        }
        case fb::NodeData::CutsceneData: {
            auto* n = dynamic_cast<CutsceneNode*>(&node);
            if (!n) return;
            auto* d = in.AsCutsceneData();
            n->setCutsceneId(d->cutscene_id);
            n->setCutsceneName(d->cutscene_name);
            CutsceneType cutsceneType = CutsceneType::Timeline;
            if (readEnum(d->cutscene_type, "CutsceneType", owner, errors, cutsceneType)) n->setCutsceneType(cutsceneType);
            n->setSkippable(d->skippable);
            n->setSkipHoldTime(d->skip_hold_time);
            n->setPauseGameplay(d->pause_gameplay);
            n->setHideUI(d->hide_ui);
            break;
        }
        case fb::NodeData::AudioData: {
            auto* n = dynamic_cast<AudioNode*>(&node);
            if (!n) return;
            auto* d = in.AsAudioData();
            n->setClipPath(d->clip_path);
            AudioType audioType = AudioType::SFX;
            if (readEnum(d->audio_type, "AudioType", owner, errors, audioType)) n->setAudioType(audioType);
            AudioAction action = AudioAction::Play;
            if (readEnum(d->action, "AudioAction", owner, errors, action)) n->setAction(action);
            n->setVolume(d->volume);
            n->setFadeTime(d->fade_time);
            n->setLoop(d->loop);
            n->setWaitForCompletion(d->wait_for_completion);
            n->setClipLength(d->clip_length);
            n->setChannel(d->channel);
            break;
        }
        case fb::NodeData::EventData: {
            auto* n = dynamic_cast<EventNode*>(&node);
            if (!n) return;
            auto* d = in.AsEventData();
            n->setEventName(d->event_name);
            n->setEventCategory(d->category);
            n->setWaitForCompletion(d->wait_for_completion);
            n->setTimeout(d->timeout);
            std::vector<EventParam> params;
            for (const auto& p : d->params) {
                if (!p) continue;
                params.push_back({p->name, p->value});
            }
            n->setParams(params);
            break;
        }
        case fb::NodeData::EndData: {
            auto* n = dynamic_cast<EndNode*>(&node);
            if (!n) return;
            auto* d = in.AsEndData();
            n->setLabel(d->label);
            EndType endType = EndType::Complete;
            if (readEnum(d->end_type, "EndType", owner, errors, endType)) n->setEndType(endType);
            break;
        }
        default:
            break;
    }
}

// --- 파일 헬퍼 ---
static bool readFile(const std::string& filepath, std::vector<uint8_t>& buf) {
    std::ifstream ifs(filepath, std::ios::binary | std::ios::ate);
    if (!ifs) {
        std::cerr << "[Yeon] Cannot open file: " << filepath << std::endl;
        return false;
    }
    auto size = ifs.tellg();
    if (size <= 0) {
        std::cerr << "[Yeon] Empty file: " << filepath << std::endl;
        return false;
    }
    ifs.seekg(0, std::ios::beg);
    buf.resize(static_cast<size_t>(size));
    if (!ifs.read(reinterpret_cast<char*>(buf.data()), size)) {
        std::cerr << "[Yeon] Failed to read file: " << filepath << std::endl;
        return false;
    }
    return true;
}

static bool writeFile(const std::string& filepath, const uint8_t* data, size_t size) {
    std::ofstream ofs(filepath, std::ios::binary);
    if (!ofs) {
        std::cerr << "[Yeon] Cannot open file for writing: " << filepath << std::endl;
        return false;
    }
    ofs.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return ofs.good();
}

// ==========================================================================
// .ygb
// ==========================================================================
std::vector<uint8_t> buildGraphBuffer(const Graph& graph) {
    fb::GraphDefT def;
    def.version = GRAPH_FORMAT_VERSION;
    def.id = graph.getId();
    def.name = graph.getName();
    def.description = graph.getDescription();
    def.view_offset_x = graph.getViewOffsetX();
    def.view_offset_y = graph.getViewOffsetY();
    def.view_scale = graph.getViewScale();

    for (const auto& node : graph.getNodes()) {
        auto nd = std::make_unique<fb::NodeDefT>();
        nd->id = node->getId();
        nd->type_name = node->getTypeName();
        nd->name = node->getName();
        nd->description = node->getDescription();
        nd->x = node->getX();
        nd->y = node->getY();
        nd->breakpoint = node->isBreakpoint();
        writeNodeData(*node, nd->data);
        def.nodes.push_back(std::move(nd));
    }

    for (const auto& c : graph.getConnections()) {
        auto cd = std::make_unique<fb::ConnectionDefT>();
        cd->id = c.id;
        cd->output_node_id = c.outputNodeId;
        cd->output_port_id = c.outputPortId;
        cd->input_node_id = c.inputNodeId;
        cd->input_port_id = c.inputPortId;
        def.connections.push_back(std::move(cd));
    }

    for (const auto& v : graph.getVariables()) {
        auto vd = std::make_unique<fb::VariableDefT>();
        vd->name = v.name;
        vd->type = static_cast<fb::VariableType>(v.type);
        writeValue(v.defaultValue, vd->default_value);
        def.variables.push_back(std::move(vd));
    }

    flatbuffers::FlatBufferBuilder fbb;
    auto offset = fb::GraphDef::Pack(fbb, &def);
    fb::FinishGraphDefBuffer(fbb, offset);
    return std::vector<uint8_t>(fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize());
}

bool saveGraphFile(const Graph& graph, const std::string& filepath) {
    auto buf = buildGraphBuffer(graph);
    return writeFile(filepath, buf.data(), buf.size());
}

std::unique_ptr<Graph> loadGraphBuffer(const uint8_t* data, size_t size,
                                       const NodeRegistry& registry,
                                       std::vector<std::string>& errors) {
    if (!data || size < 8) {
        errors.push_back("Graph buffer is too small");
        return nullptr;
    }
    if (!fb::GraphDefBufferHasIdentifier(data)) {
        errors.push_back("Not a Yeon graph file (missing YGRF identifier)");
        return nullptr;
    }
    flatbuffers::Verifier verifier(data, size);
    if (!fb::VerifyGraphDefBuffer(verifier)) {
        errors.push_back("Invalid graph buffer");
        return nullptr;
    }

    std::unique_ptr<fb::GraphDefT> def(fb::GetGraphDef(data)->UnPack());
    auto graph = std::make_unique<Graph>(def->id, def->name);
    graph->setDescription(def->description);
    graph->setViewOffset(def->view_offset_x, def->view_offset_y);
    graph->setViewScale(def->view_scale);

    size_t errorCount = errors.size();

    for (const auto& nd : def->nodes) {
        if (!nd) continue;
        auto node = registry.create(nd->type_name, nd->id);
        if (!node) {
            errors.push_back("Unknown node type '" + nd->type_name + "' for node " + nd->id);
            continue;
        }
        node->setName(nd->name);
        node->setDescription(nd->description);
        node->setPosition(nd->x, nd->y);
        node->setBreakpoint(nd->breakpoint);
        readNodeData(nd->data, *node, errors);
        if (!graph->addNode(std::move(node))) {
            errors.push_back("Duplicate node id: " + nd->id);
        }
    }

    for (const auto& cd : def->connections) {
        if (!cd) continue;
        if (!graph->addConnection(cd->output_node_id, cd->output_port_id,
                                  cd->input_node_id, cd->input_port_id, cd->id)) {
            errors.push_back("Invalid connection " + cd->id + ": " +
                             cd->output_node_id + "." + cd->output_port_id + " -> " +
                             cd->input_node_id + "." + cd->input_port_id);
        }
    }

    for (const auto& vd : def->variables) {
        if (!vd) continue;
        VariableDecl decl;
        decl.name = vd->name;
        if (!readEnum(vd->type, "VariableType", "variable " + vd->name, errors, decl.type)) continue;
        decl.defaultValue = readValue(vd->default_value);
        if (!graph->addVariable(decl)) {
            errors.push_back("Duplicate variable name: " + vd->name);
        }
    }

    if (errors.size() != errorCount) return nullptr;
    return graph;
}

std::unique_ptr<Graph> loadGraphFile(const std::string& filepath,
                                     const NodeRegistry& registry,
                                     std::vector<std::string>& errors) {
    std::vector<uint8_t> buf;
    if (!readFile(filepath, buf)) {
        errors.push_back("Cannot read graph file: " + filepath);
        return nullptr;
    }
    return loadGraphBuffer(buf.data(), buf.size(), registry, errors);
}

// ==========================================================================
// .ygs
// ==========================================================================
bool saveSnapshotFile(const PlayerSnapshot& snapshot, const std::string& filepath) {
    fb::SaveStateT state;
    state.version = GRAPH_FORMAT_VERSION;
    state.graph_id = snapshot.graphId;
    state.current_node_id = snapshot.currentNodeId;

    for (const auto& pair : snapshot.variables) {
        auto sv = std::make_unique<fb::SavedVarT>();
        sv->name = pair.first;
        writeValue(pair.second, sv->value);
        state.variables.push_back(std::move(sv));
    }

    flatbuffers::FlatBufferBuilder fbb;
    auto offset = fb::SaveState::Pack(fbb, &state);
    fbb.Finish(offset);
    return writeFile(filepath, fbb.GetBufferPointer(), fbb.GetSize());
}

bool loadSnapshotFile(const std::string& filepath, PlayerSnapshot& out) {
    std::vector<uint8_t> buf;
    if (!readFile(filepath, buf)) return false;

    flatbuffers::Verifier verifier(buf.data(), buf.size());
    if (!verifier.VerifyBuffer<fb::SaveState>(nullptr)) {
        std::cerr << "[Yeon] Invalid save file: " << filepath << std::endl;
        return false;
    }
    auto* saveState = flatbuffers::GetRoot<fb::SaveState>(buf.data());

    PlayerSnapshot snapshot;
    snapshot.graphId = saveState->graph_id() ? saveState->graph_id()->str() : "";
    snapshot.currentNodeId = saveState->current_node_id() ? saveState->current_node_id()->str() : "";

    auto* vars = saveState->variables();
    if (vars) {
        for (flatbuffers::uoffset_t i = 0; i < vars->size(); ++i) {
            auto* sv = vars->Get(i);
            if (!sv->name()) continue;
            std::unique_ptr<fb::SavedVarT> unpacked(sv->UnPack());
            snapshot.variables[unpacked->name] = readValue(unpacked->value);
        }
    }

    out = std::move(snapshot);
    return true;
}

} // namespace Yeon
