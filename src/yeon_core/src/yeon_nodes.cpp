#include "yeon_nodes.h"
#include "yeon_context.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>

namespace Yeon {

// --- enum 이름 테이블 ---
template <typename E, size_t N>
static bool parseEnumName(const std::string& text, const char* const (&names)[N], E& out) {
    for (size_t i = 0; i < N; ++i) {
        if (text == names[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

// 범위 밖 값은 빈 이름
template <typename E, size_t N>
static const char* enumName(E value, const char* const (&names)[N]) {
    size_t i = static_cast<size_t>(value);
    return i < N ? names[i] : "";
}

static const char* const LOGIC_NAMES[] = {"And", "Or"};
static const char* const VAR_OP_NAMES[] = {
    "Set", "Add", "Subtract", "Multiply", "Divide", "Toggle", "Append", "Random"};
static const char* const WAIT_TYPE_NAMES[] = {"Time", "Input", "Condition", "Frame"};
static const char* const CUTSCENE_TYPE_NAMES[] = {"Timeline", "Animation", "Video", "Custom"};
static const char* const AUDIO_TYPE_NAMES[] = {"SFX", "Music", "Ambient", "Voice"};
static const char* const AUDIO_ACTION_NAMES[] = {
    "Play", "Stop", "Pause", "Resume", "FadeIn", "FadeOut", "CrossFade"};
static const char* const END_TYPE_NAMES[] = {"Complete", "Failed", "Checkpoint", "Transition"};

const char* conditionLogicName(ConditionLogic logic) { return enumName(logic, LOGIC_NAMES); }
bool parseConditionLogic(const std::string& text, ConditionLogic& out) { return parseEnumName(text, LOGIC_NAMES, out); }
const char* variableOpTypeName(VariableOpType op) { return enumName(op, VAR_OP_NAMES); }
bool parseVariableOpType(const std::string& text, VariableOpType& out) { return parseEnumName(text, VAR_OP_NAMES, out); }
const char* waitTypeName(WaitType type) { return enumName(type, WAIT_TYPE_NAMES); }
bool parseWaitType(const std::string& text, WaitType& out) { return parseEnumName(text, WAIT_TYPE_NAMES, out); }
const char* cutsceneTypeName(CutsceneType type) { return enumName(type, CUTSCENE_TYPE_NAMES); }
bool parseCutsceneType(const std::string& text, CutsceneType& out) { return parseEnumName(text, CUTSCENE_TYPE_NAMES, out); }
const char* audioTypeName(AudioType type) { return enumName(type, AUDIO_TYPE_NAMES); }
bool parseAudioType(const std::string& text, AudioType& out) { return parseEnumName(text, AUDIO_TYPE_NAMES, out); }
const char* audioActionName(AudioAction action) { return enumName(action, AUDIO_ACTION_NAMES); }
bool parseAudioAction(const std::string& text, AudioAction& out) { return parseEnumName(text, AUDIO_ACTION_NAMES, out); }
const char* endTypeName(EndType type) { return enumName(type, END_TYPE_NAMES); }
bool parseEndType(const std::string& text, EndType& out) { return parseEnumName(text, END_TYPE_NAMES, out); }

bool evaluateConditions(const ExecutionContext& context, const std::vector<Condition>& conditions,
                        ConditionLogic logic) {
    if (conditions.empty()) return true;

    for (const auto& cond : conditions) {
        bool result = context.evaluateCondition(cond.variableName, cond.op, parseLiteral(cond.compareValue));
        if (logic == ConditionLogic::And && !result) return false;
        if (logic == ConditionLogic::Or && result) return true;
    }
    return logic == ConditionLogic::And;
}

// $name → 변수 값, 그 외 리터럴
static Value resolveOperand(const ExecutionContext& context, const std::string& text) {
    if (text.empty()) return Value::String(text);
    if (text[0] == '$') {
        Value v;
        if (context.tryGetVariable(text.substr(1), v)) return v;
        return Value::None();
    }
    return parseLiteral(text);
}

// ==========================================================================
// StartNode
// ==========================================================================
StartNode::StartNode(const std::string& id) : Node(id) {
    addOutputPort("Output", "output");
}

NodeResult StartNode::execute(ExecutionContext&) const {
    return NodeResult::Continue("output");
}

std::vector<std::string> StartNode::validate() const {
    std::vector<std::string> errors;
    if (label_.empty()) {
        errors.push_back("Start node '" + getId() + "' has no label");
    }
    return errors;
}

// ==========================================================================
// DialogueNode
// ==========================================================================
DialogueNode::DialogueNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("Output", "output");
}

void DialogueNode::onEnter(ExecutionContext& context) const {
    context.setTempData("currentDialogue", Value::String(getId()));
}

NodeResult DialogueNode::execute(ExecutionContext& context) const {
    context.setTempData("processedDialogueText", Value::String(getProcessedText(context)));

    if (waitForInput_) {
        return NodeResult::WaitForInput("output");
    }
    if (autoAdvanceDelay_ > 0.0f) {
        return NodeResult::Wait(autoAdvanceDelay_, "output");
    }
    return NodeResult::Continue("output");
}

std::string DialogueNode::getProcessedText(const ExecutionContext& context) const {
    std::string result;
    result.reserve(text_.size());

    size_t pos = 0;
    while (pos < text_.size()) {
        size_t open = text_.find('{', pos);
        if (open == std::string::npos) {
            result.append(text_, pos, std::string::npos);
            break;
        }
        size_t close = text_.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(text_, pos, std::string::npos);
            break;
        }

        result.append(text_, pos, open - pos);
        std::string varName = text_.substr(open + 1, close - open - 1);
        Value v;
        if (context.tryGetVariable(varName, v) && !v.isNone()) {
            result += valueToString(v);
        } else {
            result += "[" + varName + "]";
        }
        pos = close + 1;
    }
    return result;
}

std::vector<std::string> DialogueNode::validate() const {
    std::vector<std::string> errors;
    if (text_.empty() && localizedKey_.empty()) {
        errors.push_back("Dialogue node '" + getId() + "' has no text content");
    }
    return errors;
}

// ==========================================================================
// ChoiceNode
// ==========================================================================
ChoiceNode::ChoiceNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    // 출력 포트는 선택지마다 생성
}

NodeResult ChoiceNode::execute(ExecutionContext&) const {
    // 선택은 Player가 처리 (표시 목록 / 타임아웃)
    return NodeResult::WaitForInput("");
}

ChoiceOption& ChoiceNode::addChoice(const std::string& text, const std::string& conditionVariable,
                                    const std::string& id) {
    ChoiceOption choice;
    choice.id = id.empty() ? generateId() : id;
    choice.text = text;
    choice.conditionVariable = conditionVariable;
    choices_.push_back(std::move(choice));
    addOutputPort("Choice " + std::to_string(choices_.size()), choices_.back().id);
    return choices_.back();
}

bool ChoiceNode::removeChoice(int index) {
    if (index < 0 || index >= static_cast<int>(choices_.size())) return false;
    removeOutputPort(choices_[index].id);
    choices_.erase(choices_.begin() + index);
    return true;
}

void ChoiceNode::setChoices(const std::vector<ChoiceOption>& choices) {
    choices_ = choices;
    for (auto& choice : choices_) {
        if (choice.id.empty()) choice.id = generateId();
    }
    rebuildPorts();
}

void ChoiceNode::rebuildPorts() {
    clearOutputPorts();
    for (size_t i = 0; i < choices_.size(); ++i) {
        addOutputPort("Choice " + std::to_string(i + 1) + ": " + choices_[i].text, choices_[i].id);
    }
}

bool ChoiceNode::isChoiceAvailable(const ExecutionContext& context, int index) const {
    if (index < 0 || index >= static_cast<int>(choices_.size())) return false;
    const auto& choice = choices_[index];
    if (choice.conditionVariable.empty()) return true;
    return context.getBool(choice.conditionVariable, true);
}

std::vector<int> ChoiceNode::getAvailableIndices(const ExecutionContext& context) const {
    std::vector<int> indices;
    for (int i = 0; i < static_cast<int>(choices_.size()); ++i) {
        if (isChoiceAvailable(context, i)) indices.push_back(i);
    }
    return indices;
}

std::string ChoiceNode::applyChoice(ExecutionContext& context, int declaredIndex) const {
    if (declaredIndex < 0 || declaredIndex >= static_cast<int>(choices_.size())) {
        return "";
    }
    const auto& choice = choices_[declaredIndex];
    if (!choice.setVariable.empty()) {
        context.setVariable(choice.setVariable, choice.setValue);
    }
    context.setVariable("choice_" + getId(), Value::Int(declaredIndex));
    return choice.id;
}

std::vector<std::string> ChoiceNode::validate() const {
    std::vector<std::string> errors;
    if (choices_.empty()) {
        errors.push_back("Choice node '" + getId() + "' has no choices");
    }
    if (defaultIndex_ >= static_cast<int>(choices_.size())) {
        errors.push_back("Choice node '" + getId() + "' default index " +
                         std::to_string(defaultIndex_) + " is out of range");
    }
    return errors;
}

// ==========================================================================
// ConditionNode
// ==========================================================================
ConditionNode::ConditionNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("True", "true");
    addOutputPort("False", "false");
}

void ConditionNode::addCondition(const std::string& variableName, ConditionOperator op,
                                 const std::string& compareValue) {
    conditions_.push_back({variableName, op, compareValue});
}

NodeResult ConditionNode::execute(ExecutionContext& context) const {
    bool result = evaluateConditions(context, conditions_, logic_);
    return NodeResult::Branch(result ? "true" : "false");
}

std::vector<std::string> ConditionNode::validate() const {
    std::vector<std::string> errors;
    for (const auto& cond : conditions_) {
        if (cond.variableName.empty()) {
            errors.push_back("Condition node '" + getId() + "' has a condition without a variable");
        }
    }
    return errors;
}

// ==========================================================================
// VariableNode
// ==========================================================================
VariableNode::VariableNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("Output", "output");
}

void VariableNode::addOperation(const std::string& variableName, VariableOpType op, const std::string& value) {
    operations_.push_back({variableName, op, value});
}

NodeResult VariableNode::execute(ExecutionContext& context) const {
    for (const auto& op : operations_) {
        applyOperation(context, op);
    }
    return NodeResult::Continue("output");
}

// Int 결과는 int32 범위로 포화
static int32_t saturateInt(int64_t v) {
    v = std::max<int64_t>(v, std::numeric_limits<int32_t>::min());
    v = std::min<int64_t>(v, std::numeric_limits<int32_t>::max());
    return static_cast<int32_t>(v);
}

// 산술 결과는 기존 변수 타입(Int/Float)을 유지, 없으면 Float
static Value arithmeticResult(const Value& current, double result) {
    if (current.type == Value::INT && !std::isnan(result)) {
        double r = std::nearbyint(result);
        r = std::max(r, static_cast<double>(std::numeric_limits<int32_t>::min()));
        r = std::min(r, static_cast<double>(std::numeric_limits<int32_t>::max()));
        return Value::Int(static_cast<int32_t>(r));
    }
    return Value::Float(static_cast<float>(result));
}

void VariableNode::applyOperation(ExecutionContext& context, const VariableOperation& operation) const {
    const std::string& name = operation.variableName;
    Value operand = resolveOperand(context, operation.value);

    Value current;
    context.tryGetVariable(name, current);

    switch (operation.op) {
        case VariableOpType::Set:
            context.setVariable(name, operand);
            break;

        case VariableOpType::Add:
        case VariableOpType::Subtract:
        case VariableOpType::Multiply:
        case VariableOpType::Divide: {
            double a = 0.0;
            double b = 0.0;
            toNumber(current, a);
            if (!toNumber(operand, b)) break;

            if (current.type == Value::INT && operand.type == Value::INT &&
                operation.op != VariableOpType::Divide) {
                int64_t r = 0;
                if (operation.op == VariableOpType::Add) r = int64_t(current.i) + operand.i;
                else if (operation.op == VariableOpType::Subtract) r = int64_t(current.i) - operand.i;
                else r = int64_t(current.i) * operand.i;
                context.setVariable(name, Value::Int(saturateInt(r)));
                break;
            }

            double r = 0.0;
            switch (operation.op) {
                case VariableOpType::Add:      r = a + b; break;
                case VariableOpType::Subtract: r = a - b; break;
                case VariableOpType::Multiply: r = a * b; break;
                default:
                    if (b == 0.0) return; // 0으로 나누기는 무시
                    r = a / b;
                    break;
            }
            context.setVariable(name, arithmeticResult(current, r));
            break;
        }

        case VariableOpType::Toggle:
            context.setVariable(name, Value::Bool(!context.getBool(name, false)));
            break;

        case VariableOpType::Append:
            context.setVariable(name, Value::String(context.getString(name, "") + valueToString(operand)));
            break;

        case VariableOpType::Random: {
            const std::string& range = operation.value;
            size_t comma = range.find(',');
            if (comma == std::string::npos) break;
            double lo = 0.0;
            double hi = 0.0;
            if (!toNumber(Value::String(range.substr(0, comma)), lo) ||
                !toNumber(Value::String(range.substr(comma + 1)), hi)) {
                break;
            }
            if (hi < lo) std::swap(lo, hi);
            std::uniform_real_distribution<double> dist(lo, hi);
            double r = (lo == hi) ? lo : dist(context.getRng());
            context.setVariable(name, Value::Float(static_cast<float>(r)));
            break;
        }
    }
}

std::vector<std::string> VariableNode::validate() const {
    std::vector<std::string> errors;
    for (const auto& op : operations_) {
        if (op.variableName.empty()) {
            errors.push_back("Variable node '" + getId() + "' has an operation without a variable");
        }
    }
    return errors;
}

// ==========================================================================
// WaitNode
// ==========================================================================
WaitNode::WaitNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("Output", "output");
}

NodeResult WaitNode::execute(ExecutionContext& context) const {
    switch (waitType_) {
        case WaitType::Time:
            return NodeResult::Wait(waitTime_, "output");
        case WaitType::Input:
            return NodeResult::WaitForInput("output");
        case WaitType::Condition: {
            const ExecutionContext* ctx = &context;
            std::string varName = conditionVariable_;
            ConditionOperator op = conditionOp_;
            Value compare = parseLiteral(conditionValue_);
            return NodeResult::WaitForCondition(
                [ctx, varName, op, compare]() { return ctx->evaluateCondition(varName, op, compare); },
                "output");
        }
        case WaitType::Frame:
            return NodeResult::Wait(0.0f, "output");
    }
    return NodeResult::Continue("output");
}

std::vector<std::string> WaitNode::validate() const {
    std::vector<std::string> errors;
    if (waitType_ == WaitType::Time && waitTime_ < 0.0f) {
        errors.push_back("Wait node '" + getId() + "' has a negative wait time");
    }
    if (waitType_ == WaitType::Condition && conditionVariable_.empty()) {
        errors.push_back("Wait node '" + getId() + "' has no condition variable");
    }
    return errors;
}

// ==========================================================================
// CutsceneNode
// ==========================================================================
CutsceneNode::CutsceneNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("Complete", "complete");
    addOutputPort("Skipped", "skipped");
}

void CutsceneNode::onEnter(ExecutionContext& context) const {
    context.setTempData(COMPLETE_KEY, Value::Bool(false));
    context.setTempData(SKIPPED_KEY, Value::Bool(false));

    StoryEvent event;
    event.name = "StoryCutscene";
    event.category = "Cutscene";
    event.sourceNodeId = getId();
    event.params.emplace_back("cutsceneId", cutsceneId_);
    event.params.emplace_back("cutsceneType", cutsceneTypeName(cutsceneType_));
    event.params.emplace_back("skippable", skippable_ ? "true" : "false");
    context.emitEvent(event);
}

NodeResult CutsceneNode::execute(ExecutionContext& context) const {
    const ExecutionContext* ctx = &context;
    return NodeResult::WaitForCondition(
        [ctx]() { return ctx->getTempData(COMPLETE_KEY, Value::Bool(false)).b; },
        "complete");
}

std::string CutsceneNode::resolveOutputPort(const ExecutionContext& context,
                                            const std::string& declaredPortId) const {
    Value skipped = context.getTempData(SKIPPED_KEY, Value::Bool(false));
    if (skipped.type == Value::BOOL && skipped.b) return "skipped";
    return declaredPortId;
}

void CutsceneNode::onExit(ExecutionContext& context) const {
    context.removeTempData(COMPLETE_KEY);
    context.removeTempData(SKIPPED_KEY);
}

void CutsceneNode::signalComplete(ExecutionContext& context, bool skipped) {
    context.setTempData(SKIPPED_KEY, Value::Bool(skipped));
    context.setTempData(COMPLETE_KEY, Value::Bool(true));
}

std::vector<std::string> CutsceneNode::validate() const {
    std::vector<std::string> errors;
    if (cutsceneId_.empty()) {
        errors.push_back("Cutscene node '" + getId() + "' has no cutscene id");
    }
    return errors;
}

// ==========================================================================
// AudioNode
// ==========================================================================
AudioNode::AudioNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("Output", "output");
}

NodeResult AudioNode::execute(ExecutionContext& context) const {
    StoryEvent event;
    event.name = "StoryAudio";
    event.category = "Audio";
    event.sourceNodeId = getId();
    event.params.emplace_back("clipPath", clipPath_);
    event.params.emplace_back("audioType", audioTypeName(audioType_));
    event.params.emplace_back("action", audioActionName(action_));
    event.params.emplace_back("volume", valueToString(Value::Float(volume_)));
    event.params.emplace_back("fadeTime", valueToString(Value::Float(fadeTime_)));
    event.params.emplace_back("loop", loop_ ? "true" : "false");
    event.params.emplace_back("channel", channel_);
    context.emitEvent(event);

    if (waitForCompletion_ && action_ == AudioAction::Play && clipLength_ > 0.0f) {
        return NodeResult::Wait(clipLength_, "output");
    }
    return NodeResult::Continue("output");
}

std::vector<std::string> AudioNode::validate() const {
    std::vector<std::string> errors;
    bool needsClip = action_ == AudioAction::Play || action_ == AudioAction::FadeIn ||
                     action_ == AudioAction::CrossFade;
    if (needsClip && clipPath_.empty()) {
        errors.push_back("Audio node '" + getId() + "' has no audio clip");
    }
    return errors;
}

// ==========================================================================
// EventNode
// ==========================================================================
EventNode::EventNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
    addOutputPort("Output", "output");
    addOutputPort("Timeout", "timeout");
}

std::string EventNode::completionKey(const std::string& nodeId) {
    return "eventComplete:" + nodeId;
}

void EventNode::signalComplete(ExecutionContext& context, const std::string& nodeId) {
    context.setTempData(completionKey(nodeId), Value::Bool(true));
}

NodeResult EventNode::execute(ExecutionContext& context) const {
    StoryEvent event;
    event.name = eventName_;
    event.category = category_;
    event.sourceNodeId = getId();
    for (const auto& param : params_) {
        Value v = resolveOperand(context, param.value);
        event.params.emplace_back(param.name, valueToString(v));
    }
    context.emitEvent(event);

    if (!waitForCompletion_) {
        return NodeResult::Continue("output");
    }

    const ExecutionContext* ctx = &context;
    std::string key = completionKey(getId());
    NodeResult result = NodeResult::WaitForCondition(
        [ctx, key]() { return ctx->getTempData(key, Value::Bool(false)).b; },
        "output");
    if (timeout_ > 0.0f) {
        result.withTimeout(timeout_, "timeout");
    }
    return result;
}

void EventNode::onExit(ExecutionContext& context) const {
    context.removeTempData(completionKey(getId()));
}

std::vector<std::string> EventNode::validate() const {
    std::vector<std::string> errors;
    if (eventName_.empty()) {
        errors.push_back("Event node '" + getId() + "' has no event name");
    }
    return errors;
}

// ==========================================================================
// EndNode
// ==========================================================================
EndNode::EndNode(const std::string& id) : Node(id) {
    addInputPort("Input", "input");
}

NodeResult EndNode::execute(ExecutionContext& context) const {
    context.markComplete();
    return NodeResult::End();
}

} // namespace Yeon
