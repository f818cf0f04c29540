#pragma once
#include "yeon_graph.h"
#include <string>
#include <vector>

namespace Yeon {

// --- 노드 설정 enum ---
enum class ConditionLogic { And, Or };
enum class VariableOpType { Set, Add, Subtract, Multiply, Divide, Toggle, Append, Random };
enum class WaitType { Time, Input, Condition, Frame };
enum class CutsceneType { Timeline, Animation, Video, Custom };
enum class AudioType { SFX, Music, Ambient, Voice };
enum class AudioAction { Play, Stop, Pause, Resume, FadeIn, FadeOut, CrossFade };
enum class EndType { Complete, Failed, Checkpoint, Transition };

const char* conditionLogicName(ConditionLogic logic);
bool parseConditionLogic(const std::string& text, ConditionLogic& out);
const char* variableOpTypeName(VariableOpType op);
bool parseVariableOpType(const std::string& text, VariableOpType& out);
const char* waitTypeName(WaitType type);
bool parseWaitType(const std::string& text, WaitType& out);
const char* cutsceneTypeName(CutsceneType type);
bool parseCutsceneType(const std::string& text, CutsceneType& out);
const char* audioTypeName(AudioType type);
bool parseAudioType(const std::string& text, AudioType& out);
const char* audioActionName(AudioAction action);
bool parseAudioAction(const std::string& text, AudioAction& out);
const char* endTypeName(EndType type);
bool parseEndType(const std::string& text, EndType& out);

// 조건 한 줄: 변수 op 비교값(리터럴 문자열)
struct Condition {
    std::string variableName;
    ConditionOperator op = ConditionOperator::Equals;
    std::string compareValue;
};

// 조건 목록 평가 (빈 목록은 true)
bool evaluateConditions(const ExecutionContext& context, const std::vector<Condition>& conditions,
                        ConditionLogic logic);

// --- Start ---
class StartNode : public Node {
public:
    explicit StartNode(const std::string& id);

    NodeType getType() const override { return NodeType::Start; }
    const char* getTypeName() const override { return "Start"; }
    const char* getCategory() const override { return "Flow"; }

    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    const std::string& getLabel() const { return label_; }
    void setLabel(const std::string& label) { label_ = label; }
    bool isDefaultStart() const { return isDefault_; }
    void setDefaultStart(bool isDefault) { isDefault_ = isDefault; }

private:
    std::string label_ = "Start";
    bool isDefault_ = true;
};

// --- Dialogue ---
class DialogueNode : public Node {
public:
    explicit DialogueNode(const std::string& id);

    NodeType getType() const override { return NodeType::Dialogue; }
    const char* getTypeName() const override { return "Dialogue"; }
    const char* getCategory() const override { return "Dialogue"; }

    void onEnter(ExecutionContext& context) const override;
    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    // {변수명} → 값. 없는 변수는 [변수명]
    std::string getProcessedText(const ExecutionContext& context) const;

    const std::string& getSpeakerName() const { return speakerName_; }
    void setSpeakerName(const std::string& v) { speakerName_ = v; }
    const std::string& getSpeakerId() const { return speakerId_; }
    void setSpeakerId(const std::string& v) { speakerId_ = v; }
    const std::string& getSpeakerEmotion() const { return speakerEmotion_; }
    void setSpeakerEmotion(const std::string& v) { speakerEmotion_ = v; }
    const std::string& getText() const { return text_; }
    void setText(const std::string& v) { text_ = v; }
    const std::string& getLocalizedKey() const { return localizedKey_; }
    void setLocalizedKey(const std::string& v) { localizedKey_ = v; }
    float getTextSpeed() const { return textSpeed_; }
    void setTextSpeed(float v) { textSpeed_ = v; }
    bool getWaitForInput() const { return waitForInput_; }
    void setWaitForInput(bool v) { waitForInput_ = v; }
    float getAutoAdvanceDelay() const { return autoAdvanceDelay_; }
    void setAutoAdvanceDelay(float v) { autoAdvanceDelay_ = v; }

private:
    std::string speakerName_;
    std::string speakerId_;
    std::string speakerEmotion_;
    std::string text_;
    std::string localizedKey_;
    float textSpeed_ = 0.05f;
    bool waitForInput_ = true;
    float autoAdvanceDelay_ = 0.0f;
};

// --- Choice ---
struct ChoiceOption {
    std::string id;          // 출력 포트 ID와 같다
    std::string text;
    std::string localizedKey;
    std::string conditionVariable; // 비어 있으면 항상 표시
    std::string setVariable;
    Value setValue;
};

class ChoiceNode : public Node {
public:
    explicit ChoiceNode(const std::string& id);

    NodeType getType() const override { return NodeType::Choice; }
    const char* getTypeName() const override { return "Choice"; }
    const char* getCategory() const override { return "Dialogue"; }

    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    // 선택지 추가 (id가 비어 있으면 생성). 출력 포트도 같이 만든다.
    ChoiceOption& addChoice(const std::string& text, const std::string& conditionVariable = "",
                            const std::string& id = "");
    bool removeChoice(int index);
    void setChoices(const std::vector<ChoiceOption>& choices);
    const std::vector<ChoiceOption>& getChoices() const { return choices_; }

    // 조건 변수가 없거나 false가 아니면 표시
    bool isChoiceAvailable(const ExecutionContext& context, int index) const;
    std::vector<int> getAvailableIndices(const ExecutionContext& context) const;

    // 선택 반영: setVariable + choice_<nodeId>. 선택된 포트 ID 반환 (범위 밖이면 빈 문자열)
    std::string applyChoice(ExecutionContext& context, int declaredIndex) const;

    const std::string& getPrompt() const { return prompt_; }
    void setPrompt(const std::string& v) { prompt_ = v; }
    float getTimeout() const { return timeout_; }
    void setTimeout(float v) { timeout_ = v; }
    int getDefaultIndex() const { return defaultIndex_; }
    void setDefaultIndex(int v) { defaultIndex_ = v; }
    bool getShuffle() const { return shuffle_; }
    void setShuffle(bool v) { shuffle_ = v; }

private:
    void rebuildPorts();

    std::string prompt_;
    std::vector<ChoiceOption> choices_;
    float timeout_ = 0.0f;
    int defaultIndex_ = -1;
    bool shuffle_ = false;
};

// --- Condition (Branch) ---
class ConditionNode : public Node {
public:
    explicit ConditionNode(const std::string& id);

    NodeType getType() const override { return NodeType::Condition; }
    const char* getTypeName() const override { return "Condition"; }
    const char* getCategory() const override { return "Logic"; }

    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    void addCondition(const std::string& variableName, ConditionOperator op,
                      const std::string& compareValue);
    void setConditions(const std::vector<Condition>& conditions) { conditions_ = conditions; }
    const std::vector<Condition>& getConditions() const { return conditions_; }
    ConditionLogic getLogic() const { return logic_; }
    void setLogic(ConditionLogic logic) { logic_ = logic; }

private:
    std::vector<Condition> conditions_;
    ConditionLogic logic_ = ConditionLogic::And;
};

// --- Variable (SetVariable) ---
struct VariableOperation {
    std::string variableName;
    VariableOpType op = VariableOpType::Set;
    std::string value; // 리터럴 또는 $변수명, Random은 "min,max"
};

class VariableNode : public Node {
public:
    explicit VariableNode(const std::string& id);

    NodeType getType() const override { return NodeType::Variable; }
    const char* getTypeName() const override { return "Variable"; }
    const char* getCategory() const override { return "Logic"; }

    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    void addOperation(const std::string& variableName, VariableOpType op, const std::string& value);
    void setOperations(const std::vector<VariableOperation>& ops) { operations_ = ops; }
    const std::vector<VariableOperation>& getOperations() const { return operations_; }

private:
    void applyOperation(ExecutionContext& context, const VariableOperation& operation) const;

    std::vector<VariableOperation> operations_;
};

// --- Wait ---
class WaitNode : public Node {
public:
    explicit WaitNode(const std::string& id);

    NodeType getType() const override { return NodeType::Wait; }
    const char* getTypeName() const override { return "Wait"; }
    const char* getCategory() const override { return "Flow"; }

    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    WaitType getWaitType() const { return waitType_; }
    void setWaitType(WaitType v) { waitType_ = v; }
    float getWaitTime() const { return waitTime_; }
    void setWaitTime(float v) { waitTime_ = v; }
    const std::string& getConditionVariable() const { return conditionVariable_; }
    void setConditionVariable(const std::string& v) { conditionVariable_ = v; }
    ConditionOperator getConditionOperator() const { return conditionOp_; }
    void setConditionOperator(ConditionOperator v) { conditionOp_ = v; }
    const std::string& getConditionValue() const { return conditionValue_; }
    void setConditionValue(const std::string& v) { conditionValue_ = v; }

private:
    WaitType waitType_ = WaitType::Time;
    float waitTime_ = 1.0f;
    std::string conditionVariable_;
    ConditionOperator conditionOp_ = ConditionOperator::IsTrue;
    std::string conditionValue_;
};

// --- Cutscene ---
class CutsceneNode : public Node {
public:
    static constexpr const char* COMPLETE_KEY = "cutsceneComplete";
    static constexpr const char* SKIPPED_KEY = "cutsceneSkipped";

    explicit CutsceneNode(const std::string& id);

    NodeType getType() const override { return NodeType::Cutscene; }
    const char* getTypeName() const override { return "Cutscene"; }
    const char* getCategory() const override { return "Presentation"; }

    void onEnter(ExecutionContext& context) const override;
    void onExit(ExecutionContext& context) const override;
    NodeResult execute(ExecutionContext& context) const override;
    std::string resolveOutputPort(const ExecutionContext& context,
                                  const std::string& declaredPortId) const override;
    std::vector<std::string> validate() const override;

    // 호스트가 컷신 종료를 알림. 다음 tick에서 진행된다.
    static void signalComplete(ExecutionContext& context, bool skipped = false);

    const std::string& getCutsceneId() const { return cutsceneId_; }
    void setCutsceneId(const std::string& v) { cutsceneId_ = v; }
    const std::string& getCutsceneName() const { return cutsceneName_; }
    void setCutsceneName(const std::string& v) { cutsceneName_ = v; }
    CutsceneType getCutsceneType() const { return cutsceneType_; }
    void setCutsceneType(CutsceneType v) { cutsceneType_ = v; }
    bool isSkippable() const { return skippable_; }
    void setSkippable(bool v) { skippable_ = v; }
    float getSkipHoldTime() const { return skipHoldTime_; }
    void setSkipHoldTime(float v) { skipHoldTime_ = v; }
    bool getPauseGameplay() const { return pauseGameplay_; }
    void setPauseGameplay(bool v) { pauseGameplay_ = v; }
    bool getHideUI() const { return hideUI_; }
    void setHideUI(bool v) { hideUI_ = v; }

private:
    std::string cutsceneId_;
    std::string cutsceneName_;
    CutsceneType cutsceneType_ = CutsceneType::Timeline;
    bool skippable_ = true;
    float skipHoldTime_ = 1.0f;
    bool pauseGameplay_ = true;
    bool hideUI_ = true;
};

// --- Audio ---
class AudioNode : public Node {
public:
    explicit AudioNode(const std::string& id);

    NodeType getType() const override { return NodeType::Audio; }
    const char* getTypeName() const override { return "Audio"; }
    const char* getCategory() const override { return "Presentation"; }

    NodeResult execute(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    const std::string& getClipPath() const { return clipPath_; }
    void setClipPath(const std::string& v) { clipPath_ = v; }
    AudioType getAudioType() const { return audioType_; }
    void setAudioType(AudioType v) { audioType_ = v; }
    AudioAction getAction() const { return action_; }
    void setAction(AudioAction v) { action_ = v; }
    float getVolume() const { return volume_; }
    void setVolume(float v) { volume_ = v; }
    float getFadeTime() const { return fadeTime_; }
    void setFadeTime(float v) { fadeTime_ = v; }
    bool getLoop() const { return loop_; }
    void setLoop(bool v) { loop_ = v; }
    bool getWaitForCompletion() const { return waitForCompletion_; }
    void setWaitForCompletion(bool v) { waitForCompletion_ = v; }
    float getClipLength() const { return clipLength_; }
    void setClipLength(float v) { clipLength_ = v; }
    const std::string& getChannel() const { return channel_; }
    void setChannel(const std::string& v) { channel_ = v; }

private:
    std::string clipPath_;
    AudioType audioType_ = AudioType::SFX;
    AudioAction action_ = AudioAction::Play;
    float volume_ = 1.0f;
    float fadeTime_ = 0.0f;
    bool loop_ = false;
    bool waitForCompletion_ = false;
    float clipLength_ = 0.0f;
    std::string channel_;
};

// --- Event ---
struct EventParam {
    std::string name;
    std::string value; // $변수명이면 실행 시 치환
};

class EventNode : public Node {
public:
    explicit EventNode(const std::string& id);

    NodeType getType() const override { return NodeType::Event; }
    const char* getTypeName() const override { return "Event"; }
    const char* getCategory() const override { return "Events"; }

    NodeResult execute(ExecutionContext& context) const override;
    void onExit(ExecutionContext& context) const override;
    std::vector<std::string> validate() const override;

    static std::string completionKey(const std::string& nodeId);
    static void signalComplete(ExecutionContext& context, const std::string& nodeId);

    const std::string& getEventName() const { return eventName_; }
    void setEventName(const std::string& v) { eventName_ = v; }
    const std::string& getEventCategory() const { return category_; }
    void setEventCategory(const std::string& v) { category_ = v; }
    const std::vector<EventParam>& getParams() const { return params_; }
    void setParams(const std::vector<EventParam>& v) { params_ = v; }
    void addParam(const std::string& name, const std::string& value) { params_.push_back({name, value}); }
    bool getWaitForCompletion() const { return waitForCompletion_; }
    void setWaitForCompletion(bool v) { waitForCompletion_ = v; }
    float getTimeout() const { return timeout_; }
    void setTimeout(float v) { timeout_ = v; }

private:
    std::string eventName_;
    std::string category_;
    std::vector<EventParam> params_;
    bool waitForCompletion_ = false;
    float timeout_ = 0.0f;
};

// --- End ---
class EndNode : public Node {
public:
    explicit EndNode(const std::string& id);

    NodeType getType() const override { return NodeType::End; }
    const char* getTypeName() const override { return "End"; }
    const char* getCategory() const override { return "Flow"; }

    NodeResult execute(ExecutionContext& context) const override;

    const std::string& getLabel() const { return label_; }
    void setLabel(const std::string& v) { label_ = v; }
    EndType getEndType() const { return endType_; }
    void setEndType(EndType v) { endType_ = v; }

private:
    std::string label_;
    EndType endType_ = EndType::Complete;
};

} // namespace Yeon
