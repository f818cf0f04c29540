#include <gtest/gtest.h>
#include "test_helpers.h"
#include "yeon_nodes.h"
#include "yeon_node_registry.h"
#include "yeon_context.h"

using namespace Yeon;
using namespace YeonTest;

// --- Dialogue ---

TEST(NodesTest, DialogueInterpolation) {
    DialogueNode node("d");
    node.setText("Hi {name}, you have {gold} gold and {missing}.");
    ExecutionContext ctx;
    ctx.setVariable("name", Value::String("Mina"));
    ctx.setVariable("gold", Value::Int(30));
    EXPECT_EQ(node.getProcessedText(ctx), "Hi Mina, you have 30 gold and [missing].");
}

TEST(NodesTest, DialogueInterpolatesFloatsExactly) {
    DialogueNode node("d");
    node.setText("{score} / {ratio} / {tiny}");
    ExecutionContext ctx;
    ctx.setVariable("score", Value::Float(1234567.0f));
    ctx.setVariable("ratio", Value::Float(0.1f));
    ctx.setVariable("tiny", Value::Float(1.5f));
    EXPECT_EQ(node.getProcessedText(ctx), "1234567 / 0.1 / 1.5");

    Value text;
    ASSERT_TRUE(coerceValue(Value::Float(16777216.0f), Value::STRING, text));
    EXPECT_EQ(text, Value::String("16777216"));
}

TEST(NodesTest, DialogueResultKinds) {
    ExecutionContext ctx;
    DialogueNode node("d");
    node.setText("Line");

    node.onEnter(ctx);
    EXPECT_EQ(ctx.getTempData("currentDialogue"), Value::String("d"));

    NodeResult r = node.execute(ctx);
    EXPECT_EQ(r.type, ResultType::WaitForInput);
    EXPECT_EQ(ctx.getTempData("processedDialogueText"), Value::String("Line"));

    node.setWaitForInput(false);
    node.setAutoAdvanceDelay(1.5f);
    r = node.execute(ctx);
    EXPECT_EQ(r.type, ResultType::Wait);
    EXPECT_FLOAT_EQ(r.waitSeconds, 1.5f);

    node.setAutoAdvanceDelay(0.0f);
    r = node.execute(ctx);
    EXPECT_EQ(r.type, ResultType::Continue);
    EXPECT_EQ(r.portId, "output");
}

// --- Choice ---

TEST(NodesTest, ChoicePortsFollowChoices) {
    ChoiceNode node("c");
    node.addChoice("Yes", "", "yes");
    node.addChoice("No", "", "no");
    ASSERT_EQ(node.getOutputPorts().size(), 2u);
    EXPECT_NE(node.getOutputPort("yes"), nullptr);

    EXPECT_TRUE(node.removeChoice(0));
    EXPECT_EQ(node.getOutputPort("yes"), nullptr);
    EXPECT_EQ(node.getChoices().size(), 1u);
    EXPECT_FALSE(node.removeChoice(5));

    ChoiceOption a;
    a.text = "generated";
    node.setChoices({a});
    ASSERT_EQ(node.getChoices().size(), 1u);
    EXPECT_FALSE(node.getChoices()[0].id.empty());
    EXPECT_NE(node.getOutputPort(node.getChoices()[0].id), nullptr);
}

TEST(NodesTest, ChoiceAvailabilityAndApply) {
    ChoiceNode node("c");
    node.addChoice("Always");
    node.addChoice("Locked", "hasKey");
    auto& bribe = node.addChoice("Bribe", "rich", "bribe");
    bribe.setVariable = "bribed";
    bribe.setValue = Value::Bool(true);

    ExecutionContext ctx;
    ctx.setVariable("hasKey", Value::Bool(false));
    // rich는 없음 → 표시
    EXPECT_EQ(node.getAvailableIndices(ctx), (std::vector<int>{0, 2}));

    EXPECT_EQ(node.applyChoice(ctx, 2), "bribe");
    EXPECT_TRUE(ctx.getBool("bribed"));
    EXPECT_EQ(ctx.getVariable("choice_c"), Value::Int(2));
    EXPECT_EQ(node.applyChoice(ctx, 7), "");
}

TEST(NodesTest, ChoiceValidation) {
    ChoiceNode node("c");
    EXPECT_FALSE(node.validate().empty());
    node.addChoice("One");
    EXPECT_TRUE(node.validate().empty());
    node.setDefaultIndex(3);
    EXPECT_FALSE(node.validate().empty());
}

// --- Condition ---

TEST(NodesTest, ConditionLogic) {
    ExecutionContext ctx;
    ctx.setVariable("gold", Value::Int(50));
    ctx.setVariable("brave", Value::Bool(false));

    ConditionNode node("cond");
    node.addCondition("gold", ConditionOperator::GreaterOrEqual, "50");
    node.addCondition("brave", ConditionOperator::IsTrue, "");

    EXPECT_EQ(node.execute(ctx).portId, "false");
    node.setLogic(ConditionLogic::Or);
    EXPECT_EQ(node.execute(ctx).portId, "true");

    ConditionNode empty("empty");
    EXPECT_EQ(empty.execute(ctx).portId, "true");
}

// --- Variable ---

TEST(NodesTest, VariableArithmeticKeepsInt) {
    ExecutionContext ctx;
    ctx.setVariable("gold", Value::Int(10));

    VariableNode node("v");
    node.addOperation("gold", VariableOpType::Add, "5");
    node.addOperation("gold", VariableOpType::Multiply, "3");
    node.addOperation("gold", VariableOpType::Subtract, "1");
    node.execute(ctx);
    EXPECT_EQ(ctx.getVariable("gold"), Value::Int(44));
}

TEST(NodesTest, VariableArithmeticLargeIntsSaturate) {
    ExecutionContext ctx;
    ctx.setVariable("big", Value::Int(20000001));   // 2^24 초과
    ctx.setVariable("top", Value::Int(2147483647));
    ctx.setVariable("bottom", Value::Int(-2147483647));
    ctx.setVariable("scaled", Value::Int(2000000000));

    VariableNode node("v");
    node.addOperation("big", VariableOpType::Add, "2");
    node.addOperation("top", VariableOpType::Add, "1");
    node.addOperation("bottom", VariableOpType::Subtract, "10");
    node.addOperation("scaled", VariableOpType::Multiply, "1.5");
    node.execute(ctx);

    EXPECT_EQ(ctx.getVariable("big"), Value::Int(20000003));
    EXPECT_EQ(ctx.getVariable("top"), Value::Int(2147483647));
    EXPECT_EQ(ctx.getVariable("bottom"), Value::Int(-2147483647 - 1));
    EXPECT_EQ(ctx.getVariable("scaled"), Value::Int(2147483647));
}

TEST(NodesTest, VariableFloatAndDivide) {
    ExecutionContext ctx;
    ctx.setVariable("gold", Value::Int(10));
    ctx.setVariable("ratio", Value::Float(1.0f));

    VariableNode node("v");
    node.addOperation("ratio", VariableOpType::Add, "0.5");
    node.addOperation("gold", VariableOpType::Divide, "4");   // 2.5 → 2 (Int 유지)
    node.addOperation("ratio", VariableOpType::Divide, "0");  // 무시
    node.execute(ctx);

    EXPECT_EQ(ctx.getVariable("ratio"), Value::Float(1.5f));
    EXPECT_EQ(ctx.getVariable("gold"), Value::Int(2));
}

TEST(NodesTest, VariableSetToggleAppendAndReference) {
    ExecutionContext ctx;
    ctx.setVariable("base", Value::Int(7));

    VariableNode node("v");
    node.addOperation("copy", VariableOpType::Set, "$base");
    node.addOperation("flag", VariableOpType::Toggle, "");
    node.addOperation("name", VariableOpType::Set, "Kim");
    node.addOperation("name", VariableOpType::Append, " Minji");
    node.addOperation("copy", VariableOpType::Add, "$base");
    node.execute(ctx);

    EXPECT_EQ(ctx.getVariable("copy"), Value::Int(14));
    EXPECT_EQ(ctx.getVariable("flag"), Value::Bool(true));
    EXPECT_EQ(ctx.getVariable("name"), Value::String("Kim Minji"));
}

TEST(NodesTest, VariableRandomInRange) {
    ExecutionContext ctx;
    ctx.setSeed(1234);

    VariableNode node("v");
    node.addOperation("roll", VariableOpType::Random, "2,5");
    for (int i = 0; i < 20; ++i) {
        node.execute(ctx);
        float roll = ctx.getFloat("roll", -1.0f);
        EXPECT_GE(roll, 2.0f);
        EXPECT_LE(roll, 5.0f);
    }

    node.setOperations({{"fixed", VariableOpType::Random, "3,3"}});
    node.execute(ctx);
    EXPECT_FLOAT_EQ(ctx.getFloat("fixed"), 3.0f);

    node.setOperations({{"bad", VariableOpType::Random, "oops"}});
    node.execute(ctx);
    EXPECT_FALSE(ctx.hasVariable("bad"));
}

// --- Wait ---

TEST(NodesTest, WaitResultKinds) {
    ExecutionContext ctx;
    WaitNode node("w");

    node.setWaitTime(2.0f);
    NodeResult r = node.execute(ctx);
    EXPECT_EQ(r.type, ResultType::Wait);
    EXPECT_FLOAT_EQ(r.waitSeconds, 2.0f);

    node.setWaitType(WaitType::Frame);
    r = node.execute(ctx);
    EXPECT_EQ(r.type, ResultType::Wait);
    EXPECT_FLOAT_EQ(r.waitSeconds, 0.0f);

    node.setWaitType(WaitType::Input);
    EXPECT_EQ(node.execute(ctx).type, ResultType::WaitForInput);

    node.setWaitType(WaitType::Condition);
    node.setConditionVariable("ready");
    node.setConditionOperator(ConditionOperator::IsTrue);
    r = node.execute(ctx);
    ASSERT_EQ(r.type, ResultType::WaitForCondition);
    ASSERT_TRUE(static_cast<bool>(r.condition));
    EXPECT_FALSE(r.condition());
    ctx.setVariable("ready", Value::Bool(true));
    EXPECT_TRUE(r.condition());
}

// --- Cutscene / Audio / Event ---

TEST(NodesTest, CutsceneSignal) {
    ExecutionContext ctx;
    std::vector<std::string> events;
    ctx.setEventCallback([&](const StoryEvent& e) { events.push_back(e.name); });

    CutsceneNode node("cut");
    node.setCutsceneId("intro");
    node.onEnter(ctx);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "StoryCutscene");

    NodeResult r = node.execute(ctx);
    ASSERT_EQ(r.type, ResultType::WaitForCondition);
    EXPECT_FALSE(r.condition());

    CutsceneNode::signalComplete(ctx, true);
    EXPECT_TRUE(r.condition());
    EXPECT_EQ(node.resolveOutputPort(ctx, r.portId), "skipped");

    node.onExit(ctx);
    EXPECT_FALSE(ctx.hasTempData(CutsceneNode::COMPLETE_KEY));
    EXPECT_EQ(node.resolveOutputPort(ctx, "complete"), "complete");
}

TEST(NodesTest, AudioEmitsEvent) {
    ExecutionContext ctx;
    std::vector<StoryEvent> events;
    ctx.setEventCallback([&](const StoryEvent& e) { events.push_back(e); });

    AudioNode node("music");
    node.setClipPath("bgm/theme.ogg");
    node.setAudioType(AudioType::Music);
    EXPECT_EQ(node.execute(ctx).type, ResultType::Continue);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].name, "StoryAudio");
    EXPECT_EQ(events[0].category, "Audio");
    EXPECT_EQ(events[0].sourceNodeId, "music");
    EXPECT_EQ(events[0].params[0].second, "bgm/theme.ogg");
    EXPECT_EQ(events[0].params[1].second, "Music");

    node.setWaitForCompletion(true);
    node.setClipLength(3.0f);
    NodeResult r = node.execute(ctx);
    EXPECT_EQ(r.type, ResultType::Wait);
    EXPECT_FLOAT_EQ(r.waitSeconds, 3.0f);
}

TEST(NodesTest, EventResolvesParams) {
    ExecutionContext ctx;
    ctx.setVariable("target", Value::String("door"));
    std::vector<StoryEvent> events;
    ctx.setEventCallback([&](const StoryEvent& e) { events.push_back(e); });

    EventNode node("ev");
    node.setEventName("OpenDoor");
    node.addParam("which", "$target");
    node.addParam("speed", "2");
    EXPECT_EQ(node.execute(ctx).type, ResultType::Continue);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].params[0].second, "door");
    EXPECT_EQ(events[0].params[1].second, "2");

    node.setWaitForCompletion(true);
    node.setTimeout(4.0f);
    NodeResult r = node.execute(ctx);
    ASSERT_EQ(r.type, ResultType::WaitForCondition);
    EXPECT_FLOAT_EQ(r.timeoutSeconds, 4.0f);
    EXPECT_EQ(r.timeoutPortId, "timeout");
    EXPECT_FALSE(r.condition());
    EventNode::signalComplete(ctx, "ev");
    EXPECT_TRUE(r.condition());
}

TEST(NodesTest, EndMarksComplete) {
    ExecutionContext ctx;
    EndNode node("end");
    EXPECT_EQ(node.execute(ctx).type, ResultType::End);
    EXPECT_TRUE(ctx.isComplete());
}

TEST(NodesTest, EnumNames) {
    VariableOpType op;
    EXPECT_TRUE(parseVariableOpType("Multiply", op));
    EXPECT_EQ(op, VariableOpType::Multiply);
    EXPECT_FALSE(parseVariableOpType("multiply", op));
    EXPECT_STREQ(waitTypeName(WaitType::Frame), "Frame");
    EXPECT_STREQ(audioActionName(AudioAction::CrossFade), "CrossFade");

    ConditionOperator cop;
    EXPECT_TRUE(parseConditionOperator("GreaterOrEqual", cop));
    EXPECT_EQ(cop, ConditionOperator::GreaterOrEqual);
}

TEST(NodesTest, OutOfRangeEnumNamesAreEmpty) {
    EXPECT_STREQ(audioTypeName(static_cast<AudioType>(200)), "");
    EXPECT_STREQ(endTypeName(static_cast<EndType>(-1)), "");
    EXPECT_STREQ(conditionOperatorName(static_cast<ConditionOperator>(9)), "");

    ExecutionContext ctx;
    std::vector<StoryEvent> events;
    ctx.setEventCallback([&](const StoryEvent& e) { events.push_back(e); });
    AudioNode node("sfx");
    node.setAudioType(static_cast<AudioType>(200));
    EXPECT_EQ(node.execute(ctx).type, ResultType::Continue);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].params[1].second, "");
}

// --- Registry ---

namespace {

class NoteNode : public Node {
public:
    explicit NoteNode(const std::string& id) : Node(id) {
        addInputPort("Input", "input");
        addOutputPort("Output", "output");
    }
    NodeType getType() const override { return NodeType::Custom; }
    const char* getTypeName() const override { return "Note"; }
    const char* getCategory() const override { return "Custom"; }
    NodeResult execute(ExecutionContext& context) const override {
        context.incrementVariable("notes");
        return NodeResult::Continue("output");
    }
};

} // namespace

TEST(NodeRegistryTest, BuiltinsRegistered) {
    NodeRegistry registry;
    for (const char* name : {"Start", "Dialogue", "Choice", "Condition", "Variable",
                             "Wait", "Cutscene", "Audio", "Event", "End"}) {
        EXPECT_TRUE(registry.hasType(name)) << name;
        auto node = registry.create(name, "id");
        ASSERT_NE(node, nullptr) << name;
        EXPECT_STREQ(node->getTypeName(), name);
        EXPECT_EQ(node->getId(), "id");
    }
    EXPECT_EQ(registry.getTypeNames().size(), 10u);
    EXPECT_EQ(registry.getTypeNames().front(), "Start");
}

TEST(NodeRegistryTest, UnknownTypeReturnsNull) {
    NodeRegistry registry;
    EXPECT_EQ(registry.create("Teleport", "x"), nullptr);
}

TEST(NodeRegistryTest, CustomType) {
    NodeRegistry registry;
    EXPECT_TRUE(registry.registerType<NoteNode>("Note"));
    EXPECT_FALSE(registry.registerType<NoteNode>("Note"));

    auto node = registry.create("Note", "n1");
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->getType(), NodeType::Custom);

    // 커스텀 노드도 Player에서 실행된다
    Graph graph("g", "Graph");
    addNode<StartNode>(graph, "start");
    graph.addNode(std::move(node));
    connect(graph, "start", "n1");

    Player player;
    ASSERT_TRUE(player.play(graph));
    EXPECT_EQ(player.getState(), PlayerState::Complete);
    EXPECT_EQ(player.getContext()->getInt("notes"), 1);

    EXPECT_TRUE(registry.unregisterType("Note"));
    EXPECT_FALSE(registry.hasType("Note"));
    EXPECT_FALSE(registry.unregisterType("Note"));
}
