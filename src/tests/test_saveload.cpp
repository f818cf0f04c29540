#include <gtest/gtest.h>
#include "test_helpers.h"
#include "yeon_graph_file.h"
#include "yeon_node_registry.h"
#include <cstdio>
#include <fstream>

using namespace Yeon;
using namespace YeonTest;

static const char* GRAPH_PATH = "test_graph.ygb";
static const char* SAVE_PATH = "test_save.ygs";

class SaveLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        player.addListener(&listener);
    }
    void TearDown() override {
        std::remove(GRAPH_PATH);
        std::remove(SAVE_PATH);
    }

    static void writeGarbage(const char* path) {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "this is not a flatbuffer at all";
    }

    NodeRegistry registry;
    Player player;
    RecordingListener listener;
};

// 모든 노드 타입을 담은 그래프
static std::unique_ptr<Graph> makeFullGraph() {
    auto graph = std::make_unique<Graph>("full", "Full Graph");
    graph->setDescription("every node type");
    graph->setViewOffset(12.5f, -4.0f);
    graph->setViewScale(0.75f);
    graph->addVariable({"gold", VariableType::Int, Value::Int(10)});
    graph->addVariable({"brave", VariableType::Bool, Value::Bool(true)});
    graph->addVariable({"name", VariableType::String, Value::String("Mina")});

    auto* start = addNode<StartNode>(*graph, "start");
    start->setLabel("Prologue");
    start->setPosition(100.0f, 200.0f);

    auto* line = addLine(*graph, "line", "Hello {name}", true);
    line->setSpeakerName("Guide");
    line->setSpeakerEmotion("happy");
    line->setTextSpeed(0.02f);
    line->setBreakpoint(true);
    line->setName("Greeting");

    auto* choice = addNode<ChoiceNode>(*graph, "choice");
    choice->setPrompt("Pick one");
    choice->setTimeout(3.0f);
    choice->setDefaultIndex(1);
    choice->setShuffle(true);
    auto& left = choice->addChoice("Left", "", "left");
    left.setVariable = "dir";
    left.setValue = Value::String("west");
    choice->addChoice("Right", "brave", "right");

    auto* cond = addNode<ConditionNode>(*graph, "cond");
    cond->setLogic(ConditionLogic::Or);
    cond->addCondition("gold", ConditionOperator::GreaterThan, "5");

    auto* var = addNode<VariableNode>(*graph, "var");
    var->addOperation("gold", VariableOpType::Add, "5");
    var->addOperation("luck", VariableOpType::Random, "1,6");

    auto* wait = addNode<WaitNode>(*graph, "wait");
    wait->setWaitType(WaitType::Condition);
    wait->setConditionVariable("gold");
    wait->setConditionOperator(ConditionOperator::GreaterOrEqual);
    wait->setConditionValue("15");

    auto* cut = addNode<CutsceneNode>(*graph, "cut");
    cut->setCutsceneId("intro");
    cut->setCutsceneType(CutsceneType::Video);
    cut->setSkippable(false);

    auto* audio = addNode<AudioNode>(*graph, "audio");
    audio->setClipPath("bgm/theme.ogg");
    audio->setAudioType(AudioType::Music);
    audio->setAction(AudioAction::FadeIn);
    audio->setVolume(0.5f);
    audio->setLoop(true);
    audio->setChannel("bgm");

    auto* ev = addNode<EventNode>(*graph, "ev");
    ev->setEventName("OpenGate");
    ev->setEventCategory("World");
    ev->addParam("gate", "north");
    ev->setWaitForCompletion(true);
    ev->setTimeout(5.0f);

    auto* end = addNode<EndNode>(*graph, "end");
    end->setLabel("Fin");
    end->setEndType(EndType::Checkpoint);

    connect(*graph, "start", "line");
    connect(*graph, "line", "choice");
    connect(*graph, "choice", "cond", "left");
    connect(*graph, "choice", "var", "right");
    connect(*graph, "cond", "wait", "true");
    connect(*graph, "cond", "cut", "false");
    connect(*graph, "var", "audio");
    connect(*graph, "wait", "audio");
    connect(*graph, "cut", "audio", "complete");
    connect(*graph, "audio", "ev");
    connect(*graph, "ev", "end");
    return graph;
}

// --- .ygb ---

TEST_F(SaveLoadTest, GraphFileRoundTrip) {
    auto original = makeFullGraph();
    ASSERT_TRUE(saveGraphFile(*original, GRAPH_PATH));

    std::vector<std::string> errors;
    auto loaded = loadGraphFile(GRAPH_PATH, registry, errors);
    ASSERT_NE(loaded, nullptr);
    EXPECT_TRUE(errors.empty());

    EXPECT_EQ(loaded->getId(), "full");
    EXPECT_EQ(loaded->getName(), "Full Graph");
    EXPECT_EQ(loaded->getDescription(), "every node type");
    EXPECT_FLOAT_EQ(loaded->getViewOffsetX(), 12.5f);
    EXPECT_FLOAT_EQ(loaded->getViewScale(), 0.75f);
    EXPECT_EQ(loaded->getNodes().size(), original->getNodes().size());
    EXPECT_EQ(loaded->getConnections().size(), original->getConnections().size());
    ASSERT_EQ(loaded->getVariables().size(), 3u);
    EXPECT_EQ(loaded->getVariable("gold")->defaultValue, Value::Int(10));

    for (const auto& c : original->getConnections()) {
        const Connection* lc = loaded->getConnection(c.id);
        ASSERT_NE(lc, nullptr);
        EXPECT_EQ(lc->outputPortId, c.outputPortId);
        EXPECT_EQ(lc->inputNodeId, c.inputNodeId);
    }

    auto* start = static_cast<const StartNode*>(loaded->getNode("start"));
    EXPECT_EQ(start->getLabel(), "Prologue");
    EXPECT_FLOAT_EQ(start->getY(), 200.0f);

    auto* line = static_cast<const DialogueNode*>(loaded->getNode("line"));
    EXPECT_EQ(line->getSpeakerName(), "Guide");
    EXPECT_EQ(line->getSpeakerEmotion(), "happy");
    EXPECT_TRUE(line->getWaitForInput());
    EXPECT_TRUE(line->isBreakpoint());
    EXPECT_EQ(line->getName(), "Greeting");

    auto* choice = static_cast<const ChoiceNode*>(loaded->getNode("choice"));
    ASSERT_EQ(choice->getChoices().size(), 2u);
    EXPECT_EQ(choice->getChoices()[0].setValue, Value::String("west"));
    EXPECT_EQ(choice->getChoices()[1].conditionVariable, "brave");
    EXPECT_EQ(choice->getDefaultIndex(), 1);
    EXPECT_TRUE(choice->getShuffle());
    EXPECT_NE(choice->getOutputPort("right"), nullptr);

    auto* cond = static_cast<const ConditionNode*>(loaded->getNode("cond"));
    EXPECT_EQ(cond->getLogic(), ConditionLogic::Or);
    ASSERT_EQ(cond->getConditions().size(), 1u);
    EXPECT_EQ(cond->getConditions()[0].op, ConditionOperator::GreaterThan);

    auto* var = static_cast<const VariableNode*>(loaded->getNode("var"));
    ASSERT_EQ(var->getOperations().size(), 2u);
    EXPECT_EQ(var->getOperations()[1].op, VariableOpType::Random);
    EXPECT_EQ(var->getOperations()[1].value, "1,6");

    auto* wait = static_cast<const WaitNode*>(loaded->getNode("wait"));
    EXPECT_EQ(wait->getWaitType(), WaitType::Condition);
    EXPECT_EQ(wait->getConditionValue(), "15");

    auto* cut = static_cast<const CutsceneNode*>(loaded->getNode("cut"));
    EXPECT_EQ(cut->getCutsceneType(), CutsceneType::Video);
    EXPECT_FALSE(cut->isSkippable());

    auto* audio = static_cast<const AudioNode*>(loaded->getNode("audio"));
    EXPECT_EQ(audio->getAction(), AudioAction::FadeIn);
    EXPECT_TRUE(audio->getLoop());
    EXPECT_EQ(audio->getChannel(), "bgm");

    auto* ev = static_cast<const EventNode*>(loaded->getNode("ev"));
    ASSERT_EQ(ev->getParams().size(), 1u);
    EXPECT_EQ(ev->getParams()[0].value, "north");
    EXPECT_FLOAT_EQ(ev->getTimeout(), 5.0f);

    auto* end = static_cast<const EndNode*>(loaded->getNode("end"));
    EXPECT_EQ(end->getEndType(), EndType::Checkpoint);

    EXPECT_TRUE(loaded->validate().empty());
}

TEST_F(SaveLoadTest, GraphBufferRejectsGarbage) {
    std::vector<std::string> errors;
    const uint8_t tiny[] = {1, 2, 3};
    EXPECT_EQ(loadGraphBuffer(tiny, sizeof(tiny), registry, errors), nullptr);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Graph buffer is too small");

    errors.clear();
    std::vector<uint8_t> junk(64, 0xAB);
    EXPECT_EQ(loadGraphBuffer(junk.data(), junk.size(), registry, errors), nullptr);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("YGRF"), std::string::npos);
}

TEST_F(SaveLoadTest, GraphFileMissing) {
    std::vector<std::string> errors;
    EXPECT_EQ(loadGraphFile("does_not_exist.ygb", registry, errors), nullptr);
    ASSERT_FALSE(errors.empty());
    EXPECT_NE(errors.back().find("Cannot read graph file"), std::string::npos);
}

namespace {

class MarkerNode : public Node {
public:
    explicit MarkerNode(const std::string& id) : Node(id) {
        addInputPort("Input", "input");
        addOutputPort("Output", "output");
    }
    NodeType getType() const override { return NodeType::Custom; }
    const char* getTypeName() const override { return "Marker"; }
    const char* getCategory() const override { return "Custom"; }
    NodeResult execute(ExecutionContext&) const override { return NodeResult::Continue(); }
};

} // namespace

TEST_F(SaveLoadTest, CustomNodeTypeNeedsRegistration) {
    Graph graph("custom", "Custom");
    addNode<StartNode>(graph, "start");
    addNode<MarkerNode>(graph, "mark");
    connect(graph, "start", "mark");
    auto buf = buildGraphBuffer(graph);

    std::vector<std::string> errors;
    EXPECT_EQ(loadGraphBuffer(buf.data(), buf.size(), registry, errors), nullptr);
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0], "Unknown node type 'Marker' for node mark");

    errors.clear();
    registry.registerType<MarkerNode>("Marker");
    auto loaded = loadGraphBuffer(buf.data(), buf.size(), registry, errors);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(loaded->getNode("mark")->getType(), NodeType::Custom);
    EXPECT_EQ(loaded->getConnections().size(), 1u);
}

TEST_F(SaveLoadTest, GraphBufferRejectsOutOfRangeEnums) {
    Graph graph("enums", "Enums");
    addNode<StartNode>(graph, "start");
    addNode<AudioNode>(graph, "sfx")->setAudioType(static_cast<AudioType>(200));
    addNode<ConditionNode>(graph, "cond")->addCondition("x", static_cast<ConditionOperator>(9), "");
    addNode<EndNode>(graph, "end")->setEndType(EndType::Transition);
    graph.addVariable({"mode", static_cast<VariableType>(7), Value::None()});
    auto buf = buildGraphBuffer(graph);

    std::vector<std::string> errors;
    EXPECT_EQ(loadGraphBuffer(buf.data(), buf.size(), registry, errors), nullptr);
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "Invalid AudioType value -56 for node sfx");
    EXPECT_EQ(errors[1], "Invalid ConditionOperator value 9 for node cond");
    EXPECT_EQ(errors[2], "Invalid VariableType value 7 for variable mode");
}

TEST_F(SaveLoadTest, LoadedGraphPlays) {
    auto graph = makeChoiceGraph();
    ASSERT_TRUE(saveGraphFile(*graph, GRAPH_PATH));
    std::vector<std::string> errors;
    auto loaded = loadGraphFile(GRAPH_PATH, registry, errors);
    ASSERT_NE(loaded, nullptr);

    player.play(*loaded);
    ASSERT_EQ(player.getPresentedChoices().size(), 3u);
    player.selectChoice(2);
    EXPECT_EQ(listener.count("enter:lineC"), 1);
    EXPECT_TRUE(listener.lastSuccess);
}

// --- .ygs ---

TEST_F(SaveLoadTest, SnapshotFileKeepsValueTypes) {
    PlayerSnapshot snapshot;
    snapshot.graphId = "g";
    snapshot.currentNodeId = "n";
    snapshot.variables["b"] = Value::Bool(true);
    snapshot.variables["i"] = Value::Int(-12);
    snapshot.variables["f"] = Value::Float(2.25f);
    snapshot.variables["s"] = Value::String("text");
    ASSERT_TRUE(saveSnapshotFile(snapshot, SAVE_PATH));

    PlayerSnapshot loaded;
    ASSERT_TRUE(loadSnapshotFile(SAVE_PATH, loaded));
    EXPECT_EQ(loaded.graphId, "g");
    EXPECT_EQ(loaded.currentNodeId, "n");
    EXPECT_EQ(loaded.variables, snapshot.variables);
}

TEST_F(SaveLoadTest, SaveAndResumeMidDialogue) {
    auto graph = makeLinearGraph(true);
    player.play(*graph);
    ASSERT_EQ(player.getState(), PlayerState::WaitingForInput);
    player.getContext()->setVariable("gold", Value::Int(5));
    ASSERT_TRUE(player.saveStateToFile(SAVE_PATH));

    Player restored;
    RecordingListener restoredLog;
    restored.addListener(&restoredLog);
    ASSERT_TRUE(restored.loadStateFromFile(SAVE_PATH, *graph));

    EXPECT_EQ(restored.getState(), PlayerState::WaitingForInput);
    EXPECT_EQ(restored.getCurrentNode()->getId(), "line");
    EXPECT_EQ(restored.getContext()->getInt("gold"), 5);
    EXPECT_EQ(restoredLog.entered(), (std::vector<std::string>{"line"}));

    EXPECT_TRUE(restored.sendInput());
    EXPECT_EQ(restored.getState(), PlayerState::Complete);
    EXPECT_TRUE(restoredLog.lastSuccess);
}

TEST_F(SaveLoadTest, SaveAtChoicePoint) {
    auto graph = makeChoiceGraph();
    player.play(*graph);
    ASSERT_TRUE(player.saveStateToFile(SAVE_PATH));

    Player restored;
    ASSERT_TRUE(restored.loadStateFromFile(SAVE_PATH, *graph));
    ASSERT_EQ(restored.getPresentedChoices().size(), 3u);
    EXPECT_TRUE(restored.selectChoice(1));
    EXPECT_EQ(restored.getContext()->getInt("choice_choice", -1), 1);
}

TEST_F(SaveLoadTest, LoadStateRejectsOtherGraph) {
    auto linear = makeLinearGraph(true);
    auto choices = makeChoiceGraph();
    player.play(*linear);
    PlayerSnapshot snapshot = player.saveState();

    Player other;
    RecordingListener otherLog;
    other.addListener(&otherLog);
    EXPECT_FALSE(other.loadState(snapshot, *choices));
    ASSERT_EQ(otherLog.errors.size(), 1u);
    EXPECT_NE(otherLog.errors[0].find("belongs to graph 'linear'"), std::string::npos);
    EXPECT_EQ(other.getState(), PlayerState::Idle);
}

TEST_F(SaveLoadTest, LoadStateMissingNode) {
    auto graph = makeLinearGraph();
    PlayerSnapshot snapshot;
    snapshot.graphId = "linear";
    snapshot.currentNodeId = "ghost";
    EXPECT_FALSE(player.loadState(snapshot, *graph));
    EXPECT_EQ(listener.errors.back(), "Saved node not found: ghost");
}

TEST_F(SaveLoadTest, LoadStateWithoutNodeStartsAtStart) {
    auto graph = makeLinearGraph(true);
    PlayerSnapshot snapshot;
    snapshot.graphId = "linear";
    snapshot.variables["gold"] = Value::Int(3);
    ASSERT_TRUE(player.loadState(snapshot, *graph));
    EXPECT_EQ(listener.entered(), (std::vector<std::string>{"start", "line"}));
    EXPECT_EQ(player.getContext()->getInt("gold"), 3);
}

TEST_F(SaveLoadTest, CorruptSaveFile) {
    writeGarbage(SAVE_PATH);
    auto graph = makeLinearGraph();
    EXPECT_FALSE(player.loadStateFromFile(SAVE_PATH, *graph));
    ASSERT_EQ(listener.errors.size(), 1u);
    EXPECT_EQ(listener.errors[0], std::string("Failed to load save file: ") + SAVE_PATH);
}

TEST_F(SaveLoadTest, SaveWithoutRunFails) {
    EXPECT_FALSE(player.saveStateToFile(SAVE_PATH));
}
