#pragma once
#include "yeon_graph.h"
#include "yeon_graph_cache.h"
#include "yeon_context.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace Yeon {

class ChoiceNode;

enum class PlayerState {
    Idle,
    Running,
    Paused,
    Waiting,             // 시간 대기
    WaitingForInput,
    WaitingForCondition,
    Complete
};

const char* playerStateName(PlayerState state);

// --- Player 이벤트 수신 ---
class PlayerListener {
public:
    virtual ~PlayerListener() = default;

    virtual void onStoryStart(const Graph& graph) { (void)graph; }
    virtual void onNodeEnter(const Node& node) { (void)node; }
    virtual void onNodeExit(const Node& node) { (void)node; }
    virtual void onStoryEnd(const Graph& graph, bool success) { (void)graph; (void)success; }
    virtual void onError(const std::string& message) { (void)message; }
    virtual void onStoryEvent(const StoryEvent& event) { (void)event; }
};

// 표시된 선택지 (필터/셔플 후). declaredIndex는 노드의 원래 선택지 인덱스
struct PresentedChoice {
    int declaredIndex = -1;
    std::string portId;
    std::string text;
};

enum class SuspensionKind { None, Time, Condition, Input, Choice };

// 대기 중인 중단 지점 기록
struct Suspension {
    SuspensionKind kind = SuspensionKind::None;
    std::string portId;               // 재개 시 따라갈 선언 포트
    double deadline = 0.0;            // Time: run clock 기준
    std::function<bool()> condition;  // Condition
    std::vector<PresentedChoice> choices;
    bool hasTimeout = false;          // Choice / Condition 타임아웃
    double timeoutAt = 0.0;
    std::string timeoutPortId;        // Condition 타임아웃 시 포트
};

// --- Player (traversal state machine) ---
// 실행 1회 = Player 1개 + ExecutionContext 1개. Graph/GraphCache는 읽기 전용 공유.
class Player {
public:
    Player() = default;
    ~Player() = default;

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // 실행 시작. 시작 노드를 못 찾으면 onError 후 false
    bool play(const Graph& graph);
    bool play(const Graph& graph, const std::string& startNodeId);
    bool play(const Graph& graph, const GraphCache& cache, const std::string& startNodeId = "");

    // 현재 노드 onExit 1회 + onStoryEnd(false). 실행 중이 아니면 무시
    void stop();
    void pause();
    void resume();

    // 진행 중인 실행을 버리고 같은 컨텍스트로 nodeId에서 다시 시작 (onStoryEnd 없음)
    bool jumpToNode(const std::string& nodeId);

    // 호스트 tick. 대기 시간/조건/선택지 타임아웃 처리
    void tick(float deltaSeconds);

    // WaitForInput 재개. 입력 대기 중이 아니면 false
    bool sendInput();
    bool selectChoice(int presentedIndex);
    bool selectPort(const std::string& portId);

    PlayerState getState() const { return state_; }
    bool isActive() const { return state_ != PlayerState::Idle && state_ != PlayerState::Complete; }
    bool isComplete() const { return state_ == PlayerState::Complete; }
    bool isWaitingForInput() const { return state_ == PlayerState::WaitingForInput; }

    const Graph* getGraph() const { return graph_; }
    const GraphCache* getCache() const { return cache_; }
    const Node* getCurrentNode() const { return currentNode_; }
    ExecutionContext* getContext() { return context_.get(); }
    const ExecutionContext* getContext() const { return context_.get(); }
    const Suspension& getSuspension() const { return suspension_; }
    const std::vector<PresentedChoice>& getPresentedChoices() const { return suspension_.choices; }
    double getRunTime() const { return clock_; }

    // Listener (소유하지 않음)
    void addListener(PlayerListener* listener);
    void removeListener(PlayerListener* listener);

    // 설정
    void setDebugMode(bool enabled) { debugMode_ = enabled; }
    bool isDebugMode() const { return debugMode_; }
    void setMaxStepsPerTick(int steps) { maxStepsPerTick_ = steps < 0 ? 0 : steps; }
    int getMaxStepsPerTick() const { return maxStepsPerTick_; }
    void setStoreKind(StoreKind kind) { storeKind_ = kind; }
    StoreKind getStoreKind() const { return storeKind_; }
    void setSeed(uint32_t seed);

    // Save/Load
    PlayerSnapshot saveState() const;
    bool loadState(const PlayerSnapshot& snapshot, const Graph& graph);
    bool saveStateToFile(const std::string& filepath) const;
    bool loadStateFromFile(const std::string& filepath, const Graph& graph);

private:
    enum class Phase { Enter, Execute, Suspended };

    bool startRun(const Graph& graph, const GraphCache& cache, const Node* start,
                  const VariableSnapshot* restored);
    void advance();
    void enterNode(uint64_t gen);
    void executeNode(uint64_t gen);
    void finishNode(uint64_t gen, const std::string& portId);
    void exitNode();
    void complete(bool success);
    void resumeFromSuspension(std::string portId);
    void presentChoices(const ChoiceNode& node);
    void resolveChoice(int declaredIndex);
    void applyChoiceTimeout();
    void reportError(const std::string& message);
    void trace(const std::string& message) const;

    template <typename F>
    void notify(F&& fn) {
        auto listeners = listeners_;  // 콜백 중 추가/제거 허용
        for (auto* listener : listeners) fn(*listener);
    }

    const Graph* graph_ = nullptr;
    const GraphCache* cache_ = nullptr;
    std::unique_ptr<GraphCache> ownedCache_;
    std::unique_ptr<ExecutionContext> context_;
    // 콜백 안에서 재시작된 경우 호출 스택이 풀릴 때까지 유지
    std::unique_ptr<GraphCache> retiredCache_;
    std::unique_ptr<ExecutionContext> retiredContext_;

    PlayerState state_ = PlayerState::Idle;
    PlayerState resumeState_ = PlayerState::Running;
    Phase phase_ = Phase::Enter;
    const Node* currentNode_ = nullptr;
    bool nodeEntered_ = false;  // onEnter 후 onExit 전
    Suspension suspension_;
    double clock_ = 0.0;
    uint64_t generation_ = 0;   // 실행이 버려질 때마다 증가

    std::vector<PlayerListener*> listeners_;

    bool debugMode_ = false;
    int maxStepsPerTick_ = 0;
    StoreKind storeKind_ = StoreKind::Map;
    bool hasSeed_ = false;
    uint32_t seed_ = 0;
};

} // namespace Yeon
