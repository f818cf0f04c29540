#pragma once
#include "yeon_value.h"
#include "yeon_variable_store.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <random>
#include <unordered_map>
#include <utility>

namespace Yeon {

class Graph;
class Node;

// 노드가 호스트로 내보내는 이벤트 (오디오 재생, 게임 이벤트 등)
struct StoryEvent {
    std::string name;
    std::string category;
    std::string sourceNodeId;
    std::vector<std::pair<std::string, std::string>> params;
};

// 변수 저장소의 평면 스냅샷 (temp/history 제외)
using VariableSnapshot = std::unordered_map<std::string, Value>;

// 저장 파일 단위: 변수 스냅샷 + 현재 노드
struct PlayerSnapshot {
    std::string graphId;
    std::string currentNodeId;
    VariableSnapshot variables;
};

// --- 실행 컨텍스트 (실행 1회당 하나) ---
class ExecutionContext {
public:
    using VariableChangedCallback =
        std::function<void(const std::string& name, const Value& oldValue, const Value& newValue)>;
    using NodeChangedCallback = std::function<void(const Node* node)>;
    using StoryEventCallback = std::function<void(const StoryEvent& event)>;

    explicit ExecutionContext(const Graph* graph = nullptr, StoreKind kind = StoreKind::Map);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    const Graph* getGraph() const { return graph_; }
    StoreKind getStoreKind() const { return storeKind_; }

    // --- Variables ---
    void setVariable(const std::string& name, const Value& value);
    // 저장된 값을 defaultValue의 타입으로 변환. 없거나 변환 실패면 defaultValue
    Value getVariable(const std::string& name, const Value& defaultValue = Value()) const;
    bool tryGetVariable(const std::string& name, Value& out) const;
    bool hasVariable(const std::string& name) const;
    std::vector<std::string> getVariableNames() const;

    int32_t getInt(const std::string& name, int32_t defaultValue = 0) const;
    float getFloat(const std::string& name, float defaultValue = 0.0f) const;
    bool getBool(const std::string& name, bool defaultValue = false) const;
    std::string getString(const std::string& name, const std::string& defaultValue = "") const;

    // Int는 정수 덧셈, Float는 실수 덧셈. 없으면 0에서 시작
    void incrementVariable(const std::string& name, int32_t amount = 1);

    // 없는 변수/변환 실패는 false
    bool evaluateCondition(const std::string& name, ConditionOperator op, const Value& compareValue) const;

    // --- Temp data (노드 진입마다 초기화) ---
    void setTempData(const std::string& key, const Value& value);
    Value getTempData(const std::string& key, const Value& defaultValue = Value()) const;
    bool hasTempData(const std::string& key) const;
    bool removeTempData(const std::string& key);
    void clearTempData() { tempData_.clear(); }

    // --- History ---
    void pushHistory(const std::string& nodeId);
    std::string popHistory();        // 비어 있으면 ""
    std::string peekHistory() const; // 비어 있으면 ""
    void clearHistory() { history_.clear(); }
    const std::vector<std::string>& getHistory() const { return history_; }

    // --- Current node ---
    void setCurrentNode(const Node* node);
    const Node* getCurrentNode() const { return currentNode_; }
    std::string getCurrentNodeId() const;

    // --- Flags ---
    bool isPaused() const { return paused_; }
    void setPaused(bool paused) { paused_ = paused; }
    bool isComplete() const { return complete_; }
    void markComplete() { complete_ = true; }

    // --- State ---
    VariableSnapshot saveState() const;
    void loadState(const VariableSnapshot& snapshot);
    void reset();

    // --- RNG ---
    void setSeed(uint32_t seed) { rng_.seed(seed); }
    std::mt19937& getRng() { return rng_; }

    // --- Callbacks ---
    void setVariableChangedCallback(VariableChangedCallback cb) { onVariableChanged_ = std::move(cb); }
    void setNodeChangedCallback(NodeChangedCallback cb) { onNodeChanged_ = std::move(cb); }
    void setEventCallback(StoryEventCallback cb) { onStoryEvent_ = std::move(cb); }
    void emitEvent(const StoryEvent& event) const;

private:
    void seedFromGraph();

    const Graph* graph_ = nullptr;
    StoreKind storeKind_ = StoreKind::Map;
    std::unique_ptr<VariableStore> variables_;
    std::unordered_map<std::string, Value> tempData_;
    std::vector<std::string> history_;
    const Node* currentNode_ = nullptr;
    bool paused_ = false;
    bool complete_ = false;
    std::mt19937 rng_;

    VariableChangedCallback onVariableChanged_;
    NodeChangedCallback onNodeChanged_;
    StoryEventCallback onStoryEvent_;
};

} // namespace Yeon
