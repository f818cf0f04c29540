#pragma once
#include "yeon_graph.h"
#include "yeon_graph_cache.h"
#include "yeon_player.h"
#include "yeon_node_registry.h"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <cstdint>

namespace Yeon {

// 노드가 내보낸 StoryEvent를 호스트 쪽에서 처리
class EventHandler {
public:
    virtual ~EventHandler() = default;
    virtual bool canHandle(const StoryEvent& event) const = 0;
    // context: 이벤트를 보낸 실행의 컨텍스트 (EventNode::signalComplete 등에 사용)
    virtual void handleEvent(const StoryEvent& event, ExecutionContext& context) = 0;
};

// --- Session ---
// 호스트가 만들고 소유하는 그래프/실행 레지스트리.
// 그래프마다 GraphCache를 하나 만들어 모든 실행이 공유한다.
class Session {
public:
    Session();
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // --- Graph ---
    // 같은 ID가 이미 있으면 nullptr
    const Graph* addGraph(std::unique_ptr<Graph> graph);
    // .ygb 로드 후 등록. 실패 시 nullptr (에러는 stderr)
    const Graph* loadGraph(const std::string& filepath);
    const Graph* getGraph(const std::string& graphId) const;
    const GraphCache* getGraphCache(const std::string& graphId) const;
    // 그 그래프를 쓰는 실행은 모두 stop 후 제거된다. Player 콜백 안에서 호출하지 말 것.
    bool unloadGraph(const std::string& graphId);
    std::vector<std::string> getGraphIds() const;

    NodeRegistry& getRegistry() { return registry_; }

    // --- Runs ---
    Player* playStory(const std::string& graphId, const std::string& startNodeId = "");
    // 모든 실행 tick 후 끝난 실행 정리
    void tick(float deltaSeconds);
    // 모든 실행 stop. 정리는 다음 tick에서
    void stopAllStories();

    Player* getCurrentPlayer() const { return currentPlayer_; }
    size_t getActivePlayerCount() const;
    size_t getPlayerCount() const { return runs_.size(); }

    // 현재 Player로 전달
    bool sendInput();
    bool selectChoice(int index);

    // --- Events / listeners (소유하지 않음) ---
    void registerEventHandler(EventHandler* handler);
    void unregisterEventHandler(EventHandler* handler);
    // 이후 생성되는 모든 Player에 붙는다
    void addPlayerListener(PlayerListener* listener);
    void removePlayerListener(PlayerListener* listener);

    // --- 설정 (이후 생성되는 Player에 적용) ---
    void setDebugMode(bool enabled) { debugMode_ = enabled; }
    void setStoreKind(StoreKind kind) { storeKind_ = kind; }
    void setSeed(uint32_t seed) { hasSeed_ = true; seed_ = seed; }

    // --- Save/Load (.ygs) ---
    bool saveGameState(const std::string& filepath) const;
    bool loadGameState(const std::string& filepath);

private:
    struct Run;
    struct GraphEntry {
        std::unique_ptr<Graph> graph;
        std::unique_ptr<GraphCache> cache;
    };

    Run& createRun();
    void removeRun(const Player* player);
    void onRunFinished(const Player& player);
    void dispatchEvent(const StoryEvent& event, ExecutionContext& context);
    void reapFinished();
    Player* firstActivePlayer() const;

    NodeRegistry registry_;
    std::unordered_map<std::string, GraphEntry> graphs_;
    std::vector<std::unique_ptr<Run>> runs_;
    Player* currentPlayer_ = nullptr;

    std::vector<EventHandler*> eventHandlers_;
    std::vector<PlayerListener*> playerListeners_;

    bool debugMode_ = false;
    StoreKind storeKind_ = StoreKind::Map;
    bool hasSeed_ = false;
    uint32_t seed_ = 0;
};

} // namespace Yeon
