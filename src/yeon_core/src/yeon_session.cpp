#include "yeon_session.h"
#include "yeon_graph_file.h"
#include <algorithm>
#include <iostream>

namespace Yeon {

// 실행 하나: Player + 세션으로 이벤트를 돌려주는 리스너
struct Session::Run : public PlayerListener {
    Session& session;
    Player player;

    explicit Run(Session& owner) : session(owner) {}

    void onStoryEnd(const Graph&, bool) override {
        session.onRunFinished(player);
    }

    void onStoryEvent(const StoryEvent& event) override {
        if (auto* context = player.getContext()) {
            session.dispatchEvent(event, *context);
        }
    }
};

Session::Session() = default;

Session::~Session() {
    // 리스너 콜백이 세션으로 돌아오지 않도록 먼저 분리
    for (auto& run : runs_) {
        run->player.removeListener(run.get());
    }
    runs_.clear();
}

// --- Graph ---
const Graph* Session::addGraph(std::unique_ptr<Graph> graph) {
    if (!graph) return nullptr;
    const std::string id = graph->getId();
    if (graphs_.count(id)) {
        std::cerr << "[Yeon] Graph already loaded: " << id << std::endl;
        return nullptr;
    }

    GraphEntry entry;
    entry.cache = std::make_unique<GraphCache>(*graph);
    entry.graph = std::move(graph);
    const Graph* raw = entry.graph.get();
    graphs_.emplace(id, std::move(entry));
    return raw;
}

const Graph* Session::loadGraph(const std::string& filepath) {
    std::vector<std::string> errors;
    auto graph = loadGraphFile(filepath, registry_, errors);
    if (!graph) {
        std::cerr << "[Yeon] Could not load graph: " << filepath << std::endl;
        for (const auto& err : errors) {
            std::cerr << "[Yeon]   " << err << std::endl;
        }
        return nullptr;
    }
    return addGraph(std::move(graph));
}

const Graph* Session::getGraph(const std::string& graphId) const {
    auto it = graphs_.find(graphId);
    return it != graphs_.end() ? it->second.graph.get() : nullptr;
}

const GraphCache* Session::getGraphCache(const std::string& graphId) const {
    auto it = graphs_.find(graphId);
    return it != graphs_.end() ? it->second.cache.get() : nullptr;
}

bool Session::unloadGraph(const std::string& graphId) {
    auto it = graphs_.find(graphId);
    if (it == graphs_.end()) return false;

    const Graph* graph = it->second.graph.get();
    std::vector<const Player*> doomed;
    for (auto& run : runs_) {
        if (run->player.getGraph() == graph) {
            run->player.stop();
            doomed.push_back(&run->player);
        }
    }
    for (const Player* player : doomed) {
        removeRun(player);
    }

    graphs_.erase(it);
    return true;
}

std::vector<std::string> Session::getGraphIds() const {
    std::vector<std::string> ids;
    ids.reserve(graphs_.size());
    for (const auto& pair : graphs_) {
        ids.push_back(pair.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// --- Runs ---
Session::Run& Session::createRun() {
    auto run = std::make_unique<Run>(*this);
    run->player.setDebugMode(debugMode_);
    run->player.setStoreKind(storeKind_);
    if (hasSeed_) run->player.setSeed(seed_);
    run->player.addListener(run.get());
    for (auto* listener : playerListeners_) {
        run->player.addListener(listener);
    }
    runs_.push_back(std::move(run));
    return *runs_.back();
}

void Session::removeRun(const Player* player) {
    if (currentPlayer_ == player) currentPlayer_ = nullptr;
    runs_.erase(std::remove_if(runs_.begin(), runs_.end(),
                               [&](const std::unique_ptr<Run>& run) { return &run->player == player; }),
                runs_.end());
    if (!currentPlayer_) currentPlayer_ = firstActivePlayer();
}

Player* Session::playStory(const std::string& graphId, const std::string& startNodeId) {
    auto it = graphs_.find(graphId);
    if (it == graphs_.end()) {
        std::cerr << "[Yeon] Could not load graph: " << graphId << std::endl;
        return nullptr;
    }

    Run& run = createRun();
    Player* player = &run.player;
    currentPlayer_ = player;

    if (!player->play(*it->second.graph, *it->second.cache, startNodeId)) {
        removeRun(player);
        return nullptr;
    }
    return player;
}

void Session::tick(float deltaSeconds) {
    // tick 중 새 실행이 추가될 수 있으므로 목록을 복사
    std::vector<Player*> players;
    players.reserve(runs_.size());
    for (auto& run : runs_) {
        players.push_back(&run->player);
    }
    for (auto* player : players) {
        player->tick(deltaSeconds);
    }
    reapFinished();
}

void Session::stopAllStories() {
    for (auto& run : runs_) {
        run->player.stop();
    }
    currentPlayer_ = nullptr;
}

size_t Session::getActivePlayerCount() const {
    return static_cast<size_t>(std::count_if(runs_.begin(), runs_.end(),
                                             [](const std::unique_ptr<Run>& run) { return run->player.isActive(); }));
}

Player* Session::firstActivePlayer() const {
    for (const auto& run : runs_) {
        if (run->player.isActive()) return &run->player;
    }
    return nullptr;
}

void Session::onRunFinished(const Player& player) {
    if (currentPlayer_ == &player) {
        currentPlayer_ = firstActivePlayer();
    }
}

void Session::reapFinished() {
    runs_.erase(std::remove_if(runs_.begin(), runs_.end(),
                               [](const std::unique_ptr<Run>& run) { return !run->player.isActive(); }),
                runs_.end());
}

bool Session::sendInput() {
    return currentPlayer_ ? currentPlayer_->sendInput() : false;
}

bool Session::selectChoice(int index) {
    return currentPlayer_ ? currentPlayer_->selectChoice(index) : false;
}

// --- Events ---
void Session::registerEventHandler(EventHandler* handler) {
    if (!handler) return;
    if (std::find(eventHandlers_.begin(), eventHandlers_.end(), handler) != eventHandlers_.end()) return;
    eventHandlers_.push_back(handler);
}

void Session::unregisterEventHandler(EventHandler* handler) {
    eventHandlers_.erase(std::remove(eventHandlers_.begin(), eventHandlers_.end(), handler),
                         eventHandlers_.end());
}

void Session::addPlayerListener(PlayerListener* listener) {
    if (!listener) return;
    if (std::find(playerListeners_.begin(), playerListeners_.end(), listener) != playerListeners_.end()) return;
    playerListeners_.push_back(listener);
}

void Session::removePlayerListener(PlayerListener* listener) {
    playerListeners_.erase(std::remove(playerListeners_.begin(), playerListeners_.end(), listener),
                           playerListeners_.end());
    for (auto& run : runs_) {
        run->player.removeListener(listener);
    }
}

void Session::dispatchEvent(const StoryEvent& event, ExecutionContext& context) {
    auto handlers = eventHandlers_;
    for (auto* handler : handlers) {
        if (handler->canHandle(event)) {
            handler->handleEvent(event, context);
        }
    }
}

// --- Save/Load ---
bool Session::saveGameState(const std::string& filepath) const {
    if (!currentPlayer_ || !currentPlayer_->isActive()) {
        std::cerr << "[Yeon] No active story to save" << std::endl;
        return false;
    }
    return saveSnapshotFile(currentPlayer_->saveState(), filepath);
}

bool Session::loadGameState(const std::string& filepath) {
    PlayerSnapshot snapshot;
    if (!loadSnapshotFile(filepath, snapshot)) return false;

    const Graph* graph = getGraph(snapshot.graphId);
    if (!graph) {
        std::cerr << "[Yeon] Could not load graph: " << snapshot.graphId << std::endl;
        return false;
    }

    stopAllStories();
    reapFinished();

    Run& run = createRun();
    Player* player = &run.player;
    currentPlayer_ = player;
    if (!player->loadState(snapshot, *graph)) {
        removeRun(player);
        return false;
    }
    return true;
}

} // namespace Yeon
