#include "yeon_player.h"
#include "yeon_nodes.h"
#include "yeon_graph_file.h"
#include <algorithm>
#include <iostream>

namespace Yeon {

const char* playerStateName(PlayerState state) {
    switch (state) {
        case PlayerState::Idle:                return "Idle";
        case PlayerState::Running:             return "Running";
        case PlayerState::Paused:              return "Paused";
        case PlayerState::Waiting:             return "Waiting";
        case PlayerState::WaitingForInput:     return "WaitingForInput";
        case PlayerState::WaitingForCondition: return "WaitingForCondition";
        case PlayerState::Complete:            return "Complete";
    }
    return "Idle";
}

// --- 시작 ---
bool Player::play(const Graph& graph) {
    return play(graph, std::string());
}

bool Player::play(const Graph& graph, const std::string& startNodeId) {
    stop();

    auto cache = std::make_unique<GraphCache>(graph);
    const Node* start = startNodeId.empty() ? cache->getStartNode() : cache->getNode(startNodeId);
    if (!start) {
        reportError(startNodeId.empty() ? "Graph '" + graph.getId() + "' has no Start node"
                                        : "Start node not found: " + startNodeId);
        return false;
    }

    retiredCache_ = std::move(ownedCache_);
    ownedCache_ = std::move(cache);
    return startRun(graph, *ownedCache_, start, nullptr);
}

bool Player::play(const Graph& graph, const GraphCache& cache, const std::string& startNodeId) {
    stop();

    if (!cache.isBuilt() || cache.getGraph() != &graph) {
        reportError("Lookup cache was not built for graph '" + graph.getId() + "'");
        return false;
    }

    const Node* start = startNodeId.empty() ? cache.getStartNode() : cache.getNode(startNodeId);
    if (!start) {
        reportError(startNodeId.empty() ? "Graph '" + graph.getId() + "' has no Start node"
                                        : "Start node not found: " + startNodeId);
        return false;
    }

    retiredCache_ = std::move(ownedCache_);
    return startRun(graph, cache, start, nullptr);
}

bool Player::startRun(const Graph& graph, const GraphCache& cache, const Node* start,
                      const VariableSnapshot* restored) {
    graph_ = &graph;
    cache_ = &cache;

    retiredContext_ = std::move(context_);
    context_ = std::make_unique<ExecutionContext>(&graph, storeKind_);
    if (hasSeed_) context_->setSeed(seed_);
    if (restored) context_->loadState(*restored);
    context_->setEventCallback([this](const StoryEvent& event) {
        notify([&](PlayerListener& l) { l.onStoryEvent(event); });
    });

    ++generation_;
    uint64_t gen = generation_;
    clock_ = 0.0;
    suspension_ = Suspension();
    nodeEntered_ = false;
    currentNode_ = start;
    phase_ = Phase::Enter;
    state_ = PlayerState::Running;

    trace("Story started: " + graph.getId() + " at " + start->getId());
    notify([&](PlayerListener& l) { l.onStoryStart(graph); });
    if (gen != generation_) return true;

    advance();
    return true;
}

// --- 종료/일시정지 ---
void Player::stop() {
    if (!isActive()) return;

    ++generation_;
    uint64_t gen = generation_;
    exitNode();
    if (gen != generation_) return;
    complete(false);
}

void Player::pause() {
    if (!isActive() || state_ == PlayerState::Paused) return;
    resumeState_ = state_;
    state_ = PlayerState::Paused;
    context_->setPaused(true);
    trace("Paused at " + (currentNode_ ? currentNode_->getId() : std::string()));
}

void Player::resume() {
    if (state_ != PlayerState::Paused) return;
    state_ = resumeState_;
    context_->setPaused(false);
    trace("Resumed");
    if (state_ == PlayerState::Running) {
        advance();
    }
}

bool Player::jumpToNode(const std::string& nodeId) {
    if (!context_ || !cache_) {
        reportError("Cannot jump to '" + nodeId + "': no story is loaded");
        return false;
    }
    const Node* target = cache_->getNode(nodeId);
    if (!target) {
        reportError("Jump target not found: " + nodeId);
        return false;
    }

    ++generation_;
    uint64_t gen = generation_;
    exitNode();
    if (gen != generation_) return true;

    suspension_ = Suspension();
    context_->setPaused(false);
    currentNode_ = target;
    phase_ = Phase::Enter;
    state_ = PlayerState::Running;
    trace("Jump to node: " + nodeId);
    advance();
    return true;
}

// --- tick ---
void Player::tick(float deltaSeconds) {
    if (!isActive() || state_ == PlayerState::Paused) return;
    if (deltaSeconds > 0.0f) clock_ += deltaSeconds;

    switch (state_) {
        case PlayerState::Running:
            advance();
            break;
        case PlayerState::Waiting:
            if (clock_ >= suspension_.deadline) {
                std::string port = suspension_.portId;
                resumeFromSuspension(port);
            }
            break;
        case PlayerState::WaitingForCondition:
            if (!suspension_.condition || suspension_.condition()) {
                std::string port = suspension_.portId;
                resumeFromSuspension(port);
            } else if (suspension_.hasTimeout && clock_ >= suspension_.timeoutAt) {
                std::string port = suspension_.timeoutPortId;
                trace("Wait timeout on node '" + currentNode_->getId() + "'");
                resumeFromSuspension(port);
            }
            break;
        case PlayerState::WaitingForInput:
            if (suspension_.kind == SuspensionKind::Choice && suspension_.hasTimeout &&
                clock_ >= suspension_.timeoutAt) {
                applyChoiceTimeout();
            }
            break;
        default:
            break;
    }
}

// --- 입력 ---
bool Player::sendInput() {
    if (state_ != PlayerState::WaitingForInput) return false;
    if (suspension_.kind == SuspensionKind::Choice) {
        reportError("Choice node '" + currentNode_->getId() + "' requires a selection");
        return false;
    }
    std::string port = suspension_.portId;
    resumeFromSuspension(port);
    return true;
}

bool Player::selectChoice(int presentedIndex) {
    if (state_ != PlayerState::WaitingForInput || suspension_.kind != SuspensionKind::Choice) {
        return false;
    }
    if (presentedIndex < 0 || presentedIndex >= static_cast<int>(suspension_.choices.size())) {
        reportError("Invalid choice index: " + std::to_string(presentedIndex));
        return false;
    }
    int declared = suspension_.choices[static_cast<size_t>(presentedIndex)].declaredIndex;
    resolveChoice(declared);
    return true;
}

bool Player::selectPort(const std::string& portId) {
    if (state_ != PlayerState::WaitingForInput) return false;

    if (suspension_.kind == SuspensionKind::Choice) {
        for (const auto& choice : suspension_.choices) {
            if (choice.portId == portId) {
                int declared = choice.declaredIndex;
                resolveChoice(declared);
                return true;
            }
        }
        reportError("Choice port not available: " + portId);
        return false;
    }

    if (!currentNode_->getOutputPort(portId)) {
        reportError("Output port not found on node '" + currentNode_->getId() + "': " + portId);
        return false;
    }
    resumeFromSuspension(portId);
    return true;
}

// --- 루프 ---
void Player::advance() {
    uint64_t gen = generation_;
    int steps = 0;

    while (state_ == PlayerState::Running && gen == generation_) {
        if (phase_ == Phase::Enter) {
            if (maxStepsPerTick_ > 0 && steps >= maxStepsPerTick_) {
                trace("Step budget reached, continuing next tick");
                return;
            }
            ++steps;
            enterNode(gen);
        } else if (phase_ == Phase::Execute) {
            executeNode(gen);
        } else {
            return;
        }
    }
}

void Player::enterNode(uint64_t gen) {
    const Node* node = currentNode_;

    context_->clearTempData();
    context_->setCurrentNode(node);
    nodeEntered_ = true;
    phase_ = Phase::Execute;
    node->onEnter(*context_);
    if (gen != generation_) return;

    trace(std::string("Enter node: ") + node->getId() + " (" + node->getTypeName() + ")");
    notify([&](PlayerListener& l) { l.onNodeEnter(*node); });
    if (gen != generation_ || state_ != PlayerState::Running) return;

    if (debugMode_ && node->isBreakpoint()) {
        std::cerr << "[Yeon] Breakpoint hit: " << node->getId() << std::endl;
        resumeState_ = PlayerState::Running;
        state_ = PlayerState::Paused;
        context_->setPaused(true);
    }
}

void Player::executeNode(uint64_t gen) {
    const Node* node = currentNode_;
    NodeResult result = node->execute(*context_);
    if (gen != generation_) return;

    // 실행 도중 리스너가 pause()를 불렀으면 재개 후 상태로 기록
    auto suspend = [this](PlayerState next) {
        phase_ = Phase::Suspended;
        if (state_ == PlayerState::Paused) {
            resumeState_ = next;
        } else {
            state_ = next;
        }
    };

    switch (result.type) {
        case ResultType::Continue:
            finishNode(gen, result.portId);
            break;

        case ResultType::Wait: {
            suspension_ = Suspension();
            suspension_.kind = SuspensionKind::Time;
            suspension_.portId = result.portId;
            suspension_.deadline = clock_ + std::max(0.0f, result.waitSeconds);
            suspend(PlayerState::Waiting);
            break;
        }

        case ResultType::WaitForCondition:
            if (!result.condition || result.condition()) {
                finishNode(gen, result.portId);
                break;
            }
            suspension_ = Suspension();
            suspension_.kind = SuspensionKind::Condition;
            suspension_.portId = result.portId;
            suspension_.condition = std::move(result.condition);
            if (result.timeoutSeconds > 0.0f) {
                suspension_.hasTimeout = true;
                suspension_.timeoutAt = clock_ + result.timeoutSeconds;
                suspension_.timeoutPortId = result.timeoutPortId;
            }
            suspend(PlayerState::WaitingForCondition);
            break;

        case ResultType::WaitForInput: {
            if (auto* choiceNode = dynamic_cast<const ChoiceNode*>(node)) {
                presentChoices(*choiceNode);
                break;
            }
            suspension_ = Suspension();
            suspension_.kind = SuspensionKind::Input;
            suspension_.portId = result.portId;
            suspend(PlayerState::WaitingForInput);
            break;
        }

        case ResultType::End:
            exitNode();
            if (gen != generation_) return;
            complete(true);
            break;
    }
}

void Player::finishNode(uint64_t gen, const std::string& portId) {
    const Node* node = currentNode_;
    std::string resolved = node->resolveOutputPort(*context_, portId);

    exitNode();
    if (gen != generation_) return;

    const Node* next = cache_->getConnectedNode(node->getId(), resolved);
    if (!next) {
        trace("Dead end at node: " + node->getId() + " port '" + resolved + "'");
        complete(context_->isComplete());
        return;
    }

    currentNode_ = next;
    phase_ = Phase::Enter;
}

void Player::exitNode() {
    if (!nodeEntered_ || !currentNode_) return;
    nodeEntered_ = false;

    const Node* node = currentNode_;
    node->onExit(*context_);
    notify([&](PlayerListener& l) { l.onNodeExit(*node); });
}

void Player::complete(bool success) {
    suspension_ = Suspension();
    phase_ = Phase::Suspended;
    state_ = PlayerState::Complete;
    context_->setPaused(false);

    trace(std::string("Story ended (") + (success ? "success" : "incomplete") + ")");
    const Graph& graph = *graph_;
    notify([&](PlayerListener& l) { l.onStoryEnd(graph, success); });
}

void Player::resumeFromSuspension(std::string portId) {
    uint64_t gen = generation_;
    suspension_ = Suspension();
    state_ = PlayerState::Running;

    finishNode(gen, portId);
    if (gen != generation_) return;
    advance();
}

// --- 선택지 ---
void Player::presentChoices(const ChoiceNode& node) {
    std::vector<int> indices = node.getAvailableIndices(*context_);
    if (indices.empty()) {
        trace("Choice node '" + node.getId() + "' has no available choices");
        finishNode(generation_, "");
        return;
    }
    if (node.getShuffle()) {
        std::shuffle(indices.begin(), indices.end(), context_->getRng());
    }

    Suspension suspension;
    suspension.kind = SuspensionKind::Choice;
    const auto& choices = node.getChoices();
    for (int idx : indices) {
        PresentedChoice presented;
        presented.declaredIndex = idx;
        presented.portId = choices[static_cast<size_t>(idx)].id;
        presented.text = choices[static_cast<size_t>(idx)].text;
        suspension.choices.push_back(std::move(presented));
    }
    if (node.getTimeout() > 0.0f) {
        suspension.hasTimeout = true;
        suspension.timeoutAt = clock_ + node.getTimeout();
    }
    suspension_ = std::move(suspension);

    phase_ = Phase::Suspended;
    if (state_ == PlayerState::Paused) {
        resumeState_ = PlayerState::WaitingForInput;
    } else {
        state_ = PlayerState::WaitingForInput;
    }
}

void Player::resolveChoice(int declaredIndex) {
    auto* node = dynamic_cast<const ChoiceNode*>(currentNode_);
    if (!node) return;

    std::string port = node->applyChoice(*context_, declaredIndex);
    trace("Choice selected: " + std::to_string(declaredIndex) + " -> " + port);
    resumeFromSuspension(port);
}

void Player::applyChoiceTimeout() {
    auto* node = dynamic_cast<const ChoiceNode*>(currentNode_);
    if (!node) return;

    // 기본 인덱스가 표시 중이면 그것, 아니면 선언 순서상 첫 번째 표시 선택지
    int declared = -1;
    int defaultIndex = node->getDefaultIndex();
    for (const auto& choice : suspension_.choices) {
        if (choice.declaredIndex == defaultIndex) {
            declared = defaultIndex;
            break;
        }
    }
    if (declared < 0) {
        for (const auto& choice : suspension_.choices) {
            if (declared < 0 || choice.declaredIndex < declared) declared = choice.declaredIndex;
        }
    }

    trace("Choice timeout on node '" + node->getId() + "', selecting " + std::to_string(declared));
    if (declared < 0) {
        resumeFromSuspension("");
        return;
    }
    resolveChoice(declared);
}

// --- Listener ---
void Player::addListener(PlayerListener* listener) {
    if (!listener) return;
    if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) return;
    listeners_.push_back(listener);
}

void Player::removeListener(PlayerListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

void Player::setSeed(uint32_t seed) {
    hasSeed_ = true;
    seed_ = seed;
    if (context_) context_->setSeed(seed);
}

// --- Save/Load ---
PlayerSnapshot Player::saveState() const {
    PlayerSnapshot snapshot;
    if (graph_) snapshot.graphId = graph_->getId();
    if (currentNode_) snapshot.currentNodeId = currentNode_->getId();
    if (context_) snapshot.variables = context_->saveState();
    return snapshot;
}

bool Player::loadState(const PlayerSnapshot& snapshot, const Graph& graph) {
    if (!snapshot.graphId.empty() && snapshot.graphId != graph.getId()) {
        reportError("Save state belongs to graph '" + snapshot.graphId + "', not '" + graph.getId() + "'");
        return false;
    }

    stop();

    auto cache = std::make_unique<GraphCache>(graph);
    const Node* start = snapshot.currentNodeId.empty() ? cache->getStartNode()
                                                       : cache->getNode(snapshot.currentNodeId);
    if (!start) {
        reportError("Saved node not found: " + snapshot.currentNodeId);
        return false;
    }

    retiredCache_ = std::move(ownedCache_);
    ownedCache_ = std::move(cache);
    return startRun(graph, *ownedCache_, start, &snapshot.variables);
}

bool Player::saveStateToFile(const std::string& filepath) const {
    if (!context_) {
        std::cerr << "[Yeon] No story loaded" << std::endl;
        return false;
    }
    return saveSnapshotFile(saveState(), filepath);
}

bool Player::loadStateFromFile(const std::string& filepath, const Graph& graph) {
    PlayerSnapshot snapshot;
    if (!loadSnapshotFile(filepath, snapshot)) {
        reportError("Failed to load save file: " + filepath);
        return false;
    }
    return loadState(snapshot, graph);
}

// --- 진단 ---
void Player::reportError(const std::string& message) {
    std::cerr << "[Yeon] " << message << std::endl;
    notify([&](PlayerListener& l) { l.onError(message); });
}

void Player::trace(const std::string& message) const {
    if (debugMode_) {
        std::cerr << "[Yeon] " << message << std::endl;
    }
}

} // namespace Yeon
