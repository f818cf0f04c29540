#include "yeon_session.h"
#include "yeon_nodes.h"
#include <iostream>
#include <string>
#include <cstdlib>

namespace {

const float TICK_SECONDS = 0.1f;
// 아무도 조건을 만족시키지 않는 대기 상한 (시뮬레이션 시간)
const double MAX_CONDITION_WAIT = 60.0;

void printUsage() {
    std::cout << "Usage: YeonPlayer <story.ygb> [--start <nodeId>] [--debug] [--seed N]" << std::endl;
}

// 대사/이벤트 출력
class ConsoleListener : public Yeon::PlayerListener {
public:
    explicit ConsoleListener(Yeon::Session& session) : session_(session) {}

    void onNodeEnter(const Yeon::Node& node) override {
        auto* dialogue = dynamic_cast<const Yeon::DialogueNode*>(&node);
        if (!dialogue) return;

        Yeon::Player* player = session_.getCurrentPlayer();
        if (!player || !player->getContext()) return;

        std::string text = dialogue->getProcessedText(*player->getContext());
        if (!dialogue->getSpeakerName().empty()) {
            std::cout << dialogue->getSpeakerName() << ": " << text << std::endl;
        } else {
            std::cout << text << std::endl;
        }
        std::cout << std::endl;
    }

    void onStoryEnd(const Yeon::Graph&, bool success) override {
        if (!success) std::cout << "(stopped)" << std::endl;
    }

    void onError(const std::string& message) override {
        std::cerr << "error: " << message << std::endl;
    }

private:
    Yeon::Session& session_;
};

// 콘솔에는 연출이 없으므로 이벤트/컷신은 받는 즉시 완료 처리
class ConsoleEventHandler : public Yeon::EventHandler {
public:
    bool canHandle(const Yeon::StoryEvent&) const override { return true; }

    void handleEvent(const Yeon::StoryEvent& event, Yeon::ExecutionContext& context) override {
        std::cout << "[EVENT] " << event.name << "(";
        for (size_t i = 0; i < event.params.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << event.params[i].first << "=" << event.params[i].second;
        }
        std::cout << ")" << std::endl;
        std::cout << std::endl;

        if (event.name == "StoryCutscene") {
            Yeon::CutsceneNode::signalComplete(context);
        } else if (event.name != "StoryAudio") {
            Yeon::EventNode::signalComplete(context, event.sourceNodeId);
        }
    }
};

int readChoice(size_t count) {
    while (true) {
        std::cout << "> ";
        std::string line;
        if (!std::getline(std::cin, line)) return -1;
        int input = std::atoi(line.c_str());
        if (input >= 1 && input <= static_cast<int>(count)) {
            return input - 1;
        }
        std::cout << "1~" << count << " 사이의 번호를 입력하세요." << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::string filepath;
    std::string startNodeId;
    bool debug = false;
    bool hasSeed = false;
    uint32_t seed = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (arg == "--start" && i + 1 < argc) {
            startNodeId = argv[++i];
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--seed" && i + 1 < argc) {
            hasSeed = true;
            seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (filepath.empty() && arg[0] != '-') {
            filepath = arg;
        } else {
            std::cerr << "error: unknown option '" << arg << "'" << std::endl;
            printUsage();
            return 1;
        }
    }
    if (filepath.empty()) filepath = "story.ygb";

    Yeon::Session session;
    session.setDebugMode(debug);
    if (hasSeed) session.setSeed(seed);

    ConsoleListener listener(session);
    ConsoleEventHandler eventHandler;
    session.addPlayerListener(&listener);
    session.registerEventHandler(&eventHandler);

    const Yeon::Graph* graph = session.loadGraph(filepath);
    if (!graph) {
        return 1;
    }

    std::cout << "\n=== Yeon Story Player ===" << std::endl;
    std::cout << std::endl;

    if (!session.playStory(graph->getId(), startNodeId)) {
        std::cerr << "Failed to start story." << std::endl;
        return 1;
    }

    // 콘솔 플레이 루프
    double conditionWait = 0.0;
    while (session.getActivePlayerCount() > 0) {
        Yeon::Player* player = session.getCurrentPlayer();
        if (!player) break;

        switch (player->getState()) {
            case Yeon::PlayerState::WaitingForInput: {
                conditionWait = 0.0;
                const auto& choices = player->getPresentedChoices();
                if (player->getSuspension().kind == Yeon::SuspensionKind::Choice) {
                    for (size_t i = 0; i < choices.size(); ++i) {
                        std::cout << "  [" << (i + 1) << "] " << choices[i].text << std::endl;
                    }
                    std::cout << std::endl;
                    int index = readChoice(choices.size());
                    if (index < 0) {
                        session.stopAllStories();
                        break;
                    }
                    std::cout << std::endl;
                    player->selectChoice(index);
                } else {
                    std::string line;
                    if (!std::getline(std::cin, line)) {
                        session.stopAllStories();
                        break;
                    }
                    player->sendInput();
                }
                break;
            }

            case Yeon::PlayerState::Paused:
                std::cout << "(paused at " << (player->getCurrentNode() ? player->getCurrentNode()->getId() : "")
                          << ", Enter to resume)" << std::endl;
                {
                    std::string line;
                    if (!std::getline(std::cin, line)) {
                        session.stopAllStories();
                        break;
                    }
                }
                player->resume();
                break;

            case Yeon::PlayerState::WaitingForCondition:
                conditionWait += TICK_SECONDS;
                if (conditionWait > MAX_CONDITION_WAIT) {
                    std::cerr << "warning: condition on node '"
                              << (player->getCurrentNode() ? player->getCurrentNode()->getId() : "")
                              << "' never became true, stopping" << std::endl;
                    session.stopAllStories();
                    break;
                }
                session.tick(TICK_SECONDS);
                break;

            default:
                conditionWait = 0.0;
                session.tick(TICK_SECONDS);
                break;
        }
        // stop 후 남은 실행 정리
        if (session.getActivePlayerCount() == 0) session.tick(0.0f);
    }

    std::cout << "=== END ===" << std::endl;
    return 0;
}
