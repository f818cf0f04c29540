#include "yeon_node_registry.h"
#include "yeon_nodes.h"
#include <algorithm>

namespace Yeon {

NodeRegistry::NodeRegistry() {
    registerBuiltins();
}

void NodeRegistry::registerBuiltins() {
    registerType<StartNode>("Start");
    registerType<DialogueNode>("Dialogue");
    registerType<ChoiceNode>("Choice");
    registerType<ConditionNode>("Condition");
    registerType<VariableNode>("Variable");
    registerType<WaitNode>("Wait");
    registerType<CutsceneNode>("Cutscene");
    registerType<AudioNode>("Audio");
    registerType<EventNode>("Event");
    registerType<EndNode>("End");
}

bool NodeRegistry::registerType(const std::string& typeName, Factory factory) {
    if (typeName.empty() || !factory) return false;
    if (factories_.count(typeName)) return false;
    factories_.emplace(typeName, std::move(factory));
    order_.push_back(typeName);
    return true;
}

bool NodeRegistry::unregisterType(const std::string& typeName) {
    if (factories_.erase(typeName) == 0) return false;
    order_.erase(std::remove(order_.begin(), order_.end(), typeName), order_.end());
    return true;
}

bool NodeRegistry::hasType(const std::string& typeName) const {
    return factories_.count(typeName) > 0;
}

std::unique_ptr<Node> NodeRegistry::create(const std::string& typeName, const std::string& id) const {
    auto it = factories_.find(typeName);
    if (it == factories_.end()) return nullptr;
    return it->second(id.empty() ? generateId() : id);
}

std::vector<std::string> NodeRegistry::getTypeNames() const {
    return order_;
}

} // namespace Yeon
