#include "yeon_context.h"
#include "yeon_graph.h"

namespace Yeon {

static std::unique_ptr<VariableStore> makeStore(StoreKind kind) {
    if (kind == StoreKind::Columnar) {
        return std::make_unique<ColumnarVariableStore>();
    }
    return std::make_unique<MapVariableStore>();
}

ExecutionContext::ExecutionContext(const Graph* graph, StoreKind kind)
    : graph_(graph), storeKind_(kind), variables_(makeStore(kind)), rng_(std::random_device{}()) {
    seedFromGraph();
}

// --- Variables ---
void ExecutionContext::setVariable(const std::string& name, const Value& value) {
    Value oldValue;
    variables_->get(name, oldValue);
    variables_->set(name, value);
    if (onVariableChanged_) {
        onVariableChanged_(name, oldValue, value);
    }
}

Value ExecutionContext::getVariable(const std::string& name, const Value& defaultValue) const {
    Value stored;
    if (!variables_->get(name, stored)) return defaultValue;

    Value out;
    if (!coerceValue(stored, defaultValue.type, out)) return defaultValue;
    return out;
}

bool ExecutionContext::tryGetVariable(const std::string& name, Value& out) const {
    return variables_->get(name, out);
}

bool ExecutionContext::hasVariable(const std::string& name) const {
    return variables_->has(name);
}

std::vector<std::string> ExecutionContext::getVariableNames() const {
    return variables_->names();
}

int32_t ExecutionContext::getInt(const std::string& name, int32_t defaultValue) const {
    return getVariable(name, Value::Int(defaultValue)).i;
}

float ExecutionContext::getFloat(const std::string& name, float defaultValue) const {
    return getVariable(name, Value::Float(defaultValue)).f;
}

bool ExecutionContext::getBool(const std::string& name, bool defaultValue) const {
    return getVariable(name, Value::Bool(defaultValue)).b;
}

std::string ExecutionContext::getString(const std::string& name, const std::string& defaultValue) const {
    return getVariable(name, Value::String(defaultValue)).s;
}

void ExecutionContext::incrementVariable(const std::string& name, int32_t amount) {
    Value current;
    if (variables_->get(name, current) && current.type == Value::FLOAT) {
        setVariable(name, Value::Float(current.f + static_cast<float>(amount)));
        return;
    }
    setVariable(name, Value::Int(getInt(name, 0) + amount));
}

bool ExecutionContext::evaluateCondition(const std::string& name, ConditionOperator op,
                                         const Value& compareValue) const {
    Value stored;
    if (!variables_->get(name, stored)) return false;
    return evaluateValueCondition(stored, op, compareValue);
}

// --- Temp data ---
void ExecutionContext::setTempData(const std::string& key, const Value& value) {
    tempData_[key] = value;
}

Value ExecutionContext::getTempData(const std::string& key, const Value& defaultValue) const {
    auto it = tempData_.find(key);
    return it != tempData_.end() ? it->second : defaultValue;
}

bool ExecutionContext::hasTempData(const std::string& key) const {
    return tempData_.find(key) != tempData_.end();
}

bool ExecutionContext::removeTempData(const std::string& key) {
    return tempData_.erase(key) > 0;
}

// --- History ---
void ExecutionContext::pushHistory(const std::string& nodeId) {
    history_.push_back(nodeId);
}

std::string ExecutionContext::popHistory() {
    if (history_.empty()) return "";
    std::string top = std::move(history_.back());
    history_.pop_back();
    return top;
}

std::string ExecutionContext::peekHistory() const {
    return history_.empty() ? "" : history_.back();
}

// --- Current node ---
void ExecutionContext::setCurrentNode(const Node* node) {
    if (currentNode_) {
        pushHistory(currentNode_->getId());
    }
    currentNode_ = node;
    if (onNodeChanged_) {
        onNodeChanged_(node);
    }
}

std::string ExecutionContext::getCurrentNodeId() const {
    return currentNode_ ? currentNode_->getId() : "";
}

// --- State ---
VariableSnapshot ExecutionContext::saveState() const {
    VariableSnapshot snapshot;
    for (const auto& name : variables_->names()) {
        Value v;
        if (variables_->get(name, v)) {
            snapshot[name] = v;
        }
    }
    return snapshot;
}

void ExecutionContext::loadState(const VariableSnapshot& snapshot) {
    variables_->clear();
    for (const auto& pair : snapshot) {
        variables_->set(pair.first, pair.second);
    }
}

void ExecutionContext::reset() {
    variables_->clear();
    tempData_.clear();
    history_.clear();
    currentNode_ = nullptr;
    paused_ = false;
    complete_ = false;
    seedFromGraph();
}

void ExecutionContext::seedFromGraph() {
    if (!graph_) return;
    for (const auto& decl : graph_->getVariables()) {
        variables_->set(decl.name, decl.getDefaultValue());
    }
}

void ExecutionContext::emitEvent(const StoryEvent& event) const {
    if (onStoryEvent_) {
        onStoryEvent_(event);
    }
}

} // namespace Yeon
