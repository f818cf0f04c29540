#include "yeon_graph.h"
#include "yeon_nodes.h"
#include <algorithm>
#include <iostream>
#include <random>
#include <unordered_set>

namespace Yeon {

// --- VariableDecl ---
Value VariableDecl::getDefaultValue() const {
    Value out;
    if (coerceValue(defaultValue, valueTypeFor(type), out) && !out.isNone()) {
        return out;
    }
    return defaultValueFor(type);
}

// --- NodeResult ---
NodeResult NodeResult::Continue(const std::string& portId) {
    NodeResult r;
    r.type = ResultType::Continue;
    r.portId = portId;
    return r;
}

NodeResult NodeResult::Wait(float seconds, const std::string& portId) {
    NodeResult r;
    r.type = ResultType::Wait;
    r.waitSeconds = seconds;
    r.portId = portId;
    return r;
}

NodeResult NodeResult::WaitForCondition(std::function<bool()> condition, const std::string& portId) {
    NodeResult r;
    r.type = ResultType::WaitForCondition;
    r.condition = std::move(condition);
    r.portId = portId;
    return r;
}

NodeResult NodeResult::WaitForInput(const std::string& portId) {
    NodeResult r;
    r.type = ResultType::WaitForInput;
    r.portId = portId;
    return r;
}

NodeResult& NodeResult::withTimeout(float seconds, const std::string& portId) {
    timeoutSeconds = seconds;
    timeoutPortId = portId;
    return *this;
}

NodeResult NodeResult::End() {
    NodeResult r;
    r.type = ResultType::End;
    r.portId.clear();
    return r;
}

// --- Node ---
Node::Node(const std::string& id) : id_(id) {}

const Port* Node::getPort(const std::string& portId) const {
    const Port* port = getInputPort(portId);
    return port ? port : getOutputPort(portId);
}

const Port* Node::getInputPort(const std::string& portId) const {
    for (const auto& port : inputPorts_) {
        if (port.id == portId) return &port;
    }
    return nullptr;
}

const Port* Node::getOutputPort(const std::string& portId) const {
    for (const auto& port : outputPorts_) {
        if (port.id == portId) return &port;
    }
    return nullptr;
}

void Node::onEnter(ExecutionContext&) const {}
void Node::onExit(ExecutionContext&) const {}

std::string Node::resolveOutputPort(const ExecutionContext&, const std::string& declaredPortId) const {
    return declaredPortId;
}

std::vector<std::string> Node::validate() const {
    return {};
}

Port& Node::addInputPort(const std::string& name, const std::string& id, PortCapacity capacity) {
    Port port;
    port.id = id.empty() ? generateId() : id;
    port.name = name;
    port.direction = PortDirection::Input;
    port.capacity = capacity;
    inputPorts_.push_back(std::move(port));
    return inputPorts_.back();
}

Port& Node::addOutputPort(const std::string& name, const std::string& id, PortCapacity capacity) {
    Port port;
    port.id = id.empty() ? generateId() : id;
    port.name = name;
    port.direction = PortDirection::Output;
    port.capacity = capacity;
    outputPorts_.push_back(std::move(port));
    return outputPorts_.back();
}

bool Node::removeOutputPort(const std::string& id) {
    auto it = std::find_if(outputPorts_.begin(), outputPorts_.end(),
                           [&](const Port& p) { return p.id == id; });
    if (it == outputPorts_.end()) return false;
    outputPorts_.erase(it);
    return true;
}

// --- ID 생성 ---
std::string generateId() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    static const char* HEX = "0123456789abcdef";

    std::string id(36, '-');
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        id[i] = HEX[dist(rng)];
    }
    id[14] = '4';
    id[19] = HEX[(dist(rng) & 0x3) | 0x8];
    return id;
}

// --- Graph ---
Graph::Graph(const std::string& id, const std::string& name) : id_(id), name_(name) {}

Node* Graph::addNode(std::unique_ptr<Node> node) {
    if (!node) return nullptr;
    if (getNode(node->getId())) {
        std::cerr << "[Yeon] Duplicate node id: " << node->getId() << std::endl;
        return nullptr;
    }
    nodes_.push_back(std::move(node));
    return nodes_.back().get();
}

bool Graph::removeNode(const std::string& nodeId) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&](const std::unique_ptr<Node>& n) { return n->getId() == nodeId; });
    if (it == nodes_.end()) return false;

    // 연결을 먼저 정리해야 dangling 참조가 보이지 않는다
    connections_.erase(
        std::remove_if(connections_.begin(), connections_.end(),
                       [&](const Connection& c) {
                           return c.outputNodeId == nodeId || c.inputNodeId == nodeId;
                       }),
        connections_.end());

    nodes_.erase(it);
    return true;
}

const Node* Graph::getNode(const std::string& nodeId) const {
    for (const auto& node : nodes_) {
        if (node->getId() == nodeId) return node.get();
    }
    return nullptr;
}

Node* Graph::getNode(const std::string& nodeId) {
    for (auto& node : nodes_) {
        if (node->getId() == nodeId) return node.get();
    }
    return nullptr;
}

std::vector<const Node*> Graph::getNodesOfType(NodeType type) const {
    std::vector<const Node*> result;
    for (const auto& node : nodes_) {
        if (node->getType() == type) result.push_back(node.get());
    }
    return result;
}

const Node* Graph::getStartNode() const {
    const Node* first = nullptr;
    for (const auto& node : nodes_) {
        if (node->getType() != NodeType::Start) continue;
        auto* start = dynamic_cast<const StartNode*>(node.get());
        if (start && start->isDefaultStart()) return node.get();
        if (!first) first = node.get();
    }
    return first;
}

const Connection* Graph::addConnection(const std::string& outputNodeId, const std::string& outputPortId,
                                       const std::string& inputNodeId, const std::string& inputPortId,
                                       const std::string& connectionId) {
    const Node* outputNode = getNode(outputNodeId);
    const Node* inputNode = getNode(inputNodeId);
    if (!outputNode || !inputNode) {
        std::cerr << "[Yeon] Cannot create connection: node not found" << std::endl;
        return nullptr;
    }

    const Port* outPort = outputNode->getOutputPort(outputPortId);
    const Port* inPort = inputNode->getInputPort(inputPortId);
    if (!outPort || !inPort) {
        std::cerr << "[Yeon] Cannot create connection: port not found ("
                  << outputNodeId << "." << outputPortId << " -> "
                  << inputNodeId << "." << inputPortId << ")" << std::endl;
        return nullptr;
    }

    for (const auto& c : connections_) {
        if (c.outputNodeId == outputNodeId && c.outputPortId == outputPortId &&
            c.inputNodeId == inputNodeId && c.inputPortId == inputPortId) {
            return nullptr;
        }
        if (!connectionId.empty() && c.id == connectionId) {
            std::cerr << "[Yeon] Duplicate connection id: " << connectionId << std::endl;
            return nullptr;
        }
    }

    // Single 포트는 연결 하나만 허용
    if (outPort->capacity == PortCapacity::Single && getConnectionFromPort(outputNodeId, outputPortId)) {
        return nullptr;
    }
    if (inPort->capacity == PortCapacity::Single) {
        for (const auto& c : connections_) {
            if (c.inputNodeId == inputNodeId && c.inputPortId == inputPortId) return nullptr;
        }
    }

    Connection connection;
    connection.id = connectionId.empty() ? generateId() : connectionId;
    connection.outputNodeId = outputNodeId;
    connection.outputPortId = outputPortId;
    connection.inputNodeId = inputNodeId;
    connection.inputPortId = inputPortId;
    connections_.push_back(std::move(connection));
    return &connections_.back();
}

bool Graph::removeConnection(const std::string& connectionId) {
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&](const Connection& c) { return c.id == connectionId; });
    if (it == connections_.end()) return false;
    connections_.erase(it);
    return true;
}

const Connection* Graph::getConnection(const std::string& connectionId) const {
    for (const auto& c : connections_) {
        if (c.id == connectionId) return &c;
    }
    return nullptr;
}

std::vector<const Connection*> Graph::getConnectionsFromNode(const std::string& nodeId) const {
    std::vector<const Connection*> result;
    for (const auto& c : connections_) {
        if (c.outputNodeId == nodeId) result.push_back(&c);
    }
    return result;
}

std::vector<const Connection*> Graph::getConnectionsToNode(const std::string& nodeId) const {
    std::vector<const Connection*> result;
    for (const auto& c : connections_) {
        if (c.inputNodeId == nodeId) result.push_back(&c);
    }
    return result;
}

const Connection* Graph::getConnectionFromPort(const std::string& nodeId, const std::string& portId) const {
    for (const auto& c : connections_) {
        if (c.outputNodeId == nodeId && c.outputPortId == portId) return &c;
    }
    return nullptr;
}

const Node* Graph::getConnectedNode(const std::string& nodeId, const std::string& outputPortId) const {
    const Connection* c = getConnectionFromPort(nodeId, outputPortId);
    return c ? getNode(c->inputNodeId) : nullptr;
}

bool Graph::addVariable(const VariableDecl& variable) {
    if (variable.name.empty() || getVariable(variable.name)) return false;
    variables_.push_back(variable);
    return true;
}

bool Graph::removeVariable(const std::string& name) {
    auto before = variables_.size();
    variables_.erase(std::remove_if(variables_.begin(), variables_.end(),
                                    [&](const VariableDecl& v) { return v.name == name; }),
                     variables_.end());
    return variables_.size() != before;
}

const VariableDecl* Graph::getVariable(const std::string& name) const {
    for (const auto& v : variables_) {
        if (v.name == name) return &v;
    }
    return nullptr;
}

// 실행 중 쓰기가 일어나는 변수 이름 수집 (선언 외 변수 허용용)
static void collectWrittenVariables(const Node& node, std::unordered_set<std::string>& out) {
    switch (node.getType()) {
        case NodeType::Variable: {
            auto& varNode = static_cast<const VariableNode&>(node);
            for (const auto& op : varNode.getOperations()) out.insert(op.variableName);
            break;
        }
        case NodeType::Choice: {
            auto& choiceNode = static_cast<const ChoiceNode&>(node);
            out.insert("choice_" + node.getId());
            for (const auto& choice : choiceNode.getChoices()) {
                if (!choice.setVariable.empty()) out.insert(choice.setVariable);
            }
            break;
        }
        default:
            break;
    }
}

std::vector<std::string> Graph::validate() const {
    std::vector<std::string> errors;

    auto startNodes = getNodesOfType(NodeType::Start);
    if (startNodes.empty()) {
        errors.push_back("Graph must have at least one Start node");
    } else if (startNodes.size() > 1) {
        errors.push_back("Graph has " + std::to_string(startNodes.size()) +
                         " Start nodes; traversal entry point is ambiguous");
    }

    for (const auto& c : connections_) {
        const Node* out = getNode(c.outputNodeId);
        const Node* in = getNode(c.inputNodeId);
        if (!out) {
            errors.push_back("Connection " + c.id + " has invalid output node");
        } else if (!out->getOutputPort(c.outputPortId)) {
            errors.push_back("Connection " + c.id + " has invalid output port '" + c.outputPortId + "'");
        }
        if (!in) {
            errors.push_back("Connection " + c.id + " has invalid input node");
        } else if (!in->getInputPort(c.inputPortId)) {
            errors.push_back("Connection " + c.id + " has invalid input port '" + c.inputPortId + "'");
        }
    }

    std::unordered_set<std::string> seenVars;
    for (const auto& v : variables_) {
        if (!seenVars.insert(v.name).second) {
            errors.push_back("Duplicate variable name: " + v.name);
        }
    }

    std::unordered_set<std::string> knownVars = seenVars;
    for (const auto& node : nodes_) {
        collectWrittenVariables(*node, knownVars);
    }

    for (const auto& node : nodes_) {
        auto nodeErrors = node->validate();
        errors.insert(errors.end(), nodeErrors.begin(), nodeErrors.end());

        // 조건 평가는 실행 중 조용히 false가 되므로 여기서 미리 알린다
        if (node->getType() == NodeType::Condition) {
            auto& condNode = static_cast<const ConditionNode&>(*node);
            for (const auto& cond : condNode.getConditions()) {
                if (!knownVars.count(cond.variableName)) {
                    errors.push_back("Condition node '" + node->getId() +
                                     "' references undeclared variable '" + cond.variableName + "'");
                }
            }
        } else if (node->getType() == NodeType::Wait) {
            auto& waitNode = static_cast<const WaitNode&>(*node);
            if (waitNode.getWaitType() == WaitType::Condition &&
                !knownVars.count(waitNode.getConditionVariable())) {
                errors.push_back("Wait node '" + node->getId() +
                                 "' references undeclared variable '" +
                                 waitNode.getConditionVariable() + "'");
            }
        }
    }

    return errors;
}

void Graph::clear() {
    connections_.clear();
    nodes_.clear();
    variables_.clear();
}

} // namespace Yeon
