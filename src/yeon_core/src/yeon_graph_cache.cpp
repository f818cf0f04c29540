#include "yeon_graph_cache.h"
#include <iostream>

namespace Yeon {

GraphCache::GraphCache(const Graph& graph) {
    build(graph);
}

void GraphCache::build(const Graph& graph) {
    clear();
    graph_ = &graph;

    const auto& nodes = graph.getNodes();
    nodeIndex_.reserve(nodes.size());
    for (const auto& node : nodes) {
        nodeIndex_[node->getId()] = node.get();
        typeIndex_[static_cast<int>(node->getType())].push_back(node.get());
    }

    // 사본을 먼저 다 채운 뒤 인덱싱 (재할당으로 string_view가 깨지지 않게)
    connections_ = graph.getConnections();
    connectionIndex_.reserve(connections_.size());
    portIndex_.reserve(connections_.size());
    for (size_t i = 0; i < connections_.size(); ++i) {
        const Connection& c = connections_[i];
        connectionIndex_[c.id] = i;
        // 같은 포트에서 여러 연결이 나가면 첫 번째가 우선
        portIndex_.emplace(PortKey{c.outputNodeId, c.outputPortId}, i);
        fromIndex_[c.outputNodeId].push_back(i);
        toIndex_[c.inputNodeId].push_back(i);
    }

    startNode_ = graph.getStartNode();
}

void GraphCache::rebuild() {
    if (!graph_) {
        std::cerr << "[Yeon] GraphCache::rebuild called before build" << std::endl;
        return;
    }
    const Graph* graph = graph_;
    build(*graph);
}

void GraphCache::clear() {
    graph_ = nullptr;
    nodeIndex_.clear();
    connectionIndex_.clear();
    portIndex_.clear();
    fromIndex_.clear();
    toIndex_.clear();
    typeIndex_.clear();
    connections_.clear();
    startNode_ = nullptr;
}

const Node* GraphCache::getNode(const std::string& nodeId) const {
    auto it = nodeIndex_.find(nodeId);
    return it != nodeIndex_.end() ? it->second : nullptr;
}

const Connection* GraphCache::getConnection(const std::string& connectionId) const {
    auto it = connectionIndex_.find(connectionId);
    return it != connectionIndex_.end() ? &connections_[it->second] : nullptr;
}

const Connection* GraphCache::getConnectionFromPort(const std::string& nodeId, const std::string& portId) const {
    auto it = portIndex_.find(PortKey{nodeId, portId});
    return it != portIndex_.end() ? &connections_[it->second] : nullptr;
}

const Node* GraphCache::getConnectedNode(const std::string& nodeId, const std::string& portId) const {
    const Connection* c = getConnectionFromPort(nodeId, portId);
    return c ? getNode(c->inputNodeId) : nullptr;
}

std::vector<const Connection*> GraphCache::getConnectionsFromNode(const std::string& nodeId) const {
    std::vector<const Connection*> result;
    auto it = fromIndex_.find(nodeId);
    if (it == fromIndex_.end()) return result;
    result.reserve(it->second.size());
    for (size_t idx : it->second) result.push_back(&connections_[idx]);
    return result;
}

std::vector<const Connection*> GraphCache::getConnectionsToNode(const std::string& nodeId) const {
    std::vector<const Connection*> result;
    auto it = toIndex_.find(nodeId);
    if (it == toIndex_.end()) return result;
    result.reserve(it->second.size());
    for (size_t idx : it->second) result.push_back(&connections_[idx]);
    return result;
}

std::vector<const Node*> GraphCache::getNodesOfType(NodeType type) const {
    auto it = typeIndex_.find(static_cast<int>(type));
    return it != typeIndex_.end() ? it->second : std::vector<const Node*>{};
}

} // namespace Yeon
