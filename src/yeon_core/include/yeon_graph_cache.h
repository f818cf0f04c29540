#pragma once
#include "yeon_graph.h"
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <functional>

namespace Yeon {

// --- Graph lookup cache ---
// 한 번 빌드 후 읽기 전용. 그래프 구조가 바뀌면 rebuild() 필요.
// 여러 Player가 동시에 읽어도 안전하다 (빌드 중 제외).
class GraphCache {
public:
    GraphCache() = default;
    explicit GraphCache(const Graph& graph);

    GraphCache(const GraphCache&) = delete;
    GraphCache& operator=(const GraphCache&) = delete;

    void build(const Graph& graph);
    void rebuild();
    void clear();

    bool isBuilt() const { return graph_ != nullptr; }
    const Graph* getGraph() const { return graph_; }

    const Node* getNode(const std::string& nodeId) const;
    const Connection* getConnection(const std::string& connectionId) const;
    const Connection* getConnectionFromPort(const std::string& nodeId, const std::string& portId) const;
    const Node* getConnectedNode(const std::string& nodeId, const std::string& portId) const;
    std::vector<const Connection*> getConnectionsFromNode(const std::string& nodeId) const;
    std::vector<const Connection*> getConnectionsToNode(const std::string& nodeId) const;
    std::vector<const Node*> getNodesOfType(NodeType type) const;
    const Node* getStartNode() const { return startNode_; }

    size_t getNodeCount() const { return nodeIndex_.size(); }
    size_t getConnectionCount() const { return connections_.size(); }

private:
    // (nodeId, portId) 결합 키
    struct PortKey {
        std::string_view nodeId;
        std::string_view portId;
        bool operator==(const PortKey& other) const {
            return nodeId == other.nodeId && portId == other.portId;
        }
    };

    struct PortKeyHash {
        size_t operator()(const PortKey& key) const {
            size_t h1 = std::hash<std::string_view>{}(key.nodeId);
            size_t h2 = std::hash<std::string_view>{}(key.portId);
            return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
        }
    };

    const Graph* graph_ = nullptr;

    // 그래프의 연결 목록 사본 (인덱스가 가리키는 문자열 소유)
    std::vector<Connection> connections_;

    std::unordered_map<std::string_view, const Node*> nodeIndex_;
    std::unordered_map<std::string_view, size_t> connectionIndex_;
    std::unordered_map<PortKey, size_t, PortKeyHash> portIndex_;
    std::unordered_map<std::string_view, std::vector<size_t>> fromIndex_;
    std::unordered_map<std::string_view, std::vector<size_t>> toIndex_;
    std::unordered_map<int, std::vector<const Node*>> typeIndex_;
    const Node* startNode_ = nullptr;
};

} // namespace Yeon
