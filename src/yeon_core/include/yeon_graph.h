#pragma once
#include "yeon_value.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace Yeon {

class ExecutionContext;

// --- Port ---
enum class PortDirection { Input, Output };
enum class PortCapacity { Single, Multi };

struct Port {
    std::string id;
    std::string name;
    PortDirection direction = PortDirection::Input;
    PortCapacity capacity = PortCapacity::Single;
};

// --- Connection: (outputNode, outputPort) -> (inputNode, inputPort) ---
struct Connection {
    std::string id;
    std::string outputNodeId;
    std::string outputPortId;
    std::string inputNodeId;
    std::string inputPortId;
};

// --- 그래프 변수 선언 ---
struct VariableDecl {
    std::string name;
    VariableType type = VariableType::String;
    Value defaultValue;

    // 선언 타입으로 변환된 기본값 (변환 실패 시 타입 기본값)
    Value getDefaultValue() const;
};

// --- Node::execute() 결과 ---
enum class ResultType { Continue, Wait, WaitForCondition, WaitForInput, End };

struct NodeResult {
    ResultType type = ResultType::Continue;
    std::string portId = "output";
    float waitSeconds = 0.0f;
    std::function<bool()> condition;
    // WaitForCondition 제한 시간 (0이면 없음). 초과 시 timeoutPortId로 진행
    float timeoutSeconds = 0.0f;
    std::string timeoutPortId;

    NodeResult& withTimeout(float seconds, const std::string& portId);

    static NodeResult Continue(const std::string& portId = "output");
    static NodeResult Wait(float seconds, const std::string& portId = "output");
    static NodeResult WaitForCondition(std::function<bool()> condition, const std::string& portId = "output");
    static NodeResult WaitForInput(const std::string& portId = "output");
    static NodeResult End();
    static NodeResult Branch(const std::string& portId) { return Continue(portId); }
};

enum class NodeType {
    Start,
    Dialogue,
    Choice,
    Condition,
    Variable,
    Wait,
    Cutscene,
    Audio,
    Event,
    End,
    Custom
};

// --- Node (추상) ---
// 실행 훅은 const: 노드는 여러 실행이 공유하며, 실행별 상태는 ExecutionContext에 둔다.
class Node {
public:
    explicit Node(const std::string& id);
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& getId() const { return id_; }

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }
    const std::string& getDescription() const { return description_; }
    void setDescription(const std::string& desc) { description_ = desc; }

    float getX() const { return x_; }
    float getY() const { return y_; }
    void setPosition(float x, float y) { x_ = x; y_ = y; }

    bool isBreakpoint() const { return breakpoint_; }
    void setBreakpoint(bool enabled) { breakpoint_ = enabled; }

    const std::vector<Port>& getInputPorts() const { return inputPorts_; }
    const std::vector<Port>& getOutputPorts() const { return outputPorts_; }
    const Port* getPort(const std::string& portId) const;
    const Port* getInputPort(const std::string& portId) const;
    const Port* getOutputPort(const std::string& portId) const;

    virtual NodeType getType() const = 0;
    // 레지스트리/직렬화에 쓰이는 타입 이름 ("Dialogue", "Choice", ...)
    virtual const char* getTypeName() const = 0;
    virtual const char* getCategory() const = 0;

    virtual NodeResult execute(ExecutionContext& context) const = 0;
    virtual void onEnter(ExecutionContext& context) const;
    virtual void onExit(ExecutionContext& context) const;

    // 대기가 끝난 뒤 실제로 따라갈 출력 포트. 기본은 선언된 포트 그대로.
    virtual std::string resolveOutputPort(const ExecutionContext& context,
                                          const std::string& declaredPortId) const;

    virtual std::vector<std::string> validate() const;

protected:
    Port& addInputPort(const std::string& name, const std::string& id,
                       PortCapacity capacity = PortCapacity::Multi);
    Port& addOutputPort(const std::string& name, const std::string& id,
                        PortCapacity capacity = PortCapacity::Single);
    bool removeOutputPort(const std::string& id);
    void clearOutputPorts() { outputPorts_.clear(); }

private:
    std::string id_;
    std::string name_;
    std::string description_;
    float x_ = 0.0f;
    float y_ = 0.0f;
    bool breakpoint_ = false;
    std::vector<Port> inputPorts_;
    std::vector<Port> outputPorts_;
};

// UUID v4 형식의 식별자 생성
std::string generateId();

// --- Graph ---
class Graph {
public:
    Graph() = default;
    Graph(const std::string& id, const std::string& name);

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    const std::string& getId() const { return id_; }
    void setId(const std::string& id) { id_ = id; }
    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }
    const std::string& getDescription() const { return description_; }
    void setDescription(const std::string& desc) { description_ = desc; }

    // 에디터 뷰 상태 (실행과 무관, 라운드트립 용도)
    float getViewOffsetX() const { return viewOffsetX_; }
    float getViewOffsetY() const { return viewOffsetY_; }
    float getViewScale() const { return viewScale_; }
    void setViewOffset(float x, float y) { viewOffsetX_ = x; viewOffsetY_ = y; }
    void setViewScale(float scale) { viewScale_ = scale; }

    // --- Node ---
    // 중복 ID면 nullptr
    Node* addNode(std::unique_ptr<Node> node);

    template <typename T>
    T* createNode() {
        auto node = std::make_unique<T>(generateId());
        T* raw = node.get();
        return addNode(std::move(node)) ? raw : nullptr;
    }

    // 노드를 참조하는 연결을 모두 지운 뒤 노드를 제거
    bool removeNode(const std::string& nodeId);

    const Node* getNode(const std::string& nodeId) const;
    Node* getNode(const std::string& nodeId);
    std::vector<const Node*> getNodesOfType(NodeType type) const;
    const Node* getStartNode() const;
    const std::vector<std::unique_ptr<Node>>& getNodes() const { return nodes_; }

    // --- Connection ---
    // 노드/포트가 없거나, 방향이 틀리거나, 중복이면 nullptr
    const Connection* addConnection(const std::string& outputNodeId, const std::string& outputPortId,
                                    const std::string& inputNodeId, const std::string& inputPortId,
                                    const std::string& connectionId = "");
    bool removeConnection(const std::string& connectionId);

    const Connection* getConnection(const std::string& connectionId) const;
    std::vector<const Connection*> getConnectionsFromNode(const std::string& nodeId) const;
    std::vector<const Connection*> getConnectionsToNode(const std::string& nodeId) const;
    const Connection* getConnectionFromPort(const std::string& nodeId, const std::string& portId) const;
    const Node* getConnectedNode(const std::string& nodeId, const std::string& outputPortId) const;
    const std::vector<Connection>& getConnections() const { return connections_; }

    // --- Variable ---
    bool addVariable(const VariableDecl& variable);
    bool removeVariable(const std::string& name);
    const VariableDecl* getVariable(const std::string& name) const;
    const std::vector<VariableDecl>& getVariables() const { return variables_; }

    // 구조 검증. 에러 메시지 목록 (비어 있으면 정상)
    std::vector<std::string> validate() const;

    void clear();

private:
    std::string id_;
    std::string name_;
    std::string description_;
    float viewOffsetX_ = 0.0f;
    float viewOffsetY_ = 0.0f;
    float viewScale_ = 1.0f;

    std::vector<std::unique_ptr<Node>> nodes_;
    std::vector<Connection> connections_;
    std::vector<VariableDecl> variables_;
};

} // namespace Yeon
