#pragma once
#include "yeon_graph.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>

namespace Yeon {

// --- 노드 타입 이름 → 생성 함수 ---
// 로더(.ygb, JSON)가 타입 이름으로 노드를 만들 때 사용. 기본 노드는 생성 시 등록된다.
class NodeRegistry {
public:
    using Factory = std::function<std::unique_ptr<Node>(const std::string& id)>;

    NodeRegistry();

    // 같은 이름이 이미 있으면 false
    bool registerType(const std::string& typeName, Factory factory);
    bool unregisterType(const std::string& typeName);
    bool hasType(const std::string& typeName) const;

    template <typename T>
    bool registerType(const std::string& typeName) {
        return registerType(typeName, [](const std::string& id) { return std::make_unique<T>(id); });
    }

    // 모르는 타입이면 nullptr
    std::unique_ptr<Node> create(const std::string& typeName, const std::string& id) const;

    std::vector<std::string> getTypeNames() const;

private:
    void registerBuiltins();

    std::unordered_map<std::string, Factory> factories_;
    std::vector<std::string> order_;
};

} // namespace Yeon
