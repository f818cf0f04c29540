#pragma once
#include "yeon_graph.h"
#include <nlohmann/json.hpp>
#include <string>

namespace Yeon {

/**
 * JSON export for Yeon story graphs.
 *
 * Converts a loaded Graph back to the JSON interchange format read by
 * JsonImport. Node payloads are written under "data" with camelCase keys,
 * enums as their names and values as native JSON scalars.
 */
class JsonExport {
public:
    /// Convert a Graph to a JSON object
    static nlohmann::json toJson(const Graph& graph);

    /// Convert a Graph to a pretty-printed JSON string
    static std::string toJsonString(const Graph& graph, int indent = 2);

private:
    static nlohmann::json serializeValue(const Value& value);
    static nlohmann::json serializeNode(const Node& node);
    static nlohmann::json serializeNodeData(const Node& node);
};

} // namespace Yeon
