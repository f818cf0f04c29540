#pragma once
#include "yeon_graph.h"
#include "yeon_node_registry.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <memory>

namespace Yeon {

/**
 * JSON import for Yeon story graphs.
 *
 * Builds a Graph from the JSON interchange format (see JsonExport).
 * Node types are created through a NodeRegistry; fields missing from
 * "data" keep the node's defaults. Problems are appended to the error
 * list and the import returns nullptr.
 */
class JsonImport {
public:
    static std::unique_ptr<Graph> fromJson(const nlohmann::json& doc,
                                           const NodeRegistry& registry,
                                           std::vector<std::string>& errors);

    static std::unique_ptr<Graph> fromString(const std::string& text,
                                             const NodeRegistry& registry,
                                             std::vector<std::string>& errors);

    static std::unique_ptr<Graph> fromFile(const std::string& filepath,
                                           const NodeRegistry& registry,
                                           std::vector<std::string>& errors);

private:
    static Value readValue(const nlohmann::json& value);
    static void readNode(const nlohmann::json& obj, Graph& graph,
                         const NodeRegistry& registry, std::vector<std::string>& errors);
    static void readNodeData(const nlohmann::json& data, Node& node,
                             std::vector<std::string>& errors);
};

} // namespace Yeon
