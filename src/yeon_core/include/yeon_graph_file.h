#pragma once
#include "yeon_graph.h"
#include "yeon_context.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace Yeon {

class NodeRegistry;

// 바이너리 그래프(.ygb) / 세이브(.ygs) 포맷 버전
extern const char* const GRAPH_FORMAT_VERSION;

// --- .ygb (FlatBuffers GraphDef, identifier "YGRF") ---
std::vector<uint8_t> buildGraphBuffer(const Graph& graph);
bool saveGraphFile(const Graph& graph, const std::string& filepath);

// 검증 실패/모르는 노드 타입/잘못된 연결은 errors에 추가하고 nullptr
std::unique_ptr<Graph> loadGraphBuffer(const uint8_t* data, size_t size,
                                       const NodeRegistry& registry,
                                       std::vector<std::string>& errors);
std::unique_ptr<Graph> loadGraphFile(const std::string& filepath,
                                     const NodeRegistry& registry,
                                     std::vector<std::string>& errors);

// --- .ygs (FlatBuffers SaveState) ---
bool saveSnapshotFile(const PlayerSnapshot& snapshot, const std::string& filepath);
bool loadSnapshotFile(const std::string& filepath, PlayerSnapshot& out);

} // namespace Yeon
