#ifndef GRAPH_SERIALIZER_H
#define GRAPH_SERIALIZER_H

#include "graph/LineageGraph.h"
#include <nlohmann/json.hpp>
#include <string>

// JSON form of a LineageGraph: {"metadata": {...}, "nodes": [...],
// "edges": [...]} with snake_case keys. Malformed input raises
// GraphFormatError.
class GraphSerializer {
public:
  static nlohmann::json toJson(const LineageGraph &graph);
  static LineageGraph fromJson(const nlohmann::json &json);

  static void save(const LineageGraph &graph, const std::string &path);
  static LineageGraph load(const std::string &path);

  static nlohmann::json nodeToJson(const GraphNode &node);
  static nlohmann::json edgeToJson(const GraphEdge &edge);

private:
  static GraphNode nodeFromJson(const nlohmann::json &json);
  static GraphEdge edgeFromJson(const nlohmann::json &json);
  static GraphMetadata metadataFromJson(const nlohmann::json &json);
};

#endif
