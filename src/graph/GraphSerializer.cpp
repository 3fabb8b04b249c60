#include "graph/GraphSerializer.h"
#include "core/logger.h"
#include "lineage/LineageErrors.h"
#include "utils/file_utils.h"
#include <fstream>

using json = nlohmann::json;

namespace {

json optionalToJson(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optionalFromJson(const json &object,
                                            const char *key) {
  if (!object.contains(key) || object[key].is_null())
    return std::nullopt;
  return object[key].get<std::string>();
}

const json &required(const json &object, const char *key, const char *owner) {
  if (!object.is_object() || !object.contains(key))
    throw GraphFormatError(std::string(owner) + " is missing '" + key + "'");
  return object[key];
}

} // namespace

json GraphSerializer::nodeToJson(const GraphNode &node) {
  json nodeJson;
  nodeJson["identifier"] = node.identifier;
  nodeJson["file_path"] = node.filePath;
  nodeJson["query_index"] = node.queryIndex;
  nodeJson["schema_name"] = optionalToJson(node.schemaName);
  nodeJson["table"] = optionalToJson(node.table);
  nodeJson["column"] = optionalToJson(node.column);
  return nodeJson;
}

json GraphSerializer::edgeToJson(const GraphEdge &edge) {
  json edgeJson;
  edgeJson["source_node"] = edge.sourceNode;
  edgeJson["target_node"] = edge.targetNode;
  edgeJson["file_path"] = edge.filePath;
  edgeJson["query_index"] = edge.queryIndex;
  return edgeJson;
}

json GraphSerializer::toJson(const LineageGraph &graph) {
  json metadata;
  metadata["node_format"] = graph.metadata.nodeFormat;
  metadata["default_dialect"] = graph.metadata.defaultDialect;
  metadata["created_at"] = graph.metadata.createdAt;
  metadata["source_files"] = graph.metadata.sourceFiles;
  metadata["total_nodes"] = graph.metadata.totalNodes;
  metadata["total_edges"] = graph.metadata.totalEdges;

  json nodes = json::array();
  for (const auto &node : graph.nodes)
    nodes.push_back(nodeToJson(node));
  json edges = json::array();
  for (const auto &edge : graph.edges)
    edges.push_back(edgeToJson(edge));

  json result;
  result["metadata"] = metadata;
  result["nodes"] = nodes;
  result["edges"] = edges;
  return result;
}

GraphNode GraphSerializer::nodeFromJson(const json &object) {
  GraphNode node;
  node.identifier = required(object, "identifier", "node").get<std::string>();
  node.filePath = required(object, "file_path", "node").get<std::string>();
  node.queryIndex = required(object, "query_index", "node").get<size_t>();
  node.schemaName = optionalFromJson(object, "schema_name");
  node.table = optionalFromJson(object, "table");
  node.column = optionalFromJson(object, "column");
  return node;
}

GraphEdge GraphSerializer::edgeFromJson(const json &object) {
  GraphEdge edge;
  edge.sourceNode = required(object, "source_node", "edge").get<std::string>();
  edge.targetNode = required(object, "target_node", "edge").get<std::string>();
  edge.filePath = required(object, "file_path", "edge").get<std::string>();
  edge.queryIndex = required(object, "query_index", "edge").get<size_t>();
  return edge;
}

GraphMetadata GraphSerializer::metadataFromJson(const json &object) {
  GraphMetadata metadata;
  if (!object.is_object())
    throw GraphFormatError("Graph metadata must be an object");
  metadata.nodeFormat = object.value("node_format", metadata.nodeFormat);
  metadata.defaultDialect =
      object.value("default_dialect", metadata.defaultDialect);
  metadata.createdAt = object.value("created_at", std::string());
  if (object.contains("source_files"))
    metadata.sourceFiles =
        object["source_files"].get<std::vector<std::string>>();
  metadata.totalNodes = object.value("total_nodes", size_t{0});
  metadata.totalEdges = object.value("total_edges", size_t{0});
  return metadata;
}

LineageGraph GraphSerializer::fromJson(const json &object) {
  if (!object.is_object())
    throw GraphFormatError("Graph JSON must be an object");

  try {
    LineageGraph graph;
    if (object.contains("metadata"))
      graph.metadata = metadataFromJson(object["metadata"]);

    const json &nodes = required(object, "nodes", "graph");
    const json &edges = required(object, "edges", "graph");
    if (!nodes.is_array() || !edges.is_array())
      throw GraphFormatError("Graph 'nodes' and 'edges' must be arrays");

    for (const auto &node : nodes)
      graph.nodes.push_back(nodeFromJson(node));
    for (const auto &edge : edges)
      graph.edges.push_back(edgeFromJson(edge));
    return graph;
  } catch (const json::exception &e) {
    throw GraphFormatError("Invalid graph JSON: " + std::string(e.what()));
  }
}

void GraphSerializer::save(const LineageGraph &graph, const std::string &path) {
  std::ofstream file(path);
  if (!file.is_open())
    throw std::runtime_error("Cannot write graph file: " + path);
  file << toJson(graph).dump(2);
  if (!file)
    throw std::runtime_error("Failed writing graph file: " + path);
  Logger::debug(LogCategory::GRAPH, "GraphSerializer",
                "Saved graph with " + std::to_string(graph.nodes.size()) +
                    " nodes to " + path);
}

LineageGraph GraphSerializer::load(const std::string &path) {
  std::string content;
  try {
    content = FileUtils::readTextFile(path);
  } catch (const std::runtime_error &e) {
    throw GraphFormatError("Cannot read graph file: " + std::string(e.what()));
  }

  json parsed;
  try {
    parsed = json::parse(content);
  } catch (const json::parse_error &e) {
    throw GraphFormatError("Graph file " + path +
                           " is not valid JSON: " + std::string(e.what()));
  }
  return fromJson(parsed);
}
