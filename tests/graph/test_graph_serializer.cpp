#include "graph/GraphSerializer.h"
#include "lineage/LineageErrors.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

LineageGraph sampleGraph() {
  LineageGraph graph;
  graph.metadata.nodeFormat = "qualified";
  graph.metadata.defaultDialect = "postgres";
  graph.metadata.createdAt = "2024-01-02T03:04:05.000000+00:00";
  graph.metadata.sourceFiles = {"/sql/a.sql", "/sql/b.sql"};
  graph.nodes.push_back(
      GraphNode::fromIdentifier("raw.orders.amount", "/sql/a.sql", 0));
  graph.nodes.push_back(GraphNode::fromIdentifier("daily.total", "/sql/a.sql", 0));
  graph.nodes.push_back(GraphNode::fromIdentifier("flag", "/sql/b.sql", 2));

  GraphEdge edge;
  edge.sourceNode = "raw.orders.amount";
  edge.targetNode = "daily.total";
  edge.filePath = "/sql/a.sql";
  edge.queryIndex = 0;
  graph.edges.push_back(edge);
  graph.metadata.totalNodes = graph.nodes.size();
  graph.metadata.totalEdges = graph.edges.size();
  return graph;
}

bool throwsFormatError(const json &input, const std::string &fragment) {
  try {
    GraphSerializer::fromJson(input);
  } catch (const GraphFormatError &e) {
    return std::string(e.what()).find(fragment) != std::string::npos;
  }
  return false;
}

} // namespace

void testJsonLayout() {
  std::cout << "Testing GraphSerializer - JSON layout...\n";

  json document = GraphSerializer::toJson(sampleGraph());
  assert(document["metadata"]["default_dialect"] == "postgres");
  assert(document["metadata"]["total_nodes"] == 3);
  assert(document["metadata"]["source_files"].size() == 2);

  const json &schemaNode = document["nodes"][0];
  assert(schemaNode["identifier"] == "raw.orders.amount");
  assert(schemaNode["schema_name"] == "raw");
  assert(schemaNode["table"] == "orders");
  assert(schemaNode["column"] == "amount");

  const json &bareNode = document["nodes"][2];
  assert(bareNode["schema_name"].is_null());
  assert(bareNode["table"].is_null());
  assert(bareNode["column"] == "flag");
  assert(bareNode["query_index"] == 2);

  const json &edge = document["edges"][0];
  assert(edge["source_node"] == "raw.orders.amount");
  assert(edge["target_node"] == "daily.total");
  assert(edge["file_path"] == "/sql/a.sql");

  std::cout << "✓ GraphSerializer layout test passed\n";
}

void testRoundTrip() {
  std::cout << "Testing GraphSerializer - save and load...\n";

  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() /
                 ("sqllineage_serializer_" + std::to_string(stamp));
  fs::create_directories(dir);
  std::string path = (dir / "graph.json").string();

  LineageGraph original = sampleGraph();
  GraphSerializer::save(original, path);

  std::ifstream file(path);
  std::stringstream content;
  content << file.rdbuf();
  assert(content.str() == GraphSerializer::toJson(original).dump(2));

  LineageGraph loaded = GraphSerializer::load(path);
  assert(loaded.metadata.defaultDialect == "postgres");
  assert(loaded.metadata.createdAt == original.metadata.createdAt);
  assert(loaded.metadata.sourceFiles == original.metadata.sourceFiles);
  assert(loaded.nodes.size() == 3);
  assert(!loaded.nodes[1].schemaName);
  assert(loaded.nodes[1].table && *loaded.nodes[1].table == "daily");
  assert(!loaded.nodes[2].table);
  assert(loaded.nodes[2].queryIndex == 2);
  assert(loaded.edges.size() == 1);
  assert(loaded.edges[0].targetNode == "daily.total");

  std::ofstream broken(dir / "broken.json");
  broken << "{\"nodes\": [";
  broken.close();
  bool threw = false;
  try {
    GraphSerializer::load((dir / "broken.json").string());
  } catch (const GraphFormatError &e) {
    threw = std::string(e.what()).find("not valid JSON") != std::string::npos;
  }
  assert(threw && "Truncated JSON is a format error");

  threw = false;
  try {
    GraphSerializer::load((dir / "absent.json").string());
  } catch (const GraphFormatError &) {
    threw = true;
  }
  assert(threw && "Missing graph files are a format error");

  fs::remove_all(dir);
  std::cout << "✓ GraphSerializer round trip test passed\n";
}

void testMalformedDocuments() {
  std::cout << "Testing GraphSerializer - malformed documents...\n";

  assert(throwsFormatError(json::array(), "must be an object"));
  assert(throwsFormatError(json{{"nodes", json::array()}},
                           "graph is missing 'edges'"));
  assert(throwsFormatError(json{{"nodes", json::object()}, {"edges", json::array()}},
                           "must be arrays"));

  json missingPath = {{"nodes", json::array({{{"identifier", "a"}}})},
                      {"edges", json::array()}};
  assert(throwsFormatError(missingPath, "node is missing 'file_path'"));

  json badIndex = {
      {"nodes", json::array()},
      {"edges", json::array({{{"source_node", "a"},
                              {"target_node", "b"},
                              {"file_path", "f.sql"},
                              {"query_index", "zero"}}})}};
  assert(throwsFormatError(badIndex, "Invalid graph JSON"));

  json minimal = {{"nodes", json::array({{{"identifier", "a"},
                                          {"file_path", "f.sql"},
                                          {"query_index", 0}}})},
                  {"edges", json::array()}};
  LineageGraph graph = GraphSerializer::fromJson(minimal);
  assert(graph.nodes.size() == 1);
  assert(!graph.nodes[0].column && "Absent optional keys load as empty");
  assert(graph.metadata.nodeFormat == "qualified");

  std::cout << "✓ GraphSerializer malformed document test passed\n";
}

int main() {
  try {
    testJsonLayout();
    testRoundTrip();
    testMalformedDocuments();
    std::cout << "\n✅ All GraphSerializer tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
