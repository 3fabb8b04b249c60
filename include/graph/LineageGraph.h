#ifndef LINEAGE_GRAPH_H
#define LINEAGE_GRAPH_H

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

// Source of the createdAt timestamp; replaced in tests for stable output.
using GraphClock = std::function<std::chrono::system_clock::time_point()>;

// A column in the lineage graph. schemaName, table and column are parsed
// from the identifier: a.b.c... -> (a, b, c...), a.b -> (-, a, b), a -> column.
struct GraphNode {
  std::string identifier;
  std::string filePath;
  size_t queryIndex{0};
  std::optional<std::string> schemaName;
  std::optional<std::string> table;
  std::optional<std::string> column;

  static GraphNode fromIdentifier(const std::string &identifier,
                                  const std::string &filePath,
                                  size_t queryIndex);
};

// sourceNode contributes to targetNode.
struct GraphEdge {
  std::string sourceNode;
  std::string targetNode;
  std::string filePath;
  size_t queryIndex{0};
};

struct GraphMetadata {
  std::string nodeFormat{"qualified"};
  std::string defaultDialect{"spark"};
  std::string createdAt;
  std::vector<std::string> sourceFiles;
  size_t totalNodes{0};
  size_t totalEdges{0};
};

struct LineageGraph {
  GraphMetadata metadata;
  std::vector<GraphNode> nodes;
  std::vector<GraphEdge> edges;

  // Case-insensitive lookup by identifier.
  const GraphNode *findNode(const std::string &identifier) const;
};

struct LineagePath {
  std::vector<std::string> nodes;

  size_t hops() const { return nodes.size() > 1 ? nodes.size() - 1 : 0; }
  std::string toArrowString() const;

  bool operator==(const LineagePath &other) const { return nodes == other.nodes; }
  bool operator<(const LineagePath &other) const { return nodes < other.nodes; }
};

enum class LineageDirection { UPSTREAM, DOWNSTREAM };

std::string toString(LineageDirection direction);

// A graph node as returned by a lineage query.
struct LineageNode : GraphNode {
  size_t hops{0};
  std::string outputColumn;
  bool isRoot{false};
  bool isLeaf{false};
  std::vector<LineagePath> paths;
};

struct LineageQueryResult {
  std::string queryColumn;
  LineageDirection direction{LineageDirection::UPSTREAM};
  std::vector<LineageNode> related;
  // The column itself, or every column of the table for table queries.
  std::vector<std::string> queriedColumns;
  bool isTableQuery{false};

  size_t size() const { return related.size(); }
  const LineageNode *find(const std::string &identifier) const;
};

// Insertion-ordered node and edge sets shared by the builder and the merger.
// Nodes are unique by identifier with the first occurrence kept; edges are
// unique by (source, target).
class GraphAccumulator {
public:
  bool addNodeIfNotExists(const GraphNode &node);
  bool addEdgeIfNotExists(const GraphEdge &edge);
  bool hasNode(const std::string &identifier) const;
  bool hasEdge(const std::string &source, const std::string &target) const;

  void addSourceFile(const std::string &path) { sourceFiles_.insert(path); }

  const std::vector<GraphNode> &nodes() const { return nodes_; }
  const std::vector<GraphEdge> &edges() const { return edges_; }

  // Copies nodes and edges into a graph; sourceFiles and the totals of
  // metadata are filled in here.
  LineageGraph toGraph(GraphMetadata metadata) const;

private:
  std::vector<GraphNode> nodes_;
  std::vector<GraphEdge> edges_;
  std::set<std::string> nodeIds_;
  std::set<std::pair<std::string, std::string>> edgeKeys_;
  std::set<std::string> sourceFiles_;
};

#endif
