#include "graph/LineageGraph.h"
#include "utils/string_utils.h"

GraphNode GraphNode::fromIdentifier(const std::string &identifier,
                                    const std::string &filePath,
                                    size_t queryIndex) {
  GraphNode node;
  node.identifier = identifier;
  node.filePath = filePath;
  node.queryIndex = queryIndex;

  std::vector<std::string> parts = StringUtils::split(identifier, '.');
  if (parts.size() >= 3) {
    node.schemaName = parts[0];
    node.table = parts[1];
    node.column = StringUtils::join(
        std::vector<std::string>(parts.begin() + 2, parts.end()), ".");
  } else if (parts.size() == 2) {
    node.table = parts[0];
    node.column = parts[1];
  } else {
    node.column = identifier;
  }
  return node;
}

const GraphNode *LineageGraph::findNode(const std::string &identifier) const {
  for (const auto &node : nodes) {
    if (StringUtils::equalsIgnoreCase(node.identifier, identifier))
      return &node;
  }
  return nullptr;
}

std::string LineagePath::toArrowString() const {
  return StringUtils::join(nodes, " -> ");
}

std::string toString(LineageDirection direction) {
  return direction == LineageDirection::UPSTREAM ? "upstream" : "downstream";
}

const LineageNode *
LineageQueryResult::find(const std::string &identifier) const {
  for (const auto &node : related) {
    if (StringUtils::equalsIgnoreCase(node.identifier, identifier))
      return &node;
  }
  return nullptr;
}

bool GraphAccumulator::addNodeIfNotExists(const GraphNode &node) {
  if (!nodeIds_.insert(node.identifier).second)
    return false;
  nodes_.push_back(node);
  return true;
}

bool GraphAccumulator::addEdgeIfNotExists(const GraphEdge &edge) {
  if (!edgeKeys_.emplace(edge.sourceNode, edge.targetNode).second)
    return false;
  edges_.push_back(edge);
  return true;
}

bool GraphAccumulator::hasNode(const std::string &identifier) const {
  return nodeIds_.count(identifier) > 0;
}

bool GraphAccumulator::hasEdge(const std::string &source,
                               const std::string &target) const {
  return edgeKeys_.count({source, target}) > 0;
}

LineageGraph GraphAccumulator::toGraph(GraphMetadata metadata) const {
  LineageGraph graph;
  graph.nodes = nodes_;
  graph.edges = edges_;
  metadata.sourceFiles.assign(sourceFiles_.begin(), sourceFiles_.end());
  metadata.totalNodes = nodes_.size();
  metadata.totalEdges = edges_.size();
  graph.metadata = std::move(metadata);
  return graph;
}
