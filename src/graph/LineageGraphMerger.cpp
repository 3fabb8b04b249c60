#include "graph/LineageGraphMerger.h"
#include "core/logger.h"
#include "graph/GraphSerializer.h"
#include "utils/time_utils.h"

LineageGraphMerger::LineageGraphMerger()
    : clock_([]() { return std::chrono::system_clock::now(); }) {}

LineageGraphMerger &LineageGraphMerger::addGraph(const LineageGraph &graph) {
  for (const auto &file : graph.metadata.sourceFiles)
    graph_.addSourceFile(file);
  for (const auto &node : graph.nodes)
    graph_.addNodeIfNotExists(node);

  size_t dropped = 0;
  for (const auto &edge : graph.edges) {
    if (!graph_.hasNode(edge.sourceNode) || !graph_.hasNode(edge.targetNode)) {
      ++dropped;
      continue;
    }
    graph_.addEdgeIfNotExists(edge);
  }
  if (dropped > 0) {
    Logger::warning(LogCategory::GRAPH, "LineageGraphMerger",
                    "Dropped " + std::to_string(dropped) +
                        " edge(s) with unknown endpoints");
  }
  return *this;
}

LineageGraphMerger &LineageGraphMerger::addFile(const std::string &path) {
  return addGraph(GraphSerializer::load(path));
}

LineageGraphMerger &
LineageGraphMerger::addFiles(const std::vector<std::string> &paths) {
  for (const auto &path : paths)
    addFile(path);
  return *this;
}

LineageGraph LineageGraphMerger::merge() const {
  GraphMetadata metadata;
  metadata.createdAt = TimeUtils::toIso8601Utc(clock_());
  return graph_.toGraph(std::move(metadata));
}
