#ifndef LINEAGE_GRAPH_MERGER_H
#define LINEAGE_GRAPH_MERGER_H

#include "graph/LineageGraph.h"
#include <string>
#include <vector>

// Unions independently built graphs with the builder's dedup rules. Edges
// whose endpoints are not among the merged nodes are dropped.
class LineageGraphMerger {
public:
  LineageGraphMerger();

  LineageGraphMerger &addGraph(const LineageGraph &graph);
  LineageGraphMerger &addFile(const std::string &path);
  LineageGraphMerger &addFiles(const std::vector<std::string> &paths);

  void setClock(GraphClock clock) { clock_ = std::move(clock); }

  LineageGraph merge() const;

private:
  GraphAccumulator graph_;
  GraphClock clock_;
};

#endif
