#ifndef LINEAGE_GRAPH_QUERIER_H
#define LINEAGE_GRAPH_QUERIER_H

#include "graph/LineageGraph.h"
#include <string>
#include <unordered_map>
#include <vector>

// Upstream and downstream queries over a lineage graph. Node lookup is
// case-insensitive. Hops are shortest-path lengths; paths are every simple
// path between the related node and the queried one, capped per node.
class LineageGraphQuerier {
public:
  static constexpr size_t DEFAULT_MAX_PATHS_PER_NODE = 10000;

  explicit LineageGraphQuerier(LineageGraph graph,
                               size_t maxPathsPerNode = DEFAULT_MAX_PATHS_PER_NODE);

  static LineageGraphQuerier
  fromFile(const std::string &path,
           size_t maxPathsPerNode = DEFAULT_MAX_PATHS_PER_NODE);

  // Columns the queried column is derived from. Paths run from the related
  // node to the queried column. Throws NodeNotFoundError.
  LineageQueryResult findUpstream(const std::string &column) const;
  // Columns derived from the queried column. Paths start at the queried
  // column. Throws NodeNotFoundError.
  LineageQueryResult findDownstream(const std::string &column) const;

  // Aggregates over every column of table ("orders" matches the table part
  // of any node, "prod.orders" matches the identifier prefix). The table's
  // own columns are excluded. Throws TableNotFoundError.
  LineageQueryResult findUpstreamTable(const std::string &table) const;
  LineageQueryResult findDownstreamTable(const std::string &table) const;

  std::vector<std::string> listColumns() const;

  bool isRoot(const std::string &column) const;
  bool isLeaf(const std::string &column) const;

  const LineageGraph &graph() const { return graph_; }

private:
  size_t indexOf(const std::string &column) const;
  std::vector<std::string> tableColumns(const std::string &table) const;
  std::vector<std::pair<size_t, size_t>> distances(size_t start,
                                                   bool upstream) const;
  std::vector<LineagePath> simplePaths(size_t from, size_t to) const;
  LineageQueryResult find(const std::string &column,
                          LineageDirection direction) const;
  LineageQueryResult findTable(const std::string &table,
                               LineageDirection direction) const;

  LineageGraph graph_;
  size_t maxPathsPerNode_;
  std::unordered_map<std::string, size_t> index_;
  std::vector<std::vector<size_t>> outgoing_;
  std::vector<std::vector<size_t>> incoming_;
};

#endif
