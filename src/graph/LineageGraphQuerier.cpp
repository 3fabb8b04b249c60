#include "graph/LineageGraphQuerier.h"
#include "core/logger.h"
#include "graph/GraphSerializer.h"
#include "lineage/LineageErrors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <map>
#include <queue>
#include <set>

namespace {

bool byIdentifier(const LineageNode &a, const LineageNode &b) {
  return StringUtils::lessIgnoreCase(a.identifier, b.identifier);
}

} // namespace

LineageGraphQuerier::LineageGraphQuerier(LineageGraph graph,
                                         size_t maxPathsPerNode)
    : graph_(std::move(graph)), maxPathsPerNode_(maxPathsPerNode) {
  if (maxPathsPerNode_ == 0)
    maxPathsPerNode_ = 1;

  for (size_t i = 0; i < graph_.nodes.size(); ++i)
    index_.emplace(StringUtils::toLower(graph_.nodes[i].identifier), i);

  outgoing_.resize(graph_.nodes.size());
  incoming_.resize(graph_.nodes.size());
  std::set<std::pair<size_t, size_t>> seen;
  for (const auto &edge : graph_.edges) {
    auto source = index_.find(StringUtils::toLower(edge.sourceNode));
    auto target = index_.find(StringUtils::toLower(edge.targetNode));
    if (source == index_.end() || target == index_.end())
      continue;
    if (!seen.emplace(source->second, target->second).second)
      continue;
    outgoing_[source->second].push_back(target->second);
    incoming_[target->second].push_back(source->second);
  }
}

LineageGraphQuerier LineageGraphQuerier::fromFile(const std::string &path,
                                                  size_t maxPathsPerNode) {
  return LineageGraphQuerier(GraphSerializer::load(path), maxPathsPerNode);
}

size_t LineageGraphQuerier::indexOf(const std::string &column) const {
  auto it = index_.find(StringUtils::toLower(column));
  if (it == index_.end())
    throw NodeNotFoundError(column, listColumns());
  return it->second;
}

bool LineageGraphQuerier::isRoot(const std::string &column) const {
  return incoming_[indexOf(column)].empty();
}

bool LineageGraphQuerier::isLeaf(const std::string &column) const {
  return outgoing_[indexOf(column)].empty();
}

// Breadth-first hop counts from start, following edges backwards for
// upstream queries. start itself is not reported.
std::vector<std::pair<size_t, size_t>>
LineageGraphQuerier::distances(size_t start, bool upstream) const {
  const auto &adjacency = upstream ? incoming_ : outgoing_;
  std::vector<std::pair<size_t, size_t>> result;
  std::vector<bool> visited(graph_.nodes.size(), false);
  std::queue<std::pair<size_t, size_t>> queue;

  visited[start] = true;
  queue.emplace(start, 0);
  while (!queue.empty()) {
    auto current = queue.front();
    queue.pop();
    for (size_t next : adjacency[current.first]) {
      if (visited[next])
        continue;
      visited[next] = true;
      result.emplace_back(next, current.second + 1);
      queue.emplace(next, current.second + 1);
    }
  }
  return result;
}

// Every simple path from -> to along edge direction, sorted, at most
// maxPathsPerNode_ of them.
std::vector<LineagePath> LineageGraphQuerier::simplePaths(size_t from,
                                                          size_t to) const {
  std::vector<LineagePath> paths;
  std::vector<size_t> path{from};
  std::vector<size_t> nextChild{0};
  std::vector<bool> onPath(graph_.nodes.size(), false);
  onPath[from] = true;
  bool truncated = false;

  while (!path.empty()) {
    size_t node = path.back();
    size_t &child = nextChild.back();
    if (child >= outgoing_[node].size()) {
      onPath[node] = false;
      path.pop_back();
      nextChild.pop_back();
      continue;
    }

    size_t next = outgoing_[node][child++];
    if (onPath[next])
      continue;
    if (next == to) {
      if (paths.size() >= maxPathsPerNode_) {
        truncated = true;
        break;
      }
      LineagePath found;
      for (size_t index : path)
        found.nodes.push_back(graph_.nodes[index].identifier);
      found.nodes.push_back(graph_.nodes[to].identifier);
      paths.push_back(std::move(found));
      continue;
    }
    onPath[next] = true;
    path.push_back(next);
    nextChild.push_back(0);
  }

  if (truncated) {
    Logger::warning(LogCategory::GRAPH, "LineageGraphQuerier",
                    "Path enumeration between " + graph_.nodes[from].identifier +
                        " and " + graph_.nodes[to].identifier +
                        " stopped at " + std::to_string(maxPathsPerNode_) +
                        " paths");
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

LineageQueryResult LineageGraphQuerier::find(const std::string &column,
                                             LineageDirection direction) const {
  const size_t queried = indexOf(column);
  const bool upstream = direction == LineageDirection::UPSTREAM;
  const std::string &queriedId = graph_.nodes[queried].identifier;

  LineageQueryResult result;
  result.queryColumn = queriedId;
  result.direction = direction;
  result.queriedColumns.push_back(queriedId);

  for (const auto &entry : distances(queried, upstream)) {
    size_t index = entry.first;
    LineageNode node;
    static_cast<GraphNode &>(node) = graph_.nodes[index];
    node.hops = entry.second;
    node.outputColumn = queriedId;
    node.isRoot = incoming_[index].empty();
    node.isLeaf = outgoing_[index].empty();
    node.paths = upstream ? simplePaths(index, queried)
                          : simplePaths(queried, index);
    result.related.push_back(std::move(node));
  }
  std::sort(result.related.begin(), result.related.end(), byIdentifier);
  return result;
}

LineageQueryResult
LineageGraphQuerier::findUpstream(const std::string &column) const {
  return find(column, LineageDirection::UPSTREAM);
}

LineageQueryResult
LineageGraphQuerier::findDownstream(const std::string &column) const {
  return find(column, LineageDirection::DOWNSTREAM);
}

std::vector<std::string>
LineageGraphQuerier::tableColumns(const std::string &table) const {
  const std::string lowered = StringUtils::toLower(table);
  const bool singlePart = lowered.find('.') == std::string::npos;
  const std::string prefix = lowered + ".";

  std::vector<std::string> columns;
  std::set<std::string> knownTables;
  for (const auto &node : graph_.nodes) {
    if (node.table)
      knownTables.insert(node.schemaName ? *node.schemaName + "." + *node.table
                                         : *node.table);
    bool match = singlePart
                     ? node.table && StringUtils::toLower(*node.table) == lowered
                     : StringUtils::startsWith(
                           StringUtils::toLower(node.identifier), prefix);
    if (match)
      columns.push_back(node.identifier);
  }
  if (columns.empty()) {
    throw TableNotFoundError(
        table, std::vector<std::string>(knownTables.begin(), knownTables.end()));
  }
  std::sort(columns.begin(), columns.end(), StringUtils::lessIgnoreCase);
  return columns;
}

LineageQueryResult
LineageGraphQuerier::findTable(const std::string &table,
                               LineageDirection direction) const {
  std::vector<std::string> columns = tableColumns(table);
  std::set<std::string> queried;
  for (const auto &column : columns)
    queried.insert(StringUtils::toLower(column));

  std::map<std::string, LineageNode> merged;
  for (const auto &column : columns) {
    for (auto &node : find(column, direction).related) {
      std::string key = StringUtils::toLower(node.identifier);
      if (queried.count(key))
        continue;

      auto it = merged.find(key);
      if (it == merged.end()) {
        node.outputColumn = table;
        merged.emplace(key, std::move(node));
        continue;
      }
      LineageNode &existing = it->second;
      existing.hops = std::min(existing.hops, node.hops);
      for (auto &path : node.paths) {
        if (std::find(existing.paths.begin(), existing.paths.end(), path) ==
            existing.paths.end())
          existing.paths.push_back(std::move(path));
      }
    }
  }

  LineageQueryResult result;
  result.queryColumn = table;
  result.direction = direction;
  result.queriedColumns = columns;
  result.isTableQuery = true;
  for (auto &entry : merged) {
    std::sort(entry.second.paths.begin(), entry.second.paths.end());
    result.related.push_back(std::move(entry.second));
  }
  std::sort(result.related.begin(), result.related.end(), byIdentifier);
  return result;
}

LineageQueryResult
LineageGraphQuerier::findUpstreamTable(const std::string &table) const {
  return findTable(table, LineageDirection::UPSTREAM);
}

LineageQueryResult
LineageGraphQuerier::findDownstreamTable(const std::string &table) const {
  return findTable(table, LineageDirection::DOWNSTREAM);
}

std::vector<std::string> LineageGraphQuerier::listColumns() const {
  std::vector<std::string> columns;
  columns.reserve(graph_.nodes.size());
  for (const auto &node : graph_.nodes)
    columns.push_back(node.identifier);
  std::sort(columns.begin(), columns.end(), StringUtils::lessIgnoreCase);
  return columns;
}
