#ifndef ILINEAGE_TRACER_H
#define ILINEAGE_TRACER_H

#include "sql/ScopeResolver.h"
#include <string>
#include <vector>

namespace sql {

// Dependency tree of one output column. Leaves are source columns
// (qualified as table.column) or literals.
struct TraceNode {
  std::string name;
  std::string expression;
  // Table or scope the column is read from; empty at the root and literals.
  std::string source;
  bool literal{false};
  std::vector<TraceNode> downstream;

  bool isLeaf() const { return downstream.empty(); }
};

class ILineageTracer {
public:
  virtual ~ILineageTracer() = default;

  // Traces output column `column` of the statement in `sql`. The schema
  // dictionary is used for wildcard expansion and to attribute unqualified
  // columns. Throws LineageError (or a subclass) when the column cannot be
  // traced.
  virtual TraceNode trace(const std::string &column, const std::string &sql,
                          const std::string &dialect,
                          const SchemaMap &schema) const = 0;

  // Traces the output at `position` of the projection list (after wildcard
  // expansion; first branch of a set operation). Outputs that share a name
  // are told apart by position. Tracers that only look up names keep the
  // default.
  virtual TraceNode traceAt(size_t position, const std::string &column,
                            const std::string &sql, const std::string &dialect,
                            const SchemaMap &schema) const {
    (void)position;
    return trace(column, sql, dialect, schema);
  }
};

} // namespace sql

#endif
