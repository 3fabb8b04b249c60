#ifndef SQL_LINEAGE_TRACER_H
#define SQL_LINEAGE_TRACER_H

#include "sql/ILineageTracer.h"

namespace sql {

// Built-in column lineage tracer. Parses the statement, finds the requested
// projection and follows it through set operations, CTEs, derived tables,
// table functions, lateral views and scalar subqueries down to the physical
// tables it reads.
class SqlLineageTracer : public ILineageTracer {
public:
  explicit SqlLineageTracer(size_t maxDepth = 256);

  TraceNode trace(const std::string &column, const std::string &sql,
                  const std::string &dialect,
                  const SchemaMap &schema) const override;
  TraceNode traceAt(size_t position, const std::string &column,
                    const std::string &sql, const std::string &dialect,
                    const SchemaMap &schema) const override;

  size_t maxDepth() const { return maxDepth_; }

private:
  TraceNode traceStatement(const std::string &column, const size_t *position,
                           const std::string &sql, const std::string &dialect,
                           const SchemaMap &schema) const;

  size_t maxDepth_;
};

} // namespace sql

#endif
