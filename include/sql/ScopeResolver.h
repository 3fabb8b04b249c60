#ifndef SQL_SCOPE_RESOLVER_H
#define SQL_SCOPE_RESOLVER_H

#include "sql/SqlAst.h"
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace sql {

// Table identifier (lower-case, dot-qualified) -> ordered column names.
using SchemaMap = std::map<std::string, std::vector<std::string>>;

// One CTE visible at some point of a query. Nodes form a chain through
// parent, so a CTE body only sees the CTEs defined before it.
struct CteScope {
  const CteScope *parent{nullptr};
  const CommonTableExpr *cte{nullptr};

  const CteScope *find(const std::string &name) const;
};

enum class BindingKind { Table, Cte, Derived, Function, LateralView };

// A source visible in one SELECT: a FROM item, a join, or a lateral view.
struct SourceBinding {
  BindingKind kind{BindingKind::Table};
  // Name the rest of the SELECT refers to it by (alias or table name).
  std::string name;
  // Qualified table name for Table, CTE name for Cte.
  std::string tableName;
  const QueryNode *query{nullptr};
  // CTEs the body of query is resolved against.
  const CteScope *queryScope{nullptr};
  const Expression *generator{nullptr};
  std::vector<std::string> columnAliases;
  bool filtering{false};

  // Name used when qualifying a column read from this source.
  std::string qualifiedName() const;
};

struct SelectScope {
  const SelectCore *select{nullptr};
  const CteScope *ctes{nullptr};
  const SelectScope *outer{nullptr};
  std::vector<SourceBinding> sources;

  // Source referred to by a column qualifier such as t, db.t or alias.
  const SourceBinding *find(const std::vector<std::string> &qualifier) const;
};

// One output column of a SELECT after wildcard expansion.
struct ResolvedProjection {
  std::string name;
  const SelectItem *item{nullptr};
  const Expression *expr{nullptr};
  // Set when the projection came from expanding * or t.*.
  const SourceBinding *source{nullptr};
  // * or t.* whose columns are unknown; source is set for t.*.
  bool unresolvedStar{false};
};

// Binds the sources of SELECT blocks and expands their projection lists
// against a schema dictionary and the CTEs in scope. CTE scope nodes are
// owned by the resolver, so scopes must not outlive it.
class ScopeResolver {
public:
  explicit ScopeResolver(const SchemaMap &schema);

  ScopeResolver(const ScopeResolver &) = delete;
  ScopeResolver &operator=(const ScopeResolver &) = delete;

  // Extends outer with the CTEs of query, in definition order.
  const CteScope *pushCtes(const QueryNode &query, const CteScope *outer);

  SelectScope bind(const SelectCore &select, const CteScope *ctes,
                   const SelectScope *outer = nullptr);

  std::vector<ResolvedProjection> projections(const SelectScope &scope);

  // Known columns of a source; empty when they cannot be determined.
  std::vector<std::string> columnsOf(const SourceBinding &source);

  // Output column names of query (the first branch of a set operation).
  // Unresolvable wildcards contribute no names.
  std::vector<std::string> outputColumns(const QueryNode &query,
                                         const CteScope *outer);

  const std::vector<std::string> *lookupTable(const std::string &name) const;

  const SchemaMap &schema() const { return schema_; }

private:
  const SchemaMap &schema_;
  std::deque<CteScope> cteNodes_;
};

// Name a projection without alias is known by: the column name for a column
// reference, the expression text otherwise.
std::string projectionName(const Expression &expr);

// Columns generated by a lateral view or table function without explicit
// column aliases (explode -> col, posexplode -> pos, col, ...).
std::vector<std::string> defaultGeneratorColumns(const Expression &generator);

} // namespace sql

#endif
