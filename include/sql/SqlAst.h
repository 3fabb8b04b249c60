#ifndef SQL_AST_H
#define SQL_AST_H

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sql {

struct QueryNode;

enum class ExprKind {
  Column,
  Star,
  Literal,
  Parameter,
  Function,
  Subquery,
  Exists,
  Case,
  Cast,
  Unary,
  Binary,
  Predicate,
  Lambda,
  Array,
  Tuple,
  Interval,
  Other
};

// Generic expression tree. Every node keeps the exact source text it was
// parsed from so callers can report expressions as the user wrote them.
struct Expression {
  ExprKind kind{ExprKind::Other};
  std::string text;
  // Function name, operator or literal value, depending on kind.
  std::string name;
  // Column: qualifier parts followed by the column name. Star: qualifier.
  std::vector<std::string> path;
  std::vector<std::unique_ptr<Expression>> children;
  std::unique_ptr<QueryNode> subquery;
  std::vector<std::string> lambdaParams;

  bool isColumn() const { return kind == ExprKind::Column; }
  bool isStar() const { return kind == ExprKind::Star; }
  const std::string &columnName() const { return path.back(); }
  std::vector<std::string> qualifier() const;
};

using ExprPtr = std::unique_ptr<Expression>;

struct TableName {
  std::vector<std::string> parts;

  bool empty() const { return parts.empty(); }
  const std::string &name() const { return parts.back(); }
  // Parts joined with dots, lower-cased.
  std::string qualified() const;
};

enum class SourceKind { Table, Derived, TableFunction };

struct TableSource {
  SourceKind kind{SourceKind::Table};
  TableName table;
  std::unique_ptr<QueryNode> query;
  ExprPtr function;
  std::string alias;
  std::vector<std::string> columnAliases;
  std::string text;

  // Name other clauses use to refer to this source.
  std::string referenceName() const;
};

enum class JoinKind { Inner, Left, Right, Full, Cross, Semi, Anti, Comma };

struct Join {
  JoinKind kind{JoinKind::Inner};
  TableSource source;
  ExprPtr condition;
  std::vector<std::string> usingColumns;

  // SEMI and ANTI joins filter rows without contributing columns.
  bool isFiltering() const {
    return kind == JoinKind::Semi || kind == JoinKind::Anti;
  }
};

struct LateralView {
  ExprPtr generator;
  std::string alias;
  std::vector<std::string> columnAliases;
  bool outer{false};
};

struct SelectItem {
  ExprPtr expr;
  std::vector<std::string> aliases;
  std::string text;

  bool hasAlias() const { return !aliases.empty(); }
  const std::string &alias() const { return aliases.front(); }
};

struct SelectCore {
  bool distinct{false};
  std::vector<SelectItem> projections;
  std::unique_ptr<TableSource> from;
  std::vector<Join> joins;
  std::vector<LateralView> lateralViews;
  ExprPtr where;
  std::vector<ExprPtr> groupBy;
  ExprPtr having;
  ExprPtr qualify;
};

struct CommonTableExpr {
  std::string name;
  std::vector<std::string> columnAliases;
  std::unique_ptr<QueryNode> query;
};

enum class QueryKind { Select, SetOperation, Values };

struct QueryNode {
  QueryKind kind{QueryKind::Select};
  std::vector<CommonTableExpr> ctes;
  std::unique_ptr<SelectCore> select;
  // UNION, UNION ALL, INTERSECT, EXCEPT, ...
  std::string setOperator;
  std::unique_ptr<QueryNode> left;
  std::unique_ptr<QueryNode> right;
  std::vector<std::vector<ExprPtr>> rows;
  std::vector<ExprPtr> orderBy;
  std::string text;

  // Left-most branch of a set operation; the query itself otherwise.
  const QueryNode &firstBranch() const;
};

using QueryPtr = std::unique_ptr<QueryNode>;

// ---------------------------------------------------------------------------
// Statements

struct SelectStatement {
  QueryPtr query;
};

struct InsertStatement {
  TableName target;
  std::vector<std::string> columns;
  QueryPtr query;
  bool overwrite{false};
  bool hasValues{false};
};

enum class CreateKind { Table, View, Cache, Other };

struct ColumnDefinition {
  std::string name;
  std::string type;
};

struct CreateStatement {
  CreateKind kind{CreateKind::Other};
  // TABLE, VIEW, MATERIALIZED VIEW, FUNCTION, SCHEMA, ...
  std::string objectType;
  TableName target;
  std::vector<ColumnDefinition> columns;
  QueryPtr query;
  bool orReplace{false};
  bool temporary{false};
};

struct Assignment {
  std::string column;
  ExprPtr value;
};

struct MergeStatement {
  TableName target;
  std::string targetAlias;
  TableSource source;
  ExprPtr condition;
};

struct UpdateStatement {
  TableName target;
  std::string targetAlias;
  std::vector<Assignment> assignments;
  std::vector<TableSource> from;
  ExprPtr where;
};

struct DeleteStatement {
  TableName target;
  ExprPtr where;
};

struct AdministrativeStatement {
  // Leading keywords upper-cased, e.g. "DROP TABLE" or "SET".
  std::string verb;
  TableName target;
};

using StatementBody =
    std::variant<SelectStatement, InsertStatement, CreateStatement,
                 MergeStatement, UpdateStatement, DeleteStatement,
                 AdministrativeStatement>;

struct Statement {
  size_t index{0};
  std::string text;
  StatementBody body;

  // SELECT, INSERT, CREATE TABLE, CACHE TABLE, MERGE, DROP TABLE, ...
  std::string typeName() const;
};

// ---------------------------------------------------------------------------
// Traversal helpers

// Column references inside expr. Subqueries are not entered and lambda
// parameters are not reported as columns.
void collectColumns(const Expression &expr,
                    std::vector<const Expression *> &out);

// Subqueries (scalar, IN, EXISTS) directly inside expr.
void collectSubqueries(const Expression &expr,
                       std::vector<const QueryNode *> &out);

// True when expr references no column, wildcard or subquery.
bool isConstantExpression(const Expression &expr);

// Every expression owned by select itself: projections, join conditions,
// lateral generators and the filtering and grouping clauses.
void forEachExpression(const SelectCore &select,
                       const std::function<void(const Expression &)> &fn);

struct TableReference {
  TableName name;
  bool isCte{false};
};

// All table names read anywhere in query, including CTE bodies, derived
// tables and subqueries. References that resolve to a CTE in scope are
// flagged isCte.
std::vector<TableReference> tableReferences(const QueryNode &query);
std::vector<TableReference> tableReferences(const Statement &statement);

// The query whose projections define the statement's output columns, or null
// when the statement has none.
const QueryNode *lineageQuery(const Statement &statement);

// Write target of the statement, empty for plain queries.
const TableName *targetTable(const Statement &statement);

} // namespace sql

#endif
