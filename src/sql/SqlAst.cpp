#include "sql/SqlAst.h"
#include "utils/string_utils.h"
#include <algorithm>

namespace sql {

std::vector<std::string> Expression::qualifier() const {
  if (kind == ExprKind::Star)
    return path;
  if (path.size() <= 1)
    return {};
  return std::vector<std::string>(path.begin(), path.end() - 1);
}

std::string TableName::qualified() const {
  return StringUtils::toLower(StringUtils::join(parts, "."));
}

std::string TableSource::referenceName() const {
  if (!alias.empty())
    return StringUtils::toLower(alias);
  if (kind == SourceKind::Table && !table.empty())
    return StringUtils::toLower(table.name());
  return "";
}

const QueryNode &QueryNode::firstBranch() const {
  const QueryNode *node = this;
  while (node->kind == QueryKind::SetOperation && node->left)
    node = node->left.get();
  return *node;
}

namespace {

struct TypeNameVisitor {
  std::string operator()(const SelectStatement &) const { return "SELECT"; }
  std::string operator()(const InsertStatement &s) const {
    return s.overwrite ? "INSERT OVERWRITE" : "INSERT";
  }
  std::string operator()(const CreateStatement &s) const {
    if (s.kind == CreateKind::Cache)
      return "CACHE TABLE";
    return "CREATE " + s.objectType;
  }
  std::string operator()(const MergeStatement &) const { return "MERGE"; }
  std::string operator()(const UpdateStatement &) const { return "UPDATE"; }
  std::string operator()(const DeleteStatement &) const { return "DELETE"; }
  std::string operator()(const AdministrativeStatement &s) const {
    return s.verb;
  }
};

bool contains(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), StringUtils::toLower(name)) !=
         names.end();
}

void collectColumnsImpl(const Expression &expr,
                        const std::vector<std::string> &lambdaScope,
                        std::vector<const Expression *> &out) {
  if (expr.kind == ExprKind::Column) {
    if (!contains(lambdaScope, expr.path.front()))
      out.push_back(&expr);
    return;
  }
  if (expr.kind == ExprKind::Lambda) {
    std::vector<std::string> scope = lambdaScope;
    for (const auto &param : expr.lambdaParams)
      scope.push_back(StringUtils::toLower(param));
    for (const auto &child : expr.children)
      collectColumnsImpl(*child, scope, out);
    return;
  }
  for (const auto &child : expr.children)
    collectColumnsImpl(*child, lambdaScope, out);
}

bool containsStarOrSubquery(const Expression &expr) {
  if (expr.kind == ExprKind::Star || expr.subquery)
    return true;
  return std::any_of(expr.children.begin(), expr.children.end(),
                     [](const ExprPtr &child) {
                       return containsStarOrSubquery(*child);
                     });
}

class ReferenceCollector {
public:
  explicit ReferenceCollector(std::vector<TableReference> &out) : out_(out) {}

  void query(const QueryNode &q, std::vector<std::string> cteNames) {
    for (const auto &cte : q.ctes) {
      if (cte.query)
        query(*cte.query, cteNames);
      cteNames.push_back(StringUtils::toLower(cte.name));
    }

    switch (q.kind) {
    case QueryKind::Select:
      if (q.select)
        select(*q.select, cteNames);
      break;
    case QueryKind::SetOperation:
      if (q.left)
        query(*q.left, cteNames);
      if (q.right)
        query(*q.right, cteNames);
      break;
    case QueryKind::Values:
      for (const auto &row : q.rows)
        for (const auto &value : row)
          expression(*value, cteNames);
      break;
    }
    for (const auto &order : q.orderBy)
      expression(*order, cteNames);
  }

  void select(const SelectCore &s, const std::vector<std::string> &cteNames) {
    if (s.from)
      source(*s.from, cteNames);
    for (const auto &join : s.joins)
      source(join.source, cteNames);
    forEachExpression(
        s, [&](const Expression &expr) { expression(expr, cteNames); });
  }

  void source(const TableSource &src,
              const std::vector<std::string> &cteNames) {
    switch (src.kind) {
    case SourceKind::Table: {
      TableReference ref;
      ref.name = src.table;
      ref.isCte = src.table.parts.size() == 1 &&
                  contains(cteNames, src.table.name());
      out_.push_back(std::move(ref));
      break;
    }
    case SourceKind::Derived:
      if (src.query)
        query(*src.query, cteNames);
      break;
    case SourceKind::TableFunction:
      if (src.function)
        expression(*src.function, cteNames);
      break;
    }
  }

  void expression(const Expression &expr,
                  const std::vector<std::string> &cteNames) {
    if (expr.subquery)
      query(*expr.subquery, cteNames);
    for (const auto &child : expr.children)
      expression(*child, cteNames);
  }

private:
  std::vector<TableReference> &out_;
};

} // namespace

std::string Statement::typeName() const {
  return std::visit(TypeNameVisitor{}, body);
}

void collectColumns(const Expression &expr,
                    std::vector<const Expression *> &out) {
  collectColumnsImpl(expr, {}, out);
}

void collectSubqueries(const Expression &expr,
                       std::vector<const QueryNode *> &out) {
  if (expr.subquery) {
    out.push_back(expr.subquery.get());
    return;
  }
  for (const auto &child : expr.children)
    collectSubqueries(*child, out);
}

bool isConstantExpression(const Expression &expr) {
  std::vector<const Expression *> columns;
  collectColumns(expr, columns);
  return columns.empty() && !containsStarOrSubquery(expr);
}

void forEachExpression(const SelectCore &select,
                       const std::function<void(const Expression &)> &fn) {
  for (const auto &item : select.projections)
    fn(*item.expr);
  if (select.from && select.from->function)
    fn(*select.from->function);
  for (const auto &join : select.joins) {
    if (join.source.function)
      fn(*join.source.function);
    if (join.condition)
      fn(*join.condition);
  }
  for (const auto &lateral : select.lateralViews)
    fn(*lateral.generator);
  if (select.where)
    fn(*select.where);
  for (const auto &group : select.groupBy)
    fn(*group);
  if (select.having)
    fn(*select.having);
  if (select.qualify)
    fn(*select.qualify);
}

std::vector<TableReference> tableReferences(const QueryNode &query) {
  std::vector<TableReference> refs;
  ReferenceCollector collector(refs);
  collector.query(query, {});
  return refs;
}

std::vector<TableReference> tableReferences(const Statement &statement) {
  std::vector<TableReference> refs;
  ReferenceCollector collector(refs);

  if (const auto *merge = std::get_if<MergeStatement>(&statement.body)) {
    collector.source(merge->source, {});
    if (merge->condition)
      collector.expression(*merge->condition, {});
  } else if (const auto *update =
                 std::get_if<UpdateStatement>(&statement.body)) {
    for (const auto &src : update->from)
      collector.source(src, {});
    for (const auto &assignment : update->assignments)
      collector.expression(*assignment.value, {});
    if (update->where)
      collector.expression(*update->where, {});
  } else if (const auto *del = std::get_if<DeleteStatement>(&statement.body)) {
    if (del->where)
      collector.expression(*del->where, {});
  } else if (const QueryNode *query = lineageQuery(statement)) {
    collector.query(*query, {});
  }
  return refs;
}

const QueryNode *lineageQuery(const Statement &statement) {
  if (const auto *select = std::get_if<SelectStatement>(&statement.body))
    return select->query.get();
  if (const auto *insert = std::get_if<InsertStatement>(&statement.body))
    return insert->query.get();
  if (const auto *create = std::get_if<CreateStatement>(&statement.body))
    return create->query.get();
  if (const auto *merge = std::get_if<MergeStatement>(&statement.body)) {
    if (merge->source.kind == SourceKind::Derived)
      return merge->source.query.get();
  }
  return nullptr;
}

const TableName *targetTable(const Statement &statement) {
  if (const auto *insert = std::get_if<InsertStatement>(&statement.body))
    return &insert->target;
  if (const auto *create = std::get_if<CreateStatement>(&statement.body))
    return &create->target;
  if (const auto *merge = std::get_if<MergeStatement>(&statement.body))
    return &merge->target;
  if (const auto *update = std::get_if<UpdateStatement>(&statement.body))
    return &update->target;
  if (const auto *del = std::get_if<DeleteStatement>(&statement.body))
    return &del->target;
  return nullptr;
}

} // namespace sql
