#include "sql/SqlLineageTracer.h"
#include "lineage/LineageErrors.h"
#include "sql/SqlParser.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <iterator>

namespace sql {

namespace {

// Subqueries reachable from an expression without crossing another
// subquery. EXISTS only filters rows and is left out.
void valueSubqueries(const Expression &expr,
                     std::vector<const QueryNode *> &out) {
  if (expr.subquery) {
    if (expr.kind != ExprKind::Exists)
      out.push_back(expr.subquery.get());
  }
  for (const auto &child : expr.children)
    valueSubqueries(*child, out);
}

bool findName(const std::vector<std::string> &names, const std::string &name,
              size_t &index) {
  for (size_t i = 0; i < names.size(); ++i) {
    if (names[i] == name) {
      index = i;
      return true;
    }
  }
  for (size_t i = 0; i < names.size(); ++i) {
    if (StringUtils::equalsIgnoreCase(names[i], name)) {
      index = i;
      return true;
    }
  }
  return false;
}

bool findOutput(const std::vector<std::string> &names, const std::string &name,
                const size_t *position, size_t &index) {
  if (position && *position < names.size() &&
      StringUtils::equalsIgnoreCase(names[*position], name)) {
    index = *position;
    return true;
  }
  return findName(names, name, index);
}

class Tracer {
public:
  Tracer(const SchemaMap &schema, size_t maxDepth)
      : resolver_(schema), maxDepth_(maxDepth) {}

  // With position set, the projection at that position is traced when its
  // name matches column; otherwise the first projection named column.
  TraceNode traceRoot(const QueryNode &query, const std::string &column,
                      const size_t *position) {
    size_t index = 0;
    std::string expression;
    if (!findProjection(query, nullptr, column, position, index, expression)) {
      throw LineageError("Cannot find column '" + column + "' in query");
    }
    TraceNode root;
    root.name = column;
    root.expression = expression;
    root.downstream = traceQueryColumn(query, index, nullptr, nullptr, 0);
    return root;
  }

private:
  ScopeResolver resolver_;
  size_t maxDepth_;

  void checkDepth(size_t depth) const {
    if (depth > maxDepth_) {
      throw LineageError("Lineage depth limit of " + std::to_string(maxDepth_) +
                         " exceeded");
    }
  }

  bool findProjection(const QueryNode &query, const CteScope *outer,
                      const std::string &column, const size_t *position,
                      size_t &index, std::string &expression) {
    const CteScope *ctes = resolver_.pushCtes(query, outer);
    switch (query.kind) {
    case QueryKind::SetOperation:
      return query.left && findProjection(*query.left, ctes, column, position,
                                          index, expression);
    case QueryKind::Values: {
      std::vector<std::string> names = resolver_.outputColumns(query, outer);
      if (!findOutput(names, column, position, index))
        return false;
      expression = names[index];
      return true;
    }
    case QueryKind::Select: {
      if (!query.select)
        return false;
      SelectScope scope = resolver_.bind(*query.select, ctes);
      std::vector<ResolvedProjection> projections = resolver_.projections(scope);
      std::vector<std::string> names;
      for (const auto &projection : projections)
        names.push_back(projection.name);
      if (!findOutput(names, column, position, index))
        return false;
      const ResolvedProjection &found = projections[index];
      expression = found.source || found.unresolvedStar
                       ? found.name
                       : StringUtils::trim(found.item->text);
      return true;
    }
    }
    return false;
  }

  std::vector<TraceNode> traceQueryColumn(const QueryNode &query, size_t index,
                                          const CteScope *outerCtes,
                                          const SelectScope *outerScope,
                                          size_t depth) {
    checkDepth(depth);
    const CteScope *ctes = resolver_.pushCtes(query, outerCtes);
    std::vector<TraceNode> nodes;

    switch (query.kind) {
    case QueryKind::SetOperation:
      // Set operations match branches by position.
      if (query.left) {
        auto left = traceQueryColumn(*query.left, index, ctes, outerScope,
                                     depth + 1);
        std::move(left.begin(), left.end(), std::back_inserter(nodes));
      }
      if (query.right) {
        auto right = traceQueryColumn(*query.right, index, ctes, outerScope,
                                      depth + 1);
        std::move(right.begin(), right.end(), std::back_inserter(nodes));
      }
      break;

    case QueryKind::Values:
      for (const auto &row : query.rows) {
        if (index < row.size())
          nodes.push_back(literalLeaf(*row[index]));
      }
      break;

    case QueryKind::Select: {
      if (!query.select)
        break;
      SelectScope scope = resolver_.bind(*query.select, ctes, outerScope);
      std::vector<ResolvedProjection> projections = resolver_.projections(scope);
      if (index >= projections.size())
        break;
      const ResolvedProjection &projection = projections[index];
      if (projection.unresolvedStar) {
        nodes = traceStar(scope, projection.source, depth + 1);
      } else if (projection.source) {
        nodes.push_back(traceSourceColumn(*projection.source, projection.name,
                                          scope, projection.name, depth + 1));
      } else {
        nodes = traceExpression(*projection.expr, scope, depth + 1);
      }
      break;
    }
    }
    return nodes;
  }

  TraceNode literalLeaf(const Expression &expr) const {
    TraceNode leaf;
    leaf.name = StringUtils::trim(expr.text);
    leaf.expression = leaf.name;
    leaf.literal = true;
    return leaf;
  }

  std::vector<TraceNode> traceExpression(const Expression &expr,
                                         const SelectScope &scope,
                                         size_t depth) {
    checkDepth(depth);
    std::vector<const Expression *> columns;
    collectColumns(expr, columns);
    std::vector<const QueryNode *> subqueries;
    valueSubqueries(expr, subqueries);

    std::vector<TraceNode> nodes;
    if (columns.empty() && subqueries.empty()) {
      if (expr.isStar()) {
        return traceStar(scope, scope.find(expr.path), depth + 1);
      }
      nodes.push_back(literalLeaf(expr));
      return nodes;
    }

    for (const Expression *column : columns)
      nodes.push_back(resolveColumn(*column, scope, depth + 1));

    for (const QueryNode *subquery : subqueries) {
      auto inner =
          traceQueryColumn(*subquery, 0, scope.ctes, &scope, depth + 1);
      std::move(inner.begin(), inner.end(), std::back_inserter(nodes));
    }
    return nodes;
  }

  // Picks the source an unqualified column comes from. owner receives the
  // scope the source belongs to, which differs from scope for correlated
  // references.
  const SourceBinding *findUnqualified(const std::string &column,
                                       const SelectScope &scope,
                                       const SelectScope *&owner) {
    for (const SelectScope *current = &scope; current;
         current = current->outer) {
      for (const auto &source : current->sources) {
        if (source.kind == BindingKind::LateralView &&
            std::find(source.columnAliases.begin(), source.columnAliases.end(),
                      column) != source.columnAliases.end()) {
          owner = current;
          return &source;
        }
      }

      std::vector<const SourceBinding *> relations;
      for (const auto &source : current->sources) {
        if (source.kind != BindingKind::LateralView)
          relations.push_back(&source);
      }
      if (current == &scope && relations.size() == 1) {
        owner = current;
        return relations.front();
      }
      for (const SourceBinding *source : relations) {
        std::vector<std::string> known = resolver_.columnsOf(*source);
        if (std::find(known.begin(), known.end(), column) != known.end()) {
          owner = current;
          return source;
        }
      }
    }

    // Nothing claims the column: attribute it to the first source whose
    // columns are unknown, or failing that the first source.
    const SourceBinding *fallback = nullptr;
    for (const auto &source : scope.sources) {
      if (source.kind == BindingKind::LateralView || source.filtering)
        continue;
      if (!fallback)
        fallback = &source;
      if (resolver_.columnsOf(source).empty()) {
        fallback = &source;
        break;
      }
    }
    owner = &scope;
    return fallback;
  }

  TraceNode resolveColumn(const Expression &column, const SelectScope &scope,
                          size_t depth) {
    checkDepth(depth);
    std::string name = StringUtils::toLower(column.columnName());
    std::vector<std::string> qualifier = column.qualifier();

    const SelectScope *owner = &scope;
    const SourceBinding *binding = nullptr;
    if (!qualifier.empty()) {
      for (const SelectScope *current = &scope; current && !binding;
           current = current->outer) {
        binding = current->find(qualifier);
        if (binding)
          owner = current;
      }
      if (!binding) {
        // s.field where s is a struct column rather than a table.
        name = StringUtils::toLower(column.path.front());
      }
    }
    if (!binding)
      binding = findUnqualified(name, scope, owner);

    if (!binding) {
      TraceNode leaf;
      leaf.name = StringUtils::toLower(StringUtils::join(column.path, "."));
      leaf.expression = column.text;
      return leaf;
    }
    return traceSourceColumn(*binding, name, *owner, column.text, depth + 1);
  }

  TraceNode traceSourceColumn(const SourceBinding &source,
                              const std::string &column,
                              const SelectScope &owner,
                              const std::string &expression, size_t depth) {
    checkDepth(depth);
    TraceNode node;
    node.expression = expression;
    node.source = source.qualifiedName();

    switch (source.kind) {
    case BindingKind::Table:
      node.name = source.tableName + "." + column;
      break;

    case BindingKind::Cte:
    case BindingKind::Derived: {
      node.name = source.name.empty() ? column : source.name + "." + column;
      if (!source.query)
        break;
      size_t index = 0;
      if (findName(resolver_.columnsOf(source), column, index)) {
        node.downstream = traceQueryColumn(*source.query, index,
                                           source.queryScope, nullptr,
                                           depth + 1);
      } else {
        node.downstream = tracePassthrough(*source.query, source.queryScope,
                                           column, depth + 1);
      }
      break;
    }

    case BindingKind::Function:
    case BindingKind::LateralView:
      node.name = source.name.empty() ? column : source.name + "." + column;
      if (source.generator)
        node.downstream = traceExpression(*source.generator, owner, depth + 1);
      break;
    }
    return node;
  }

  // A column that is not among a body's known outputs can only come
  // through one of its unresolved wildcards.
  std::vector<TraceNode> tracePassthrough(const QueryNode &query,
                                          const CteScope *outerCtes,
                                          const std::string &column,
                                          size_t depth) {
    checkDepth(depth);
    const CteScope *ctes = resolver_.pushCtes(query, outerCtes);
    std::vector<TraceNode> nodes;

    if (query.kind == QueryKind::SetOperation) {
      for (const QueryNode *branch : {query.left.get(), query.right.get()}) {
        if (!branch)
          continue;
        auto inner = tracePassthrough(*branch, ctes, column, depth + 1);
        std::move(inner.begin(), inner.end(), std::back_inserter(nodes));
      }
      return nodes;
    }
    if (query.kind != QueryKind::Select || !query.select)
      return nodes;

    SelectScope scope = resolver_.bind(*query.select, ctes);
    for (const auto &projection : resolver_.projections(scope)) {
      if (!projection.unresolvedStar)
        continue;
      const SelectScope *owner = &scope;
      const SourceBinding *source = projection.source;
      if (!source)
        source = findUnqualified(column, scope, owner);
      if (source)
        nodes.push_back(
            traceSourceColumn(*source, column, *owner, column, depth + 1));
    }
    return nodes;
  }

  // Leaves for a wildcard whose columns are unknown: table.* per source.
  std::vector<TraceNode> traceStar(const SelectScope &scope,
                                   const SourceBinding *only, size_t depth) {
    checkDepth(depth);
    std::vector<const SourceBinding *> sources;
    if (only) {
      sources.push_back(only);
    } else {
      for (const auto &source : scope.sources) {
        if (!source.filtering)
          sources.push_back(&source);
      }
    }

    std::vector<TraceNode> nodes;
    for (const SourceBinding *source : sources) {
      TraceNode node;
      node.expression = "*";
      node.source = source->qualifiedName();
      node.name = source->qualifiedName().empty()
                      ? "*"
                      : source->qualifiedName() + ".*";
      if ((source->kind == BindingKind::Cte ||
           source->kind == BindingKind::Derived) &&
          source->query) {
        node.downstream =
            traceStarQuery(*source->query, source->queryScope, depth + 1);
      } else if (source->generator) {
        node.downstream = traceExpression(*source->generator, scope, depth + 1);
      }
      nodes.push_back(std::move(node));
    }
    return nodes;
  }

  std::vector<TraceNode> traceStarQuery(const QueryNode &query,
                                        const CteScope *outerCtes,
                                        size_t depth) {
    checkDepth(depth);
    const CteScope *ctes = resolver_.pushCtes(query, outerCtes);
    std::vector<TraceNode> nodes;
    if (query.kind == QueryKind::SetOperation) {
      for (const QueryNode *branch : {query.left.get(), query.right.get()}) {
        if (!branch)
          continue;
        auto inner = traceStarQuery(*branch, ctes, depth + 1);
        std::move(inner.begin(), inner.end(), std::back_inserter(nodes));
      }
    } else if (query.kind == QueryKind::Select && query.select) {
      SelectScope scope = resolver_.bind(*query.select, ctes);
      for (const auto &projection : resolver_.projections(scope)) {
        if (!projection.unresolvedStar)
          continue;
        auto inner = traceStar(scope, projection.source, depth + 1);
        std::move(inner.begin(), inner.end(), std::back_inserter(nodes));
      }
    }
    return nodes;
  }
};

} // namespace

SqlLineageTracer::SqlLineageTracer(size_t maxDepth) : maxDepth_(maxDepth) {}

TraceNode SqlLineageTracer::trace(const std::string &column,
                                  const std::string &sql,
                                  const std::string &dialect,
                                  const SchemaMap &schema) const {
  return traceStatement(column, nullptr, sql, dialect, schema);
}

TraceNode SqlLineageTracer::traceAt(size_t position, const std::string &column,
                                    const std::string &sql,
                                    const std::string &dialect,
                                    const SchemaMap &schema) const {
  return traceStatement(column, &position, sql, dialect, schema);
}

TraceNode SqlLineageTracer::traceStatement(const std::string &column,
                                           const size_t *position,
                                           const std::string &sql,
                                           const std::string &dialect,
                                           const SchemaMap &schema) const {
  SqlParser parser(dialect);
  Statement statement = parser.parseStatement(sql);
  const QueryNode *query = lineageQuery(statement);
  if (!query) {
    throw UnsupportedStatementError(
        statement.typeName(), "Statement type '" + statement.typeName() +
                                  "' does not support lineage analysis");
  }
  Tracer tracer(schema, maxDepth_);
  return tracer.traceRoot(*query, column, position);
}

} // namespace sql
