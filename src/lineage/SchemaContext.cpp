#include "lineage/SchemaContext.h"
#include "lineage/LineageErrors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <set>
#include <utility>

namespace {

std::vector<std::string> lowered(const std::vector<std::string> &names) {
  std::vector<std::string> result;
  result.reserve(names.size());
  for (const auto &name : names)
    result.push_back(StringUtils::toLower(name));
  return result;
}

// Walks every SELECT of a statement and collects (table, column) pairs that
// its column references prove to exist.
class ColumnInference {
public:
  ColumnInference(const sql::SchemaMap &schema, const std::string &preview,
                  bool strict)
      : resolver_(schema), preview_(preview), strict_(strict) {}

  void visitQuery(const sql::QueryNode &query, const sql::CteScope *outer) {
    const sql::CteScope *ctes = resolver_.pushCtes(query, outer);

    std::vector<const sql::CteScope *> own;
    for (const sql::CteScope *node = ctes;
         node != outer && own.size() < query.ctes.size(); node = node->parent)
      own.push_back(node);
    for (auto it = own.rbegin(); it != own.rend(); ++it) {
      if ((*it)->cte->query)
        visitQuery(*(*it)->cte->query, (*it)->parent);
    }

    switch (query.kind) {
    case sql::QueryKind::SetOperation:
      if (query.left)
        visitQuery(*query.left, ctes);
      if (query.right)
        visitQuery(*query.right, ctes);
      break;
    case sql::QueryKind::Select:
      if (query.select)
        visitSelect(*query.select, ctes);
      break;
    case sql::QueryKind::Values:
      break;
    }
  }

  const std::vector<std::pair<std::string, std::string>> &found() const {
    return found_;
  }

private:
  void visitSelect(const sql::SelectCore &select, const sql::CteScope *ctes) {
    sql::SelectScope scope = resolver_.bind(select, ctes);

    std::set<std::string> localNames;
    for (const auto &item : select.projections) {
      for (const auto &alias : item.aliases)
        localNames.insert(StringUtils::toLower(alias));
    }
    std::vector<const sql::SourceBinding *> relations;
    for (const auto &source : scope.sources) {
      if (source.kind == sql::BindingKind::LateralView) {
        for (const auto &column : source.columnAliases)
          localNames.insert(StringUtils::toLower(column));
      } else {
        relations.push_back(&source);
        if (source.kind == sql::BindingKind::Derived && source.query)
          visitQuery(*source.query, ctes);
      }
    }

    std::vector<const sql::Expression *> columns;
    sql::forEachExpression(select, [&](const sql::Expression &expr) {
      sql::collectColumns(expr, columns);
      std::vector<const sql::QueryNode *> subqueries;
      sql::collectSubqueries(expr, subqueries);
      for (const sql::QueryNode *subquery : subqueries)
        visitQuery(*subquery, ctes);
    });

    for (const sql::Expression *column : columns) {
      std::string name = StringUtils::toLower(column->columnName());
      std::vector<std::string> qualifier = column->qualifier();

      if (!qualifier.empty()) {
        const sql::SourceBinding *source = scope.find(qualifier);
        if (source && source->kind == sql::BindingKind::Table)
          found_.emplace_back(source->tableName, name);
        continue;
      }

      if (localNames.count(name))
        continue;
      if (relations.size() == 1) {
        if (relations.front()->kind == sql::BindingKind::Table)
          found_.emplace_back(relations.front()->tableName, name);
        continue;
      }
      if (relations.size() > 1 && strict_) {
        throw SchemaResolutionError(
            "Cannot resolve table for unqualified column '" + name +
            "' in multi-table query: " + preview_);
      }
    }
  }

  sql::ScopeResolver resolver_;
  std::string preview_;
  bool strict_;
  std::vector<std::pair<std::string, std::string>> found_;
};

} // namespace

SchemaContext::SchemaContext(const sql::SchemaMap &initial) { reset(initial); }

void SchemaContext::set(const std::string &table,
                        const std::vector<std::string> &columns) {
  if (columns.empty())
    return;
  schema_[StringUtils::toLower(table)] = lowered(columns);
}

void SchemaContext::addColumn(const std::string &table,
                              const std::string &column) {
  std::vector<std::string> &columns = schema_[StringUtils::toLower(table)];
  std::string name = StringUtils::toLower(column);
  if (std::find(columns.begin(), columns.end(), name) == columns.end())
    columns.push_back(name);
}

void SchemaContext::merge(const SchemaContext &other, bool overwrite) {
  for (const auto &entry : other.schema_) {
    if (overwrite || schema_.count(entry.first) == 0)
      schema_[entry.first] = entry.second;
  }
}

bool SchemaContext::contains(const std::string &table) const {
  return schema_.count(StringUtils::toLower(table)) > 0;
}

const std::vector<std::string> *
SchemaContext::find(const std::string &table) const {
  auto it = schema_.find(StringUtils::toLower(table));
  return it == schema_.end() ? nullptr : &it->second;
}

void SchemaContext::record(const sql::Statement &statement) {
  const auto *create = std::get_if<sql::CreateStatement>(&statement.body);
  if (!create || create->kind == sql::CreateKind::Other ||
      create->target.empty())
    return;

  std::vector<std::string> declared;
  for (const auto &column : create->columns)
    declared.push_back(column.name);

  std::vector<std::string> columns;
  if (create->query) {
    sql::ScopeResolver resolver(schema_);
    columns = resolver.outputColumns(*create->query, nullptr);
    // CREATE VIEW v (x, y) AS ... renames the leading columns.
    for (size_t i = 0; i < declared.size() && i < columns.size(); ++i)
      columns[i] = declared[i];
  } else {
    columns = declared;
  }
  set(create->target.qualified(), columns);
}

void SchemaContext::inferFromQuery(const sql::Statement &statement,
                                   bool strict) {
  const sql::QueryNode *query = sql::lineageQuery(statement);
  if (!query)
    return;

  std::string preview =
      StringUtils::normalizeWhitespace(statement.text).substr(0, 80);
  ColumnInference inference(schema_, preview, strict);
  inference.visitQuery(*query, nullptr);
  for (const auto &entry : inference.found())
    addColumn(entry.first, entry.second);
}

sql::SchemaMap
SchemaContext::pruneTo(const std::vector<sql::TableReference> &references) const {
  sql::SchemaMap pruned;
  for (const auto &reference : references) {
    if (reference.isCte)
      continue;
    auto it = schema_.find(reference.name.qualified());
    if (it != schema_.end())
      pruned.insert(*it);
  }
  return pruned;
}

std::vector<std::string> SchemaContext::tables() const {
  std::vector<std::string> names;
  names.reserve(schema_.size());
  for (const auto &entry : schema_)
    names.push_back(entry.first);
  return names;
}

void SchemaContext::reset(const sql::SchemaMap &initial) {
  schema_.clear();
  for (const auto &entry : initial)
    set(entry.first, entry.second);
}
