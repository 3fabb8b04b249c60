#include "sql/ScopeResolver.h"
#include "utils/string_utils.h"

namespace sql {

namespace {

std::vector<std::string> overlayAliases(std::vector<std::string> columns,
                                        const std::vector<std::string> &aliases) {
  if (aliases.empty())
    return columns;
  std::vector<std::string> result = aliases;
  for (size_t i = aliases.size(); i < columns.size(); ++i)
    result.push_back(columns[i]);
  return result;
}

} // namespace

const CteScope *CteScope::find(const std::string &name) const {
  std::string key = StringUtils::toLower(name);
  for (const CteScope *node = this; node; node = node->parent) {
    if (node->cte && StringUtils::toLower(node->cte->name) == key)
      return node;
  }
  return nullptr;
}

std::string SourceBinding::qualifiedName() const {
  if (kind == BindingKind::Table)
    return tableName;
  return name;
}

const SourceBinding *
SelectScope::find(const std::vector<std::string> &qualifier) const {
  if (qualifier.empty())
    return nullptr;
  std::string joined = StringUtils::toLower(StringUtils::join(qualifier, "."));
  for (const auto &source : sources) {
    if (source.name == joined ||
        (source.kind == BindingKind::Table && source.tableName == joined))
      return &source;
  }
  if (qualifier.size() > 1) {
    std::string last = StringUtils::toLower(qualifier.back());
    for (const auto &source : sources) {
      if (source.name == last)
        return &source;
    }
  }
  return nullptr;
}

ScopeResolver::ScopeResolver(const SchemaMap &schema) : schema_(schema) {}

const CteScope *ScopeResolver::pushCtes(const QueryNode &query,
                                        const CteScope *outer) {
  const CteScope *current = outer;
  for (const auto &cte : query.ctes) {
    CteScope node;
    node.parent = current;
    node.cte = &cte;
    cteNodes_.push_back(node);
    current = &cteNodes_.back();
  }
  return current;
}

SelectScope ScopeResolver::bind(const SelectCore &select, const CteScope *ctes,
                                const SelectScope *outer) {
  SelectScope scope;
  scope.select = &select;
  scope.ctes = ctes;
  scope.outer = outer;

  auto bindSource = [&](const TableSource &src, bool filtering) {
    SourceBinding binding;
    binding.name = src.referenceName();
    binding.filtering = filtering;
    binding.columnAliases = src.columnAliases;

    switch (src.kind) {
    case SourceKind::Table: {
      const CteScope *cte = nullptr;
      if (src.table.parts.size() == 1 && ctes)
        cte = ctes->find(src.table.name());
      if (cte) {
        binding.kind = BindingKind::Cte;
        binding.tableName = StringUtils::toLower(cte->cte->name);
        binding.query = cte->cte->query.get();
        binding.queryScope = cte->parent;
        if (binding.columnAliases.empty())
          binding.columnAliases = cte->cte->columnAliases;
      } else {
        binding.kind = BindingKind::Table;
        binding.tableName = src.table.qualified();
      }
      break;
    }
    case SourceKind::Derived:
      binding.kind = BindingKind::Derived;
      binding.query = src.query.get();
      binding.queryScope = ctes;
      break;
    case SourceKind::TableFunction:
      binding.kind = BindingKind::Function;
      binding.generator = src.function.get();
      if (binding.columnAliases.empty() && src.function)
        binding.columnAliases = defaultGeneratorColumns(*src.function);
      break;
    }
    scope.sources.push_back(std::move(binding));
  };

  if (select.from)
    bindSource(*select.from, false);
  for (const auto &join : select.joins)
    bindSource(join.source, join.isFiltering());

  for (const auto &lateral : select.lateralViews) {
    SourceBinding binding;
    binding.kind = BindingKind::LateralView;
    binding.name = StringUtils::toLower(lateral.alias);
    binding.generator = lateral.generator.get();
    binding.columnAliases = lateral.columnAliases.empty()
                                ? defaultGeneratorColumns(*lateral.generator)
                                : lateral.columnAliases;
    scope.sources.push_back(std::move(binding));
  }
  return scope;
}

std::vector<std::string> ScopeResolver::columnsOf(const SourceBinding &source) {
  switch (source.kind) {
  case BindingKind::Table: {
    const std::vector<std::string> *columns = lookupTable(source.tableName);
    if (!columns)
      return source.columnAliases;
    return overlayAliases(*columns, source.columnAliases);
  }
  case BindingKind::Cte:
  case BindingKind::Derived:
    if (!source.query)
      return source.columnAliases;
    return overlayAliases(outputColumns(*source.query, source.queryScope),
                          source.columnAliases);
  case BindingKind::Function:
  case BindingKind::LateralView:
    return source.columnAliases;
  }
  return {};
}

std::vector<ResolvedProjection>
ScopeResolver::projections(const SelectScope &scope) {
  std::vector<ResolvedProjection> result;

  for (const auto &item : scope.select->projections) {
    const Expression *expr = item.expr.get();

    if (expr->isStar()) {
      const SourceBinding *qualified = nullptr;
      std::vector<const SourceBinding *> candidates;
      if (expr->path.empty()) {
        for (const auto &source : scope.sources) {
          if (!source.filtering)
            candidates.push_back(&source);
        }
      } else {
        qualified = scope.find(expr->path);
        if (qualified)
          candidates.push_back(qualified);
      }

      bool expanded = false;
      for (const SourceBinding *source : candidates) {
        for (const auto &column : columnsOf(*source)) {
          ResolvedProjection projection;
          projection.name = column;
          projection.item = &item;
          projection.expr = expr;
          projection.source = source;
          result.push_back(std::move(projection));
          expanded = true;
        }
      }
      if (!expanded) {
        ResolvedProjection projection;
        projection.name = "*";
        projection.item = &item;
        projection.expr = expr;
        projection.source = qualified;
        projection.unresolvedStar = true;
        result.push_back(std::move(projection));
      }
      continue;
    }

    if (item.aliases.size() > 1) {
      for (const auto &alias : item.aliases) {
        ResolvedProjection projection;
        projection.name = alias;
        projection.item = &item;
        projection.expr = expr;
        result.push_back(std::move(projection));
      }
      continue;
    }

    ResolvedProjection projection;
    projection.name = item.hasAlias() ? item.alias() : projectionName(*expr);
    projection.item = &item;
    projection.expr = expr;
    result.push_back(std::move(projection));
  }
  return result;
}

std::vector<std::string> ScopeResolver::outputColumns(const QueryNode &query,
                                                      const CteScope *outer) {
  const CteScope *ctes = pushCtes(query, outer);
  std::vector<std::string> names;

  switch (query.kind) {
  case QueryKind::SetOperation:
    if (query.left)
      names = outputColumns(*query.left, ctes);
    break;
  case QueryKind::Values:
    if (!query.rows.empty()) {
      for (size_t i = 0; i < query.rows.front().size(); ++i)
        names.push_back("col" + std::to_string(i + 1));
    }
    break;
  case QueryKind::Select:
    if (query.select) {
      SelectScope scope = bind(*query.select, ctes);
      for (const auto &projection : projections(scope)) {
        if (!projection.unresolvedStar)
          names.push_back(projection.name);
      }
    }
    break;
  }
  return names;
}

const std::vector<std::string> *
ScopeResolver::lookupTable(const std::string &name) const {
  auto it = schema_.find(StringUtils::toLower(name));
  if (it == schema_.end())
    return nullptr;
  return &it->second;
}

std::string projectionName(const Expression &expr) {
  if (expr.isColumn())
    return StringUtils::toLower(expr.columnName());
  return StringUtils::trim(expr.text);
}

std::vector<std::string> defaultGeneratorColumns(const Expression &generator) {
  if (generator.kind != ExprKind::Function)
    return {};
  const std::string &fn = generator.name;
  if (fn == "explode" || fn == "explode_outer" || fn == "unnest")
    return {"col"};
  if (fn == "posexplode" || fn == "posexplode_outer")
    return {"pos", "col"};
  if (fn == "json_tuple" && generator.children.size() > 1) {
    std::vector<std::string> names;
    for (size_t i = 1; i < generator.children.size(); ++i)
      names.push_back("c" + std::to_string(i - 1));
    return names;
  }
  return {};
}

} // namespace sql
