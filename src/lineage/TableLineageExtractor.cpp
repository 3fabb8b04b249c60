#include "lineage/TableLineageExtractor.h"
#include "sql/SqlParser.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <map>
#include <set>

namespace {

constexpr size_t kPreviewLength = 100;

ObjectType targetObjectType(const sql::Statement &statement) {
  if (const auto *create = std::get_if<sql::CreateStatement>(&statement.body)) {
    switch (create->kind) {
    case sql::CreateKind::Table:
    case sql::CreateKind::Cache:
      return ObjectType::TABLE;
    case sql::CreateKind::View:
      return ObjectType::VIEW;
    case sql::CreateKind::Other:
      break;
    }
  }
  return ObjectType::UNKNOWN;
}

std::set<std::string> cteNames(const sql::Statement &statement) {
  std::set<std::string> names;
  if (const sql::QueryNode *query = sql::lineageQuery(statement)) {
    for (const auto &cte : query->ctes)
      names.insert(StringUtils::toLower(cte.name));
  }
  return names;
}

} // namespace

TableLineageExtractor::TableLineageExtractor(const std::string &dialect)
    : dialect_(dialect) {}

std::vector<std::string>
TableLineageExtractor::inputTables(const sql::Statement &statement) {
  std::set<std::string> unique;
  for (const auto &reference : sql::tableReferences(statement)) {
    if (!reference.isCte)
      unique.insert(reference.name.qualified());
  }
  return std::vector<std::string>(unique.begin(), unique.end());
}

bool TableLineageExtractor::referencesTable(const sql::Statement &statement,
                                            const std::string &filter) {
  std::vector<std::string> names = inputTables(statement);
  if (const sql::TableName *target = sql::targetTable(statement))
    names.push_back(target->qualified());
  return std::any_of(names.begin(), names.end(), [&](const std::string &name) {
    return StringUtils::containsIgnoreCase(name, filter);
  });
}

QueryMetadata TableLineageExtractor::metadataFor(const sql::Statement &statement) {
  return metadataFor(statement.index, statement.text);
}

QueryMetadata TableLineageExtractor::metadataFor(size_t index,
                                                 const std::string &text) {
  QueryMetadata metadata;
  metadata.queryIndex = index;
  metadata.queryPreview = StringUtils::truncate(
      StringUtils::normalizeWhitespace(text), kPreviewLength);
  return metadata;
}

std::vector<LineageItem>
TableLineageExtractor::extract(const sql::Statement &statement) const {
  const sql::TableName *target = sql::targetTable(statement);
  std::string output = target ? target->qualified() : QUERY_RESULT_TABLE;

  std::vector<LineageItem> items;
  for (const auto &input : inputTables(statement)) {
    LineageItem item;
    item.outputName = output;
    item.sourceName = input;
    items.push_back(std::move(item));
  }
  return items;
}

std::vector<TableInfo>
TableLineageExtractor::tables(const sql::Statement &statement) const {
  std::map<std::string, TableInfo> byName;

  for (const auto &cte : cteNames(statement)) {
    TableInfo info;
    info.name = cte;
    info.usage = TableUsage::INPUT;
    info.objectType = ObjectType::CTE;
    byName[cte] = info;
  }

  if (const sql::TableName *target = sql::targetTable(statement)) {
    std::string name = target->qualified();
    auto it = byName.find(name);
    TableInfo info;
    info.name = name;
    info.usage = it == byName.end() ? TableUsage::OUTPUT : TableUsage::BOTH;
    info.objectType = targetObjectType(statement);
    byName[name] = info;
  }

  for (const auto &input : inputTables(statement)) {
    auto it = byName.find(input);
    if (it == byName.end()) {
      TableInfo info;
      info.name = input;
      info.usage = TableUsage::INPUT;
      info.objectType = ObjectType::UNKNOWN;
      byName[input] = info;
    } else if (it->second.usage == TableUsage::OUTPUT) {
      it->second.usage = TableUsage::BOTH;
    }
  }

  std::vector<TableInfo> result;
  for (auto &entry : byName)
    result.push_back(std::move(entry.second));
  std::sort(result.begin(), result.end(),
            [](const TableInfo &a, const TableInfo &b) {
              return StringUtils::lessIgnoreCase(a.name, b.name);
            });
  return result;
}

std::vector<QueryTablesResult> TableLineageExtractor::analyzeTables(
    const std::string &sql, const std::optional<std::string> &tableFilter) const {
  sql::SqlParser parser(dialect_);
  std::vector<QueryTablesResult> results;

  for (const auto &statement : parser.parseScript(sql)) {
    if (tableFilter && !referencesTable(statement, *tableFilter))
      continue;
    QueryTablesResult result;
    result.metadata = metadataFor(statement);
    result.tables = tables(statement);
    results.push_back(std::move(result));
  }
  return results;
}
