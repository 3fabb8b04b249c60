#ifndef TABLE_LINEAGE_EXTRACTOR_H
#define TABLE_LINEAGE_EXTRACTOR_H

#include "lineage/LineageModels.h"
#include "sql/SqlAst.h"
#include <optional>
#include <string>
#include <vector>

// Table-level lineage: which tables a statement reads and which it writes.
// No column resolution is involved.
class TableLineageExtractor {
public:
  explicit TableLineageExtractor(const std::string &dialect = "spark");

  // One item per input table: (target, input). Plain queries use
  // "query_result" as the target.
  std::vector<LineageItem> extract(const sql::Statement &statement) const;

  // Every table the statement touches with its usage and object type,
  // sorted case-insensitively by name.
  std::vector<TableInfo> tables(const sql::Statement &statement) const;

  std::vector<QueryTablesResult>
  analyzeTables(const std::string &sql,
                const std::optional<std::string> &tableFilter = std::nullopt) const;

  // Non-CTE input tables, qualified and lower-case, without duplicates.
  static std::vector<std::string> inputTables(const sql::Statement &statement);

  // Case-insensitive substring match of filter against every table the
  // statement touches.
  static bool referencesTable(const sql::Statement &statement,
                              const std::string &filter);

  static QueryMetadata metadataFor(const sql::Statement &statement);
  static QueryMetadata metadataFor(size_t index, const std::string &text);

private:
  std::string dialect_;
};

#endif
