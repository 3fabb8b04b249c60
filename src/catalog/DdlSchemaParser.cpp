#include "catalog/DdlSchemaParser.h"
#include "core/logger.h"
#include "lineage/LineageErrors.h"
#include "sql/SqlParser.h"
#include "utils/string_utils.h"

DdlSchemaParser::DdlSchemaParser(const std::string &dialect)
    : dialect_(dialect) {}

sql::SchemaMap DdlSchemaParser::parse(const std::string &ddl) const {
  sql::SchemaMap schema;
  sql::SqlParser parser(dialect_);

  std::vector<std::string> statements;
  try {
    statements = parser.splitStatements(ddl);
  } catch (const LineageError &e) {
    Logger::warning(LogCategory::CATALOG, "DdlSchemaParser",
                    "Skipping unreadable DDL: " + std::string(e.what()));
    return schema;
  }

  for (const auto &text : statements) {
    try {
      sql::Statement statement = parser.parseStatement(text);
      const auto *create = std::get_if<sql::CreateStatement>(&statement.body);
      if (!create || create->target.empty() || create->columns.empty())
        continue;
      if (create->kind != sql::CreateKind::Table &&
          create->kind != sql::CreateKind::View)
        continue;

      std::vector<std::string> columns;
      for (const auto &column : create->columns)
        columns.push_back(StringUtils::toLower(column.name));
      schema[create->target.qualified()] = columns;
    } catch (const LineageError &e) {
      Logger::warning(LogCategory::CATALOG, "DdlSchemaParser",
                      "Skipping unparsable DDL: " + std::string(e.what()));
    }
  }
  return schema;
}
