#ifndef DDL_SCHEMA_PARSER_H
#define DDL_SCHEMA_PARSER_H

#include "sql/ScopeResolver.h"
#include <string>

// Extracts table -> column names from CREATE TABLE / CREATE VIEW statements
// with an explicit column list. Types are ignored; other statements and
// statements that fail to parse are skipped.
class DdlSchemaParser {
public:
  explicit DdlSchemaParser(const std::string &dialect = "spark");

  sql::SchemaMap parse(const std::string &ddl) const;

private:
  std::string dialect_;
};

#endif
