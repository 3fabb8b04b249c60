#ifndef SQL_PARSER_H
#define SQL_PARSER_H

#include "sql/SqlAst.h"
#include "sql/SqlTokenizer.h"
#include <string>
#include <vector>

namespace sql {

// A statement of a script that failed to parse.
struct StatementParseError {
  size_t index{0};
  std::string text;
  std::string message;
};

// Recursive-descent parser for the statement kinds lineage analysis cares
// about. Statements it does not model (DROP, SET, GRANT, ...) are returned as
// AdministrativeStatement without further parsing. Syntax errors inside
// modelled statements raise SqlParseError.
class SqlParser {
public:
  explicit SqlParser(const std::string &dialect = "spark");

  // Splits on top-level semicolons and parses every non-empty statement.
  // Statement indexes count non-empty statements from zero. Without errors
  // the first SqlParseError propagates; with errors, statements that fail
  // are appended there and the rest are still parsed. Tokenizer errors
  // always propagate.
  std::vector<Statement>
  parseScript(const std::string &sql,
              std::vector<StatementParseError> *errors = nullptr) const;

  // Text of every non-empty statement, without the separating semicolons.
  std::vector<std::string> splitStatements(const std::string &sql) const;

  Statement parseStatement(const std::string &sql) const;

  // Parses sql as a single query (WITH / SELECT / VALUES / set operation).
  QueryPtr parseQuery(const std::string &sql) const;

  const std::string &dialect() const { return dialect_; }

private:
  std::vector<std::vector<Token>> splitTokens(const std::string &sql) const;

  std::string dialect_;
  SqlTokenizer tokenizer_;
};

} // namespace sql

#endif
