#ifndef SCHEMA_CONTEXT_H
#define SCHEMA_CONTEXT_H

#include "sql/ScopeResolver.h"
#include "sql/SqlAst.h"
#include <string>
#include <vector>

// Known output columns per table or view within one analysis scope (a file,
// or a whole build during schema gathering). Keys and column names are
// lower-case.
class SchemaContext {
public:
  SchemaContext() = default;
  explicit SchemaContext(const sql::SchemaMap &initial);

  // Replaces the column list of table. Empty lists are ignored.
  void set(const std::string &table, const std::vector<std::string> &columns);

  // Appends column to table unless already present.
  void addColumn(const std::string &table, const std::string &column);

  // Adds entries of other; existing tables are only replaced when
  // overwrite is set.
  void merge(const SchemaContext &other, bool overwrite);

  bool contains(const std::string &table) const;
  const std::vector<std::string> *find(const std::string &table) const;

  // Records the output columns of CREATE TABLE/VIEW (AS SELECT or with a
  // column list) and CACHE TABLE AS SELECT. Call only after the statement
  // itself has been analysed.
  void record(const sql::Statement &statement);

  // Infers table columns from column references in the statement's queries.
  // With strict set, an unqualified column in a multi-source SELECT raises
  // SchemaResolutionError.
  void inferFromQuery(const sql::Statement &statement, bool strict);

  // Entries for the non-CTE tables in references only.
  sql::SchemaMap pruneTo(const std::vector<sql::TableReference> &references) const;

  std::vector<std::string> tables() const;
  const sql::SchemaMap &toMap() const { return schema_; }
  size_t size() const { return schema_.size(); }
  bool empty() const { return schema_.empty(); }
  void reset(const sql::SchemaMap &initial = {});

private:
  sql::SchemaMap schema_;
};

#endif
