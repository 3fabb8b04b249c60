#ifndef COLUMN_LINEAGE_EXTRACTOR_H
#define COLUMN_LINEAGE_EXTRACTOR_H

#include "lineage/LineageModels.h"
#include "lineage/SchemaContext.h"
#include "lineage/TableLineageExtractor.h"
#include "sql/ILineageTracer.h"
#include "sql/SqlAst.h"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct ExtractorOptions {
  std::string dialect = "spark";
  // Raise StarResolutionError instead of emitting a * output.
  bool noStar = false;
  // Raise SchemaResolutionError for unattributable columns while gathering
  // schema.
  bool strictSchema = false;
  size_t maxDepth = 256;
};

// Output column of a statement as reported to callers (displayName) and as
// the tracer knows it inside the query (lineageName). position is its index
// in the statement's output list.
struct OutputColumn {
  std::string displayName;
  std::string lineageName;
  size_t position{0};
};

// Column lineage for the statements of one SQL text. The extractor owns the
// file-scoped SchemaContext: it starts from the initial schema on every
// analyzeQueries call and grows after each statement is analysed.
class ColumnLineageExtractor {
public:
  explicit ColumnLineageExtractor(std::shared_ptr<sql::ILineageTracer> tracer,
                                  ExtractorOptions options = {});

  void setInitialSchema(const sql::SchemaMap &schema);
  const sql::SchemaMap &initialSchema() const { return initialSchema_; }

  std::vector<QueryLineageResult>
  analyzeQueries(const std::string &sql, const AnalysisRequest &request = {});

  // Statements analyzeQueries could not produce lineage for.
  const std::vector<SkippedQuery> &skippedQueries() const { return skipped_; }

  // Schema-only pass: records CREATE outputs and infers table columns from
  // the queries without tracing lineage.
  const SchemaContext &extractSchema(const std::string &sql);

  // Tables the last extractSchema call defined with CREATE TABLE/VIEW/CACHE.
  const std::set<std::string> &definedTables() const { return definedTables_; }

  // Outputs of one statement, qualified with the write target for DML/DDL.
  // Throws UnsupportedStatementError for statements without a query.
  std::vector<OutputColumn> getOutputColumns(const sql::Statement &statement) const;

  // (output, source) pairs, sorted per output. With column set only that
  // output is traced; an empty result means the statement lacks it.
  std::vector<LineageItem>
  extractForward(const sql::Statement &statement,
                 const std::optional<std::string> &column = std::nullopt) const;

  // (sourceColumn, affected output) pairs; empty when the statement neither
  // reads nor produces sourceColumn.
  std::vector<LineageItem> extractReverse(const sql::Statement &statement,
                                          const std::string &sourceColumn) const;

  const SchemaContext &schema() const { return schema_; }
  SchemaContext &schema() { return schema_; }
  const ExtractorOptions &options() const { return options_; }

private:
  std::vector<std::string> traceSources(const OutputColumn &output,
                                        const std::string &sql,
                                        const sql::SchemaMap &schema) const;
  std::vector<std::string> flatten(const sql::TraceNode &root) const;

  std::shared_ptr<sql::ILineageTracer> tracer_;
  ExtractorOptions options_;
  TableLineageExtractor tableExtractor_;
  sql::SchemaMap initialSchema_;
  SchemaContext schema_;
  std::set<std::string> definedTables_;
  std::vector<SkippedQuery> skipped_;
};

// SELECT statement equivalent to the SET list of an UPDATE, used to trace
// the assigned columns.
std::string updateAsSelect(const sql::UpdateStatement &update);

// True when the UPDATE reads from a subquery or a derived table.
bool updateHasSelect(const sql::UpdateStatement &update);

#endif
