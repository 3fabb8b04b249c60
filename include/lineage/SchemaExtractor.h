#ifndef SCHEMA_EXTRACTOR_H
#define SCHEMA_EXTRACTOR_H

#include "catalog/ICatalogProvider.h"
#include "lineage/ColumnLineageExtractor.h"
#include "lineage/SchemaContext.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Rewrites SQL text before analysis (template rendering and the like). The
// second argument is the path the text was read from.
using SqlPreprocessor =
    std::function<std::string(const std::string &sql, const std::string &path)>;

struct SqlSource {
  std::string path;
  // Empty means the extractor's default dialect.
  std::string dialect;
};

// Schema-gathering pass over a set of SQL files: CREATE statements and
// column references of every file are folded into one SchemaContext. The
// files are re-read until the schema stops changing, so the result does not
// depend on their order. Optionally fills the remaining gaps from a catalog.
class SchemaExtractor {
public:
  explicit SchemaExtractor(std::shared_ptr<sql::ILineageTracer> tracer,
                           ExtractorOptions options = {});

  void setPreprocessor(SqlPreprocessor preprocessor) {
    preprocessor_ = std::move(preprocessor);
  }

  // Files that cannot be read or parsed are skipped; SchemaResolutionError
  // propagates.
  SchemaContext extractFromFiles(const std::vector<SqlSource> &sources,
                                 const sql::SchemaMap &initial = {}) const;

  // Non-CTE tables read or written by any statement of the sources.
  std::vector<std::string>
  referencedTables(const std::vector<SqlSource> &sources) const;

  // Adds catalog columns for referenced tables the schema does not know.
  // Entries already present are never replaced. Returns the number of tables
  // added.
  size_t fillFromCatalog(SchemaContext &schema,
                         const std::vector<SqlSource> &sources,
                         ICatalogProvider &catalog) const;

  // extractFromFiles followed by fillFromCatalog when catalog is set.
  SchemaContext resolve(const std::vector<SqlSource> &sources,
                        const sql::SchemaMap &initial = {},
                        ICatalogProvider *catalog = nullptr) const;

private:
  std::string loadSql(const SqlSource &source) const;
  std::string dialectOf(const SqlSource &source) const;
  // One read of every file against current. Tables a file defines take
  // that file's columns; inferred columns are unioned.
  SchemaContext extractPass(const std::vector<SqlSource> &sources,
                            const SchemaContext &current,
                            const sql::SchemaMap &initial,
                            bool firstPass) const;

  std::shared_ptr<sql::ILineageTracer> tracer_;
  ExtractorOptions options_;
  SqlPreprocessor preprocessor_;
};

#endif
