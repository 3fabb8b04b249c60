#ifndef LINEAGE_GRAPH_BUILDER_H
#define LINEAGE_GRAPH_BUILDER_H

#include "catalog/CatalogRegistry.h"
#include "catalog/ICatalogProvider.h"
#include "core/lineage_config.h"
#include "graph/LineageGraph.h"
#include "lineage/LineageModels.h"
#include "lineage/SchemaContext.h"
#include "lineage/SchemaExtractor.h"
#include "sql/ILineageTracer.h"
#include <memory>
#include <string>
#include <vector>

struct BuilderOptions {
  std::string dialect{"spark"};
  std::string nodeFormat{"qualified"};
  // Run a schema-gathering pass over every file before the lineage pass.
  bool resolveSchema{false};
  bool noStar{false};
  bool strictSchema{false};
  size_t maxLineageDepth{256};
  sql::SchemaMap initialSchema;
  // Consulted for tables still unknown after the gathering pass.
  std::shared_ptr<ICatalogProvider> catalog;

  static BuilderOptions fromConfig(const LineageConfig &config,
                                   const CatalogRegistry &registry);
};

struct SkippedFile {
  std::string filePath;
  std::string reason;
};

struct SkippedStatement {
  std::string filePath;
  SkippedQuery query;
};

// Builds one column lineage graph from many SQL files. Files are queued by
// the add* calls and analysed by build(); each file gets its own
// ColumnLineageExtractor seeded with the initial (or gathered) schema.
class LineageGraphBuilder {
public:
  explicit LineageGraphBuilder(BuilderOptions options = {},
                               std::shared_ptr<sql::ILineageTracer> tracer = nullptr);

  LineageGraphBuilder &addFile(const std::string &path,
                               const std::string &dialect = "");
  LineageGraphBuilder &addFiles(const std::vector<std::string> &paths,
                                const std::string &dialect = "");
  LineageGraphBuilder &addDirectory(const std::string &dir,
                                    bool recursive = false,
                                    const std::string &glob = "*.sql",
                                    const std::string &dialect = "");
  // Manifest dialects win over dialect, which wins over the default.
  LineageGraphBuilder &addManifest(const std::string &path,
                                   const std::string &dialect = "");

  void setPreprocessor(SqlPreprocessor preprocessor);
  void setClock(GraphClock clock) { clock_ = std::move(clock); }

  // Analyses the queued files and returns the graph accumulated so far.
  // StarResolutionError and SchemaResolutionError propagate; other failures
  // are recorded in skippedFiles() and skippedQueries().
  LineageGraph build();

  const std::vector<SkippedFile> &skippedFiles() const { return skippedFiles_; }
  const std::vector<SkippedStatement> &skippedQueries() const {
    return skippedQueries_;
  }
  // Schema the lineage pass was seeded with.
  const SchemaContext &resolvedSchema() const { return resolvedSchema_; }
  const BuilderOptions &options() const { return options_; }

private:
  void analyzeFile(const SqlSource &source);
  void addLineageItem(const LineageItem &item, const std::string &filePath,
                      size_t queryIndex);
  std::string dialectOf(const SqlSource &source) const;

  BuilderOptions options_;
  std::shared_ptr<sql::ILineageTracer> tracer_;
  SqlPreprocessor preprocessor_;
  GraphClock clock_;
  std::vector<SqlSource> pending_;
  SchemaContext resolvedSchema_;
  GraphAccumulator graph_;
  std::vector<SkippedFile> skippedFiles_;
  std::vector<SkippedStatement> skippedQueries_;
};

#endif
