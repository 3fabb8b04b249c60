#include "graph/LineageGraphBuilder.h"
#include "core/logger.h"
#include "lineage/ColumnLineageExtractor.h"
#include "lineage/LineageErrors.h"
#include "sql/SqlLineageTracer.h"
#include "utils/file_utils.h"
#include "utils/time_utils.h"

BuilderOptions BuilderOptions::fromConfig(const LineageConfig &config,
                                          const CatalogRegistry &registry) {
  BuilderOptions options;
  options.dialect = config.getDialect();
  options.nodeFormat = config.getNodeFormat();
  options.resolveSchema = config.getResolveSchema();
  options.noStar = config.getNoStar();
  options.strictSchema = config.getStrictSchema();
  options.maxLineageDepth = config.getMaxLineageDepth();
  if (!config.getCatalogType().empty()) {
    options.catalog = std::shared_ptr<ICatalogProvider>(
        registry.create(config.getCatalogType(), config.getCatalogConfig()));
  }
  return options;
}

LineageGraphBuilder::LineageGraphBuilder(
    BuilderOptions options, std::shared_ptr<sql::ILineageTracer> tracer)
    : options_(std::move(options)), tracer_(std::move(tracer)),
      resolvedSchema_(options_.initialSchema) {
  if (!tracer_)
    tracer_ = std::make_shared<sql::SqlLineageTracer>(options_.maxLineageDepth);
  clock_ = []() { return std::chrono::system_clock::now(); };
}

void LineageGraphBuilder::setPreprocessor(SqlPreprocessor preprocessor) {
  preprocessor_ = std::move(preprocessor);
}

std::string LineageGraphBuilder::dialectOf(const SqlSource &source) const {
  return source.dialect.empty() ? options_.dialect : source.dialect;
}

LineageGraphBuilder &LineageGraphBuilder::addFile(const std::string &path,
                                                  const std::string &dialect) {
  SqlSource source;
  source.path = FileUtils::absolutePath(path);
  source.dialect = dialect;
  pending_.push_back(std::move(source));
  return *this;
}

LineageGraphBuilder &
LineageGraphBuilder::addFiles(const std::vector<std::string> &paths,
                              const std::string &dialect) {
  for (const auto &path : paths)
    addFile(path, dialect);
  return *this;
}

LineageGraphBuilder &LineageGraphBuilder::addDirectory(
    const std::string &dir, bool recursive, const std::string &glob,
    const std::string &dialect) {
  return addFiles(FileUtils::listFiles(dir, glob, recursive), dialect);
}

LineageGraphBuilder &LineageGraphBuilder::addManifest(const std::string &path,
                                                      const std::string &dialect) {
  for (const auto &entry : FileUtils::readManifest(path))
    addFile(entry.filePath, entry.dialect.empty() ? dialect : entry.dialect);
  return *this;
}

void LineageGraphBuilder::addLineageItem(const LineageItem &item,
                                         const std::string &filePath,
                                         size_t queryIndex) {
  if (item.outputName.empty() || item.sourceName.empty())
    return;

  // Outputs fed only by constants or unresolved sources still get a node.
  if (item.sourceName == UNRESOLVED_SOURCE || isLiteralMarker(item.sourceName) ||
      item.sourceName == item.outputName) {
    graph_.addNodeIfNotExists(
        GraphNode::fromIdentifier(item.outputName, filePath, queryIndex));
    return;
  }

  graph_.addNodeIfNotExists(
      GraphNode::fromIdentifier(item.sourceName, filePath, queryIndex));
  graph_.addNodeIfNotExists(
      GraphNode::fromIdentifier(item.outputName, filePath, queryIndex));

  GraphEdge edge;
  edge.sourceNode = item.sourceName;
  edge.targetNode = item.outputName;
  edge.filePath = filePath;
  edge.queryIndex = queryIndex;
  graph_.addEdgeIfNotExists(edge);
}

void LineageGraphBuilder::analyzeFile(const SqlSource &source) {
  const std::string fileName = FileUtils::fileName(source.path);
  std::string sql = FileUtils::readTextFile(source.path);
  if (preprocessor_)
    sql = preprocessor_(sql, source.path);

  ExtractorOptions extractorOptions;
  extractorOptions.dialect = dialectOf(source);
  extractorOptions.noStar = options_.noStar;
  extractorOptions.strictSchema = options_.strictSchema;
  extractorOptions.maxDepth = options_.maxLineageDepth;

  ColumnLineageExtractor extractor(tracer_, extractorOptions);
  extractor.setInitialSchema(resolvedSchema_.toMap());

  std::vector<QueryLineageResult> results;
  try {
    results = extractor.analyzeQueries(sql);
  } catch (const StarResolutionError &) {
    throw;
  } catch (const SchemaResolutionError &) {
    throw;
  } catch (const LineageError &e) {
    skippedFiles_.push_back({source.path, e.what()});
    Logger::warning(LogCategory::GRAPH, "LineageGraphBuilder",
                    "Skipping " + fileName + ": " + std::string(e.what()));
    return;
  }

  for (const auto &skipped : extractor.skippedQueries()) {
    Logger::warning(LogCategory::GRAPH, "LineageGraphBuilder",
                    "Skipping query " + std::to_string(skipped.queryIndex) +
                        " in " + fileName + " (" + skipped.statementType +
                        "): " + skipped.reason);
    skippedQueries_.push_back({source.path, skipped});
  }

  graph_.addSourceFile(source.path);
  for (const auto &result : results) {
    for (const auto &item : result.items)
      addLineageItem(item, source.path, result.metadata.queryIndex);
  }
}

LineageGraph LineageGraphBuilder::build() {
  std::vector<SqlSource> sources;
  sources.swap(pending_);

  if (options_.resolveSchema && !sources.empty()) {
    ExtractorOptions extractorOptions;
    extractorOptions.dialect = options_.dialect;
    extractorOptions.strictSchema = options_.strictSchema;
    extractorOptions.maxDepth = options_.maxLineageDepth;

    SchemaExtractor schemaExtractor(tracer_, extractorOptions);
    schemaExtractor.setPreprocessor(preprocessor_);
    resolvedSchema_ = schemaExtractor.resolve(sources, resolvedSchema_.toMap(),
                                              options_.catalog.get());
  }

  for (const auto &source : sources)
    analyzeFile(source);

  GraphMetadata metadata;
  metadata.nodeFormat = options_.nodeFormat;
  metadata.defaultDialect = options_.dialect;
  metadata.createdAt = TimeUtils::toIso8601Utc(clock_());
  LineageGraph graph = graph_.toGraph(std::move(metadata));

  if (!skippedFiles_.empty()) {
    Logger::warning(LogCategory::GRAPH, "LineageGraphBuilder",
                    "Skipped " + std::to_string(skippedFiles_.size()) +
                        " file(s) that could not be analyzed for lineage");
  }
  Logger::info(LogCategory::GRAPH, "LineageGraphBuilder",
               "Built graph with " + std::to_string(graph.nodes.size()) +
                   " nodes and " + std::to_string(graph.edges.size()) +
                   " edges");
  return graph;
}
