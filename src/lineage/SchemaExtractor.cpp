#include "lineage/SchemaExtractor.h"
#include "catalog/DdlSchemaParser.h"
#include "core/logger.h"
#include "lineage/LineageErrors.h"
#include "lineage/TableLineageExtractor.h"
#include "sql/SqlParser.h"
#include "utils/file_utils.h"
#include <set>

SchemaExtractor::SchemaExtractor(std::shared_ptr<sql::ILineageTracer> tracer,
                                 ExtractorOptions options)
    : tracer_(std::move(tracer)), options_(std::move(options)) {}

std::string SchemaExtractor::dialectOf(const SqlSource &source) const {
  return source.dialect.empty() ? options_.dialect : source.dialect;
}

std::string SchemaExtractor::loadSql(const SqlSource &source) const {
  std::string sql = FileUtils::readTextFile(source.path);
  if (preprocessor_)
    sql = preprocessor_(sql, source.path);
  return sql;
}

SchemaContext SchemaExtractor::extractPass(const std::vector<SqlSource> &sources,
                                           const SchemaContext &current,
                                           const sql::SchemaMap &initial,
                                           bool firstPass) const {
  SchemaContext next(initial);
  sql::SchemaMap defined;
  size_t position = 0;

  for (const auto &source : sources) {
    ++position;
    if (firstPass) {
      Logger::info(LogCategory::SCHEMA, "SchemaExtractor",
                   "Extracting schema " + std::to_string(position) + "/" +
                       std::to_string(sources.size()) + ": " +
                       FileUtils::fileName(source.path));
    }
    try {
      ExtractorOptions options = options_;
      options.dialect = dialectOf(source);
      ColumnLineageExtractor extractor(tracer_, options);
      extractor.setInitialSchema(current.toMap());

      const SchemaContext &fileSchema = extractor.extractSchema(loadSql(source));
      for (const auto &entry : fileSchema.toMap()) {
        if (extractor.definedTables().count(entry.first)) {
          defined[entry.first] = entry.second;
          continue;
        }
        for (const auto &column : entry.second)
          next.addColumn(entry.first, column);
      }
    } catch (const SchemaResolutionError &) {
      throw;
    } catch (const std::runtime_error &e) {
      // The lineage pass reports the file again if it also fails there.
      if (firstPass) {
        Logger::debug(LogCategory::SCHEMA, "SchemaExtractor",
                      "Schema extraction skipped " + source.path + ": " +
                          std::string(e.what()));
      }
    }
  }

  // CREATE outputs replace whatever was inferred for the same table.
  for (const auto &entry : defined)
    next.set(entry.first, entry.second);
  return next;
}

SchemaContext
SchemaExtractor::extractFromFiles(const std::vector<SqlSource> &sources,
                                  const sql::SchemaMap &initial) const {
  SchemaContext schema(initial);

  // Every pass sees the whole schema of the previous one, so a view over a
  // view defined in a later file resolves once the chain has settled.
  const size_t maxPasses = sources.size() + 2;
  for (size_t pass = 1; pass <= maxPasses; ++pass) {
    SchemaContext next = extractPass(sources, schema, initial, pass == 1);
    if (next.toMap() == schema.toMap()) {
      Logger::debug(LogCategory::SCHEMA, "SchemaExtractor",
                    "Schema settled after " + std::to_string(pass) +
                        " pass(es)");
      return schema;
    }
    schema = std::move(next);
  }
  Logger::warning(LogCategory::SCHEMA, "SchemaExtractor",
                  "Schema still changing after " + std::to_string(maxPasses) +
                      " passes; using the last one");
  return schema;
}

std::vector<std::string>
SchemaExtractor::referencedTables(const std::vector<SqlSource> &sources) const {
  std::set<std::string> tables;
  for (const auto &source : sources) {
    try {
      std::string dialect = dialectOf(source);
      sql::SqlParser parser(dialect);
      TableLineageExtractor extractor(dialect);
      std::vector<sql::StatementParseError> parseErrors;
      for (const auto &statement : parser.parseScript(loadSql(source), &parseErrors)) {
        for (const auto &table : extractor.tables(statement)) {
          if (table.objectType != ObjectType::CTE)
            tables.insert(table.name);
        }
      }
    } catch (const std::runtime_error &e) {
      Logger::debug(LogCategory::SCHEMA, "SchemaExtractor",
                    "Cannot list tables of " + source.path + ": " +
                        std::string(e.what()));
    }
  }
  return std::vector<std::string>(tables.begin(), tables.end());
}

size_t SchemaExtractor::fillFromCatalog(SchemaContext &schema,
                                        const std::vector<SqlSource> &sources,
                                        ICatalogProvider &catalog) const {
  std::vector<std::string> missing;
  for (const auto &table : referencedTables(sources)) {
    if (!schema.contains(table))
      missing.push_back(table);
  }
  if (missing.empty())
    return 0;

  Logger::info(LogCategory::CATALOG, "SchemaExtractor",
               "Pulling DDL from " + catalog.name() + " for " +
                   std::to_string(missing.size()) + " table(s)");

  DdlSchemaParser parser(options_.dialect);
  size_t added = 0;
  for (const auto &entry : catalog.getDdlBatch(missing)) {
    if (!entry.second.ok()) {
      Logger::warning(LogCategory::CATALOG, "SchemaExtractor",
                      "Could not pull DDL for " + entry.first + ": " +
                          entry.second.error);
      continue;
    }
    sql::SchemaMap parsed;
    try {
      parsed = parser.parse(entry.second.ddl);
    } catch (const std::runtime_error &e) {
      Logger::warning(LogCategory::CATALOG, "SchemaExtractor",
                      "Could not read DDL for " + entry.first + ": " +
                          std::string(e.what()));
      continue;
    }
    if (parsed.empty()) {
      Logger::warning(LogCategory::CATALOG, "SchemaExtractor",
                      "No columns in DDL for " + entry.first);
      continue;
    }
    for (const auto &table : parsed) {
      if (schema.contains(table.first))
        continue;
      schema.set(table.first, table.second);
      ++added;
    }
  }
  return added;
}

SchemaContext SchemaExtractor::resolve(const std::vector<SqlSource> &sources,
                                       const sql::SchemaMap &initial,
                                       ICatalogProvider *catalog) const {
  SchemaContext schema = extractFromFiles(sources, initial);
  if (catalog)
    fillFromCatalog(schema, sources, *catalog);
  Logger::info(LogCategory::SCHEMA, "SchemaExtractor",
               "Schema resolved for " + std::to_string(schema.size()) +
                   " table(s)");
  return schema;
}
