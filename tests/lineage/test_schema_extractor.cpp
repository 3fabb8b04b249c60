#include "catalog/ICatalogProvider.h"
#include "lineage/LineageErrors.h"
#include "lineage/SchemaExtractor.h"
#include "sql/SqlLineageTracer.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using Columns = std::vector<std::string>;

// Mock catalog answering from a fixed table -> DDL map
class MockCatalogProvider : public ICatalogProvider {
public:
  std::map<std::string, std::string> ddlByTable;
  std::vector<std::string> requested;

  std::string name() const override { return "mock"; }
  void configure(const nlohmann::json &) override {}

  CatalogDdlResult getDdl(const std::string &table) override {
    requested.push_back(table);
    CatalogDdlResult result;
    auto it = ddlByTable.find(table);
    if (it == ddlByTable.end())
      result.error = "Table not found in catalog: " + table;
    else
      result.ddl = it->second;
    return result;
  }
};

namespace {

fs::path makeTempDir() {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() /
                 ("sqllineage_schema_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

std::string writeFile(const fs::path &dir, const std::string &name,
                      const std::string &content) {
  fs::path path = dir / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

SchemaExtractor makeExtractor(ExtractorOptions options = {}) {
  return SchemaExtractor(std::make_shared<sql::SqlLineageTracer>(), options);
}

} // namespace

void testExtractAcrossFiles() {
  std::cout << "Testing SchemaExtractor - schema across files...\n";

  fs::path dir = makeTempDir();
  std::vector<SqlSource> sources = {
      {writeFile(dir, "01_staging.sql",
                 "CREATE TABLE staging AS SELECT id, amount FROM raw.orders;"),
       ""},
      {(dir / "missing.sql").string(), ""},
      {writeFile(dir, "02_report.sql",
                 "INSERT INTO report SELECT * FROM staging;\n"
                 "SELECT name FROM customers WHERE active"),
       ""},
      {writeFile(dir, "03_broken.sql", "SELECT a FROM (SELECT"), ""}};

  SchemaContext schema = makeExtractor().extractFromFiles(sources);

  assert(*schema.find("staging") == (Columns{"id", "amount"}));
  assert(*schema.find("raw.orders") == (Columns{"id", "amount"}));
  assert(*schema.find("customers") == (Columns{"name", "active"}));
  assert(!schema.contains("report") && "INSERT targets are not recorded");

  SchemaContext seeded =
      makeExtractor().extractFromFiles({sources[2]}, {{"customers", {"id"}}});
  assert(*seeded.find("customers") == (Columns{"id", "name", "active"}) &&
         "Inferred columns extend the initial schema");

  fs::remove_all(dir);
  std::cout << "✓ SchemaExtractor multi-file test passed\n";
}

void testStrictSchemaPropagates() {
  std::cout << "Testing SchemaExtractor - strict schema...\n";

  fs::path dir = makeTempDir();
  std::vector<SqlSource> sources = {
      {writeFile(dir, "join.sql", "SELECT a FROM t1 JOIN t2 ON t1.id = t2.id"),
       ""}};

  ExtractorOptions options;
  options.strictSchema = true;
  bool threw = false;
  try {
    makeExtractor(options).extractFromFiles(sources);
  } catch (const SchemaResolutionError &) {
    threw = true;
  }
  assert(threw && "SchemaResolutionError must not be swallowed");

  SchemaContext lenient = makeExtractor().extractFromFiles(sources);
  assert(*lenient.find("t1") == Columns{"id"});

  fs::remove_all(dir);
  std::cout << "✓ SchemaExtractor strict schema test passed\n";
}

void testPreprocessorAndDialect() {
  std::cout << "Testing SchemaExtractor - preprocessor and dialect...\n";

  fs::path dir = makeTempDir();
  std::vector<SqlSource> sources = {
      {writeFile(dir, "templated.sql", "SELECT x FROM {{ source }}"), ""},
      {writeFile(dir, "pg.sql", "SELECT \"Mixed\" FROM pg_table"), "postgres"}};

  auto extractor = makeExtractor();
  extractor.setPreprocessor([](const std::string &sql, const std::string &path) {
    if (path.find("templated") == std::string::npos)
      return sql;
    std::string rendered = sql;
    rendered.replace(rendered.find("{{ source }}"), 12, "events");
    return rendered;
  });

  SchemaContext schema = extractor.extractFromFiles(sources);
  assert(*schema.find("events") == Columns{"x"});
  assert(*schema.find("pg_table") == Columns{"mixed"} &&
         "Per-file dialect reads double quotes as identifiers");

  fs::remove_all(dir);
  std::cout << "✓ SchemaExtractor preprocessor test passed\n";
}

void testDefinitionOrder() {
  std::cout << "Testing SchemaExtractor - views defined in later files...\n";

  fs::path dir = makeTempDir();
  SqlSource outer{writeFile(dir, "a_outer.sql",
                            "CREATE VIEW v2 AS SELECT * FROM v1"),
                  ""};
  SqlSource inner{writeFile(dir, "b_inner.sql",
                            "CREATE VIEW v1 AS SELECT x, y FROM t"),
                  ""};
  SqlSource chained{writeFile(dir, "c_chained.sql",
                              "CREATE VIEW v3 AS SELECT *, z FROM v2"),
                    ""};

  SchemaContext forward = makeExtractor().extractFromFiles({outer, inner});
  SchemaContext backward = makeExtractor().extractFromFiles({inner, outer});
  assert(forward.find("v2") && *forward.find("v2") == (Columns{"x", "y"}) &&
         "A view over a later view still gets its columns");
  assert(forward.toMap() == backward.toMap());

  SchemaContext chain =
      makeExtractor().extractFromFiles({chained, outer, inner});
  assert(*chain.find("v3") == (Columns{"x", "y", "z"}) &&
         "Definitions replace partial columns from earlier passes");
  assert(chain.toMap() ==
         makeExtractor().extractFromFiles({inner, outer, chained}).toMap());

  fs::remove_all(dir);
  std::cout << "✓ SchemaExtractor definition order test passed\n";
}

void testCatalogFill() {
  std::cout << "Testing SchemaExtractor - catalog fill...\n";

  fs::path dir = makeTempDir();
  std::vector<SqlSource> sources = {
      {writeFile(dir, "load.sql",
                 "CREATE VIEW staging AS SELECT id FROM raw.events;\n"
                 "INSERT INTO mart.daily SELECT * FROM raw.customers"),
       ""}};

  auto extractor = makeExtractor();
  assert(extractor.referencedTables(sources) ==
         (Columns{"mart.daily", "raw.customers", "raw.events", "staging"}));

  MockCatalogProvider catalog;
  catalog.ddlByTable["raw.customers"] =
      "CREATE TABLE `raw`.`customers` (`id` integer, `Name` character varying)";
  catalog.ddlByTable["raw.events"] =
      "CREATE TABLE `raw`.`events` (`id` integer, `payload` text)";

  SchemaContext schema = extractor.resolve(sources, {}, &catalog);

  assert(*schema.find("raw.customers") == (Columns{"id", "name"}));
  assert(*schema.find("raw.events") == Columns{"id"} &&
         "Known tables are not replaced by catalog DDL");
  assert(!schema.contains("mart.daily") && "Catalog misses are skipped");

  assert(catalog.requested.size() == 2);
  assert(catalog.requested[0] == "mart.daily");
  assert(catalog.requested[1] == "raw.customers");

  MockCatalogProvider broken;
  broken.ddlByTable["raw.customers"] = "CREATE TABLE t (`a INT, b STRING)";
  broken.ddlByTable["mart.daily"] =
      "CREATE TABLE `mart`.`daily` (`day` date, `total` numeric)";
  SchemaContext partial = extractor.extractFromFiles(sources);
  assert(extractor.fillFromCatalog(partial, sources, broken) == 1 &&
         "Malformed DDL for one table does not stop the others");
  assert(!partial.contains("raw.customers"));
  assert(*partial.find("mart.daily") == (Columns{"day", "total"}));

  SchemaContext complete = schema;
  MockCatalogProvider unused;
  assert(extractor.fillFromCatalog(complete, sources, unused) == 0);
  assert(unused.requested.size() == 1 && "Only the still-missing table is asked for");

  fs::remove_all(dir);
  std::cout << "✓ SchemaExtractor catalog fill test passed\n";
}

int main() {
  try {
    testExtractAcrossFiles();
    testStrictSchemaPropagates();
    testDefinitionOrder();
    testPreprocessorAndDialect();
    testCatalogFill();
    std::cout << "\n✅ All SchemaExtractor tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
