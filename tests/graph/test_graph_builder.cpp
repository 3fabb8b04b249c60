#include "graph/LineageGraphBuilder.h"
#include "graph/LineageGraphMerger.h"
#include "graph/LineageGraphQuerier.h"
#include "lineage/LineageErrors.h"
#include "utils/file_utils.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

using EdgeKey = std::pair<std::string, std::string>;

// Mock catalog answering from a fixed table -> DDL map
class MockCatalogProvider : public ICatalogProvider {
public:
  std::map<std::string, std::string> ddlByTable;

  std::string name() const override { return "mock"; }
  void configure(const nlohmann::json &) override {}
  CatalogDdlResult getDdl(const std::string &table) override {
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

fs::path makeTempDir(const std::string &tag) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() /
                 ("sqllineage_" + tag + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

std::string writeFile(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << content;
  return path.string();
}

std::set<std::string> nodeIds(const LineageGraph &graph) {
  std::set<std::string> ids;
  for (const auto &node : graph.nodes)
    ids.insert(node.identifier);
  return ids;
}

std::set<EdgeKey> edgeKeys(const LineageGraph &graph) {
  std::set<EdgeKey> keys;
  for (const auto &edge : graph.edges)
    keys.emplace(edge.sourceNode, edge.targetNode);
  return keys;
}

} // namespace

void testBuildOrderAndMergeAgree() {
  std::cout << "Testing LineageGraphBuilder - build order vs merge...\n";

  fs::path dir = makeTempDir("order");
  std::string f1 = writeFile(dir / "f1.sql",
                             "CREATE TABLE s AS SELECT a, b FROM raw;");
  std::string f2 = writeFile(dir / "f2.sql",
                             "INSERT INTO out SELECT a AS x, b + 1 AS y FROM s;");

  LineageGraph forward = LineageGraphBuilder().addFile(f1).addFile(f2).build();
  LineageGraph backward = LineageGraphBuilder().addFiles({f2, f1}).build();

  LineageGraph g1 = LineageGraphBuilder().addFile(f1).build();
  LineageGraph g2 = LineageGraphBuilder().addFile(f2).build();
  LineageGraph merged = LineageGraphMerger().addGraph(g1).addGraph(g2).merge();

  std::set<EdgeKey> expected = {{"raw.a", "s.a"},
                                {"raw.b", "s.b"},
                                {"s.a", "out.x"},
                                {"s.b", "out.y"}};
  assert(edgeKeys(forward) == expected);
  assert(edgeKeys(backward) == expected);
  assert(edgeKeys(merged) == expected);
  assert(nodeIds(forward).size() == 6);
  assert(nodeIds(forward) == nodeIds(backward));
  assert(nodeIds(forward) == nodeIds(merged));

  assert(forward.metadata.totalNodes == 6);
  assert(forward.metadata.totalEdges == 4);
  assert(forward.metadata.sourceFiles.size() == 2);

  LineageGraphBuilder incremental;
  incremental.addFile(f1);
  assert(incremental.build().edges.size() == 2);
  incremental.addFile(f2);
  assert(incremental.build().edges.size() == 4 &&
         "Later builds extend the same graph");

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder order/merge test passed\n";
}

void testNodeAndEdgeAttributes() {
  std::cout << "Testing LineageGraphBuilder - node and edge attributes...\n";

  fs::path dir = makeTempDir("attrs");
  std::string path = writeFile(
      dir / "mart.sql",
      "DROP TABLE IF EXISTS mart.daily;\n"
      "INSERT INTO mart.daily SELECT o.id AS order_id, 1 AS one FROM raw.orders o;\n"
      "SELECT id FROM raw.orders");

  LineageGraphBuilder builder;
  builder.setClock([]() {
    return std::chrono::system_clock::from_time_t(1704164645);
  });
  LineageGraph graph = builder.addFile(path).build();

  assert(graph.metadata.createdAt == "2024-01-02T03:04:05.000000+00:00");
  assert(graph.metadata.nodeFormat == "qualified");
  assert(graph.metadata.defaultDialect == "spark");

  assert(graph.edges.size() == 1 && "Literals and self references add no edges");
  const GraphEdge &edge = graph.edges[0];
  assert(edge.sourceNode == "raw.orders.id");
  assert(edge.targetNode == "mart.daily.order_id");
  assert(edge.queryIndex == 1);
  assert(edge.filePath == FileUtils::absolutePath(path));

  const GraphNode *source = graph.findNode("RAW.ORDERS.ID");
  assert(source);
  assert(source->schemaName && *source->schemaName == "raw");
  assert(source->table && *source->table == "orders");
  assert(source->column && *source->column == "id");
  assert(source->queryIndex == 1);

  const GraphNode *constant = graph.findNode("mart.daily.one");
  assert(constant && "Outputs fed only by literals are still nodes");
  assert(constant->queryIndex == 1);
  assert(graph.metadata.totalNodes == 3);

  LineageGraphQuerier querier(graph);
  LineageQueryResult downstream = querier.findDownstream("mart.daily.one");
  assert(downstream.related.empty());
  LineageQueryResult upstream = querier.findUpstream("MART.DAILY.ONE");
  assert(upstream.related.empty());

  assert(builder.skippedQueries().size() == 1);
  assert(builder.skippedQueries()[0].query.statementType == "DROP TABLE");
  assert(builder.skippedFiles().empty());

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder attribute test passed\n";
}

void testSkippedAndMissingFiles() {
  std::cout << "Testing LineageGraphBuilder - skipped and missing files...\n";

  fs::path dir = makeTempDir("skip");
  std::string broken = writeFile(dir / "broken.sql",
                                 "SELECT a FROM (SELECT;\n"
                                 "INSERT INTO out2 SELECT b FROM t2");
  std::string good = writeFile(dir / "good.sql", "INSERT INTO out SELECT a FROM t");
  std::string unreadable =
      writeFile(dir / "unreadable.sql", "SELECT 'never closed FROM t");
  std::string nested = writeFile(
      dir / "nested.sql", "SELECT " + std::string(20000, '(') + "a" +
                              std::string(20000, ')') + " AS x FROM t");

  LineageGraphBuilder builder;
  LineageGraph graph =
      builder.addFiles({broken, good, unreadable, nested}).build();
  assert(edgeKeys(graph) ==
         (std::set<EdgeKey>{{"t2.b", "out2.b"}, {"t.a", "out.a"}}) &&
         "Statements after an unparsable one are still analysed");

  assert(builder.skippedQueries().size() == 2);
  const SkippedStatement &first = builder.skippedQueries()[0];
  assert(first.filePath == FileUtils::absolutePath(broken));
  assert(first.query.queryIndex == 0);
  assert(first.query.statementType == "SELECT");
  assert(first.query.reason.find("offset") != std::string::npos);
  const SkippedStatement &deep = builder.skippedQueries()[1];
  assert(deep.filePath == FileUtils::absolutePath(nested));
  assert(deep.query.reason.find("Nesting") != std::string::npos &&
         "Deep nesting is a parse error, not a crash");

  assert(builder.skippedFiles().size() == 1);
  assert(builder.skippedFiles()[0].filePath == FileUtils::absolutePath(unreadable));
  assert(builder.skippedFiles()[0].reason.find("Unterminated") != std::string::npos);
  assert(graph.metadata.sourceFiles.size() == 3);

  bool threw = false;
  try {
    LineageGraphBuilder().addFile((dir / "absent.sql").string()).build();
  } catch (const LineageError &) {
    assert(false && "A missing file is not a lineage error");
  } catch (const std::runtime_error &e) {
    threw = true;
    assert(std::string(e.what()).find("SQL file not found") != std::string::npos);
  }
  assert(threw && "Missing files raise");

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder skipped file test passed\n";
}

void testManifestAndDirectory() {
  std::cout << "Testing LineageGraphBuilder - manifest and directory input...\n";

  fs::path dir = makeTempDir("inputs");
  writeFile(dir / "a.sql", "INSERT INTO out SELECT x FROM src");
  writeFile(dir / "sub" / "b.sql", "SELECT \"Id\" AS k FROM pg");
  writeFile(dir / "notes.txt", "not sql");
  std::string manifest = writeFile(dir / "manifest.csv",
                                   "file_path,dialect\n"
                                   "sub/b.sql,postgres\n"
                                   "a.sql,\n"
                                   "\n");

  LineageGraph fromManifest = LineageGraphBuilder().addManifest(manifest).build();
  assert(edgeKeys(fromManifest) ==
         (std::set<EdgeKey>{{"src.x", "out.x"}, {"pg.id", "pg.k"}}) &&
         "Manifest dialect reads double quotes as an identifier");
  assert(fromManifest.metadata.sourceFiles.size() == 2);

  LineageGraph flat = LineageGraphBuilder().addDirectory(dir.string()).build();
  assert(flat.metadata.sourceFiles.size() == 1);

  LineageGraph deep =
      LineageGraphBuilder().addDirectory(dir.string(), true).build();
  assert(deep.metadata.sourceFiles.size() == 2);
  assert(edgeKeys(deep) == (std::set<EdgeKey>{{"src.x", "out.x"}}) &&
         "Default dialect reads \"Id\" as a string literal");

  bool threw = false;
  try {
    LineageGraphBuilder().addDirectory((dir / "nowhere").string());
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw && "Unknown directories are rejected");

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder manifest/directory test passed\n";
}

void testSchemaResolution() {
  std::cout << "Testing LineageGraphBuilder - schema resolution...\n";

  fs::path dir = makeTempDir("schema");
  std::string use = writeFile(dir / "01_use.sql", "INSERT INTO out SELECT * FROM s");
  std::string define =
      writeFile(dir / "02_define.sql", "CREATE TABLE s AS SELECT a FROM raw");

  LineageGraph plain = LineageGraphBuilder().addFiles({use, define}).build();
  assert(edgeKeys(plain) ==
         (std::set<EdgeKey>{{"s.*", "out.*"}, {"raw.a", "s.a"}}));

  BuilderOptions options;
  options.resolveSchema = true;
  LineageGraphBuilder resolving(options);
  LineageGraph resolved = resolving.addFiles({use, define}).build();
  assert(edgeKeys(resolved) ==
         (std::set<EdgeKey>{{"s.a", "out.a"}, {"raw.a", "s.a"}}));
  assert(resolving.resolvedSchema().contains("s"));

  BuilderOptions strict;
  strict.noStar = true;
  bool threw = false;
  try {
    LineageGraphBuilder(strict).addFile(use).build();
  } catch (const StarResolutionError &) {
    threw = true;
  }
  assert(threw && "No-star failures propagate out of build");

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder schema resolution test passed\n";
}

void testSchemaResolutionIgnoresFileOrder() {
  std::cout << "Testing LineageGraphBuilder - schema pass file order...\n";

  fs::path dir = makeTempDir("views");
  std::string outer =
      writeFile(dir / "a_outer.sql", "CREATE VIEW v2 AS SELECT * FROM v1");
  std::string inner =
      writeFile(dir / "b_inner.sql", "CREATE VIEW v1 AS SELECT x, y FROM t");

  BuilderOptions options;
  options.resolveSchema = true;
  LineageGraph forward = LineageGraphBuilder(options).addFiles({outer, inner}).build();
  LineageGraph backward = LineageGraphBuilder(options).addFiles({inner, outer}).build();

  std::set<EdgeKey> expected = {{"t.x", "v1.x"},
                                {"t.y", "v1.y"},
                                {"v1.x", "v2.x"},
                                {"v1.y", "v2.y"}};
  assert(edgeKeys(forward) == expected);
  assert(edgeKeys(backward) == expected);
  assert(nodeIds(forward) == nodeIds(backward));

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder schema pass order test passed\n";
}

void testCatalogAndPreprocessor() {
  std::cout << "Testing LineageGraphBuilder - catalog and preprocessor...\n";

  fs::path dir = makeTempDir("catalog");
  std::string path = writeFile(
      dir / "load.sql", "INSERT INTO ${schema}.out SELECT * FROM raw.users");

  auto catalog = std::make_shared<MockCatalogProvider>();
  catalog->ddlByTable["raw.users"] =
      "CREATE TABLE `raw`.`users` (`id` integer, `email` text)";

  BuilderOptions options;
  options.resolveSchema = true;
  options.catalog = catalog;
  LineageGraphBuilder builder(options);
  builder.setPreprocessor([](const std::string &sql, const std::string &) {
    std::string rendered = sql;
    rendered.replace(rendered.find("${schema}"), 9, "prod");
    return rendered;
  });

  LineageGraph graph = builder.addFile(path).build();
  assert(edgeKeys(graph) ==
         (std::set<EdgeKey>{{"raw.users.id", "prod.out.id"},
                            {"raw.users.email", "prod.out.email"}}));

  CatalogRegistry registry;
  registry.registerProvider("mock", []() {
    return std::unique_ptr<ICatalogProvider>(new MockCatalogProvider());
  });
  LineageConfig config;
  config.setDialect("postgres");
  config.setResolveSchema(true);
  config.setCatalogType("mock");
  BuilderOptions fromConfig = BuilderOptions::fromConfig(config, registry);
  assert(fromConfig.dialect == "postgres");
  assert(fromConfig.resolveSchema);
  assert(fromConfig.catalog && fromConfig.catalog->name() == "mock");

  fs::remove_all(dir);
  std::cout << "✓ LineageGraphBuilder catalog test passed\n";
}

int main() {
  try {
    testBuildOrderAndMergeAgree();
    testNodeAndEdgeAttributes();
    testSkippedAndMissingFiles();
    testManifestAndDirectory();
    testSchemaResolution();
    testSchemaResolutionIgnoresFileOrder();
    testCatalogAndPreprocessor();
    std::cout << "\n✅ All LineageGraphBuilder tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
