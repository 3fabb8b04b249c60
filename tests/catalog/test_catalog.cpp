#include "catalog/CatalogRegistry.h"
#include "catalog/DdlSchemaParser.h"
#include "catalog/PostgresCatalogProvider.h"
#include "lineage/LineageErrors.h"
#include <cassert>
#include <iostream>

using Columns = std::vector<std::string>;

// Mock provider recording the configuration it receives
class MockCatalogProvider : public ICatalogProvider {
public:
  static nlohmann::json lastConfig;

  std::string name() const override { return "mock"; }
  void configure(const nlohmann::json &config) override { lastConfig = config; }
  CatalogDdlResult getDdl(const std::string &table) override {
    CatalogDdlResult result;
    result.ddl = "CREATE TABLE " + table + " (id INT)";
    return result;
  }
};

nlohmann::json MockCatalogProvider::lastConfig;

void testRegistry() {
  std::cout << "Testing CatalogRegistry - registration and lookup...\n";

  CatalogRegistry registry;
  CatalogRegistry::registerBuiltins(registry);
  assert(registry.contains("POSTGRES"));
  assert(registry.names() == Columns{"postgres"});

  registry.registerProvider("Mock", []() {
    return std::unique_ptr<ICatalogProvider>(new MockCatalogProvider());
  });
  assert(registry.names() == (Columns{"mock", "postgres"}));

  auto plain = registry.create("mock");
  assert(plain->name() == "mock");
  assert(MockCatalogProvider::lastConfig.is_null() &&
         "Empty configuration is not applied");

  auto configured = registry.create("mock", {{"project", "analytics"}});
  assert(MockCatalogProvider::lastConfig["project"] == "analytics");

  auto batch = configured->getDdlBatch({"a", "b"});
  assert(batch.size() == 2);
  assert(batch["b"].ok());
  assert(batch["b"].ddl == "CREATE TABLE b (id INT)");

  bool threw = false;
  try {
    registry.create("oracle");
  } catch (const CatalogError &e) {
    threw = true;
    assert(std::string(e.what()).find("Available catalogs: mock, postgres") !=
           std::string::npos);
  }
  assert(threw && "Unknown catalog should raise CatalogError");

  threw = false;
  try {
    registry.registerProvider("", nullptr);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw && "Registration needs a name and a factory");

  std::cout << "✓ CatalogRegistry test passed\n";
}

void testPostgresConfiguration() {
  std::cout << "Testing PostgresCatalogProvider - configuration...\n";

  CatalogRegistry registry;
  CatalogRegistry::registerBuiltins(registry);
  auto provider = registry.create(
      "postgres", {{"host", "localhost"}, {"port", 5432}, {"default_schema", "analytics"}});
  auto *postgres = dynamic_cast<PostgresCatalogProvider *>(provider.get());
  assert(postgres);
  assert(postgres->name() == "postgres");
  assert(postgres->defaultSchema() == "analytics");

  auto unqualified = postgres->splitTableName("orders");
  assert(unqualified.first == "analytics" && unqualified.second == "orders");
  auto qualified = postgres->splitTableName("warehouse.sales.orders");
  assert(qualified.first == "sales" && qualified.second == "orders");

  PostgresCatalogProvider defaults;
  assert(defaults.defaultSchema() == "public");

  bool threw = false;
  try {
    defaults.configure({{"host", true}});
  } catch (const CatalogError &) {
    threw = true;
  }
  assert(threw && "Non-string settings are rejected");

  threw = false;
  try {
    defaults.configure(nlohmann::json::array());
  } catch (const CatalogError &) {
    threw = true;
  }
  assert(threw && "Configuration must be an object");

  std::cout << "✓ PostgresCatalogProvider configuration test passed\n";
}

void testBuildDdl() {
  std::cout << "Testing PostgresCatalogProvider - DDL generation...\n";

  std::string ddl = PostgresCatalogProvider::buildDdl(
      "raw.orders", {{"id", "integer"}, {"odd`name", "text"}});
  assert(ddl == "CREATE TABLE `raw`.`orders` (`id` integer, `odd``name` text)");
  assert(PostgresCatalogProvider::buildDdl("raw.empty", {}).empty());

  sql::SchemaMap parsed = DdlSchemaParser("spark").parse(ddl);
  assert(parsed.size() == 1);
  assert(parsed["raw.orders"] == (Columns{"id", "odd`name"}));

  std::cout << "✓ PostgresCatalogProvider DDL test passed\n";
}

void testDdlSchemaParser() {
  std::cout << "Testing DdlSchemaParser - statement filtering...\n";

  DdlSchemaParser parser("spark");
  sql::SchemaMap schema = parser.parse(
      "CREATE TABLE Sales.Orders (ID BIGINT, Amount DECIMAL(10, 2), "
      "PRIMARY KEY (ID));\n"
      "CREATE VIEW v (a, b) AS SELECT 1, 2;\n"
      "CREATE TABLE derived AS SELECT 1 AS x;\n"
      "DROP TABLE gone;\n"
      "CREATE TABLE bad (id");

  assert(schema.size() == 2);
  assert(schema["sales.orders"] == (Columns{"id", "amount"}));
  assert(schema["v"] == (Columns{"a", "b"}));
  assert(schema.count("derived") == 0 && "CTAS without column list is skipped");
  assert(schema.count("bad") == 0 && "Unparsable DDL is skipped");

  assert(parser.parse("").empty());
  assert(parser.parse("CREATE TABLE t (`a INT, b STRING)").empty() &&
         "Unterminated quotes are skipped, not raised");

  std::cout << "✓ DdlSchemaParser test passed\n";
}

int main() {
  try {
    testRegistry();
    testPostgresConfiguration();
    testBuildDdl();
    testDdlSchemaParser();
    std::cout << "\n✅ All catalog tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
