#include "core/database_config.h"
#include "core/lineage_config.h"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename Fn> bool rejects(Fn fn) {
  try {
    fn();
  } catch (const std::invalid_argument &) {
    return true;
  }
  return false;
}

} // namespace

void testDefaults() {
  std::cout << "\n=== Test 1: Defaults ===" << std::endl;

  LineageConfig config;
  assert(config.getDialect() == "spark");
  assert(config.getNodeFormat() == "qualified");
  assert(config.getMaxPathsPerNode() == 10000);
  assert(config.getMaxLineageDepth() == 256);
  assert(!config.getNoStar());
  assert(!config.getStrictSchema());
  assert(!config.getResolveSchema());
  assert(config.getCatalogType().empty());
  assert(config.getCatalogConfig().is_object());
  assert(config.getLogging().level == "INFO");
  assert(config.getLogging().console);

  std::cout << "✅ Defaults are in place" << std::endl;
}

void testSetterValidation() {
  std::cout << "\n=== Test 2: Setter Validation ===" << std::endl;

  LineageConfig config;
  assert(rejects([&] { config.setMaxPathsPerNode(0); }));
  assert(rejects([&] { config.setMaxPathsPerNode(1000001); }));
  config.setMaxPathsPerNode(1);
  assert(config.getMaxPathsPerNode() == 1);
  config.setMaxPathsPerNode(1000000);
  assert(config.getMaxPathsPerNode() == 1000000);
  std::cout << "✅ max_paths_per_node bounds enforced" << std::endl;

  assert(rejects([&] { config.setMaxLineageDepth(7); }));
  assert(rejects([&] { config.setMaxLineageDepth(4097); }));
  config.setMaxLineageDepth(8);
  assert(config.getMaxLineageDepth() == 8);
  std::cout << "✅ max_lineage_depth bounds enforced" << std::endl;

  assert(rejects([&] { config.setDialect("klingon"); }));
  config.setDialect("PostgreS");
  assert(config.getDialect() == "postgres");
  assert(LineageConfig::isSupportedDialect("TSQL"));
  assert(LineageConfig::supportedDialects().size() == 15);
  std::cout << "✅ Dialects validated" << std::endl;

  assert(rejects([&] { config.setNodeFormat("flat"); }));
  config.setNodeFormat("Structured");
  assert(config.getNodeFormat() == "structured");

  assert(rejects([&] { config.setCatalogConfig(json::array()); }));

  LoggingSettings loud;
  loud.level = "LOUD";
  assert(rejects([&] { config.setLogging(loud); }));
  LoggingSettings noBackups;
  noBackups.maxBackupFiles = 0;
  assert(rejects([&] { config.setLogging(noBackups); }));
  std::cout << "✅ Remaining setters validated" << std::endl;
}

void testFromJson() {
  std::cout << "\n=== Test 3: JSON Loading ===" << std::endl;

  json document = {
      {"lineage",
       {{"dialect", "snowflake"},
        {"node_format", "structured"},
        {"max_paths_per_node", 0},
        {"max_lineage_depth", "deep"},
        {"no_star", true},
        {"resolve_schema", true},
        {"catalog", {{"type", "postgres"}, {"config", {{"host", "db"}}}}}}},
      {"logging", {{"level", "debug"}, {"max_backup_files", 0}}}};

  LineageConfig config = LineageConfig::fromJson(document);
  assert(config.getDialect() == "snowflake");
  assert(config.getNodeFormat() == "structured");
  assert(config.getMaxPathsPerNode() == 10000 && "Invalid value keeps default");
  assert(config.getMaxLineageDepth() == 256 && "Wrong type keeps default");
  assert(config.getNoStar());
  assert(config.getResolveSchema());
  assert(!config.getStrictSchema());
  assert(config.getCatalogType() == "postgres");
  assert(config.getCatalogConfig()["host"] == "db");
  assert(config.getLogging().level == "INFO" &&
         "A rejected logging block keeps default logging");

  LineageConfig empty = LineageConfig::fromJson(json::object());
  assert(empty.getDialect() == "spark");

  LineageConfig roundTrip = LineageConfig::fromJson(config.toJson());
  assert(roundTrip.getDialect() == config.getDialect());
  assert(roundTrip.getNodeFormat() == config.getNodeFormat());
  assert(roundTrip.getNoStar() == config.getNoStar());
  assert(roundTrip.getResolveSchema() == config.getResolveSchema());
  assert(roundTrip.getCatalogType() == "postgres");
  assert(roundTrip.getCatalogConfig() == config.getCatalogConfig());
  assert(!empty.toJson()["lineage"].contains("catalog"));

  std::cout << "✅ JSON values applied, invalid ones ignored" << std::endl;
}

void testLoadFromFile() {
  std::cout << "\n=== Test 4: File Loading ===" << std::endl;

  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() /
                 ("sqllineage_config_" + std::to_string(stamp));
  fs::create_directories(dir);

  LineageConfig missing = LineageConfig::loadFromFile((dir / "none.json").string());
  assert(missing.getDialect() == "spark");
  std::cout << "✅ Missing file falls back to defaults" << std::endl;

  std::ofstream(dir / "broken.json") << "{\"lineage\": ";
  LineageConfig broken = LineageConfig::loadFromFile((dir / "broken.json").string());
  assert(broken.getMaxPathsPerNode() == 10000);
  std::cout << "✅ Malformed file falls back to defaults" << std::endl;

  std::ofstream(dir / "config.json")
      << "{\"lineage\": {\"dialect\": \"bigquery\", \"max_paths_per_node\": 50,"
         " \"strict_schema\": true},"
         " \"logging\": {\"level\": \"warning\", \"console\": false}}";
  LineageConfig loaded = LineageConfig::loadFromFile((dir / "config.json").string());
  assert(loaded.getDialect() == "bigquery");
  assert(loaded.getMaxPathsPerNode() == 50);
  assert(loaded.getStrictSchema());
  assert(loaded.getLogging().level == "warning");
  assert(!loaded.getLogging().console);
  std::cout << "✅ Config file loaded" << std::endl;

  fs::remove_all(dir);
}

void testDatabaseSettings() {
  std::cout << "\n=== Test 5: Database Settings ===" << std::endl;

  PostgresSettings settings;
  settings.host = "db.local";
  settings.port = "6543";
  settings.database = "lineage";
  settings.user = "etl";
  settings.password = "p w";
  assert(settings.connectionString() ==
         "host=db.local port=6543 dbname=lineage user=etl password='p w'");
  assert(settings.redactedConnectionString().find("p w") == std::string::npos);

  DatabaseConfig::set(PostgresSettings{});
  DatabaseConfig::loadFromJson(
      {{"database",
        {{"postgres", {{"host", "warehouse"}, {"port", 70000}, {"password", "it's"}}}}}});
  PostgresSettings loaded = DatabaseConfig::get();
  assert(DatabaseConfig::isInitialized());
  assert(loaded.host == "warehouse");
  assert(loaded.port == "5432" && "Out-of-range port keeps the previous one");
  assert(loaded.user == "postgres");
  assert(loaded.connectionString().find("password='it\\'s'") != std::string::npos);
  assert(loaded.redactedConnectionString().find("password=***") !=
         std::string::npos);

  DatabaseConfig::loadFromJson({{"database", {{"postgres", {{"port", "5433"}}}}}});
  assert(DatabaseConfig::get().port == "5433");
  assert(DatabaseConfig::get().host == "warehouse");

  std::cout << "✅ PostgreSQL settings loaded" << std::endl;
}

int main() {
  try {
    testDefaults();
    testSetterValidation();
    testFromJson();
    testLoadFromFile();
    testDatabaseSettings();
    std::cout << "\n✅ All LineageConfig tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
