#include "core/lineage_config.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <fstream>

using json = nlohmann::json;

namespace {

template <typename Setter>
void applyOrWarn(const std::string &key, Setter setter) {
  try {
    setter();
  } catch (const std::invalid_argument &e) {
    Logger::warning(LogCategory::CONFIG, "LineageConfig",
                    "Ignoring invalid value for '" + key +
                        "': " + std::string(e.what()));
  } catch (const json::type_error &e) {
    Logger::warning(LogCategory::CONFIG, "LineageConfig",
                    "Ignoring '" + key + "' with wrong type: " +
                        std::string(e.what()));
  }
}

} // namespace

const std::vector<std::string> &LineageConfig::supportedDialects() {
  static const std::vector<std::string> dialects = {
      "ansi",     "bigquery", "databricks", "duckdb", "hive",
      "mysql",    "oracle",   "postgres",   "presto", "redshift",
      "snowflake", "spark",   "sqlite",     "trino",  "tsql"};
  return dialects;
}

bool LineageConfig::isSupportedDialect(const std::string &dialect) {
  const auto &dialects = supportedDialects();
  return std::find(dialects.begin(), dialects.end(),
                   StringUtils::toLower(dialect)) != dialects.end();
}

void LineageConfig::setDialect(const std::string &dialect) {
  if (!isSupportedDialect(dialect)) {
    throw std::invalid_argument(
        "Unsupported dialect '" + dialect +
        "'. Supported: " + StringUtils::join(supportedDialects(), ", "));
  }
  dialect_ = StringUtils::toLower(dialect);
}

void LineageConfig::setNodeFormat(const std::string &format) {
  std::string lower = StringUtils::toLower(format);
  if (lower != "qualified" && lower != "structured") {
    throw std::invalid_argument("node_format must be 'qualified' or "
                                "'structured', got '" +
                                format + "'");
  }
  nodeFormat_ = lower;
}

void LineageConfig::setMaxPathsPerNode(size_t v) {
  if (v < MIN_MAX_PATHS_PER_NODE || v > MAX_MAX_PATHS_PER_NODE) {
    throw std::invalid_argument("max_paths_per_node must be between " +
                                std::to_string(MIN_MAX_PATHS_PER_NODE) +
                                " and " +
                                std::to_string(MAX_MAX_PATHS_PER_NODE));
  }
  maxPathsPerNode_ = v;
}

void LineageConfig::setMaxLineageDepth(size_t v) {
  if (v < MIN_MAX_LINEAGE_DEPTH || v > MAX_MAX_LINEAGE_DEPTH) {
    throw std::invalid_argument("max_lineage_depth must be between " +
                                std::to_string(MIN_MAX_LINEAGE_DEPTH) +
                                " and " +
                                std::to_string(MAX_MAX_LINEAGE_DEPTH));
  }
  maxLineageDepth_ = v;
}

void LineageConfig::setCatalogConfig(const json &config) {
  if (!config.is_object()) {
    throw std::invalid_argument("catalog.config must be a JSON object");
  }
  catalogConfig_ = config;
}

void LineageConfig::setLogging(const LoggingSettings &settings) {
  if (!Logger::isValidLevel(settings.level)) {
    throw std::invalid_argument("Unknown log level '" + settings.level + "'");
  }
  if (settings.maxBackupFiles < 1) {
    throw std::invalid_argument("logging.max_backup_files must be >= 1");
  }
  logging_ = settings;
}

LineageConfig LineageConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "LineageConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults");
    return LineageConfig{};
  }

  try {
    json config;
    configFile >> config;
    return fromJson(config);
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "LineageConfig",
                  "Error parsing config file '" + configPath +
                      "': " + std::string(e.what()) + ", using defaults");
    return LineageConfig{};
  }
}

LineageConfig LineageConfig::fromJson(const json &config) {
  LineageConfig result;

  if (config.contains("lineage") && config["lineage"].is_object()) {
    const json &lineage = config["lineage"];

    if (lineage.contains("dialect"))
      applyOrWarn("dialect", [&] {
        result.setDialect(lineage["dialect"].get<std::string>());
      });
    if (lineage.contains("node_format"))
      applyOrWarn("node_format", [&] {
        result.setNodeFormat(lineage["node_format"].get<std::string>());
      });
    if (lineage.contains("max_paths_per_node"))
      applyOrWarn("max_paths_per_node", [&] {
        result.setMaxPathsPerNode(lineage["max_paths_per_node"].get<size_t>());
      });
    if (lineage.contains("max_lineage_depth"))
      applyOrWarn("max_lineage_depth", [&] {
        result.setMaxLineageDepth(lineage["max_lineage_depth"].get<size_t>());
      });
    if (lineage.contains("no_star"))
      applyOrWarn("no_star",
                  [&] { result.setNoStar(lineage["no_star"].get<bool>()); });
    if (lineage.contains("strict_schema"))
      applyOrWarn("strict_schema", [&] {
        result.setStrictSchema(lineage["strict_schema"].get<bool>());
      });
    if (lineage.contains("resolve_schema"))
      applyOrWarn("resolve_schema", [&] {
        result.setResolveSchema(lineage["resolve_schema"].get<bool>());
      });

    if (lineage.contains("catalog") && lineage["catalog"].is_object()) {
      const json &catalog = lineage["catalog"];
      if (catalog.contains("type"))
        applyOrWarn("catalog.type", [&] {
          result.setCatalogType(catalog["type"].get<std::string>());
        });
      if (catalog.contains("config"))
        applyOrWarn("catalog.config",
                    [&] { result.setCatalogConfig(catalog["config"]); });
    }
  }

  if (config.contains("logging") && config["logging"].is_object()) {
    const json &logging = config["logging"];
    LoggingSettings settings = result.logging_;
    applyOrWarn("logging", [&] {
      if (logging.contains("level"))
        settings.level = logging["level"].get<std::string>();
      if (logging.contains("file"))
        settings.filePath = logging["file"].get<std::string>();
      if (logging.contains("console"))
        settings.console = logging["console"].get<bool>();
      if (logging.contains("database"))
        settings.database = logging["database"].get<bool>();
      if (logging.contains("max_file_size"))
        settings.maxFileSize = logging["max_file_size"].get<size_t>();
      if (logging.contains("max_backup_files"))
        settings.maxBackupFiles = logging["max_backup_files"].get<int>();
      result.setLogging(settings);
    });
  }

  return result;
}

json LineageConfig::toJson() const {
  json lineage = {{"dialect", dialect_},
                  {"node_format", nodeFormat_},
                  {"max_paths_per_node", maxPathsPerNode_},
                  {"max_lineage_depth", maxLineageDepth_},
                  {"no_star", noStar_},
                  {"strict_schema", strictSchema_},
                  {"resolve_schema", resolveSchema_}};
  if (!catalogType_.empty()) {
    lineage["catalog"] = {{"type", catalogType_}, {"config", catalogConfig_}};
  }
  json logging = {{"level", logging_.level},
                  {"file", logging_.filePath},
                  {"console", logging_.console},
                  {"database", logging_.database},
                  {"max_file_size", logging_.maxFileSize},
                  {"max_backup_files", logging_.maxBackupFiles}};
  return {{"lineage", lineage}, {"logging", logging}};
}
