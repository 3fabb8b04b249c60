#ifndef LINEAGE_CONFIG_H
#define LINEAGE_CONFIG_H

#include "core/logger.h"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

// Analysis settings read from the "lineage" and "logging" blocks of the JSON
// config file. Setters reject out-of-range values with std::invalid_argument;
// the loaders log the rejection and keep the default instead.
class LineageConfig {
public:
  static constexpr const char *DEFAULT_DIALECT = "spark";
  static constexpr const char *DEFAULT_NODE_FORMAT = "qualified";
  static constexpr size_t DEFAULT_MAX_PATHS_PER_NODE = 10000;
  static constexpr size_t MIN_MAX_PATHS_PER_NODE = 1;
  static constexpr size_t MAX_MAX_PATHS_PER_NODE = 1000000;
  static constexpr size_t DEFAULT_MAX_LINEAGE_DEPTH = 256;
  static constexpr size_t MIN_MAX_LINEAGE_DEPTH = 8;
  static constexpr size_t MAX_MAX_LINEAGE_DEPTH = 4096;

  LineageConfig() = default;

  static LineageConfig loadFromFile(const std::string &configPath);
  static LineageConfig fromJson(const nlohmann::json &config);

  static const std::vector<std::string> &supportedDialects();
  static bool isSupportedDialect(const std::string &dialect);

  void setDialect(const std::string &dialect);
  const std::string &getDialect() const { return dialect_; }

  void setNodeFormat(const std::string &format);
  const std::string &getNodeFormat() const { return nodeFormat_; }

  void setMaxPathsPerNode(size_t v);
  size_t getMaxPathsPerNode() const { return maxPathsPerNode_; }

  void setMaxLineageDepth(size_t v);
  size_t getMaxLineageDepth() const { return maxLineageDepth_; }

  void setNoStar(bool v) { noStar_ = v; }
  bool getNoStar() const { return noStar_; }

  void setStrictSchema(bool v) { strictSchema_ = v; }
  bool getStrictSchema() const { return strictSchema_; }

  void setResolveSchema(bool v) { resolveSchema_ = v; }
  bool getResolveSchema() const { return resolveSchema_; }

  void setCatalogType(const std::string &type) { catalogType_ = type; }
  const std::string &getCatalogType() const { return catalogType_; }

  void setCatalogConfig(const nlohmann::json &config);
  const nlohmann::json &getCatalogConfig() const { return catalogConfig_; }

  void setLogging(const LoggingSettings &settings);
  const LoggingSettings &getLogging() const { return logging_; }

  nlohmann::json toJson() const;

private:
  std::string dialect_{DEFAULT_DIALECT};
  std::string nodeFormat_{DEFAULT_NODE_FORMAT};
  size_t maxPathsPerNode_{DEFAULT_MAX_PATHS_PER_NODE};
  size_t maxLineageDepth_{DEFAULT_MAX_LINEAGE_DEPTH};
  bool noStar_{false};
  bool strictSchema_{false};
  bool resolveSchema_{false};
  std::string catalogType_;
  nlohmann::json catalogConfig_ = nlohmann::json::object();
  LoggingSettings logging_;
};

#endif
