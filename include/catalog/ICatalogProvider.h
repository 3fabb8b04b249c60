#ifndef I_CATALOG_PROVIDER_H
#define I_CATALOG_PROVIDER_H

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// DDL fetched for one table, or the reason it could not be fetched.
struct CatalogDdlResult {
  std::string ddl;
  std::string error;

  bool ok() const { return error.empty(); }
};

// Remote source of table definitions used to fill schema gaps before a
// lineage build. Implementations throw CatalogError only for failures that
// affect the whole provider (bad configuration, unreachable server);
// per-table problems are reported through CatalogDdlResult::error.
class ICatalogProvider {
public:
  virtual ~ICatalogProvider() = default;

  virtual std::string name() const = 0;
  virtual void configure(const nlohmann::json &config) = 0;
  virtual CatalogDdlResult getDdl(const std::string &table) = 0;

  virtual std::map<std::string, CatalogDdlResult>
  getDdlBatch(const std::vector<std::string> &tables) {
    std::map<std::string, CatalogDdlResult> results;
    for (const auto &table : tables)
      results[table] = getDdl(table);
    return results;
  }
};

#endif
