#ifndef POSTGRES_CATALOG_PROVIDER_H
#define POSTGRES_CATALOG_PROVIDER_H

#include "catalog/ICatalogProvider.h"
#include <pqxx/pqxx>
#include <string>
#include <vector>

// Reads column definitions from information_schema.columns of a PostgreSQL
// database and returns them as CREATE TABLE statements.
//
// Configuration keys: "connection_string", or "host", "port", "database",
// "user", "password"; "default_schema" (default "public") is used for
// unqualified table names. Without configuration the connection comes from
// DatabaseConfig.
class PostgresCatalogProvider : public ICatalogProvider {
public:
  PostgresCatalogProvider();

  std::string name() const override { return "postgres"; }
  void configure(const nlohmann::json &config) override;
  CatalogDdlResult getDdl(const std::string &table) override;
  std::map<std::string, CatalogDdlResult>
  getDdlBatch(const std::vector<std::string> &tables) override;

  const std::string &defaultSchema() const { return defaultSchema_; }

  // (schema, table) for a catalog.schema.table, schema.table or table name.
  std::pair<std::string, std::string>
  splitTableName(const std::string &table) const;

  // CREATE TABLE text for (column, type) rows; empty when there are none.
  static std::string
  buildDdl(const std::string &table,
           const std::vector<std::pair<std::string, std::string>> &columns);

private:
  pqxx::connection connect() const;
  CatalogDdlResult fetch(pqxx::connection &conn, const std::string &table) const;

  std::string connectionString_;
  std::string defaultSchema_;
};

#endif
