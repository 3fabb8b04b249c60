#include "catalog/PostgresCatalogProvider.h"
#include "core/database_config.h"
#include "core/logger.h"
#include "lineage/LineageErrors.h"
#include "utils/string_utils.h"

namespace {

// Backticks quote identifiers in every dialect the DDL may be parsed with;
// double quotes are string delimiters in some of them.
std::string quoteIdentifier(const std::string &name) {
  std::string quoted = "`";
  for (char c : name) {
    if (c == '`')
      quoted += '`';
    quoted += c;
  }
  return quoted + "`";
}

std::string jsonString(const nlohmann::json &config, const char *key) {
  if (!config.contains(key))
    return "";
  const nlohmann::json &value = config[key];
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number_integer())
    return std::to_string(value.get<long long>());
  throw CatalogError(std::string("Catalog setting '") + key +
                     "' must be a string");
}

} // namespace

PostgresCatalogProvider::PostgresCatalogProvider() : defaultSchema_("public") {}

void PostgresCatalogProvider::configure(const nlohmann::json &config) {
  if (!config.is_object())
    throw CatalogError("postgres catalog configuration must be an object");

  std::string schema = jsonString(config, "default_schema");
  if (!schema.empty())
    defaultSchema_ = schema;

  std::string connection = jsonString(config, "connection_string");
  if (!connection.empty()) {
    connectionString_ = connection;
    return;
  }

  std::string host = jsonString(config, "host");
  if (host.empty())
    return;
  std::string port = jsonString(config, "port");
  std::string database = jsonString(config, "database");
  std::string user = jsonString(config, "user");
  connectionString_ = "host=" + host;
  if (!port.empty())
    connectionString_ += " port=" + port;
  if (!database.empty())
    connectionString_ += " dbname=" + database;
  if (!user.empty())
    connectionString_ += " user=" + user;
  if (config.contains("password"))
    connectionString_ += " password=" + jsonString(config, "password");
}

pqxx::connection PostgresCatalogProvider::connect() const {
  std::string connStr = connectionString_;
  if (connStr.empty()) {
    if (!DatabaseConfig::isInitialized())
      DatabaseConfig::loadFromEnv();
    connStr = DatabaseConfig::get().connectionString();
  }
  try {
    return pqxx::connection(connStr);
  } catch (const pqxx::broken_connection &e) {
    throw CatalogError("Cannot connect to postgres catalog: " +
                       std::string(e.what()));
  }
}

std::pair<std::string, std::string>
PostgresCatalogProvider::splitTableName(const std::string &table) const {
  std::vector<std::string> parts = StringUtils::split(table, '.');
  if (parts.size() == 1)
    return {defaultSchema_, parts[0]};
  return {parts[parts.size() - 2], parts.back()};
}

std::string PostgresCatalogProvider::buildDdl(
    const std::string &table,
    const std::vector<std::pair<std::string, std::string>> &columns) {
  if (columns.empty())
    return "";

  std::vector<std::string> quotedParts;
  for (const auto &part : StringUtils::split(table, '.'))
    quotedParts.push_back(quoteIdentifier(part));

  std::string ddl = "CREATE TABLE " + StringUtils::join(quotedParts, ".") + " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0)
      ddl += ", ";
    ddl += quoteIdentifier(columns[i].first) + " " + columns[i].second;
  }
  return ddl + ")";
}

CatalogDdlResult PostgresCatalogProvider::fetch(pqxx::connection &conn,
                                                const std::string &table) const {
  CatalogDdlResult result;
  auto names = splitTableName(table);
  try {
    pqxx::work txn(conn);
    auto rows = txn.exec_params(
        "SELECT column_name, CASE WHEN data_type IN ('USER-DEFINED', 'ARRAY') "
        "THEN udt_name ELSE data_type END "
        "FROM information_schema.columns "
        "WHERE lower(table_schema) = lower($1) AND lower(table_name) = lower($2) "
        "ORDER BY ordinal_position",
        names.first, names.second);
    txn.commit();

    std::vector<std::pair<std::string, std::string>> columns;
    for (const auto &row : rows)
      columns.emplace_back(row[0].as<std::string>(), row[1].as<std::string>());

    result.ddl = buildDdl(table, columns);
    if (result.ddl.empty())
      result.error = "Table not found in catalog: " + table;
  } catch (const pqxx::broken_connection &e) {
    throw CatalogError("Lost connection to postgres catalog: " +
                       std::string(e.what()));
  } catch (const pqxx::sql_error &e) {
    result.error = "Query failed for " + table + ": " + std::string(e.what());
  }
  return result;
}

CatalogDdlResult PostgresCatalogProvider::getDdl(const std::string &table) {
  pqxx::connection conn = connect();
  return fetch(conn, table);
}

std::map<std::string, CatalogDdlResult>
PostgresCatalogProvider::getDdlBatch(const std::vector<std::string> &tables) {
  std::map<std::string, CatalogDdlResult> results;
  if (tables.empty())
    return results;

  pqxx::connection conn = connect();
  for (const auto &table : tables)
    results[table] = fetch(conn, table);

  Logger::debug(LogCategory::CATALOG, "PostgresCatalogProvider",
                "Fetched DDL for " + std::to_string(tables.size()) +
                    " table(s)");
  return results;
}
