#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

// Connection parameters of a PostgreSQL server.
struct PostgresSettings {
  std::string host{"localhost"};
  std::string port{"5432"};
  std::string database{"postgres"};
  std::string user{"postgres"};
  std::string password;

  // libpq keyword/value form.
  std::string connectionString() const;
  // connectionString() with the password masked, for log messages.
  std::string redactedConnectionString() const;
};

// Process-wide PostgreSQL settings used by the database log writer and by the
// postgres catalog provider when it is not configured explicitly. Read from
// the "database.postgres" block of the config file; POSTGRES_* environment
// variables are used when the block is absent.
class DatabaseConfig {
public:
  static void loadFromFile(const std::string &configPath);
  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();
  static void set(const PostgresSettings &settings);

  static PostgresSettings get();
  static bool isInitialized();

private:
  static PostgresSettings settings_;
  static bool initialized_;
  static std::mutex mutex_;
};

#endif
