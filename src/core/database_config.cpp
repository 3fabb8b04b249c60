#include "core/database_config.h"
#include "core/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

PostgresSettings DatabaseConfig::settings_;
bool DatabaseConfig::initialized_ = false;
std::mutex DatabaseConfig::mutex_;

namespace {

bool isValidPort(const std::string &port) {
  if (port.empty() || port.size() > 5 ||
      !std::all_of(port.begin(), port.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      }))
    return false;
  int value = std::stoi(port);
  return value > 0 && value <= 65535;
}

void applyPort(const std::string &port, PostgresSettings &settings) {
  if (isValidPort(port)) {
    settings.port = port;
    return;
  }
  Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                  "Invalid port '" + port + "', keeping " + settings.port);
}

// Quotes a libpq value when it is empty or holds blanks, quotes or
// backslashes.
std::string quoteValue(const std::string &value) {
  bool plain = !value.empty() &&
               std::none_of(value.begin(), value.end(), [](unsigned char c) {
                 return std::isspace(c) || c == '\'' || c == '\\';
               });
  if (plain)
    return value;

  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\')
      quoted += '\\';
    quoted += c;
  }
  return quoted + "'";
}

void applyEnv(PostgresSettings &settings) {
  auto read = [](const char *name) {
    const char *value = std::getenv(name);
    return value ? std::string(value) : std::string();
  };

  std::string host = read("POSTGRES_HOST");
  std::string port = read("POSTGRES_PORT");
  std::string database = read("POSTGRES_DB");
  std::string user = read("POSTGRES_USER");

  if (!host.empty())
    settings.host = host;
  if (!port.empty())
    applyPort(port, settings);
  if (!database.empty())
    settings.database = database;
  if (!user.empty())
    settings.user = user;
  if (std::getenv("POSTGRES_PASSWORD"))
    settings.password = read("POSTGRES_PASSWORD");
}

} // namespace

std::string PostgresSettings::connectionString() const {
  return "host=" + quoteValue(host) + " port=" + quoteValue(port) +
         " dbname=" + quoteValue(database) + " user=" + quoteValue(user) +
         " password=" + quoteValue(password);
}

std::string PostgresSettings::redactedConnectionString() const {
  return "host=" + quoteValue(host) + " port=" + quoteValue(port) +
         " dbname=" + quoteValue(database) + " user=" + quoteValue(user) +
         " password=***";
}

void DatabaseConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "Could not open config file '" + configPath +
                        "', reading POSTGRES_* environment variables");
    loadFromEnv();
    return;
  }

  try {
    json config;
    configFile >> config;
    loadFromJson(config);
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "DatabaseConfig",
                  "Cannot read database settings from '" + configPath +
                      "': " + std::string(e.what()));
    loadFromEnv();
  }
}

// Throws json::type_error when a value has the wrong type.
void DatabaseConfig::loadFromJson(const json &config) {
  if (!config.contains("database") || !config["database"].contains("postgres")) {
    loadFromEnv();
    return;
  }

  const json &block = config["database"]["postgres"];
  PostgresSettings settings = get();

  if (block.contains("host") && !block["host"].get<std::string>().empty())
    settings.host = block["host"].get<std::string>();
  if (block.contains("port")) {
    const json &port = block["port"];
    applyPort(port.is_number_integer() ? std::to_string(port.get<int>())
                                       : port.get<std::string>(),
              settings);
  }
  if (block.contains("database") &&
      !block["database"].get<std::string>().empty())
    settings.database = block["database"].get<std::string>();
  if (block.contains("user") && !block["user"].get<std::string>().empty())
    settings.user = block["user"].get<std::string>();
  if (block.contains("password"))
    settings.password = block["password"].get<std::string>();

  set(settings);
}

void DatabaseConfig::loadFromEnv() {
  PostgresSettings settings = get();
  applyEnv(settings);
  set(settings);
}

void DatabaseConfig::set(const PostgresSettings &settings) {
  std::lock_guard<std::mutex> lock(mutex_);
  settings_ = settings;
  initialized_ = true;
}

PostgresSettings DatabaseConfig::get() {
  std::lock_guard<std::mutex> lock(mutex_);
  return settings_;
}

bool DatabaseConfig::isInitialized() {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}
