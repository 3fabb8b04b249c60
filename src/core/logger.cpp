#include "core/logger.h"
#include "core/console_log_writer.h"
#include "core/database_config.h"
#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <iostream>

std::unique_ptr<ILogWriter> Logger::consoleWriter_ =
    std::make_unique<ConsoleLogWriter>();
std::unique_ptr<ILogWriter> Logger::fileWriter_;
std::unique_ptr<ILogWriter> Logger::dbWriter_;
std::mutex Logger::logMutex_;

// Everything at INFO and above is accepted; only warnings and errors reach the
// console unless the configured level is lowered to DEBUG.
LogLevel Logger::currentLogLevel_ = LogLevel::INFO;
LogLevel Logger::consoleMinLevel_ = LogLevel::WARNING;
std::mutex Logger::configMutex_;

const std::unordered_map<std::string, LogLevel> Logger::levelMap_ = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

namespace {

const LogCategory kCategories[] = {
    LogCategory::SYSTEM, LogCategory::CONFIG,  LogCategory::PARSER,
    LogCategory::LINEAGE, LogCategory::SCHEMA, LogCategory::GRAPH,
    LogCategory::CATALOG, LogCategory::DATABASE};

std::string formatLine(const LogRecord &record) {
  std::string line = "[" + record.timestamp + "] [" + record.level + "] [" +
                     record.category + "]";
  if (!record.function.empty())
    line += " [" + record.function + "]";
  return line + " " + record.message;
}

} // namespace

void Logger::initialize() { configure(LoggingSettings{}); }

// Replaces the active writers. A log file that cannot be opened or a database
// that cannot be reached is reported on stderr and left out.
void Logger::configure(const LoggingSettings &settings) {
  setLogLevel(settings.level);

  std::unique_ptr<ILogWriter> console;
  std::unique_ptr<ILogWriter> file;
  std::unique_ptr<ILogWriter> db;

  if (settings.console)
    console = std::make_unique<ConsoleLogWriter>();

  if (!settings.filePath.empty()) {
    auto writer = std::make_unique<FileLogWriter>(
        settings.filePath, settings.maxFileSize, settings.maxBackupFiles);
    if (writer->isOpen())
      file = std::move(writer);
    else
      std::cerr << "Logger: cannot open log file '" << settings.filePath
                << "', file logging disabled" << std::endl;
  }

  if (settings.database) {
    if (!DatabaseConfig::isInitialized())
      DatabaseConfig::loadFromEnv();
    auto writer = std::make_unique<DatabaseLogWriter>(
        DatabaseConfig::get().connectionString());
    if (writer->isOpen())
      db = std::move(writer);
  }

  std::lock_guard<std::mutex> lock(logMutex_);
  if (fileWriter_)
    fileWriter_->close();
  if (dbWriter_)
    dbWriter_->close();
  consoleWriter_ = std::move(console);
  fileWriter_ = std::move(file);
  dbWriter_ = std::move(db);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex_);
  if (consoleWriter_)
    consoleWriter_->flush();
  if (fileWriter_)
    fileWriter_->close();
  if (dbWriter_)
    dbWriter_->close();
  fileWriter_.reset();
  dbWriter_.reset();
}

void Logger::log(LogLevel level, LogCategory category,
                 const std::string &function, const std::string &message) {
  LogLevel minLevel;
  LogLevel consoleLevel;
  {
    std::lock_guard<std::mutex> lock(configMutex_);
    minLevel = currentLogLevel_;
    consoleLevel = consoleMinLevel_;
  }
  if (level < minLevel)
    return;

  LogRecord record;
  record.timestamp = TimeUtils::localTimestampMillis();
  record.level = levelName(level);
  record.category = categoryName(category);
  record.function = function;
  record.message = message;
  record.line = formatLine(record);

  std::lock_guard<std::mutex> lock(logMutex_);
  if (consoleWriter_ && level >= consoleLevel)
    consoleWriter_->write(record);
  if (fileWriter_)
    fileWriter_->write(record);
  if (dbWriter_ && dbWriter_->isOpen())
    dbWriter_->write(record);
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  currentLogLevel_ = level;
  consoleMinLevel_ =
      level == LogLevel::DEBUG ? LogLevel::DEBUG : LogLevel::WARNING;
}

// Unknown names leave the current level untouched.
void Logger::setLogLevel(const std::string &levelStr) {
  auto it = levelMap_.find(StringUtils::toUpper(StringUtils::trim(levelStr)));
  if (it != levelMap_.end())
    setLogLevel(it->second);
}

bool Logger::isValidLevel(const std::string &levelStr) {
  return levelMap_.count(StringUtils::toUpper(StringUtils::trim(levelStr))) > 0;
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return currentLogLevel_;
}

std::string Logger::levelName(LogLevel level) {
  static const char *const names[] = {"DEBUG", "INFO", "WARNING", "ERROR",
                                      "CRITICAL"};
  int index = static_cast<int>(level);
  return index >= 0 && index <= 4 ? names[index] : "UNKNOWN";
}

std::string Logger::categoryName(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::PARSER:
    return "PARSER";
  case LogCategory::LINEAGE:
    return "LINEAGE";
  case LogCategory::SCHEMA:
    return "SCHEMA";
  case LogCategory::GRAPH:
    return "GRAPH";
  case LogCategory::CATALOG:
    return "CATALOG";
  case LogCategory::DATABASE:
    return "DATABASE";
  default:
    return "UNKNOWN";
  }
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  const std::string upper = StringUtils::toUpper(StringUtils::trim(categoryStr));
  for (LogCategory category : kCategories) {
    if (categoryName(category) == upper)
      return category;
  }
  return LogCategory::UNKNOWN;
}
