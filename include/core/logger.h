#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  CONFIG = 1,
  PARSER = 2,
  LINEAGE = 3,
  SCHEMA = 4,
  GRAPH = 5,
  CATALOG = 6,
  DATABASE = 7,
  UNKNOWN = 99
};

// Contents of the "logging" config block.
struct LoggingSettings {
  std::string level = "INFO";
  std::string filePath;
  bool console = true;
  bool database = false;
  size_t maxFileSize = 10 * 1024 * 1024;
  int maxBackupFiles = 5;
};

// Process-wide logger. Lines look like
//   [2024-01-02 03:04:05.678] [WARNING] [GRAPH] [LineageGraphBuilder] message
// and go to stderr, an optional rotating file and an optional PostgreSQL
// table. Usable before configure(): warnings and errors reach stderr.
class Logger {
public:
  static void initialize();
  static void configure(const LoggingSettings &settings);
  static void shutdown();

  static void debug(const std::string &message) {
    log(LogLevel::DEBUG, LogCategory::SYSTEM, "", message);
  }
  static void info(const std::string &message) {
    log(LogLevel::INFO, LogCategory::SYSTEM, "", message);
  }
  static void warning(const std::string &message) {
    log(LogLevel::WARNING, LogCategory::SYSTEM, "", message);
  }
  static void error(const std::string &message) {
    log(LogLevel::ERROR, LogCategory::SYSTEM, "", message);
  }

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    log(LogLevel::DEBUG, category, function, message);
  }
  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    log(LogLevel::INFO, category, function, message);
  }
  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    log(LogLevel::WARNING, category, function, message);
  }
  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    log(LogLevel::ERROR, category, function, message);
  }
  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    log(LogLevel::CRITICAL, category, function, message);
  }

  static void log(LogLevel level, LogCategory category,
                  const std::string &function, const std::string &message);

  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
  static bool isValidLevel(const std::string &levelStr);

  static std::string levelName(LogLevel level);
  static std::string categoryName(LogCategory category);
  static LogCategory stringToCategory(const std::string &categoryStr);

private:
  static std::unique_ptr<ILogWriter> consoleWriter_;
  static std::unique_ptr<ILogWriter> fileWriter_;
  static std::unique_ptr<ILogWriter> dbWriter_;
  static std::mutex logMutex_;

  static LogLevel currentLogLevel_;
  static LogLevel consoleMinLevel_;
  static std::mutex configMutex_;

  static const std::unordered_map<std::string, LogLevel> levelMap_;
};

#endif
