#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Stores log records as rows of metadata.lineage_logs, creating the table on
// first use. A failed connection disables the writer for the rest of the run.
class DatabaseLogWriter : public ILogWriter {
public:
  explicit DatabaseLogWriter(const std::string &connectionString);
  ~DatabaseLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;

private:
  void createTableUnlocked();

  std::unique_ptr<pqxx::connection> conn_;
  bool enabled_{false};
  mutable std::mutex mutex_;
};

#endif
