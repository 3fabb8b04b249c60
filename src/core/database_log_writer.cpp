#include "core/database_log_writer.h"
#include <algorithm>
#include <iostream>

namespace {

constexpr size_t kMaxMessageBytes = 10000;
constexpr const char *kInsertStatement = "insert_lineage_log";

size_t utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80)
    return 1;
  if ((lead & 0xE0) == 0xC0)
    return 2;
  if ((lead & 0xF0) == 0xE0)
    return 3;
  if ((lead & 0xF8) == 0xF0)
    return 4;
  return 0;
}

// PostgreSQL rejects text with invalid UTF-8; SQL read from disk may hold
// anything. Broken sequences and control characters other than whitespace
// are dropped, and the result is cut at maxBytes on a character boundary.
std::string cleanText(const std::string &input, size_t maxBytes) {
  std::string output;
  output.reserve(std::min(input.size(), maxBytes));

  size_t i = 0;
  while (i < input.size()) {
    unsigned char lead = static_cast<unsigned char>(input[i]);
    size_t length = utf8SequenceLength(lead);
    bool valid = length > 0 && i + length <= input.size();
    for (size_t k = 1; valid && k < length; ++k)
      valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    if (valid && length == 1 && lead < 0x20 && lead != '\n' && lead != '\t' &&
        lead != '\r')
      valid = false;

    if (!valid) {
      ++i;
      continue;
    }
    if (output.size() + length > maxBytes)
      break;
    output.append(input, i, length);
    i += length;
  }
  return output;
}

} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString);
    createTableUnlocked();
    conn_->prepare(kInsertStatement,
                   "INSERT INTO metadata.lineage_logs "
                   "(logged_at, level, category, function, message) "
                   "VALUES (NOW(), $1, $2, $3, $4)");
    enabled_ = true;
  } catch (const std::exception &e) {
    conn_.reset();
    std::cerr << "DatabaseLogWriter: database logging disabled: " << e.what()
              << std::endl;
  }
}

void DatabaseLogWriter::createTableUnlocked() {
  pqxx::work txn(*conn_);
  txn.exec("CREATE SCHEMA IF NOT EXISTS metadata");
  txn.exec("CREATE TABLE IF NOT EXISTS metadata.lineage_logs ("
           "id BIGSERIAL PRIMARY KEY, "
           "logged_at TIMESTAMPTZ NOT NULL DEFAULT NOW(), "
           "level VARCHAR(16) NOT NULL, category VARCHAR(32) NOT NULL, "
           "function VARCHAR(255), message TEXT)");
  txn.commit();
}

bool DatabaseLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enabled_ || !conn_)
    return false;

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared(kInsertStatement, cleanText(record.level, 16),
                      cleanText(record.category, 32),
                      cleanText(record.function, 255),
                      cleanText(record.message, kMaxMessageBytes));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: connection lost: " << e.what()
              << std::endl;
  } catch (const pqxx::sql_error &e) {
    std::cerr << "DatabaseLogWriter: insert failed: " << e.what() << std::endl;
  }
  return false;
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_ && conn_ && conn_->is_open();
}
