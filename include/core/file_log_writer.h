#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

// Appends log lines to a file. Once the file reaches maxFileSize it becomes
// backup 1, older backups shift up (lineage.log.1 -> lineage.log.2) and the
// one past maxBackupFiles is deleted.
class FileLogWriter : public ILogWriter {
public:
  explicit FileLogWriter(const std::string &fileName,
                         size_t maxFileSize = 10 * 1024 * 1024,
                         int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  void rotate();

  const std::string &getFileName() const { return path_; }

private:
  std::filesystem::path backupPath(int index) const;
  void openUnlocked();
  void rotateUnlocked();

  std::ofstream file_;
  std::string path_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  size_t bytesWritten_{0};
  mutable std::mutex mutex_;
};

#endif
