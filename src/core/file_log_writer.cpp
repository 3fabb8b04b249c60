#include "core/file_log_writer.h"
#include <algorithm>
#include <iostream>

namespace fs = std::filesystem;

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : path_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(std::max(maxBackupFiles, 1)) {
  fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec)
      std::cerr << "FileLogWriter: cannot create " << parent << ": "
                << ec.message() << std::endl;
  }
  openUnlocked();
}

fs::path FileLogWriter::backupPath(int index) const {
  return fs::path(path_ + "." + std::to_string(index));
}

// Appends to an existing file; its current size counts toward rotation.
void FileLogWriter::openUnlocked() {
  file_.open(path_, std::ios::app);
  std::error_code ec;
  auto size = fs::file_size(path_, ec);
  bytesWritten_ = ec ? 0 : static_cast<size_t>(size);
}

bool FileLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  if (bytesWritten_ >= maxFileSize_)
    rotateUnlocked();

  file_ << record.line << '\n';
  bytesWritten_ += record.line.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.close();
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotate() {
  std::lock_guard<std::mutex> lock(mutex_);
  rotateUnlocked();
}

void FileLogWriter::rotateUnlocked() {
  if (file_.is_open())
    file_.close();

  std::error_code ec;
  fs::remove(backupPath(maxBackupFiles_), ec);
  for (int index = maxBackupFiles_ - 1; index >= 1; --index) {
    if (fs::exists(backupPath(index), ec))
      fs::rename(backupPath(index), backupPath(index + 1), ec);
  }
  if (fs::exists(path_, ec))
    fs::rename(path_, backupPath(1), ec);

  openUnlocked();
}
