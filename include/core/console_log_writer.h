#ifndef CONSOLE_LOG_WRITER_H
#define CONSOLE_LOG_WRITER_H

#include "core/log_writer.h"
#include <iostream>
#include <mutex>

// Writes formatted log lines to stderr so that stdout stays free for results.
class ConsoleLogWriter : public ILogWriter {
private:
  std::mutex mutex_;
  bool open_{true};

public:
  bool write(const LogRecord &record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_)
      return false;
    std::cerr << record.line << '\n';
    return static_cast<bool>(std::cerr);
  }

  void flush() override { std::cerr.flush(); }

  void close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
  }

  bool isOpen() const override { return open_; }
};

#endif
