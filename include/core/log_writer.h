#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

// One log entry as handed to every writer. line is the fully formatted text;
// the other fields are kept for writers that store them separately.
struct LogRecord {
  std::string timestamp;
  std::string level;
  std::string category;
  std::string function;
  std::string message;
  std::string line;
};

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const LogRecord &record) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

#endif
