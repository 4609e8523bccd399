#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

// One log line as the Logger hands it to its sinks. line is the fully
// formatted text; the other fields let a sink store the parts separately.
struct LogRecord {
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
