#ifndef CONSOLE_LOG_WRITER_H
#define CONSOLE_LOG_WRITER_H

#include "core/log_writer.h"
#include <iostream>
#include <mutex>

// Terminal sink. ERROR and CRITICAL go to the error stream, everything else
// to the output stream. Progress and error lines are flushed as they are
// written so a long table shows its [PROGRESS] lines live.
class ConsoleLogWriter : public ILogWriter {
private:
  std::ostream &out_;
  std::ostream &err_;
  std::mutex mutex_;
  bool open_{true};

public:
  ConsoleLogWriter() : ConsoleLogWriter(std::cout, std::cerr) {}
  ConsoleLogWriter(std::ostream &out, std::ostream &err)
      : out_(out), err_(err) {}
  ~ConsoleLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override;
  void close() override;
  bool isOpen() const override { return open_; }
};

#endif
