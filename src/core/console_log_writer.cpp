#include "core/console_log_writer.h"

namespace {
bool isErrorLevel(const std::string &level) {
  return level == "ERROR" || level == "CRITICAL";
}

bool isProgressLine(const LogRecord &record) {
  return record.message.compare(0, 10, "[PROGRESS]") == 0;
}
} // namespace

bool ConsoleLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_)
    return false;

  if (isErrorLevel(record.level)) {
    err_ << record.line << std::endl;
    return err_.good();
  }

  out_ << record.line << '\n';
  if (isProgressLine(record) || record.level == "WARNING")
    out_.flush();
  return out_.good();
}

void ConsoleLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
  err_.flush();
}

void ConsoleLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_) {
    out_.flush();
    err_.flush();
    open_ = false;
  }
}
