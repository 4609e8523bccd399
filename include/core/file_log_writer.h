#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <fstream>
#include <mutex>
#include <string>

// Per-run log file. The parent directory is created on open, so a
// file_prefix such as "logs/migration" works on a fresh checkout. A run that
// outgrows maxFileSize rotates into <name>.1 .. <name>.<maxBackupFiles>.
class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  mutable std::mutex mutex_;

public:
  FileLogWriter(const std::string &fileName,
                size_t maxFileSize = 10 * 1024 * 1024, int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  const std::string &fileName() const { return fileName_; }

private:
  void open();
  void rotateIfNeeded();
};

#endif
