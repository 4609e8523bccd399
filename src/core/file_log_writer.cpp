#include "core/file_log_writer.h"
#include <filesystem>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(fileName_).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);
  open();
}

void FileLogWriter::open() {
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  rotateIfNeeded();
  if (!file_.is_open())
    return false;

  file_ << record.line << '\n';
  if (record.level == "ERROR" || record.level == "CRITICAL")
    file_.flush();
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Shifts <name>.N to <name>.N+1 (the oldest backup is removed) and starts a
// fresh file. Filesystem errors only cost the rename, never the log line.
void FileLogWriter::rotateIfNeeded() {
  auto position = file_.tellp();
  if (position < 0 || static_cast<size_t>(position) < maxFileSize_)
    return;

  file_.close();
  std::error_code ec;
  if (maxBackupFiles_ <= 0) {
    std::filesystem::remove(fileName_, ec);
    open();
    return;
  }

  std::filesystem::remove(fileName_ + "." + std::to_string(maxBackupFiles_),
                          ec);
  for (int i = maxBackupFiles_ - 1; i >= 1; --i) {
    std::string from = fileName_ + "." + std::to_string(i);
    if (std::filesystem::exists(from, ec))
      std::filesystem::rename(from, fileName_ + "." + std::to_string(i + 1),
                              ec);
  }
  std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  open();
}
