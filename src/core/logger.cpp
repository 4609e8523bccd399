#include "core/logger.h"
#include "core/console_log_writer.h"
#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include <algorithm>
#include <ctime>
#include <iostream>

// Static member initialization for Logger class. writers_ holds the sinks that
// receive every line (console, rotating file), taskWriter_ holds the optional
// task_logs writer of the task currently running, logMutex serializes writes.
std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::unique_ptr<ILogWriter> Logger::taskWriter_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

namespace {
std::string buildLogFileName(const std::string &prefix) {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  struct tm tm_buf;
  localtime_r(&time_t, &tm_buf);
  std::ostringstream oss;
  oss << prefix << "_" << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << ".log";
  return oss.str();
}
} // namespace

// Formats a line and hands it to every registered writer. Lines below the
// configured level are dropped before formatting. A writer that fails returns
// false; that failure is never reported back to the caller, so logging can be
// used from error paths without masking the original error.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
  }

  if (level < minLevel) {
    return;
  }

  LogRecord record;
  record.level = getLevelString(level);
  record.category = getCategoryString(category);
  record.function = function;
  record.message = message;
  record.line = formatLogMessage(getCurrentTimestamp(), record.level,
                                 record.category, function, message);

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer && writer->isOpen()) {
      writer->write(record);
    }
  }
  if (taskWriter_ && taskWriter_->isOpen()) {
    taskWriter_->write(record);
  }
}

// Initializes the Logger from the logging section of the configuration. Any
// previously registered writers are closed first, so calling this twice
// reconfigures instead of duplicating output. The log file is named
// <file_prefix>_<YYYYmmdd_HHMMSS>.log in the working directory.
void Logger::initialize(const LoggingConfig &config) {
  setLogLevel(config.level);

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    writer->close();
  }
  writers_.clear();

  if (config.console_output) {
    writers_.push_back(std::make_unique<ConsoleLogWriter>());
  }

  if (config.file_output) {
    auto fileWriter = std::make_unique<FileLogWriter>(
        buildLogFileName(config.file_prefix), config.max_file_size,
        config.max_backup_files);
    if (fileWriter->isOpen()) {
      writers_.push_back(std::move(fileWriter));
    } else {
      std::cerr << "Warning: could not open log file, file logging disabled"
                << std::endl;
    }
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (taskWriter_) {
    taskWriter_->close();
    taskWriter_.reset();
  }
  for (auto &writer : writers_) {
    writer->flush();
    writer->close();
  }
  writers_.clear();
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  if (!writer) {
    return;
  }
  std::lock_guard<std::mutex> lock(logMutex);
  writers_.push_back(std::move(writer));
}

// Starts mirroring log lines into migration.task_logs for the given task. If
// the history database cannot be reached the writer disables itself and the
// remaining sinks keep working.
void Logger::attachTaskLog(const std::string &connectionString,
                           int64_t taskId) {
  auto writer = std::make_unique<DatabaseLogWriter>(connectionString, taskId);
  if (!writer->isEnabled()) {
    std::cerr << "Warning: task log writer unavailable for task " << taskId
              << std::endl;
    return;
  }
  std::lock_guard<std::mutex> lock(logMutex);
  if (taskWriter_) {
    taskWriter_->close();
  }
  taskWriter_ = std::move(writer);
}

void Logger::detachTaskLog() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (taskWriter_) {
    taskWriter_->close();
    taskWriter_.reset();
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Sets the current log level from its name. Accepts DEBUG, INFO, WARN/WARNING,
// ERROR and FATAL/CRITICAL in any case; anything else leaves the level as is.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}
