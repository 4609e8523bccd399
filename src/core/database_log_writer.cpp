#include "core/database_log_writer.h"
#include <iostream>

namespace {
constexpr size_t MAX_LEVEL_LENGTH = 50;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

// Drops byte sequences that are not valid UTF-8 so a binary value quoted in a
// log message cannot make PostgreSQL reject the whole insert.
std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if ((c >= 0x20 && c <= 0x7E) || c == '\n' || c == '\r' || c == '\t') {
      result += static_cast<char>(c);
      continue;
    }

    size_t extra = 0;
    if ((c & 0xE0) == 0xC0)
      extra = 1;
    else if ((c & 0xF0) == 0xE0)
      extra = 2;
    else if ((c & 0xF8) == 0xF0)
      extra = 3;
    else
      continue;

    if (i + extra >= input.size())
      continue;

    bool valid = true;
    for (size_t k = 1; k <= extra; ++k) {
      if ((static_cast<unsigned char>(input[i + k]) & 0xC0) != 0x80) {
        valid = false;
        break;
      }
    }
    if (valid) {
      result.append(input, i, extra + 1);
      i += extra;
    }
  }

  return result;
}
} // namespace

// Opens a dedicated connection to the history database. If the connection or
// the statement preparation fails the writer disables itself; every later
// write then returns false without touching the network.
DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString,
                                     int64_t taskId)
    : connectionString_(connectionString), taskId_(taskId),
      statementPrepared_(false), enabled_(true) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    prepareStatement();
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to establish connection: "
              << e.what() << std::endl;
  }
}

void DatabaseLogWriter::prepareStatement() {
  if (!conn_ || !conn_->is_open())
    return;

  if (statementPrepared_)
    return;

  try {
    conn_->prepare("task_log_insert",
                   "INSERT INTO migration.task_logs (task_id, log_level, "
                   "log_message, log_time) VALUES ($1, $2, $3, NOW())");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to prepare statement: " << e.what()
              << std::endl;
  }
}

bool DatabaseLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!enabled_ || !conn_ || !conn_->is_open()) {
    if (conn_ && !conn_->is_open()) {
      enabled_ = false;
    }
    return false;
  }

  if (record.level.length() > MAX_LEVEL_LENGTH) {
    return false;
  }

  try {
    if (!statementPrepared_) {
      prepareStatement();
      if (!statementPrepared_)
        return false;
    }

    std::string text = "[" + record.category + "] ";
    if (!record.function.empty())
      text += "[" + record.function + "] ";
    text += record.message;
    std::string message = sanitizeUTF8(text.substr(0, MAX_MESSAGE_LENGTH));

    pqxx::work txn(*conn_);
    txn.exec_prepared("task_log_insert", taskId_, record.level, message);
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Connection broken: " << e.what()
              << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: Failed to write log entry: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open() && enabled_;
}
