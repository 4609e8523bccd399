#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Appends log lines of one migration task to migration.task_logs. The row
// keeps level and message apart; log_time is the database clock.
class DatabaseLogWriter : public ILogWriter {
private:
  std::unique_ptr<pqxx::connection> conn_;
  std::string connectionString_;
  int64_t taskId_;
  bool statementPrepared_;
  bool enabled_;
  mutable std::mutex mutex_;

public:
  DatabaseLogWriter(const std::string &connectionString, int64_t taskId);
  ~DatabaseLogWriter() override { close(); }

  bool write(const LogRecord &record) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;
  bool isEnabled() const;
  int64_t taskId() const { return taskId_; }

private:
  void prepareStatement();
};

#endif
