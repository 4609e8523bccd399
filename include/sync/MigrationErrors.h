#ifndef MIGRATIONERRORS_H
#define MIGRATIONERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorSeverity { TRANSIENT, TABLE_FATAL, TASK_FATAL };

class MigrationError : public std::runtime_error {
public:
  MigrationError(std::string name, ErrorSeverity severity,
                 const std::string &message)
      : std::runtime_error(message), name_(std::move(name)),
        severity_(severity) {}

  const std::string &name() const { return name_; }
  ErrorSeverity severity() const { return severity_; }
  bool isTransient() const { return severity_ == ErrorSeverity::TRANSIENT; }

private:
  std::string name_;
  ErrorSeverity severity_;
};

// Source read failure. Transient unless it was raised after retries ran out
// or mid-stream, where the cursor cannot be resumed.
class ReadError : public MigrationError {
public:
  explicit ReadError(const std::string &message,
                     ErrorSeverity severity = ErrorSeverity::TRANSIENT)
      : MigrationError("ReadError", severity, message) {}
};

class WriteError : public MigrationError {
public:
  explicit WriteError(const std::string &message,
                      ErrorSeverity severity = ErrorSeverity::TRANSIENT)
      : MigrationError("WriteError", severity, message) {}
};

class UnsupportedTypeError : public MigrationError {
public:
  UnsupportedTypeError(const std::string &column, const std::string &type)
      : MigrationError("UnsupportedTypeError", ErrorSeverity::TABLE_FATAL,
                       "Unsupported source type '" + type + "' for column '" +
                           column + "'"),
        column_(column), type_(type) {}

  const std::string &column() const { return column_; }
  const std::string &type() const { return type_; }

private:
  std::string column_;
  std::string type_;
};

class CoercionError : public MigrationError {
public:
  CoercionError(const std::string &column, const std::string &detail)
      : MigrationError("CoercionError", ErrorSeverity::TABLE_FATAL,
                       "Cannot coerce value of column '" + column +
                           "': " + detail),
        column_(column) {}

  const std::string &column() const { return column_; }

private:
  std::string column_;
};

class SchemaMismatchError : public MigrationError {
public:
  explicit SchemaMismatchError(const std::string &message)
      : MigrationError("SchemaMismatchError", ErrorSeverity::TABLE_FATAL,
                       message) {}
};

class SchemaDriftError : public MigrationError {
public:
  explicit SchemaDriftError(const std::string &message)
      : MigrationError("SchemaDriftError", ErrorSeverity::TABLE_FATAL,
                       message) {}
};

// No connection to the source or destination could be established at all.
class ConnectionError : public MigrationError {
public:
  explicit ConnectionError(const std::string &message)
      : MigrationError("ConnectionError", ErrorSeverity::TASK_FATAL, message) {}
};

#endif
