#ifndef FORK_ERRORS_H
#define FORK_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
  NONE = 0,
  VALIDATION,
  PLANNING,
  PERMISSION,
  CONNECTION,
  TIMEOUT,
  SCHEMA_MISMATCH,
  RESUME_MISMATCH,
  CANCELLED,
  EXHAUSTED_RETRIES,
  DATA_INTEGRITY,
  STATE,
  TEMPLATE,
  INTERNAL
};

std::string errorKindToString(ErrorKind kind);

struct FieldViolation {
  std::string field;
  std::string message;
};

// Base of every error the engine surfaces. The table name is empty for
// job-level failures.
class ForkError : public std::runtime_error {
private:
  ErrorKind kind_;
  bool retryable_;
  std::string table_;
  std::string sqlState_;

public:
  ForkError(ErrorKind kind, const std::string &message, bool retryable,
            const std::string &table = "", const std::string &sqlState = "");

  ErrorKind kind() const { return kind_; }
  bool retryable() const { return retryable_; }
  const std::string &table() const { return table_; }
  const std::string &sqlState() const { return sqlState_; }
};

class PlanningError : public ForkError {
public:
  explicit PlanningError(const std::string &message)
      : ForkError(ErrorKind::PLANNING, message, false) {}
};

class PermissionError : public ForkError {
public:
  PermissionError(const std::string &message, const std::string &table = "",
                  const std::string &sqlState = "")
      : ForkError(ErrorKind::PERMISSION, message, false, table, sqlState) {}
};

class ConnectionError : public ForkError {
public:
  ConnectionError(const std::string &message, const std::string &table = "",
                  const std::string &sqlState = "")
      : ForkError(ErrorKind::CONNECTION, message, true, table, sqlState) {}
};

class TimeoutError : public ForkError {
public:
  TimeoutError(const std::string &message, bool retryable,
               const std::string &table = "", const std::string &sqlState = "")
      : ForkError(ErrorKind::TIMEOUT, message, retryable, table, sqlState) {}
};

class SchemaMismatchError : public ForkError {
public:
  SchemaMismatchError(const std::string &message, const std::string &table,
                      const std::string &sqlState = "")
      : ForkError(ErrorKind::SCHEMA_MISMATCH, message, false, table,
                  sqlState) {}
};

class ResumeMismatchError : public ForkError {
public:
  explicit ResumeMismatchError(const std::string &message)
      : ForkError(ErrorKind::RESUME_MISMATCH, message, false) {}
};

class CancellationError : public ForkError {
public:
  explicit CancellationError(const std::string &message,
                             const std::string &table = "")
      : ForkError(ErrorKind::CANCELLED, message, false, table) {}
};

// Raised when a retryable operation kept failing. Always fatal; the kind of
// the last underlying failure is kept for reporting.
class ExhaustedRetriesError : public ForkError {
private:
  int attempts_;
  ErrorKind lastKind_;

public:
  ExhaustedRetriesError(const std::string &operation, int attempts,
                        ErrorKind lastKind, const std::string &lastMessage,
                        const std::string &table = "");

  int attempts() const { return attempts_; }
  ErrorKind lastKind() const { return lastKind_; }
};

class DataIntegrityError : public ForkError {
public:
  DataIntegrityError(const std::string &message, const std::string &table = "",
                     const std::string &sqlState = "")
      : ForkError(ErrorKind::DATA_INTEGRITY, message, false, table, sqlState) {}
};

class StateError : public ForkError {
public:
  explicit StateError(const std::string &message)
      : ForkError(ErrorKind::STATE, message, false) {}
};

class ValidationError : public ForkError {
private:
  std::vector<FieldViolation> violations_;

public:
  explicit ValidationError(std::vector<FieldViolation> violations);

  const std::vector<FieldViolation> &violations() const { return violations_; }
};

class TemplateError : public ForkError {
public:
  explicit TemplateError(const std::string &message)
      : ForkError(ErrorKind::TEMPLATE, message, false) {}
};

struct ClassifiedError {
  ErrorKind kind = ErrorKind::INTERNAL;
  bool retryable = false;
  std::string message;
  std::string table;
  std::string sqlState;
};

ClassifiedError classifySqlState(const std::string &sqlState);
ClassifiedError classifyException(const std::exception &e);

// Throws the concrete ForkError subclass matching error.kind.
[[noreturn]] void throwClassified(const ClassifiedError &error);

#endif
