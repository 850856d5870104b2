#include "core/fork_errors.h"
#include <initializer_list>
#include <pqxx/pqxx>

ForkError::ForkError(ErrorKind kind, const std::string &message,
                     bool retryable, const std::string &table,
                     const std::string &sqlState)
    : std::runtime_error(message), kind_(kind), retryable_(retryable),
      table_(table), sqlState_(sqlState) {}

namespace {
std::string describeViolations(const std::vector<FieldViolation> &violations) {
  std::string message = "invalid fork specification";
  for (size_t i = 0; i < violations.size(); ++i) {
    message += (i == 0 ? ": " : "; ");
    message += violations[i].field + " " + violations[i].message;
  }
  return message;
}

bool containsAny(const std::string &text,
                 std::initializer_list<const char *> needles) {
  for (const char *needle : needles) {
    if (text.find(needle) != std::string::npos)
      return true;
  }
  return false;
}
} // namespace

ExhaustedRetriesError::ExhaustedRetriesError(const std::string &operation,
                                             int attempts, ErrorKind lastKind,
                                             const std::string &lastMessage,
                                             const std::string &table)
    : ForkError(ErrorKind::EXHAUSTED_RETRIES,
                operation + " failed after " + std::to_string(attempts) +
                    " attempts: " + lastMessage,
                false, table),
      attempts_(attempts), lastKind_(lastKind) {}

ValidationError::ValidationError(std::vector<FieldViolation> violations)
    : ForkError(ErrorKind::VALIDATION, describeViolations(violations), false),
      violations_(std::move(violations)) {}

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NONE:
    return "none";
  case ErrorKind::VALIDATION:
    return "validation";
  case ErrorKind::PLANNING:
    return "planning";
  case ErrorKind::PERMISSION:
    return "permission";
  case ErrorKind::CONNECTION:
    return "connection";
  case ErrorKind::TIMEOUT:
    return "timeout";
  case ErrorKind::SCHEMA_MISMATCH:
    return "schema_mismatch";
  case ErrorKind::RESUME_MISMATCH:
    return "resume_mismatch";
  case ErrorKind::CANCELLED:
    return "cancelled";
  case ErrorKind::EXHAUSTED_RETRIES:
    return "exhausted_retries";
  case ErrorKind::DATA_INTEGRITY:
    return "data_integrity";
  case ErrorKind::STATE:
    return "state";
  case ErrorKind::TEMPLATE:
    return "template";
  default:
    return "internal";
  }
}

// Maps a PostgreSQL SQLSTATE to the engine's error taxonomy. Connection
// exceptions (class 08), operator intervention during shutdown, resource
// exhaustion (class 53) and "object in use" are transient; statement timeouts
// and lock timeouts are timeouts; authorization failures and integrity
// violations are never retried.
ClassifiedError classifySqlState(const std::string &sqlState) {
  ClassifiedError result;
  result.sqlState = sqlState;

  if (sqlState.size() != 5) {
    return result;
  }

  std::string sqlClass = sqlState.substr(0, 2);

  if (sqlClass == "08" || sqlState == "57P01" || sqlState == "57P02" ||
      sqlState == "57P03" || sqlClass == "53" || sqlState == "55006") {
    result.kind = ErrorKind::CONNECTION;
    result.retryable = true;
  } else if (sqlState == "57014" || sqlState == "55P03") {
    result.kind = ErrorKind::TIMEOUT;
    result.retryable = true;
  } else if (sqlState == "28000" || sqlState == "28P01" ||
             sqlState == "42501") {
    result.kind = ErrorKind::PERMISSION;
  } else if (sqlClass == "23") {
    result.kind = ErrorKind::DATA_INTEGRITY;
  } else if (sqlState == "3D000") {
    result.kind = ErrorKind::PLANNING;
  } else if (sqlState == "42703" || sqlState == "42P01" ||
             sqlState == "42704") {
    result.kind = ErrorKind::SCHEMA_MISMATCH;
  }
  return result;
}

// Classifies any exception that escaped a unit of work. Engine errors keep
// their own classification. libpqxx reports failed connection attempts as
// broken_connection without a SQLSTATE, so authentication failures and missing
// databases are recognised from the server message before the error is
// treated as a transient connection problem.
ClassifiedError classifyException(const std::exception &e) {
  ClassifiedError result;
  result.message = e.what();

  if (auto forkError = dynamic_cast<const ForkError *>(&e)) {
    result.kind = forkError->kind();
    result.retryable = forkError->retryable();
    result.table = forkError->table();
    result.sqlState = forkError->sqlState();
    return result;
  }

  if (auto sqlError = dynamic_cast<const pqxx::sql_error *>(&e)) {
    ClassifiedError byState = classifySqlState(sqlError->sqlstate());
    byState.message = result.message;
    return byState;
  }

  if (dynamic_cast<const pqxx::broken_connection *>(&e)) {
    if (containsAny(result.message,
                    {"password authentication failed", "no pg_hba.conf entry",
                     "permission denied", "role \""})) {
      result.kind = ErrorKind::PERMISSION;
      result.retryable = false;
    } else if (containsAny(result.message, {"database \""}) &&
               containsAny(result.message, {"does not exist"})) {
      result.kind = ErrorKind::PLANNING;
      result.retryable = false;
    } else {
      result.kind = ErrorKind::CONNECTION;
      result.retryable = true;
    }
    return result;
  }

  result.kind = ErrorKind::INTERNAL;
  result.retryable = false;
  return result;
}

void throwClassified(const ClassifiedError &error) {
  switch (error.kind) {
  case ErrorKind::PLANNING:
    throw PlanningError(error.message);
  case ErrorKind::PERMISSION:
    throw PermissionError(error.message, error.table, error.sqlState);
  case ErrorKind::CONNECTION:
    throw ConnectionError(error.message, error.table, error.sqlState);
  case ErrorKind::TIMEOUT:
    throw TimeoutError(error.message, error.retryable, error.table,
                       error.sqlState);
  case ErrorKind::SCHEMA_MISMATCH:
    throw SchemaMismatchError(error.message, error.table, error.sqlState);
  case ErrorKind::RESUME_MISMATCH:
    throw ResumeMismatchError(error.message);
  case ErrorKind::CANCELLED:
    throw CancellationError(error.message, error.table);
  case ErrorKind::DATA_INTEGRITY:
    throw DataIntegrityError(error.message, error.table, error.sqlState);
  case ErrorKind::STATE:
    throw StateError(error.message);
  case ErrorKind::TEMPLATE:
    throw TemplateError(error.message);
  default:
    throw ForkError(error.kind == ErrorKind::NONE ? ErrorKind::INTERNAL
                                                  : error.kind,
                    error.message, error.retryable, error.table,
                    error.sqlState);
  }
}
