#include "fork/ForkTypes.h"
#include "utils/time_utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string strategyToString(TransferStrategy strategy) {
  return strategy == TransferStrategy::SAME_SERVER ? "same-server"
                                                   : "cross-server";
}

std::string phaseToString(ForkPhase phase) {
  switch (phase) {
  case ForkPhase::PLANNING:
    return "planning";
  case ForkPhase::TARGET_CLEANUP:
    return "cleanup";
  case ForkPhase::SCHEMA:
    return "schema";
  case ForkPhase::DATA:
    return "data";
  case ForkPhase::VERIFY:
    return "verify";
  case ForkPhase::DONE:
    return "done";
  case ForkPhase::FAILED:
    return "failed";
  }
  return "failed";
}

std::string taskStatusToString(TableTaskStatus status) {
  switch (status) {
  case TableTaskStatus::PENDING:
    return "pending";
  case TableTaskStatus::IN_PROGRESS:
    return "in_progress";
  case TableTaskStatus::COMPLETED:
    return "completed";
  case TableTaskStatus::FAILED:
    return "failed";
  }
  return "failed";
}

std::string ddlKindToString(DdlKind kind) {
  switch (kind) {
  case DdlKind::CREATE_DATABASE:
    return "create_database";
  case DdlKind::CLONE_DATABASE:
    return "clone_database";
  case DdlKind::EXTENSION:
    return "extension";
  case DdlKind::CREATE_TYPE:
    return "create_type";
  case DdlKind::CREATE_TABLE:
    return "create_table";
  case DdlKind::CREATE_SEQUENCE:
    return "create_sequence";
  case DdlKind::INDEX:
    return "index";
  case DdlKind::CONSTRAINT:
    return "constraint";
  case DdlKind::FOREIGN_KEY:
    return "foreign_key";
  case DdlKind::SEQUENCE_SYNC:
    return "sequence_sync";
  }
  return "create_table";
}

bool parseStrategy(const std::string &value, TransferStrategy &out) {
  if (value == "same-server") {
    out = TransferStrategy::SAME_SERVER;
    return true;
  }
  if (value == "cross-server") {
    out = TransferStrategy::CROSS_SERVER;
    return true;
  }
  return false;
}

bool parsePhase(const std::string &value, ForkPhase &out) {
  for (ForkPhase phase :
       {ForkPhase::PLANNING, ForkPhase::TARGET_CLEANUP, ForkPhase::SCHEMA,
        ForkPhase::DATA, ForkPhase::VERIFY, ForkPhase::DONE,
        ForkPhase::FAILED}) {
    if (phaseToString(phase) == value) {
      out = phase;
      return true;
    }
  }
  return false;
}

bool parseTaskStatus(const std::string &value, TableTaskStatus &out) {
  for (TableTaskStatus status :
       {TableTaskStatus::PENDING, TableTaskStatus::IN_PROGRESS,
        TableTaskStatus::COMPLETED, TableTaskStatus::FAILED}) {
    if (taskStatusToString(status) == value) {
      out = status;
      return true;
    }
  }
  return false;
}

bool parseDdlKind(const std::string &value, DdlKind &out) {
  for (DdlKind kind :
       {DdlKind::CREATE_DATABASE, DdlKind::CLONE_DATABASE, DdlKind::EXTENSION,
        DdlKind::CREATE_TYPE, DdlKind::CREATE_TABLE, DdlKind::CREATE_SEQUENCE,
        DdlKind::INDEX, DdlKind::CONSTRAINT, DdlKind::FOREIGN_KEY,
        DdlKind::SEQUENCE_SYNC}) {
    if (ddlKindToString(kind) == value) {
      out = kind;
      return true;
    }
  }
  return false;
}

std::vector<DdlStatement> TransferPlan::statementsOfKind(DdlKind kind) const {
  std::vector<DdlStatement> result;
  for (const auto &statement : statements) {
    if (statement.kind == kind)
      result.push_back(statement);
  }
  return result;
}

// Sum of the per-table estimates, or -1 when any table has no estimate.
int64_t TransferPlan::estimatedTotalRows() const {
  int64_t total = 0;
  for (const auto &task : tables) {
    if (task.estimatedRows < 0)
      return -1;
    total += task.estimatedRows;
  }
  return total;
}

const TableTask *TransferPlan::findTable(const std::string &name) const {
  for (const auto &task : tables) {
    if (task.name == name)
      return &task;
  }
  return nullptr;
}

size_t ForkJob::countTasks(TableTaskStatus status) const {
  size_t count = 0;
  for (const auto &task : plan.tables) {
    if (task.status == status)
      ++count;
  }
  return count;
}

int64_t ForkJob::rowsTransferred() const {
  int64_t total = 0;
  for (const auto &task : plan.tables)
    total += task.rowsTransferred;
  return total;
}

namespace {
template <typename T>
T requireEnum(const json &j, const char *key,
              bool (*parse)(const std::string &, T &)) {
  std::string value = j.at(key).get<std::string>();
  T out;
  if (!parse(value, out)) {
    throw StateError(std::string("unknown value '") + value + "' for " + key);
  }
  return out;
}

ErrorKind parseErrorKind(const std::string &value) {
  for (int i = static_cast<int>(ErrorKind::NONE);
       i <= static_cast<int>(ErrorKind::INTERNAL); ++i) {
    ErrorKind kind = static_cast<ErrorKind>(i);
    if (errorKindToString(kind) == value)
      return kind;
  }
  return ErrorKind::INTERNAL;
}

std::string timeToJson(std::chrono::system_clock::time_point tp) {
  return TimeUtils::toIso8601(tp);
}

std::chrono::system_clock::time_point timeFromJson(const json &j,
                                                   const char *key) {
  std::chrono::system_clock::time_point tp{};
  if (j.contains(key)) {
    TimeUtils::fromIso8601(j.at(key).get<std::string>(), tp);
  }
  return tp;
}
} // namespace

void to_json(json &j, const ConnectionConfig &config) {
  j = json{{"host", config.host},
           {"port", config.port},
           {"username", config.username},
           {"database", config.database},
           {"sslmode", config.sslmode}};
}

void from_json(const json &j, ConnectionConfig &config) {
  config.host = j.value("host", "");
  config.port = j.value("port", ForkDefaults::DEFAULT_PORT);
  config.username = j.value("username", "");
  config.database = j.value("database", "");
  config.sslmode = j.value("sslmode", ForkDefaults::DEFAULT_SSLMODE);
  config.password.clear();
}

void to_json(json &j, const ForkSpec &spec) {
  j = json{{"source", spec.source},
           {"destination", spec.destination},
           {"target_database", spec.targetDatabase},
           {"drop_if_exists", spec.dropIfExists},
           {"include_tables", spec.includeTables},
           {"exclude_tables", spec.excludeTables},
           {"schema_only", spec.schemaOnly},
           {"data_only", spec.dataOnly},
           {"max_connections", spec.maxConnections},
           {"chunk_size", spec.chunkSize},
           {"timeout_seconds", spec.timeout.count()}};
}

void from_json(const json &j, ForkSpec &spec) {
  spec.source = j.at("source").get<ConnectionConfig>();
  spec.destination = j.at("destination").get<ConnectionConfig>();
  spec.targetDatabase = j.at("target_database").get<std::string>();
  spec.dropIfExists = j.value("drop_if_exists", false);
  spec.includeTables =
      j.value("include_tables", std::vector<std::string>{});
  spec.excludeTables =
      j.value("exclude_tables", std::vector<std::string>{});
  spec.schemaOnly = j.value("schema_only", false);
  spec.dataOnly = j.value("data_only", false);
  spec.maxConnections =
      j.value("max_connections", ForkDefaults::DEFAULT_MAX_CONNECTIONS);
  spec.chunkSize = j.value("chunk_size", ForkDefaults::DEFAULT_CHUNK_SIZE);
  spec.timeout = std::chrono::seconds(
      j.value("timeout_seconds", ForkDefaults::DEFAULT_TIMEOUT_SECONDS));
}

void to_json(json &j, const DdlStatement &statement) {
  j = json{{"id", statement.id},
           {"kind", ddlKindToString(statement.kind)},
           {"table", statement.table},
           {"sql", statement.sql}};
  if (!statement.columns.empty())
    j["columns"] = statement.columns;
}

void from_json(const json &j, DdlStatement &statement) {
  statement.id = j.at("id").get<std::string>();
  statement.kind = requireEnum<DdlKind>(j, "kind", parseDdlKind);
  statement.table = j.value("table", "");
  statement.sql = j.at("sql").get<std::string>();
  statement.columns = j.value("columns", std::vector<std::string>{});
}

void to_json(json &j, const TableTask &task) {
  j = json{{"name", task.name},
           {"estimated_rows", task.estimatedRows},
           {"status", taskStatusToString(task.status)},
           {"rows_transferred", task.rowsTransferred},
           {"attempts", task.attempts},
           {"columns", task.columns}};
  if (!task.lastError.empty())
    j["last_error"] = task.lastError;
}

void from_json(const json &j, TableTask &task) {
  task.name = j.at("name").get<std::string>();
  task.estimatedRows = j.value("estimated_rows", static_cast<int64_t>(-1));
  task.status = requireEnum<TableTaskStatus>(j, "status", parseTaskStatus);
  task.rowsTransferred = j.value("rows_transferred", static_cast<int64_t>(0));
  task.attempts = j.value("attempts", 0);
  task.columns = j.value("columns", std::vector<std::string>{});
  task.lastError = j.value("last_error", "");
}

void to_json(json &j, const TransferPlan &plan) {
  j = json{{"strategy", strategyToString(plan.strategy)},
           {"target_exists", plan.targetExists},
           {"tables", plan.tables},
           {"statements", plan.statements}};
}

void from_json(const json &j, TransferPlan &plan) {
  plan.strategy = requireEnum<TransferStrategy>(j, "strategy", parseStrategy);
  plan.targetExists = j.value("target_exists", false);
  plan.tables = j.at("tables").get<std::vector<TableTask>>();
  plan.statements = j.at("statements").get<std::vector<DdlStatement>>();
}

void to_json(json &j, const ForkJob &job) {
  j = json{{"job_id", job.id},
           {"spec", job.spec},
           {"plan", job.plan},
           {"phase", phaseToString(job.phase)},
           {"applied_statements", job.appliedStatements},
           {"created_at", timeToJson(job.createdAt)},
           {"updated_at", timeToJson(job.updatedAt)}};
  if (!job.lastError.empty()) {
    j["last_error"] = job.lastError;
    j["error_kind"] = errorKindToString(job.errorKind);
  }
  if (!job.failedTable.empty())
    j["failed_table"] = job.failedTable;
}

void from_json(const json &j, ForkJob &job) {
  job.id = j.at("job_id").get<std::string>();
  job.spec = j.at("spec").get<ForkSpec>();
  job.plan = j.at("plan").get<TransferPlan>();
  job.phase = requireEnum<ForkPhase>(j, "phase", parsePhase);
  job.appliedStatements =
      j.value("applied_statements", std::set<std::string>{});
  job.createdAt = timeFromJson(j, "created_at");
  job.updatedAt = timeFromJson(j, "updated_at");
  job.lastError = j.value("last_error", "");
  job.errorKind = parseErrorKind(j.value("error_kind", "none"));
  job.failedTable = j.value("failed_table", "");
}
