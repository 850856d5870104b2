#ifndef FORK_TYPES_H
#define FORK_TYPES_H

#include "core/fork_errors.h"
#include "fork/ForkSpec.h"
#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <set>
#include <string>
#include <vector>

enum class TransferStrategy { SAME_SERVER, CROSS_SERVER };

enum class ForkPhase {
  PLANNING,
  TARGET_CLEANUP,
  SCHEMA,
  DATA,
  VERIFY,
  DONE,
  FAILED
};

enum class TableTaskStatus { PENDING, IN_PROGRESS, COMPLETED, FAILED };

enum class DdlKind {
  CREATE_DATABASE,
  CLONE_DATABASE,
  EXTENSION,
  CREATE_TYPE,
  CREATE_TABLE,
  CREATE_SEQUENCE,
  INDEX,
  CONSTRAINT,
  FOREIGN_KEY,
  SEQUENCE_SYNC
};

std::string strategyToString(TransferStrategy strategy);
std::string phaseToString(ForkPhase phase);
std::string taskStatusToString(TableTaskStatus status);
std::string ddlKindToString(DdlKind kind);

bool parseStrategy(const std::string &value, TransferStrategy &out);
bool parsePhase(const std::string &value, ForkPhase &out);
bool parseTaskStatus(const std::string &value, TableTaskStatus &out);
bool parseDdlKind(const std::string &value, DdlKind &out);

// One statement of the plan. The id is stable across runs of the same job and
// is what the job state records once the statement has been applied.
// columns lists the created columns for CREATE_TABLE statements.
struct DdlStatement {
  std::string id;
  DdlKind kind = DdlKind::CREATE_TABLE;
  std::string table;
  std::string sql;
  std::vector<std::string> columns;
};

struct TableTask {
  std::string name;
  int64_t estimatedRows = -1;
  TableTaskStatus status = TableTaskStatus::PENDING;
  int64_t rowsTransferred = 0;
  std::string lastError;
  std::vector<std::string> columns;
  int attempts = 0;

  bool isTerminal() const {
    return status == TableTaskStatus::COMPLETED ||
           status == TableTaskStatus::FAILED;
  }
};

struct TransferPlan {
  TransferStrategy strategy = TransferStrategy::CROSS_SERVER;
  bool targetExists = false;
  std::vector<TableTask> tables;
  std::vector<DdlStatement> statements;

  std::vector<DdlStatement> statementsOfKind(DdlKind kind) const;
  int64_t estimatedTotalRows() const;
  const TableTask *findTable(const std::string &name) const;
};

struct ForkJob {
  std::string id;
  ForkSpec spec;
  TransferPlan plan;
  ForkPhase phase = ForkPhase::PLANNING;
  std::string lastError;
  ErrorKind errorKind = ErrorKind::NONE;
  std::string failedTable;
  std::set<std::string> appliedStatements;
  std::chrono::system_clock::time_point createdAt;
  std::chrono::system_clock::time_point updatedAt;

  bool isTerminal() const {
    return phase == ForkPhase::DONE || phase == ForkPhase::FAILED;
  }
  size_t countTasks(TableTaskStatus status) const;
  int64_t rowsTransferred() const;
};

// JSON mapping used by the job-state file. Passwords are never written.
void to_json(nlohmann::json &j, const ConnectionConfig &config);
void from_json(const nlohmann::json &j, ConnectionConfig &config);
void to_json(nlohmann::json &j, const ForkSpec &spec);
void from_json(const nlohmann::json &j, ForkSpec &spec);
void to_json(nlohmann::json &j, const DdlStatement &statement);
void from_json(const nlohmann::json &j, DdlStatement &statement);
void to_json(nlohmann::json &j, const TableTask &task);
void from_json(const nlohmann::json &j, TableTask &task);
void to_json(nlohmann::json &j, const TransferPlan &plan);
void from_json(const nlohmann::json &j, TransferPlan &plan);
void to_json(nlohmann::json &j, const ForkJob &job);
void from_json(const nlohmann::json &j, ForkJob &job);

#endif
