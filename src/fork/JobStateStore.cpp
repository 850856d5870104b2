#include "fork/JobStateStore.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <random>
#include <set>
#include <sstream>

using json = nlohmann::json;

JobStateStore::JobStateStore(const std::string &stateDir,
                             std::shared_ptr<Logger> logger)
    : stateDir_(stateDir.empty() ? defaultStateDir() : stateDir),
      logger_(std::move(logger)) {}

std::string JobStateStore::defaultStateDir() {
  const char *tmp = std::getenv("TMPDIR");
  std::filesystem::path base = (tmp && *tmp) ? tmp : "/tmp";
  return (base / ForkDefaults::STATE_SUBDIRECTORY).string();
}

// fork-<yyyymmddHHMMSS>-<6 hex>; the random suffix keeps ids unique for
// forks started within the same second.
std::string JobStateStore::generateJobId() {
  std::random_device device;
  std::mt19937 generator(device());
  std::uniform_int_distribution<unsigned int> distribution(0, 0xFFFFFF);

  std::ostringstream id;
  id << "fork-" << TimeUtils::compactTimestamp(std::chrono::system_clock::now())
     << "-" << std::hex << std::setw(6) << std::setfill('0')
     << distribution(generator);
  return id.str();
}

std::string JobStateStore::pathFor(const std::string &jobId) const {
  return (std::filesystem::path(stateDir_) / (jobId + ".json")).string();
}

bool JobStateStore::exists(const std::string &jobId) const {
  std::error_code ec;
  return std::filesystem::exists(pathFor(jobId), ec);
}

std::optional<ForkJob> JobStateStore::load(const std::string &jobId) const {
  std::string path = pathFor(jobId);
  std::ifstream file(path);
  if (!file.is_open())
    return std::nullopt;

  try {
    json document = json::parse(file);
    ForkJob job = document.get<ForkJob>();
    if (job.id != jobId) {
      throw StateError("job state file " + path + " belongs to job " +
                       job.id);
    }
    return job;
  } catch (const json::exception &e) {
    throw StateError("cannot parse job state file " + path + ": " + e.what());
  }
}

// Written to a temporary file first and renamed over the record, so readers
// only ever see a complete document.
void JobStateStore::save(const ForkJob &job) const {
  std::error_code ec;
  std::filesystem::create_directories(stateDir_, ec);
  if (ec) {
    throw StateError("cannot create state directory " + stateDir_ + ": " +
                     ec.message());
  }

  std::string path = pathFor(job.id);
  std::string tmpPath = path + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::trunc);
    if (!file.is_open())
      throw StateError("cannot open " + tmpPath + " for writing");
    file << json(job).dump(2) << '\n';
    file.flush();
    if (!file.good())
      throw StateError("failed writing job state to " + tmpPath);
  }

  std::filesystem::rename(tmpPath, path, ec);
  if (ec) {
    std::filesystem::remove(tmpPath, ec);
    throw StateError("cannot replace job state file " + path);
  }
}

bool JobStateStore::remove(const std::string &jobId) const {
  std::error_code ec;
  bool removed = std::filesystem::remove(pathFor(jobId), ec);
  if (ec) {
    logger_->warning(LogCategory::STATE, "remove",
                     "Could not remove job " + jobId + ": " + ec.message());
    return false;
  }
  return removed;
}

std::vector<ForkJob> JobStateStore::listJobs() const {
  std::vector<ForkJob> jobs;
  std::error_code ec;
  if (!std::filesystem::is_directory(stateDir_, ec))
    return jobs;

  for (const auto &entry : std::filesystem::directory_iterator(stateDir_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json")
      continue;

    std::string jobId = entry.path().stem().string();
    try {
      std::optional<ForkJob> job = load(jobId);
      if (job)
        jobs.push_back(*job);
    } catch (const StateError &e) {
      logger_->warning(LogCategory::STATE, "listJobs",
                       "Skipping unreadable job record: " +
                           std::string(e.what()));
    }
  }

  std::sort(jobs.begin(), jobs.end(), [](const ForkJob &a, const ForkJob &b) {
    return a.createdAt < b.createdAt;
  });
  return jobs;
}

size_t JobStateStore::cleanupOldJobs(std::chrono::hours maxAge) const {
  auto cutoff = std::chrono::system_clock::now() - maxAge;
  size_t removed = 0;
  for (const auto &job : listJobs()) {
    if (!job.isTerminal() || job.updatedAt >= cutoff)
      continue;
    if (remove(job.id)) {
      ++removed;
      logger_->info(LogCategory::STATE, "cleanupOldJobs",
                    "Removed " + phaseToString(job.phase) + " job " + job.id +
                        " (last updated " + TimeUtils::toIso8601(job.updatedAt) +
                        ")");
    }
  }
  return removed;
}

void JobStateStore::beginJob(const ForkJob &job, bool persist) {
  std::lock_guard<std::mutex> lock(mutex_);
  job_ = job;
  active_ = true;
  persist_ = persist;
  if (job_.createdAt == std::chrono::system_clock::time_point{})
    job_.createdAt = std::chrono::system_clock::now();
  persistLocked();
}

ForkJob JobStateStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return job_;
}

bool JobStateStore::hasJob() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

void JobStateStore::persistLocked() {
  if (!active_)
    throw StateError("no job is being tracked");
  job_.updatedAt = std::chrono::system_clock::now();
  if (persist_)
    save(job_);
}

TableTask &JobStateStore::findTaskLocked(const std::string &table) {
  for (auto &task : job_.plan.tables) {
    if (task.name == table)
      return task;
  }
  throw StateError("table " + table + " is not part of job " + job_.id);
}

void JobStateStore::setPhase(ForkPhase phase) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (job_.phase != phase) {
    logger_->info(LogCategory::STATE, "setPhase",
                  "Job " + job_.id + ": " + phaseToString(job_.phase) +
                      " -> " + phaseToString(phase));
  }
  job_.phase = phase;
  persistLocked();
}

void JobStateStore::setPlan(const TransferPlan &plan) {
  std::lock_guard<std::mutex> lock(mutex_);
  job_.plan = plan;
  persistLocked();
}

bool JobStateStore::isValidTransition(TableTaskStatus from,
                                      TableTaskStatus to) {
  switch (from) {
  case TableTaskStatus::PENDING:
    return to == TableTaskStatus::IN_PROGRESS;
  case TableTaskStatus::IN_PROGRESS:
    return to == TableTaskStatus::COMPLETED || to == TableTaskStatus::FAILED;
  case TableTaskStatus::COMPLETED:
  case TableTaskStatus::FAILED:
    return false;
  }
  return false;
}

TableTask JobStateStore::transitionTask(const std::string &table,
                                        TableTaskStatus status,
                                        const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableTask &task = findTaskLocked(table);
  if (!isValidTransition(task.status, status)) {
    throw StateError("illegal transition of table " + table + " from " +
                     taskStatusToString(task.status) + " to " +
                     taskStatusToString(status));
  }

  task.status = status;
  if (status == TableTaskStatus::IN_PROGRESS) {
    ++task.attempts;
    task.rowsTransferred = 0;
    task.lastError.clear();
  } else if (status == TableTaskStatus::FAILED) {
    task.lastError = error;
  }
  persistLocked();
  return task;
}

void JobStateStore::recordRows(const std::string &table,
                               int64_t rowsTransferred) {
  std::lock_guard<std::mutex> lock(mutex_);
  findTaskLocked(table).rowsTransferred = rowsTransferred;
}

void JobStateStore::markStatementApplied(const std::string &statementId) {
  std::lock_guard<std::mutex> lock(mutex_);
  job_.appliedStatements.insert(statementId);
  persistLocked();
}

bool JobStateStore::isStatementApplied(const std::string &statementId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return job_.appliedStatements.count(statementId) > 0;
}

void JobStateStore::markFailed(const ClassifiedError &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  job_.phase = ForkPhase::FAILED;
  job_.errorKind = error.kind;
  job_.lastError = error.message;
  job_.failedTable = error.table;
  persistLocked();
}

void JobStateStore::prepareForResume(ForkJob &job) {
  for (auto &task : job.plan.tables) {
    if (task.status == TableTaskStatus::COMPLETED)
      continue;
    task.status = TableTaskStatus::PENDING;
    task.rowsTransferred = 0;
  }
  job.lastError.clear();
  job.errorKind = ErrorKind::NONE;
  job.failedTable.clear();
}

namespace {

std::set<std::string> asSet(const std::vector<std::string> &values) {
  return std::set<std::string>(values.begin(), values.end());
}

void checkField(std::vector<std::string> &mismatches, const std::string &field,
                const std::string &stored, const std::string &requested) {
  if (stored != requested)
    mismatches.push_back(field + " (" + stored + " != " + requested + ")");
}

} // namespace

void JobStateStore::verifyResumable(const ForkJob &stored,
                                    const ForkSpec &spec) {
  std::vector<std::string> mismatches;
  const ForkSpec &old = stored.spec;

  checkField(mismatches, "source host", old.source.host, spec.source.host);
  checkField(mismatches, "source port", std::to_string(old.source.port),
             std::to_string(spec.source.port));
  checkField(mismatches, "source user", old.source.username,
             spec.source.username);
  checkField(mismatches, "source database", old.source.database,
             spec.source.database);
  checkField(mismatches, "destination host", old.destination.host,
             spec.destination.host);
  checkField(mismatches, "destination port",
             std::to_string(old.destination.port),
             std::to_string(spec.destination.port));
  checkField(mismatches, "destination user", old.destination.username,
             spec.destination.username);
  checkField(mismatches, "target database", old.targetDatabase,
             spec.targetDatabase);

  if (asSet(old.includeTables) != asSet(spec.includeTables))
    mismatches.push_back("include_tables");
  if (asSet(old.excludeTables) != asSet(spec.excludeTables))
    mismatches.push_back("exclude_tables");
  if (old.schemaOnly != spec.schemaOnly || old.dataOnly != spec.dataOnly)
    mismatches.push_back("schema_only/data_only mode");

  if (!mismatches.empty()) {
    std::string message = "job " + stored.id +
                          " was started with a different configuration: ";
    for (size_t i = 0; i < mismatches.size(); ++i) {
      if (i > 0)
        message += ", ";
      message += mismatches[i];
    }
    throw ResumeMismatchError(message);
  }
}
