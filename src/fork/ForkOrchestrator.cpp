#include "fork/ForkOrchestrator.h"
#include "fork/ConnectionManager.h"
#include "fork/DataTransferWorkerPool.h"
#include "fork/JobStateStore.h"
#include "fork/ProgressTracker.h"
#include "fork/RetryPolicy.h"
#include "fork/SchemaExtractor.h"
#include "fork/StrategyPlanner.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

json ForkResult::toJson() const {
  json document = {{"success", success},
                   {"database", targetDatabase},
                   {"strategy", strategyToString(strategy)},
                   {"job_id", jobId},
                   {"dry_run", dryRun},
                   {"tables_completed", tablesCompleted},
                   {"tables_total", tablesTotal},
                   {"rows_transferred", rowsTransferred},
                   {"duration", TimeUtils::formatDuration(duration)}};
  if (!success) {
    document["error"] = errorMessage;
    document["error_kind"] = errorKindToString(errorKind);
    document["table"] = failedTable;
  }
  if (dryRun)
    document["plan"] = plan;
  return document;
}

// Everything one call to fork() owns. Member order is construction order:
// the connection manager borrows the retry policy, the planner borrows the
// connection manager and the extractor.
struct ForkOrchestrator::Run {
  const ForkSpec &spec;
  CancellationToken &token;
  std::string jobId;
  RetryPolicy retry;
  ConnectionManager connections;
  SchemaExtractor extractor;
  StrategyPlanner planner;
  JobStateStore store;
  ProgressTracker progress;
  std::unique_ptr<IDestinationSession> target;
  bool resumed = false;
  bool alreadyDone = false;

  Run(const ForkSpec &forkSpec, CancellationToken &cancellation,
      std::shared_ptr<IDatabaseDriver> driver, std::shared_ptr<Logger> logger)
      : spec(forkSpec), token(cancellation),
        jobId(forkSpec.jobId.empty() ? JobStateStore::generateJobId()
                                     : forkSpec.jobId),
        retry(forkSpec.retry, logger),
        connections(std::move(driver), forkSpec.source, forkSpec.destination,
                    forkSpec.targetDatabase, forkSpec.maxConnections, retry,
                    logger),
        extractor(logger), planner(connections, extractor, logger),
        store(forkSpec.stateDir, logger),
        progress(forkSpec.dryRun ? std::string() : forkSpec.progressFile,
                 logger) {}
};

namespace {

// Runs action against the schema session of the target, reconnecting on the
// next attempt when a failure left the session unusable.
template <typename Fn>
void withTargetSession(RetryPolicy &retry, ConnectionManager &connections,
                       const CancellationToken &token,
                       std::unique_ptr<IDestinationSession> &session,
                       const std::string &operation, const std::string &table,
                       Fn &&action) {
  retry.execute(
      operation, token,
      [&] {
        if (!session)
          session = connections.openTarget(token);
        try {
          action(*session);
        } catch (const std::exception &) {
          session.reset();
          throw;
        }
      },
      table);
}

const DdlStatement *findStatement(const TransferPlan &plan, DdlKind kind) {
  for (const auto &statement : plan.statements) {
    if (statement.kind == kind)
      return &statement;
  }
  return nullptr;
}

} // namespace

ForkOrchestrator::ForkOrchestrator(std::shared_ptr<IDatabaseDriver> driver,
                                   std::shared_ptr<Logger> logger)
    : driver_(std::move(driver)), logger_(std::move(logger)) {}

// Validates the spec, then drives the job through its phases. Failures of
// any phase are classified, recorded in the job state with the failing table
// and reported in the result; the job record keeps completed tables so a
// later run with resume can pick up from there.
ForkResult ForkOrchestrator::fork(CancellationToken &token,
                                  const ForkSpec &spec) {
  auto started = std::chrono::steady_clock::now();

  ForkResult result;
  result.targetDatabase = spec.targetDatabase;
  result.dryRun = spec.dryRun;
  result.jobId = spec.jobId;

  std::vector<FieldViolation> violations = spec.validate();
  if (!violations.empty()) {
    ValidationError error(violations);
    logger_->error(LogCategory::VALIDATION, "fork", error.what());
    result.errorKind = ErrorKind::VALIDATION;
    result.errorMessage = error.what();
    return result;
  }

  token.setTimeout(
      std::chrono::duration_cast<std::chrono::milliseconds>(spec.timeout));

  Run run(spec, token, driver_, logger_);
  result.jobId = run.jobId;

  try {
    if (spec.resume && !spec.dryRun)
      run.resumed = loadResumableJob(run);

    if (run.alreadyDone) {
      fillResult(run, result);
      result.success = true;
      result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      logger_->info(LogCategory::STATE, "fork",
                    "Job " + run.jobId + " already completed; nothing to do");
      return result;
    }

    if (!run.resumed) {
      ForkJob job;
      job.id = run.jobId;
      job.spec = spec;
      run.store.beginJob(job, !spec.dryRun);
      enterPhase(run, ForkPhase::PLANNING);
      run.store.setPlan(run.planner.buildPlan(spec, token));
    }

    ForkJob job = run.store.snapshot();
    result.strategy = job.plan.strategy;

    if (spec.dryRun) {
      logger_->info(LogCategory::PLANNING, "fork",
                    "Dry run: " + strategyToString(job.plan.strategy) +
                        " fork of " + std::to_string(job.plan.tables.size()) +
                        " tables with " +
                        std::to_string(job.plan.statements.size()) +
                        " statements; nothing was written");
      for (const auto &statement : job.plan.statements) {
        logger_->debug(LogCategory::PLANNING, "fork",
                       statement.id + ": " + statement.sql);
      }
      fillResult(run, result);
      result.success = true;
      result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      return result;
    }

    run.progress.start(job.plan);
    cleanupTarget(run);

    if (job.plan.strategy == TransferStrategy::SAME_SERVER)
      runSameServer(run);
    else
      runCrossServer(run);

    enterPhase(run, ForkPhase::DONE);
    result.success = true;
  } catch (const std::exception &e) {
    ClassifiedError error = classifyException(e);
    logger_->error(LogCategory::SYSTEM, "fork",
                   "Fork job " + run.jobId + " failed (" +
                       errorKindToString(error.kind) + ")" +
                       (error.table.empty() ? std::string()
                                            : " on table " + error.table) +
                       ": " + error.message);

    if (run.store.hasJob()) {
      try {
        run.store.markFailed(error);
      } catch (const std::exception &stateError) {
        logger_->error(LogCategory::STATE, "fork",
                       "Could not record failure of job " + run.jobId + ": " +
                           stateError.what());
      }
    }
    run.progress.setPhase(ForkPhase::FAILED);

    result.errorKind = error.kind;
    result.errorMessage = error.message;
    result.failedTable = error.table;
  }

  run.progress.stop();
  fillResult(run, result);
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (result.success) {
    logger_->info(LogCategory::SYSTEM, "fork",
                  "Fork job " + run.jobId + " completed: " +
                      spec.targetDatabase + " (" +
                      std::to_string(result.tablesCompleted) + "/" +
                      std::to_string(result.tablesTotal) + " tables, " +
                      std::to_string(result.rowsTransferred) + " rows in " +
                      TimeUtils::formatDuration(result.duration) + ")");
  }
  return result;
}

void ForkOrchestrator::enterPhase(Run &run, ForkPhase phase) {
  run.store.setPhase(phase);
  run.progress.setPhase(phase);
}

// Returns true when the stored job is picked up. An unknown id, or a job
// that failed before its plan was recorded, starts over with a new plan.
bool ForkOrchestrator::loadResumableJob(Run &run) {
  std::optional<ForkJob> stored = run.store.load(run.jobId);
  if (!stored) {
    logger_->warning(LogCategory::STATE, "loadResumableJob",
                     "No saved state for job " + run.jobId +
                         "; starting a new fork");
    return false;
  }

  JobStateStore::verifyResumable(*stored, run.spec);

  if (stored->phase == ForkPhase::DONE) {
    run.store.beginJob(*stored, false);
    run.alreadyDone = true;
    return true;
  }

  if (stored->plan.tables.empty() && stored->plan.statements.empty()) {
    logger_->info(LogCategory::STATE, "loadResumableJob",
                  "Job " + run.jobId +
                      " stopped before planning finished; planning again");
    return false;
  }

  ForkJob job = *stored;
  job.spec = run.spec;
  JobStateStore::prepareForResume(job);
  run.store.beginJob(job, true);

  logger_->info(LogCategory::STATE, "loadResumableJob",
                "Resuming job " + run.jobId + " from phase " +
                    phaseToString(stored->phase) + ": " +
                    std::to_string(job.countTasks(TableTaskStatus::COMPLETED)) +
                    " of " + std::to_string(job.plan.tables.size()) +
                    " tables already completed, " +
                    std::to_string(job.appliedStatements.size()) +
                    " statements already applied");
  return true;
}

// Drops a pre-existing target when asked to. Skipped once this job created
// the target itself, so a resumed run never throws away its own progress.
void ForkOrchestrator::cleanupTarget(Run &run) {
  ForkJob job = run.store.snapshot();
  if (!job.plan.targetExists || !run.spec.dropIfExists)
    return;

  const DdlStatement *create =
      job.plan.strategy == TransferStrategy::SAME_SERVER
          ? findStatement(job.plan, DdlKind::CLONE_DATABASE)
          : findStatement(job.plan, DdlKind::CREATE_DATABASE);
  if (create && run.store.isStatementApplied(create->id))
    return;

  enterPhase(run, ForkPhase::TARGET_CLEANUP);
  logger_->warning(LogCategory::DATABASE, "cleanupTarget",
                   "Dropping existing target database " +
                       run.spec.targetDatabase);
  run.retry.execute("drop target database", run.token, [&] {
    auto admin = run.connections.openAdmin(run.token);
    admin->dropDatabase(run.spec.targetDatabase);
  });
}

void ForkOrchestrator::createTargetDatabase(Run &run,
                                            const DdlStatement &statement) {
  if (run.store.isStatementApplied(statement.id))
    return;

  bool cloning = statement.kind == DdlKind::CLONE_DATABASE;
  logger_->info(LogCategory::DATABASE, "createTargetDatabase",
                cloning ? "Cloning " + run.spec.source.database + " into " +
                              run.spec.targetDatabase +
                              " with the server-side template copy"
                        : "Creating target database " +
                              run.spec.targetDatabase);

  run.retry.execute(statement.id, run.token, [&] {
    auto admin = run.connections.openAdmin(run.token);
    if (run.resumed && admin->databaseExists(run.spec.targetDatabase)) {
      logger_->info(LogCategory::DATABASE, "createTargetDatabase",
                    "Target database " + run.spec.targetDatabase +
                        " was created by an earlier run of this job");
      return;
    }
    admin->createDatabase(run.spec.targetDatabase,
                          cloning ? run.spec.source.database
                                  : std::string(ForkDefaults::TEMPLATE_DATABASE));
  });
  run.store.markStatementApplied(statement.id);
}

// Applies the statements of the given kinds in plan order. Statements a
// previous run of the job applied are skipped.
void ForkOrchestrator::applyStatements(Run &run,
                                       std::initializer_list<DdlKind> kinds) {
  ForkJob job = run.store.snapshot();
  size_t applied = 0;
  for (const auto &statement : job.plan.statements) {
    if (std::find(kinds.begin(), kinds.end(), statement.kind) == kinds.end())
      continue;
    if (job.appliedStatements.count(statement.id) > 0)
      continue;

    run.token.throwIfStopped("apply " + statement.id, statement.table);
    withTargetSession(run.retry, run.connections, run.token, run.target,
                      "apply " + statement.id, statement.table,
                      [&](IDestinationSession &session) {
                        session.execute(statement.sql);
                      });
    run.store.markStatementApplied(statement.id);
    ++applied;
    logger_->debug(LogCategory::SCHEMA, "applyStatements",
                   "Applied " + statement.id);
  }

  if (applied > 0) {
    logger_->info(LogCategory::SCHEMA, "applyStatements",
                  "Applied " + std::to_string(applied) + " " +
                      ddlKindToString(*kinds.begin()) + " statements");
  }
}

// Schema-only forks have nothing to stream; every table is complete once
// its DDL is in place.
void ForkOrchestrator::completeWithoutData(Run &run) {
  ForkJob job = run.store.snapshot();
  for (const auto &task : job.plan.tables) {
    if (task.status == TableTaskStatus::COMPLETED)
      continue;
    run.store.transitionTask(task.name, TableTaskStatus::IN_PROGRESS);
    run.progress.tableStarted(task.name);
    run.store.transitionTask(task.name, TableTaskStatus::COMPLETED);
    run.progress.tableCompleted(task.name);
  }
}

void ForkOrchestrator::runSameServer(Run &run) {
  ForkJob job = run.store.snapshot();
  const DdlStatement *clone = findStatement(job.plan, DdlKind::CLONE_DATABASE);
  if (!clone)
    throw StateError("same-server plan of job " + run.jobId +
                     " has no clone statement");

  enterPhase(run, ForkPhase::SCHEMA);
  // The template database must have no other connections during the copy.
  run.connections.closeIdleSources();
  createTargetDatabase(run, *clone);

  enterPhase(run, ForkPhase::DATA);
  for (const auto &task : job.plan.tables) {
    if (task.status == TableTaskStatus::COMPLETED)
      continue;
    run.store.transitionTask(task.name, TableTaskStatus::IN_PROGRESS);
    run.progress.tableStarted(task.name);

    int64_t rows = 0;
    withTargetSession(run.retry, run.connections, run.token, run.target,
                      "count rows of " + task.name, task.name,
                      [&](IDestinationSession &session) {
                        rows = session.countRows(task.name);
                      });
    run.store.recordRows(task.name, rows);
    run.progress.chunkCompleted(task.name, rows);
    run.store.transitionTask(task.name, TableTaskStatus::COMPLETED);
    run.progress.tableCompleted(task.name);
  }
  run.target.reset();

  enterPhase(run, ForkPhase::VERIFY);
  run.retry.execute("verify target database", run.token, [&] {
    auto admin = run.connections.openAdmin(run.token);
    if (!admin->databaseExists(run.spec.targetDatabase)) {
      throw DataIntegrityError("target database " + run.spec.targetDatabase +
                               " is missing after the clone");
    }
    int64_t size = admin->databaseSize(run.spec.targetDatabase);
    logger_->info(LogCategory::VALIDATION, "runSameServer",
                  "Target database " + run.spec.targetDatabase + " is " +
                      std::to_string(size / (1024 * 1024)) + " MB");
  });
}

// Extensions, types, tables and sequences first, then the data, then indexes
// and constraints, then foreign keys once every table is loaded, and
// sequence values last.
void ForkOrchestrator::runCrossServer(Run &run) {
  ForkJob job = run.store.snapshot();
  enterPhase(run, ForkPhase::SCHEMA);

  if (run.spec.dataOnly) {
    withTargetSession(run.retry, run.connections, run.token, run.target,
                      "verify target schema", "",
                      [&](IDestinationSession &session) {
                        run.extractor.verifyDestinationSchema(
                            session, job.plan.tables, run.token);
                      });
  } else {
    const DdlStatement *create =
        findStatement(job.plan, DdlKind::CREATE_DATABASE);
    if (create)
      createTargetDatabase(run, *create);
    applyStatements(run, {DdlKind::EXTENSION});
    applyStatements(run, {DdlKind::CREATE_TYPE});
    applyStatements(run, {DdlKind::CREATE_TABLE});
    applyStatements(run, {DdlKind::CREATE_SEQUENCE});
  }

  if (run.spec.schemaOnly) {
    applyStatements(run, {DdlKind::INDEX, DdlKind::CONSTRAINT});
    applyStatements(run, {DdlKind::FOREIGN_KEY});
    completeWithoutData(run);
    enterPhase(run, ForkPhase::VERIFY);
    applyStatements(run, {DdlKind::SEQUENCE_SYNC});
    run.target.reset();
    return;
  }

  enterPhase(run, ForkPhase::DATA);
  std::vector<std::string> pending;
  for (const auto &task : job.plan.tables) {
    if (task.status != TableTaskStatus::COMPLETED)
      pending.push_back(task.name);
  }
  if (pending.size() < job.plan.tables.size()) {
    logger_->info(LogCategory::TRANSFER, "runCrossServer",
                  "Skipping " +
                      std::to_string(job.plan.tables.size() - pending.size()) +
                      " tables completed by an earlier run");
  }

  run.target.reset();
  {
    DataTransferWorkerPool pool(run.connections, run.store, run.progress,
                                run.retry, run.spec.maxConnections,
                                run.spec.chunkSize, logger_);
    pool.run(pending, run.token);
  }

  if (!run.spec.dataOnly) {
    applyStatements(run, {DdlKind::INDEX, DdlKind::CONSTRAINT});
    applyStatements(run, {DdlKind::FOREIGN_KEY});
  }

  enterPhase(run, ForkPhase::VERIFY);
  if (!run.spec.dataOnly)
    applyStatements(run, {DdlKind::SEQUENCE_SYNC});
  verifyRowCounts(run, pending);
  run.target.reset();
}

// Compares what the workers counted with what the target now holds. Plan
// estimates are never used here; a difference is reported, not fatal.
void ForkOrchestrator::verifyRowCounts(Run &run,
                                       const std::vector<std::string> &tables) {
  ForkJob job = run.store.snapshot();
  size_t mismatches = 0;
  for (const auto &table : tables) {
    const TableTask *task = job.plan.findTable(table);
    if (!task)
      continue;

    int64_t targetRows = 0;
    withTargetSession(run.retry, run.connections, run.token, run.target,
                      "count rows of " + table, table,
                      [&](IDestinationSession &session) {
                        targetRows = session.countRows(table);
                      });
    if (targetRows != task->rowsTransferred) {
      ++mismatches;
      logger_->warning(LogCategory::VALIDATION, "verifyRowCounts",
                       "Row count mismatch for " + table + ": transferred " +
                           std::to_string(task->rowsTransferred) +
                           ", target has " + std::to_string(targetRows));
    }
  }

  logger_->info(LogCategory::VALIDATION, "verifyRowCounts",
                "Verified " + std::to_string(tables.size()) + " tables, " +
                    std::to_string(mismatches) + " row count mismatches");
}

void ForkOrchestrator::fillResult(Run &run, ForkResult &result) {
  if (!run.store.hasJob())
    return;
  ForkJob job = run.store.snapshot();
  result.strategy = job.plan.strategy;
  result.tablesCompleted = job.countTasks(TableTaskStatus::COMPLETED);
  result.tablesTotal = job.plan.tables.size();
  result.rowsTransferred = job.rowsTransferred();
  result.plan = job.plan;
}
