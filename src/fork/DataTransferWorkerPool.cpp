#include "fork/DataTransferWorkerPool.h"
#include <algorithm>
#include <system_error>

DataTransferWorkerPool::DataTransferWorkerPool(
    ConnectionManager &connections, JobStateStore &store,
    ProgressTracker &progress, RetryPolicy &retry, size_t maxWorkers,
    size_t chunkSize, std::shared_ptr<Logger> logger)
    : connections_(connections), store_(store), progress_(progress),
      retry_(retry), logger_(std::move(logger)),
      maxWorkers_(std::max<size_t>(1, maxWorkers)), chunkSize_(chunkSize) {}

DataTransferWorkerPool::~DataTransferWorkerPool() {
  stop_ = true;
  tasks_.finish();
  joinWorkers();
}

// Queues the tables, starts at most one worker per table (bounded by the
// connection limit) and waits for all of them. Workers are joined before the
// first recorded failure is rethrown, so no worker outlives this call.
void DataTransferWorkerPool::run(const std::vector<std::string> &tables,
                                 const CancellationToken &token) {
  if (tables.empty())
    return;

  for (const auto &table : tables)
    tasks_.push(table);
  tasks_.finish();

  size_t numWorkers = std::min(maxWorkers_, tables.size());
  logger_->info(LogCategory::TRANSFER, "run",
                "Transferring " + std::to_string(tables.size()) +
                    " tables with " + std::to_string(numWorkers) +
                    " workers, chunk size " + std::to_string(chunkSize_));

  workers_.reserve(numWorkers);
  try {
    for (size_t i = 0; i < numWorkers; ++i) {
      workers_.emplace_back(&DataTransferWorkerPool::workerThread, this, i,
                            std::cref(token));
    }
  } catch (const std::system_error &e) {
    logger_->error(LogCategory::TRANSFER, "run",
                   "Could not start worker thread: " + std::string(e.what()));
    stop_ = true;
    joinWorkers();
    throw;
  }

  joinWorkers();

  logger_->info(LogCategory::TRANSFER, "run",
                "Workers finished - Completed: " +
                    std::to_string(completedTasks_.load()) +
                    " | Failed: " + std::to_string(failedTasks_.load()) +
                    " | Not started: " + std::to_string(tasks_.size()));

  std::lock_guard<std::mutex> lock(errorMutex_);
  if (firstError_)
    std::rethrow_exception(firstError_);
}

void DataTransferWorkerPool::joinWorkers() {
  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }
  workers_.clear();
}

// Pops tables until the queue is drained. Once the pool is stopping (a fatal
// failure, cancellation or the deadline) no new table is started; tables left
// in the queue stay pending for a later resume.
void DataTransferWorkerPool::workerThread(size_t workerId,
                                          const CancellationToken &token) {
  logger_->debug(LogCategory::TRANSFER,
                 "Worker #" + std::to_string(workerId) + " started");

  std::string table;
  while (!stop_.load() && tasks_.popBlocking(table)) {
    if (token.isCancelled() || token.deadlineExpired()) {
      try {
        token.throwIfStopped("data transfer");
      } catch (const ForkError &e) {
        recordFailure(e, "");
      }
      stop_ = true;
      break;
    }

    try {
      transferTable(workerId, table, token);
      completedTasks_++;
    } catch (const std::exception &e) {
      failedTasks_++;
      failTable(workerId, table, e);
      recordFailure(e, table);
      stop_ = true;
    }
  }

  logger_->debug(LogCategory::TRANSFER,
                 "Worker #" + std::to_string(workerId) + " stopped");
}

// Records the failure before it is surfaced. Only a table this worker moved
// to in_progress is marked failed; a table it never started keeps its state.
// A failure to persist it is logged; the table error is still the one
// reported.
void DataTransferWorkerPool::failTable(size_t workerId,
                                       const std::string &table,
                                       const std::exception &e) {
  logger_->error(LogCategory::TRANSFER, "transferTable",
                 "Worker #" + std::to_string(workerId) + " failed table " +
                     table + ": " + e.what());
  progress_.tableFailed(table);
  try {
    ForkJob job = store_.snapshot();
    const TableTask *task = job.plan.findTable(table);
    if (task && task->status == TableTaskStatus::IN_PROGRESS) {
      store_.transitionTask(table, TableTaskStatus::FAILED, e.what());
    }
  } catch (const std::exception &stateError) {
    logger_->error(LogCategory::STATE, "transferTable",
                   "Could not record failure of table " + table + ": " +
                       stateError.what());
  }
}

// Keeps the first failure only, as a ForkError naming the table. Must be
// called from inside the handler that caught e.
void DataTransferWorkerPool::recordFailure(const std::exception &e,
                                           const std::string &table) {
  std::lock_guard<std::mutex> lock(errorMutex_);
  if (firstError_)
    return;

  const ForkError *forkError = dynamic_cast<const ForkError *>(&e);
  if (forkError && !forkError->table().empty()) {
    firstError_ = std::current_exception();
    return;
  }

  ClassifiedError classified = classifyException(e);
  classified.table = table;
  try {
    throwClassified(classified);
  } catch (const ForkError &) {
    firstError_ = std::current_exception();
  }
}

void DataTransferWorkerPool::claimTable(const std::string &table) {
  std::lock_guard<std::mutex> lock(activeMutex_);
  if (!activeTables_.insert(table).second)
    throw StateError("table " + table + " already has an active writer");
}

void DataTransferWorkerPool::releaseTable(const std::string &table) {
  std::lock_guard<std::mutex> lock(activeMutex_);
  activeTables_.erase(table);
}

// One table, start to finish. A table that was attempted before is
// truncated first, since rows inside a table are not checkpointed. Each chunk
// is written and committed through the retry policy; a failed write drops the
// destination session and the retry reconnects.
void DataTransferWorkerPool::transferTable(size_t workerId,
                                           const std::string &table,
                                           const CancellationToken &token) {
  claimTable(table);
  struct Release {
    DataTransferWorkerPool *pool;
    const std::string &table;
    ~Release() { pool->releaseTable(table); }
  } release{this, table};

  TableTask task = store_.transitionTask(table, TableTaskStatus::IN_PROGRESS);
  progress_.tableStarted(table);
  logger_->info(LogCategory::TRANSFER,
                "Worker #" + std::to_string(workerId) +
                    " processing table: " + table + " (attempt " +
                    std::to_string(task.attempts) + ", ~" +
                    std::to_string(std::max<int64_t>(task.estimatedRows, 0)) +
                    " rows)");

  std::unique_ptr<IDestinationSession> destination =
      connections_.openTarget(token);

  auto onDestination = [&](auto &&action) {
    if (!destination)
      destination = connections_.openTarget(token);
    try {
      action(*destination);
    } catch (const std::exception &) {
      destination.reset();
      throw;
    }
  };

  if (task.attempts > 1) {
    logger_->warning(LogCategory::TRANSFER, "transferTable",
                     "Restarting table " + table +
                         " from the first row; truncating previous rows");
    retry_.execute(
        "truncate " + table, token,
        [&] {
          onDestination(
              [&](IDestinationSession &session) { session.truncateTable(table); });
        },
        table);
  }

  int64_t transferred = 0;
  if (task.columns.empty()) {
    logger_->warning(LogCategory::TRANSFER, "transferTable",
                     "Table " + table + " has no writable columns; skipping rows");
  } else {
    SourceLease source = connections_.acquireSource(token);
    try {
      std::unique_ptr<ITableCursor> cursor =
          source->openCursor(table, task.columns);

      std::vector<Row> rows;
      rows.reserve(chunkSize_);
      size_t chunkNumber = 0;
      while (true) {
        token.throwIfStopped("data transfer", table);
        if (stop_.load()) {
          throw CancellationError("transfer of " + table +
                                      " stopped after another table failed",
                                  table);
        }

        rows.clear();
        if (!cursor->fetch(chunkSize_, rows))
          break;
        if (rows.empty())
          break;
        ++chunkNumber;

        retry_.execute(
            "write chunk " + std::to_string(chunkNumber) + " of " + table,
            token,
            [&] {
              onDestination([&](IDestinationSession &session) {
                session.writeChunk(table, task.columns, rows);
              });
            },
            table);

        transferred += static_cast<int64_t>(rows.size());
        store_.recordRows(table, transferred);
        progress_.chunkCompleted(table, static_cast<int64_t>(rows.size()));
      }
    } catch (const std::exception &) {
      source.invalidate();
      throw;
    }
  }

  store_.recordRows(table, transferred);
  store_.transitionTask(table, TableTaskStatus::COMPLETED);
  progress_.tableCompleted(table);

  logger_->info(LogCategory::TRANSFER,
                "Worker #" + std::to_string(workerId) +
                    " completed table: " + table + " (" +
                    std::to_string(transferred) + " rows, total tables: " +
                    std::to_string(completedTasks_.load() + 1) + ")");
}
