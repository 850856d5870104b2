#ifndef DATA_TRANSFER_WORKER_POOL_H
#define DATA_TRANSFER_WORKER_POOL_H

#include "core/cancellation.h"
#include "core/logger.h"
#include "fork/ConnectionManager.h"
#include "fork/JobStateStore.h"
#include "fork/ProgressTracker.h"
#include "fork/RetryPolicy.h"
#include "fork/ThreadSafeQueue.h"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

// Streams the rows of every pending table from the source into the target
// with a fixed number of workers. A worker owns one table at a time: one
// source cursor, one exclusive destination session, chunks committed one by
// one. The first fatal failure stops the pool; workers finish the chunk they
// are writing and stop, and run() rethrows that failure once all of them
// have returned.
class DataTransferWorkerPool {
private:
  ConnectionManager &connections_;
  JobStateStore &store_;
  ProgressTracker &progress_;
  RetryPolicy &retry_;
  std::shared_ptr<Logger> logger_;
  size_t maxWorkers_;
  size_t chunkSize_;

  std::vector<std::thread> workers_;
  ThreadSafeQueue<std::string> tasks_;
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};
  std::atomic<bool> stop_{false};

  std::mutex activeMutex_;
  std::set<std::string> activeTables_;

  std::mutex errorMutex_;
  std::exception_ptr firstError_;

  void workerThread(size_t workerId, const CancellationToken &token);
  void transferTable(size_t workerId, const std::string &table,
                     const CancellationToken &token);
  void failTable(size_t workerId, const std::string &table,
                 const std::exception &e);
  void recordFailure(const std::exception &e, const std::string &table);
  void claimTable(const std::string &table);
  void releaseTable(const std::string &table);
  void joinWorkers();

public:
  DataTransferWorkerPool(ConnectionManager &connections, JobStateStore &store,
                         ProgressTracker &progress, RetryPolicy &retry,
                         size_t maxWorkers, size_t chunkSize,
                         std::shared_ptr<Logger> logger);
  ~DataTransferWorkerPool();

  DataTransferWorkerPool(const DataTransferWorkerPool &) = delete;
  DataTransferWorkerPool &operator=(const DataTransferWorkerPool &) = delete;

  // Blocks until every table is transferred or the pool stopped.
  void run(const std::vector<std::string> &tables,
           const CancellationToken &token);
};

#endif
