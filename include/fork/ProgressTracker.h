#ifndef PROGRESS_TRACKER_H
#define PROGRESS_TRACKER_H

#include "core/logger.h"
#include "fork/ForkTypes.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <thread>

struct ProgressSnapshot {
  ForkPhase phase = ForkPhase::PLANNING;
  double percentComplete = 0.0;
  size_t tablesCompleted = 0;
  size_t tablesTotal = 0;
  int64_t rowsCompleted = 0;
  int64_t rowsTotal = -1;
  std::chrono::milliseconds elapsed{0};

  std::string currentTable;
  double currentPercent = 0.0;
  int64_t currentRows = 0;
  int64_t currentRowsTotal = -1;
  double rowsPerSecond = 0.0;

  std::optional<std::chrono::milliseconds> estimatedRemaining;

  // Progress-file document.
  nlohmann::json toJson() const;
  std::string describe() const;
};

// Aggregates per-table progress into a job-wide view. Workers report chunk
// completions and table transitions; a background thread turns them into the
// progress file and periodic log lines, so reporting never blocks a worker
// on the file system.
class ProgressTracker {
public:
  using Clock = std::chrono::steady_clock;

private:
  struct TableProgress {
    int64_t estimatedRows = -1;
    int64_t rows = 0;
    TableTaskStatus status = TableTaskStatus::PENDING;
  };

  std::string progressFile_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds minWriteInterval_;
  std::chrono::milliseconds logInterval_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, TableProgress> tables_;
  std::deque<std::pair<Clock::time_point, int64_t>> rateSamples_;
  ForkPhase phase_ = ForkPhase::PLANNING;
  std::string currentTable_;
  Clock::time_point startTime_;
  Clock::time_point lastWrite_;
  Clock::time_point lastLog_;
  int64_t rowsThisRun_ = 0;
  bool dirty_ = false;
  bool forceWrite_ = false;
  bool running_ = false;
  std::thread writer_;

  void writerLoop();
  void requestWriteLocked(bool force);
  void writeFile(const ProgressSnapshot &snapshot);
  ProgressSnapshot snapshotLocked(Clock::time_point now) const;
  double rateLocked(Clock::time_point now) const;

public:
  ProgressTracker(const std::string &progressFile,
                  std::shared_ptr<Logger> logger,
                  std::chrono::milliseconds minWriteInterval =
                      std::chrono::milliseconds(
                          ForkDefaults::PROGRESS_MIN_WRITE_INTERVAL_MS),
                  std::chrono::milliseconds logInterval =
                      std::chrono::milliseconds(
                          ForkDefaults::PROGRESS_LOG_INTERVAL_MS));
  ~ProgressTracker();

  ProgressTracker(const ProgressTracker &) = delete;
  ProgressTracker &operator=(const ProgressTracker &) = delete;

  // Loads the tables of plan, including those a previous run completed, and
  // starts the background writer.
  void start(const TransferPlan &plan);
  // Writes the final document and stops the background writer.
  void stop();

  void setPhase(ForkPhase phase);
  void tableStarted(const std::string &table);
  void chunkCompleted(const std::string &table, int64_t rows);
  void tableCompleted(const std::string &table);
  void tableFailed(const std::string &table);

  ProgressSnapshot snapshot() const;

  static double percentOf(int64_t done, int64_t total);
  static std::string formatRate(double rowsPerSecond);
};

#endif
