#include "fork/ProgressTracker.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

double roundToTenth(double value) { return std::round(value * 10.0) / 10.0; }

} // namespace

json ProgressSnapshot::toJson() const {
  json overall = {{"percent_complete", roundToTenth(percentComplete)},
                  {"tables_completed", tablesCompleted},
                  {"tables_total", tablesTotal},
                  {"rows_completed", rowsCompleted},
                  {"duration", TimeUtils::formatDuration(elapsed)}};
  if (rowsTotal >= 0)
    overall["rows_total"] = rowsTotal;
  else
    overall["rows_total"] = nullptr;

  json document = {{"phase", phaseToString(phase)}, {"overall", overall}};

  if (!currentTable.empty()) {
    json current = {{"name", currentTable},
                    {"percent_complete", roundToTenth(currentPercent)},
                    {"rows_completed", currentRows},
                    {"speed", ProgressTracker::formatRate(rowsPerSecond)}};
    if (currentRowsTotal >= 0)
      current["rows_total"] = currentRowsTotal;
    else
      current["rows_total"] = nullptr;
    document["current_table"] = current;
  }

  if (estimatedRemaining) {
    document["estimated_time_remaining"] =
        TimeUtils::formatDuration(*estimatedRemaining);
  }
  return document;
}

std::string ProgressSnapshot::describe() const {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << percentComplete << "% ("
     << tablesCompleted << "/" << tablesTotal << " tables, " << rowsCompleted
     << " rows, " << ProgressTracker::formatRate(rowsPerSecond);
  if (estimatedRemaining)
    ss << ", ETA " << TimeUtils::formatDuration(*estimatedRemaining);
  ss << ")";
  if (!currentTable.empty())
    ss << " current: " << currentTable;
  return ss.str();
}

ProgressTracker::ProgressTracker(const std::string &progressFile,
                                 std::shared_ptr<Logger> logger,
                                 std::chrono::milliseconds minWriteInterval,
                                 std::chrono::milliseconds logInterval)
    : progressFile_(progressFile), logger_(std::move(logger)),
      minWriteInterval_(minWriteInterval), logInterval_(logInterval),
      startTime_(Clock::now()) {}

ProgressTracker::~ProgressTracker() { stop(); }

double ProgressTracker::percentOf(int64_t done, int64_t total) {
  if (total <= 0)
    return 0.0;
  double percent = static_cast<double>(done) * 100.0 / static_cast<double>(total);
  return std::min(100.0, std::max(0.0, percent));
}

std::string ProgressTracker::formatRate(double rowsPerSecond) {
  return std::to_string(std::llround(std::max(0.0, rowsPerSecond))) +
         " rows/sec";
}

void ProgressTracker::start(const TransferPlan &plan) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.clear();
    for (const auto &task : plan.tables) {
      TableProgress progress;
      progress.estimatedRows = task.estimatedRows;
      if (task.status == TableTaskStatus::COMPLETED) {
        progress.status = TableTaskStatus::COMPLETED;
        progress.rows = task.rowsTransferred;
      }
      tables_[task.name] = progress;
    }

    startTime_ = Clock::now();
    lastWrite_ = startTime_ - minWriteInterval_;
    lastLog_ = startTime_;
    rowsThisRun_ = 0;
    rateSamples_.clear();
    rateSamples_.emplace_back(startTime_, 0);
    currentTable_.clear();

    if (running_)
      return;
    running_ = true;
    requestWriteLocked(true);
  }
  writer_ = std::thread(&ProgressTracker::writerLoop, this);
}

void ProgressTracker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    running_ = false;
  }
  cv_.notify_all();
  if (writer_.joinable())
    writer_.join();

  writeFile(snapshot());
}

void ProgressTracker::setPhase(ForkPhase phase) {
  std::lock_guard<std::mutex> lock(mutex_);
  phase_ = phase;
  if (phase == ForkPhase::DATA)
    lastLog_ = Clock::now();
  requestWriteLocked(true);
}

void ProgressTracker::tableStarted(const std::string &table) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableProgress &progress = tables_[table];
  progress.status = TableTaskStatus::IN_PROGRESS;
  progress.rows = 0;
  currentTable_ = table;
  requestWriteLocked(true);
}

void ProgressTracker::chunkCompleted(const std::string &table, int64_t rows) {
  std::lock_guard<std::mutex> lock(mutex_);
  Clock::time_point now = Clock::now();
  tables_[table].rows += rows;
  currentTable_ = table;
  rowsThisRun_ += rows;

  rateSamples_.emplace_back(now, rowsThisRun_);
  auto windowStart = now - std::chrono::milliseconds(ForkDefaults::RATE_WINDOW_MS);
  while (rateSamples_.size() > 2 && rateSamples_.front().first < windowStart)
    rateSamples_.pop_front();

  requestWriteLocked(false);
}

void ProgressTracker::tableCompleted(const std::string &table) {
  std::lock_guard<std::mutex> lock(mutex_);
  tables_[table].status = TableTaskStatus::COMPLETED;
  requestWriteLocked(true);
}

void ProgressTracker::tableFailed(const std::string &table) {
  std::lock_guard<std::mutex> lock(mutex_);
  tables_[table].status = TableTaskStatus::FAILED;
  requestWriteLocked(true);
}

ProgressSnapshot ProgressTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshotLocked(Clock::now());
}

// Rows per second over the moving window, measured up to now so that a
// stalled transfer shows a falling rate.
double ProgressTracker::rateLocked(Clock::time_point now) const {
  if (rateSamples_.empty())
    return 0.0;
  const auto &first = rateSamples_.front();
  const auto &last = rateSamples_.back();
  double seconds =
      std::chrono::duration<double>(now - first.first).count();
  if (seconds <= 0.0)
    return 0.0;
  return static_cast<double>(last.second - first.second) / seconds;
}

// Percent is measured against the plan-time estimates when every table has
// one, with a completed table counting as its full estimate. Otherwise it
// falls back to the share of completed tables.
ProgressSnapshot ProgressTracker::snapshotLocked(Clock::time_point now) const {
  ProgressSnapshot snapshot;
  snapshot.phase = phase_;
  snapshot.elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_);

  bool allEstimated = !tables_.empty();
  int64_t estimatedTotal = 0;
  int64_t estimatedDone = 0;
  for (const auto &entry : tables_) {
    const TableProgress &table = entry.second;
    ++snapshot.tablesTotal;
    snapshot.rowsCompleted += table.rows;
    bool completed = table.status == TableTaskStatus::COMPLETED;
    if (completed)
      ++snapshot.tablesCompleted;

    if (table.estimatedRows < 0) {
      allEstimated = false;
      continue;
    }
    estimatedTotal += table.estimatedRows;
    estimatedDone +=
        completed ? table.estimatedRows : std::min(table.rows, table.estimatedRows);
  }

  bool rowBased = allEstimated && estimatedTotal > 0;
  if (allEstimated)
    snapshot.rowsTotal = estimatedTotal;

  if (phase_ == ForkPhase::DONE)
    snapshot.percentComplete = 100.0;
  else if (rowBased)
    snapshot.percentComplete = percentOf(estimatedDone, estimatedTotal);
  else
    snapshot.percentComplete =
        percentOf(static_cast<int64_t>(snapshot.tablesCompleted),
                  static_cast<int64_t>(snapshot.tablesTotal));

  snapshot.rowsPerSecond = rateLocked(now);

  auto current = tables_.find(currentTable_);
  if (current != tables_.end()) {
    const TableProgress &table = current->second;
    snapshot.currentTable = current->first;
    snapshot.currentRows = table.rows;
    snapshot.currentRowsTotal = table.estimatedRows;
    if (table.status == TableTaskStatus::COMPLETED)
      snapshot.currentPercent = 100.0;
    else
      snapshot.currentPercent = percentOf(table.rows, table.estimatedRows);
  }

  if (phase_ == ForkPhase::DONE) {
    snapshot.estimatedRemaining = std::chrono::milliseconds(0);
  } else if (rowBased && snapshot.rowsPerSecond > 0.0) {
    double remainingRows =
        static_cast<double>(std::max<int64_t>(0, estimatedTotal - estimatedDone));
    snapshot.estimatedRemaining = std::chrono::milliseconds(
        static_cast<long long>(remainingRows / snapshot.rowsPerSecond * 1000.0));
  } else if (!rowBased && snapshot.tablesCompleted > 0) {
    auto perTable = snapshot.elapsed / static_cast<long long>(snapshot.tablesCompleted);
    snapshot.estimatedRemaining =
        perTable * static_cast<long long>(snapshot.tablesTotal -
                                          snapshot.tablesCompleted);
  }
  return snapshot;
}

void ProgressTracker::requestWriteLocked(bool force) {
  dirty_ = true;
  if (force)
    forceWrite_ = true;
  cv_.notify_one();
}

// Writes are coalesced: chunk updates wait for the minimum interval, table and
// phase transitions are written as soon as the thread wakes up.
void ProgressTracker::writerLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    Clock::time_point now = Clock::now();
    Clock::time_point nextWrite = lastWrite_ + minWriteInterval_;
    bool dataPhase = phase_ == ForkPhase::DATA;
    bool writeDue = dirty_ && (forceWrite_ || now >= nextWrite);
    bool logDue = dataPhase && now >= lastLog_ + logInterval_;

    if (!writeDue && !logDue) {
      Clock::time_point wakeAt =
          dataPhase ? lastLog_ + logInterval_ : now + logInterval_;
      if (dirty_ && nextWrite < wakeAt)
        wakeAt = nextWrite;
      cv_.wait_until(lock, wakeAt);
      continue;
    }

    ProgressSnapshot current = snapshotLocked(now);
    if (writeDue) {
      dirty_ = false;
      forceWrite_ = false;
      lastWrite_ = now;
    }
    if (logDue)
      lastLog_ = now;

    lock.unlock();
    if (writeDue)
      writeFile(current);
    if (logDue)
      logger_->info(LogCategory::PROGRESS, "Progress: " + current.describe());
    lock.lock();
  }
}

void ProgressTracker::writeFile(const ProgressSnapshot &snapshot) {
  if (progressFile_.empty())
    return;

  std::error_code ec;
  std::filesystem::path parent =
      std::filesystem::path(progressFile_).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  std::string tmpPath = progressFile_ + ".tmp";
  {
    std::ofstream file(tmpPath, std::ios::trunc);
    if (!file.is_open()) {
      logger_->warning(LogCategory::PROGRESS, "writeFile",
                       "Cannot open progress file " + tmpPath);
      return;
    }
    file << snapshot.toJson().dump(2) << '\n';
  }

  std::filesystem::rename(tmpPath, progressFile_, ec);
  if (ec) {
    logger_->warning(LogCategory::PROGRESS, "writeFile",
                     "Cannot update progress file " + progressFile_ + ": " +
                         ec.message());
  }
}
