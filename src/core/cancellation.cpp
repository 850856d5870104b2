#include "core/cancellation.h"
#include "core/fork_errors.h"

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void CancellationToken::setDeadline(Clock::time_point deadline) {
  std::lock_guard<std::mutex> lock(mutex_);
  deadline_ = deadline;
}

void CancellationToken::setTimeout(std::chrono::milliseconds timeout) {
  setDeadline(Clock::now() + timeout);
}

bool CancellationToken::deadlineExpired() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!deadline_)
    return std::nullopt;
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline_ - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

bool CancellationToken::waitFor(std::chrono::milliseconds delay) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return cancelled_.load(); });
}

void CancellationToken::throwIfStopped(const std::string &where,
                                       const std::string &table) const {
  if (isCancelled()) {
    throw CancellationError("fork cancelled during " + where, table);
  }
  if (deadlineExpired()) {
    throw TimeoutError("overall fork deadline exceeded during " + where,
                       false, table);
  }
}

ShutdownWatcher::ShutdownWatcher(const std::atomic<bool> &requested,
                                 CancellationToken &token,
                                 std::shared_ptr<Logger> logger,
                                 std::chrono::milliseconds pollInterval)
    : requested_(requested), token_(token), logger_(std::move(logger)),
      pollInterval_(pollInterval) {
  thread_ = std::thread(&ShutdownWatcher::watch, this);
}

ShutdownWatcher::~ShutdownWatcher() {
  finished_.store(true);
  if (thread_.joinable())
    thread_.join();
}

void ShutdownWatcher::watch() {
  while (!finished_.load()) {
    if (requested_.load()) {
      logger_->warning(LogCategory::SYSTEM, "main",
                       "Shutdown requested; stopping after the current chunk");
      token_.cancel();
      return;
    }
    std::this_thread::sleep_for(pollInterval_);
  }
}
