#ifndef CANCELLATION_H
#define CANCELLATION_H

#include "core/logger.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// Shared by the orchestrator and every worker of one fork. Carries the
// caller's cancellation request and the overall job deadline.
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

private:
  std::atomic<bool> cancelled_{false};
  std::optional<Clock::time_point> deadline_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;

public:
  void cancel();
  bool isCancelled() const { return cancelled_.load(); }

  void setDeadline(Clock::time_point deadline);
  void setTimeout(std::chrono::milliseconds timeout);
  bool deadlineExpired() const;
  std::optional<std::chrono::milliseconds> remaining() const;

  // Sleeps for up to delay. Returns false when woken by cancel().
  bool waitFor(std::chrono::milliseconds delay) const;

  // Throws CancellationError once cancelled and TimeoutError once the
  // deadline has passed.
  void throwIfStopped(const std::string &where,
                      const std::string &table = "") const;
};

// Watches a flag raised by a signal handler and cancels the token once it is
// set. The polling thread is joined on destruction, also during unwinding.
class ShutdownWatcher {
  const std::atomic<bool> &requested_;
  CancellationToken &token_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds pollInterval_;
  std::atomic<bool> finished_{false};
  std::thread thread_;

  void watch();

public:
  ShutdownWatcher(const std::atomic<bool> &requested, CancellationToken &token,
                  std::shared_ptr<Logger> logger,
                  std::chrono::milliseconds pollInterval =
                      std::chrono::milliseconds(100));
  ~ShutdownWatcher();

  ShutdownWatcher(const ShutdownWatcher &) = delete;
  ShutdownWatcher &operator=(const ShutdownWatcher &) = delete;
};

#endif
