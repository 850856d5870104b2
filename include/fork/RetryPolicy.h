#ifndef RETRY_POLICY_H
#define RETRY_POLICY_H

#include "core/cancellation.h"
#include "core/fork_errors.h"
#include "core/logger.h"
#include "fork/ForkSpec.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

// Runs a unit of work, retrying failures the classifier marks retryable with
// exponential backoff. Fatal failures are rethrown as the matching ForkError
// on the first occurrence; a retryable failure on the last attempt becomes
// ExhaustedRetriesError.
class RetryPolicy {
public:
  using Classifier = std::function<ClassifiedError(const std::exception &)>;

private:
  RetrySettings settings_;
  std::shared_ptr<Logger> logger_;
  Classifier classifier_;

  std::chrono::milliseconds handleFailure(const std::string &operation,
                                          const std::string &table,
                                          int attempt, const std::exception &e,
                                          const CancellationToken &token) const;

public:
  RetryPolicy(RetrySettings settings, std::shared_ptr<Logger> logger,
              Classifier classifier = classifyException);

  const RetrySettings &settings() const { return settings_; }

  // Delay before the attempt following the given (1-based) failed attempt.
  std::chrono::milliseconds delayForAttempt(int attempt) const;

  template <typename Fn>
  auto execute(const std::string &operation, const CancellationToken &token,
               Fn &&work, const std::string &table = "") -> decltype(work()) {
    for (int attempt = 1;; ++attempt) {
      token.throwIfStopped(operation, table);
      try {
        return work();
      } catch (const std::exception &e) {
        std::chrono::milliseconds delay =
            handleFailure(operation, table, attempt, e, token);
        if (!token.waitFor(delay)) {
          throw CancellationError("fork cancelled while waiting to retry " +
                                      operation,
                                  table);
        }
      }
    }
  }
};

#endif
