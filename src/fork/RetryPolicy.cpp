#include "fork/RetryPolicy.h"
#include <algorithm>
#include <cmath>

RetryPolicy::RetryPolicy(RetrySettings settings, std::shared_ptr<Logger> logger,
                         Classifier classifier)
    : settings_(settings), logger_(std::move(logger)),
      classifier_(std::move(classifier)) {
  if (settings_.maxAttempts < 1)
    settings_.maxAttempts = 1;
  if (settings_.backoffFactor < 1.0)
    settings_.backoffFactor = 1.0;
}

std::chrono::milliseconds RetryPolicy::delayForAttempt(int attempt) const {
  double delay = static_cast<double>(settings_.initialDelay.count()) *
                 std::pow(settings_.backoffFactor, std::max(0, attempt - 1));
  double cap = static_cast<double>(settings_.maxDelay.count());
  return std::chrono::milliseconds(
      static_cast<long long>(std::min(delay, cap)));
}

// Classifies the failure of one attempt and either returns how long to wait
// before the next attempt or throws. Throws the classified error when it is
// fatal, ExhaustedRetriesError once the attempt budget is spent, and a fatal
// TimeoutError when waiting would run past the overall fork deadline.
std::chrono::milliseconds
RetryPolicy::handleFailure(const std::string &operation,
                           const std::string &table, int attempt,
                           const std::exception &e,
                           const CancellationToken &token) const {
  ClassifiedError classified = classifier_(e);
  if (classified.table.empty())
    classified.table = table;

  if (!classified.retryable) {
    logger_->error(LogCategory::RETRY, "RetryPolicy",
                   operation + " failed with non-retryable " +
                       errorKindToString(classified.kind) +
                       " error: " + classified.message);
    throwClassified(classified);
  }

  if (attempt >= settings_.maxAttempts) {
    logger_->error(LogCategory::RETRY, "RetryPolicy",
                   operation + " failed on final attempt " +
                       std::to_string(attempt) + "/" +
                       std::to_string(settings_.maxAttempts) + ": " +
                       classified.message);
    throw ExhaustedRetriesError(operation, attempt, classified.kind,
                                classified.message, classified.table);
  }

  std::chrono::milliseconds delay = delayForAttempt(attempt);
  auto remaining = token.remaining();
  if (remaining && *remaining <= delay) {
    throw TimeoutError(operation + " cannot be retried before the fork "
                                   "deadline: " +
                           classified.message,
                       false, classified.table, classified.sqlState);
  }

  logger_->warning(LogCategory::RETRY, "RetryPolicy",
                   operation + " failed (attempt " + std::to_string(attempt) +
                       "/" + std::to_string(settings_.maxAttempts) +
                       "), retrying in " + std::to_string(delay.count()) +
                       "ms: " + classified.message);
  return delay;
}
