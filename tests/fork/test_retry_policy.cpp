#include "fork/RetryPolicy.h"
#include "support/capture_log_writer.h"
#include "support/test_runner.h"
#include <thread>

namespace {
RetrySettings fastSettings(int attempts) {
  RetrySettings settings;
  settings.maxAttempts = attempts;
  settings.initialDelay = std::chrono::milliseconds(1);
  settings.maxDelay = std::chrono::milliseconds(4);
  settings.backoffFactor = 2.0;
  return settings;
}
} // namespace

int main() {
  TestRunner runner;
  std::shared_ptr<CaptureLogWriter> capture;
  auto logger = makeCaptureLogger(capture);

  std::cout << "\n========================================" << std::endl;
  std::cout << "RETRY POLICY TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Backoff grows and is capped", [&]() {
    RetrySettings settings;
    settings.initialDelay = std::chrono::milliseconds(100);
    settings.maxDelay = std::chrono::milliseconds(1000);
    settings.backoffFactor = 3.0;
    RetryPolicy retry(settings, logger);
    runner.assertEquals(100, retry.delayForAttempt(1).count(), "First delay");
    runner.assertEquals(300, retry.delayForAttempt(2).count(), "Second delay");
    runner.assertEquals(900, retry.delayForAttempt(3).count(), "Third delay");
    runner.assertEquals(1000, retry.delayForAttempt(4).count(), "Capped");
  });

  runner.runTest("Transient failures are retried until success", [&]() {
    RetryPolicy retry(fastSettings(3), logger);
    CancellationToken token;
    int calls = 0;
    int value = retry.execute("open target connection", token, [&]() {
      if (++calls < 3)
        throw ConnectionError("connection refused");
      return 42;
    });
    runner.assertEquals(3, calls, "Two failures then success");
    runner.assertEquals(42, value, "Result is returned");
    runner.assertTrue(capture->countContaining("retrying in") >= 2,
                      "Each retry is logged");
  });

  runner.runTest("Fatal failures are not retried", [&]() {
    RetryPolicy retry(fastSettings(5), logger);
    CancellationToken token;
    int calls = 0;
    try {
      retry.execute(
          "write chunk 1 of users", token,
          [&]() {
            ++calls;
            throw PermissionError("permission denied for table users");
          },
          "users");
      runner.assertTrue(false, "Should have thrown");
    } catch (const PermissionError &e) {
      runner.assertEquals("users", e.table(),
                          "Table of the operation is attached");
    }
    runner.assertEquals(1, calls, "Exactly one attempt");
  });

  runner.runTest("Retry budget exhaustion", [&]() {
    RetryPolicy retry(fastSettings(3), logger);
    CancellationToken token;
    int calls = 0;
    try {
      retry.execute(
          "write chunk 2 of orders", token,
          [&]() {
            ++calls;
            throw ConnectionError("server closed the connection");
          },
          "orders");
      runner.assertTrue(false, "Should have thrown");
    } catch (const ExhaustedRetriesError &e) {
      runner.assertEquals(3, e.attempts(), "Attempts reported");
      runner.assertTrue(e.lastKind() == ErrorKind::CONNECTION,
                        "Last kind reported");
      runner.assertEquals("orders", e.table(), "Table reported");
    }
    runner.assertEquals(3, calls, "max_attempts calls");
  });

  runner.runTest("Single attempt policy fails on first error", [&]() {
    RetryPolicy retry(fastSettings(1), logger);
    CancellationToken token;
    int calls = 0;
    runner.assertThrows<ExhaustedRetriesError>(
        [&]() {
          retry.execute("probe source server", token, [&]() {
            ++calls;
            throw ConnectionError("timeout");
          });
        },
        "Exhausted after one attempt");
    runner.assertEquals(1, calls, "One call");
  });

  runner.runTest("Cancelled token stops before the first attempt", [&]() {
    RetryPolicy retry(fastSettings(3), logger);
    CancellationToken token;
    token.cancel();
    int calls = 0;
    runner.assertThrows<CancellationError>(
        [&]() { retry.execute("apply table:users", token, [&]() { ++calls; }); },
        "Cancellation error");
    runner.assertEquals(0, calls, "Work never ran");
  });

  runner.runTest("Cancellation interrupts the backoff wait", [&]() {
    RetrySettings settings = fastSettings(3);
    settings.initialDelay = std::chrono::seconds(30);
    settings.maxDelay = std::chrono::seconds(30);
    RetryPolicy retry(settings, logger);
    CancellationToken token;

    std::thread canceller([&]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    runner.assertThrows<CancellationError>(
        [&]() {
          retry.execute("open source connection", token,
                        [&]() { throw ConnectionError("refused"); });
        },
        "Cancelled while waiting");
    canceller.join();
    runner.assertTrue(std::chrono::steady_clock::now() - start <
                          std::chrono::seconds(10),
                      "Did not sleep the whole backoff");
  });

  runner.runTest("Backoff past the deadline becomes a fatal timeout", [&]() {
    RetrySettings settings = fastSettings(5);
    settings.initialDelay = std::chrono::seconds(10);
    settings.maxDelay = std::chrono::seconds(10);
    RetryPolicy retry(settings, logger);
    CancellationToken token;
    token.setTimeout(std::chrono::seconds(2));

    try {
      retry.execute("write chunk 1 of users", token,
                    [&]() { throw ConnectionError("refused"); }, "users");
      runner.assertTrue(false, "Should have thrown");
    } catch (const TimeoutError &e) {
      runner.assertFalse(e.retryable(), "Deadline timeouts are fatal");
      runner.assertEquals("users", e.table(), "Table kept");
    }
  });

  runner.runTest("Custom classifier decides retryability", [&]() {
    RetryPolicy retry(fastSettings(3), logger, [](const std::exception &e) {
      ClassifiedError error;
      error.kind = ErrorKind::CONNECTION;
      error.retryable = true;
      error.message = e.what();
      return error;
    });
    CancellationToken token;
    int calls = 0;
    retry.execute("count rows", token, [&]() {
      if (++calls == 1)
        throw std::runtime_error("flaky");
    });
    runner.assertEquals(2, calls, "Plain exception retried by classifier");
  });

  return runner.printSummary();
}
