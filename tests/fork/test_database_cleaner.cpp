#include "fork/DatabaseCleaner.h"
#include "support/capture_log_writer.h"
#include "support/fake_database.h"
#include "support/test_runner.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace {

bool contains(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

// A server with three preview forks of different ages, one fork whose age is
// unknown and an unrelated database.
struct CleanerFixture {
  std::shared_ptr<CaptureLogWriter> capture;
  std::shared_ptr<Logger> logger;
  std::shared_ptr<FakeServer> server;
  std::shared_ptr<FakeDriver> driver;
  std::unique_ptr<RetryPolicy> retry;
  ConnectionConfig config;

  CleanerFixture() {
    logger = makeCaptureLogger(capture);
    server = std::make_shared<FakeServer>("10.0.0.2", 5432, "forker");
    server->createDatabase("pr_101").age = std::chrono::hours(72);
    server->createDatabase("pr_102").age = std::chrono::hours(30);
    server->createDatabase("pr_103").age = std::chrono::hours(2);
    server->createDatabase("pr_104");
    server->createDatabase("billing").age = std::chrono::hours(500);

    driver = std::make_shared<FakeDriver>();
    driver->addServer("dst.db", 5432, server);

    RetrySettings settings;
    settings.maxAttempts = 2;
    settings.initialDelay = std::chrono::milliseconds(1);
    settings.maxDelay = std::chrono::milliseconds(2);
    retry = std::make_unique<RetryPolicy>(settings, logger);

    config.host = "dst.db";
    config.username = "forker";
    config.database = "billing";
  }

  CleanupReport cleanup(const CleanupOptions &options) {
    DatabaseCleaner cleaner(driver, config, *retry, logger);
    CancellationToken token;
    return cleaner.cleanup(options, token);
  }
};

CleanupOptions olderThan(const std::string &pattern, long hours) {
  CleanupOptions options;
  options.pattern = pattern;
  options.olderThan = std::chrono::hours(hours);
  return options;
}

} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "DATABASE CLEANER TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Wildcard matching", [&]() {
    runner.assertTrue(StringUtils::matchesWildcard("pr_101", "pr_*"),
                      "Star matches a run");
    runner.assertTrue(StringUtils::matchesWildcard("pr_1", "pr_?"),
                      "Question mark matches one character");
    runner.assertFalse(StringUtils::matchesWildcard("pr_10", "pr_?"),
                       "Question mark matches exactly one");
    runner.assertTrue(StringUtils::matchesWildcard("shop_fork_7", "*fork*"),
                      "Star on both sides");
    runner.assertFalse(StringUtils::matchesWildcard("billing", "pr_*"),
                       "Different prefix");
    runner.assertTrue(StringUtils::matchesWildcard("", "*"), "Empty name");
  });

  runner.runTest("Only matches older than the limit are dropped", [&]() {
    CleanerFixture fixture;
    CleanupReport report = fixture.cleanup(olderThan("pr_*", 24));
    runner.assertTrue(report.success(), "No failures");
    runner.assertEquals(2, report.deleted.size(), "Two dropped");
    runner.assertTrue(contains(report.deleted, "pr_101") &&
                          contains(report.deleted, "pr_102"),
                      "The old forks");
    runner.assertTrue(contains(report.skipped, "pr_103"), "Young fork kept");
    runner.assertFalse(fixture.server->hasDatabase("pr_101"), "pr_101 gone");
    runner.assertTrue(fixture.server->hasDatabase("pr_103"), "pr_103 kept");
    runner.assertTrue(fixture.server->hasDatabase("billing"),
                      "Non-matching database untouched");
  });

  runner.runTest("Unknown age keeps the database", [&]() {
    CleanerFixture fixture;
    CleanupReport report = fixture.cleanup(olderThan("pr_*", 1));
    runner.assertTrue(contains(report.skipped, "pr_104"), "pr_104 skipped");
    runner.assertTrue(fixture.server->hasDatabase("pr_104"), "pr_104 kept");
    runner.assertEquals(1, fixture.capture->countContaining(
                               "Could not determine age of database pr_104"),
                        "Skip is warned about");
  });

  runner.runTest("Force drops regardless of age", [&]() {
    CleanerFixture fixture;
    CleanupOptions options;
    options.pattern = "pr_*";
    options.force = true;
    CleanupReport report = fixture.cleanup(options);
    runner.assertEquals(4, report.deleted.size(), "Every fork dropped");
    runner.assertTrue(fixture.server->hasDatabase("billing"), "billing kept");
  });

  runner.runTest("Excluded databases are kept", [&]() {
    CleanerFixture fixture;
    CleanupOptions options = olderThan("pr_*", 24);
    options.exclude = {"pr_101"};
    CleanupReport report = fixture.cleanup(options);
    runner.assertEquals(1, report.deleted.size(), "One dropped");
    runner.assertEquals("pr_102", report.deleted[0], "pr_102 dropped");
    runner.assertTrue(fixture.server->hasDatabase("pr_101"), "pr_101 kept");
  });

  runner.runTest("Dry run drops nothing", [&]() {
    CleanerFixture fixture;
    CleanupOptions options = olderThan("pr_*", 24);
    options.dryRun = true;
    CleanupReport report = fixture.cleanup(options);
    runner.assertEquals(2, report.deleted.size(), "Two would be dropped");
    runner.assertTrue(fixture.server->hasDatabase("pr_101") &&
                          fixture.server->hasDatabase("pr_102"),
                      "Both still exist");
    runner.assertEquals(1, fixture.capture->countContaining(
                               "Would drop database pr_101"),
                        "Planned drop logged");

    nlohmann::json document = report.toJson();
    runner.assertTrue(document["dry_run"].get<bool>(), "dry_run flag");
    runner.assertEquals(2, document["deleted_count"].get<int>(),
                        "deleted_count");
    runner.assertFalse(document.contains("failed_databases"),
                       "No failures listed");
  });

  runner.runTest("A failed drop does not stop the others", [&]() {
    CleanerFixture fixture;
    fixture.server->failDrop("pr_101");
    CleanupReport report = fixture.cleanup(olderThan("pr_*", 24));
    runner.assertFalse(report.success(), "Reported as failed");
    runner.assertEquals(1, report.failed.size(), "One failure");
    runner.assertEquals("pr_101", report.failed[0], "pr_101 failed");
    runner.assertTrue(contains(report.deleted, "pr_102"), "pr_102 dropped");
    runner.assertTrue(fixture.capture->countContaining(
                          "must be owner of database pr_101") == 1,
                      "Server error logged");
    runner.assertEquals("pr_101",
                        report.toJson()["failed_databases"][0]
                            .get<std::string>(),
                        "failed_databases in the document");
  });

  runner.runTest("Templates and the maintenance database are never listed",
                 [&]() {
    CleanerFixture fixture;
    CleanupOptions options;
    options.pattern = "*";
    options.force = true;
    options.dryRun = true;
    CleanupReport report = fixture.cleanup(options);
    runner.assertFalse(contains(report.deleted, "postgres"),
                       "Maintenance database not a candidate");
    runner.assertFalse(contains(report.deleted, "template1"),
                       "Template not a candidate");
    runner.assertEquals(5, report.deleted.size(), "User databases only");
  });

  runner.runTest("Unusable options are rejected", [&]() {
    CleanerFixture fixture;
    CleanupOptions noAge;
    noAge.pattern = "pr_*";
    try {
      fixture.cleanup(noAge);
      runner.assertTrue(false, "Missing age limit should fail");
    } catch (const ValidationError &e) {
      runner.assertEquals("older_than", e.violations()[0].field,
                          "Age limit required without force");
    }

    CleanupOptions noPattern;
    noPattern.force = true;
    runner.assertThrows<ValidationError>(
        [&]() { fixture.cleanup(noPattern); }, "Pattern required");
    runner.assertTrue(fixture.server->hasDatabase("pr_101"), "Nothing dropped");
  });

  return runner.printSummary();
}
