#include "fork/ForkSpec.h"
#include "support/test_runner.h"

namespace {

ForkSpec validSpec() {
  ForkSpec spec;
  spec.source.host = "src.db";
  spec.source.username = "forker";
  spec.source.database = "shop";
  spec.destination.host = "dst.db";
  spec.destination.username = "forker";
  spec.destination.database = "postgres";
  spec.targetDatabase = "shop_fork";
  return spec;
}

bool hasViolation(const std::vector<FieldViolation> &violations,
                  const std::string &field) {
  for (const auto &violation : violations) {
    if (violation.field == field)
      return true;
  }
  return false;
}

} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "FORK SPEC VALIDATION TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("A complete spec is valid", [&]() {
    runner.assertEquals(0, validSpec().validate().size(), "No violations");
  });

  runner.runTest("Missing endpoint fields are all reported", [&]() {
    ForkSpec spec = validSpec();
    spec.source.host.clear();
    spec.source.database.clear();
    spec.destination.username.clear();
    spec.targetDatabase.clear();

    auto violations = spec.validate();
    runner.assertTrue(hasViolation(violations, "source.host"), "source.host");
    runner.assertTrue(hasViolation(violations, "source.database"),
                      "source.database");
    runner.assertTrue(hasViolation(violations, "destination.username"),
                      "destination.username");
    runner.assertTrue(hasViolation(violations, "target_database"),
                      "target_database");
  });

  runner.runTest("Port and sslmode ranges", [&]() {
    ForkSpec spec = validSpec();
    spec.source.port = 70000;
    spec.destination.sslmode = "sometimes";
    auto violations = spec.validate();
    runner.assertTrue(hasViolation(violations, "source.port"), "Port range");
    runner.assertTrue(hasViolation(violations, "destination.sslmode"),
                      "Unknown sslmode");
  });

  runner.runTest("Numeric limits", [&]() {
    ForkSpec spec = validSpec();
    spec.maxConnections = 0;
    spec.chunkSize = 50;
    spec.timeout = std::chrono::seconds(10);
    spec.retry.maxAttempts = 0;
    spec.retry.backoffFactor = 0.5;
    auto violations = spec.validate();
    runner.assertTrue(hasViolation(violations, "max_connections"),
                      "max_connections lower bound");
    runner.assertTrue(hasViolation(violations, "chunk_size"),
                      "chunk_size lower bound");
    runner.assertTrue(hasViolation(violations, "timeout"), "timeout minimum");
    runner.assertTrue(hasViolation(violations, "retry.max_attempts"),
                      "retry attempts");
    runner.assertTrue(hasViolation(violations, "retry.backoff_factor"),
                      "backoff factor");

    spec = validSpec();
    spec.chunkSize = 200000;
    spec.maxConnections = 101;
    violations = spec.validate();
    runner.assertTrue(hasViolation(violations, "chunk_size"),
                      "chunk_size upper bound");
    runner.assertTrue(hasViolation(violations, "max_connections"),
                      "max_connections upper bound");
  });

  runner.runTest("Target name length and placeholders", [&]() {
    ForkSpec spec = validSpec();
    spec.targetDatabase = std::string(64, 'x');
    runner.assertTrue(hasViolation(spec.validate(), "target_database"),
                      "Longer than 63 characters");
    spec.targetDatabase = "shop_{{BRANCH}}";
    runner.assertTrue(hasViolation(spec.validate(), "target_database"),
                      "Unresolved placeholder");
  });

  runner.runTest("Table filters", [&]() {
    ForkSpec spec = validSpec();
    spec.includeTables = {"users", "orders", "users"};
    spec.excludeTables = {"orders", " "};
    auto violations = spec.validate();
    runner.assertTrue(hasViolation(violations, "include_tables"),
                      "Duplicate or overlapping include");
    runner.assertTrue(hasViolation(violations, "exclude_tables"),
                      "Empty exclude entry");
  });

  runner.runTest("Mutually exclusive modes", [&]() {
    ForkSpec spec = validSpec();
    spec.schemaOnly = true;
    spec.dataOnly = true;
    runner.assertTrue(hasViolation(spec.validate(), "schema_only"),
                      "schema_only with data_only");

    spec = validSpec();
    spec.dataOnly = true;
    spec.dropIfExists = true;
    runner.assertTrue(hasViolation(spec.validate(), "drop_if_exists"),
                      "drop_if_exists with data_only");
  });

  runner.runTest("Forking a database onto itself", [&]() {
    ForkSpec spec = validSpec();
    spec.destination.host = spec.source.host;
    spec.targetDatabase = spec.source.database;
    runner.assertTrue(hasViolation(spec.validate(), "target_database"),
                      "Same server and same name");

    spec.destination.host = "other.db";
    runner.assertEquals(0, spec.validate().size(),
                        "Same name on another server is fine");
  });

  runner.runTest("Resume needs a job id", [&]() {
    ForkSpec spec = validSpec();
    spec.resume = true;
    runner.assertTrue(hasViolation(spec.validate(), "job_id"),
                      "Missing job id");
    spec.jobId = "fork-1";
    runner.assertEquals(0, spec.validate().size(), "Job id given");
  });

  runner.runTest("Filter detection", [&]() {
    ForkSpec spec = validSpec();
    runner.assertFalse(spec.hasTableFilters(), "No filters");
    spec.excludeTables = {"audit_logs"};
    runner.assertTrue(spec.hasTableFilters(), "Exclude counts as a filter");
  });

  return runner.printSummary();
}
