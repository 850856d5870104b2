#include "fork/DatabaseCleaner.h"
#include "core/fork_defaults.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::vector<FieldViolation> CleanupOptions::validate() const {
  std::vector<FieldViolation> violations;
  if (StringUtils::trim(pattern).empty())
    violations.push_back({"pattern", "a database name pattern is required"});
  if (!force && !olderThan) {
    violations.push_back(
        {"older_than", "either an age limit or force is required"});
  }
  if (olderThan && olderThan->count() < 0)
    violations.push_back({"older_than", "must not be negative"});
  return violations;
}

json CleanupReport::toJson() const {
  json document = {{"success", success()},
                   {"dry_run", dryRun},
                   {"deleted_count", deleted.size()},
                   {"deleted_databases", deleted},
                   {"skipped_count", skipped.size()},
                   {"skipped_databases", skipped},
                   {"duration_ms", duration.count()}};
  if (!failed.empty())
    document["failed_databases"] = failed;
  return document;
}

DatabaseCleaner::DatabaseCleaner(std::shared_ptr<IDatabaseDriver> driver,
                                 const ConnectionConfig &server,
                                 RetryPolicy &retry,
                                 std::shared_ptr<Logger> logger)
    : driver_(std::move(driver)),
      server_(server.withDatabase(ForkDefaults::MAINTENANCE_DATABASE)),
      retry_(retry), logger_(std::move(logger)) {}

// Databases whose age the server cannot report are kept whenever an age
// limit applies.
CleanupReport DatabaseCleaner::cleanup(const CleanupOptions &options,
                                       const CancellationToken &token) {
  std::vector<FieldViolation> violations = options.validate();
  if (!violations.empty())
    throw ValidationError(violations);

  auto start = std::chrono::steady_clock::now();
  CleanupReport report;
  report.dryRun = options.dryRun;

  auto admin = retry_.execute("open admin connection", token, [&] {
    return driver_->openAdmin(server_);
  });
  std::vector<DatabaseInfo> databases =
      retry_.execute("list databases", token,
                     [&] { return admin->listDatabases(); });

  for (const auto &database : databases) {
    if (!StringUtils::matchesWildcard(database.name, options.pattern))
      continue;
    if (std::find(options.exclude.begin(), options.exclude.end(),
                  database.name) != options.exclude.end()) {
      logger_->debug(LogCategory::DATABASE, "cleanup",
                     "Excluded database " + database.name);
      continue;
    }

    if (!options.force && options.olderThan) {
      if (!database.age) {
        logger_->warning(LogCategory::DATABASE, "cleanup",
                         "Could not determine age of database " +
                             database.name + "; keeping it");
        report.skipped.push_back(database.name);
        continue;
      }
      if (*database.age < *options.olderThan) {
        report.skipped.push_back(database.name);
        continue;
      }
    }

    if (options.dryRun) {
      logger_->info(LogCategory::DATABASE, "cleanup",
                    "Would drop database " + database.name);
      report.deleted.push_back(database.name);
      continue;
    }

    token.throwIfStopped("database cleanup");
    try {
      admin->dropDatabase(database.name);
      report.deleted.push_back(database.name);
    } catch (const std::exception &e) {
      logger_->error(LogCategory::DATABASE, "cleanup",
                     "Failed to drop database " + database.name + ": " +
                         e.what());
      report.failed.push_back(database.name);
    }
  }

  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  logger_->info(LogCategory::DATABASE, "cleanup",
                std::string(options.dryRun ? "Dry run: " : "") +
                    std::to_string(report.deleted.size()) +
                    " databases matching '" + options.pattern + "' " +
                    (options.dryRun ? "would be dropped" : "dropped") + ", " +
                    std::to_string(report.skipped.size()) + " kept, " +
                    std::to_string(report.failed.size()) + " failed");
  return report;
}
