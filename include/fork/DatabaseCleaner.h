#ifndef DATABASE_CLEANER_H
#define DATABASE_CLEANER_H

#include "core/cancellation.h"
#include "core/connection_config.h"
#include "core/fork_errors.h"
#include "core/logger.h"
#include "engines/database_session.h"
#include "fork/RetryPolicy.h"
#include <chrono>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

struct CleanupOptions {
  // Database name glob; '*' and '?' are wildcards.
  std::string pattern;
  std::optional<std::chrono::hours> olderThan;
  std::vector<std::string> exclude;
  // Drops every match regardless of age.
  bool force = false;
  bool dryRun = false;

  std::vector<FieldViolation> validate() const;
};

// In a dry run, deleted lists the databases that would be dropped.
struct CleanupReport {
  bool dryRun = false;
  std::vector<std::string> deleted;
  std::vector<std::string> skipped;
  std::vector<std::string> failed;
  std::chrono::milliseconds duration{0};

  bool success() const { return failed.empty(); }
  nlohmann::json toJson() const;
};

// Drops fork databases on one server by name pattern and age, the way
// preview environments are torn down. Templates and the maintenance database
// are never candidates.
class DatabaseCleaner {
  std::shared_ptr<IDatabaseDriver> driver_;
  ConnectionConfig server_;
  RetryPolicy &retry_;
  std::shared_ptr<Logger> logger_;

public:
  DatabaseCleaner(std::shared_ptr<IDatabaseDriver> driver,
                  const ConnectionConfig &server, RetryPolicy &retry,
                  std::shared_ptr<Logger> logger);

  // Throws ValidationError for unusable options. A database that cannot be
  // dropped is reported in failed and does not stop the others.
  CleanupReport cleanup(const CleanupOptions &options,
                        const CancellationToken &token);
};

#endif
