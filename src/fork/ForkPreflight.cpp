#include "fork/ForkPreflight.h"
#include "core/fork_errors.h"
#include "fork/ConnectionManager.h"
#include "fork/RetryPolicy.h"
#include "fork/StrategyPlanner.h"
#include <nlohmann/json.hpp>
#include <optional>

using json = nlohmann::json;

std::string checkStatusToString(CheckStatus status) {
  switch (status) {
  case CheckStatus::PASS:
    return "pass";
  case CheckStatus::WARN:
    return "warn";
  case CheckStatus::FAIL:
    return "fail";
  }
  return "fail";
}

bool PreflightReport::passed() const {
  for (const auto &check : checks) {
    if (check.status == CheckStatus::FAIL)
      return false;
  }
  return true;
}

const PreflightCheck *PreflightReport::find(const std::string &name) const {
  for (const auto &check : checks) {
    if (check.name == name)
      return &check;
  }
  return nullptr;
}

json PreflightReport::toJson() const {
  json document = {{"success", passed()}, {"checks", json::array()}};
  for (const auto &check : checks) {
    document["checks"].push_back({{"check", check.name},
                                  {"status", checkStatusToString(check.status)},
                                  {"message", check.message}});
  }
  return document;
}

ForkPreflight::ForkPreflight(std::shared_ptr<IDatabaseDriver> driver,
                             std::shared_ptr<Logger> logger)
    : driver_(std::move(driver)), logger_(std::move(logger)) {}

// Checks that depend on a connection are only run once that connection
// answered, so one unreachable server yields one failed check.
PreflightReport ForkPreflight::run(const ForkSpec &spec,
                                   const CancellationToken &token) {
  PreflightReport report;
  auto add = [&](const std::string &name, CheckStatus status,
                 const std::string &message) {
    report.checks.push_back({name, status, message});
    std::string line = name + ": " + message;
    if (status == CheckStatus::PASS) {
      logger_->info(LogCategory::VALIDATION, "preflight", line);
    } else {
      logger_->warning(LogCategory::VALIDATION, "preflight", line);
    }
  };

  std::vector<FieldViolation> violations = spec.validate();
  if (!violations.empty()) {
    for (const auto &violation : violations) {
      add("configuration", CheckStatus::FAIL,
          violation.field + ": " + violation.message);
    }
    return report;
  }
  add("configuration", CheckStatus::PASS, "fork settings are valid");

  RetryPolicy retry(spec.retry, logger_);
  ConnectionManager connections(driver_, spec.source, spec.destination,
                                spec.targetDatabase, 1, retry, logger_);

  std::optional<ServerIdentity> sourceIdentity;
  try {
    sourceIdentity = connections.probeSource(token);
    add("source_connectivity", CheckStatus::PASS,
        "connected to " + spec.source.describe() + " (" +
            sourceIdentity->version + ")");
  } catch (const PlanningError &e) {
    add("source_database_exists", CheckStatus::FAIL, e.what());
  } catch (const CancellationError &) {
    throw;
  } catch (const std::exception &e) {
    add("source_connectivity", CheckStatus::FAIL, e.what());
  }

  if (sourceIdentity) {
    try {
      SourceLease source = connections.acquireSource(token);
      size_t tables = source->listTables().size();
      add("source_read_permission", CheckStatus::PASS,
          std::to_string(tables) + " tables readable in schema " +
              ForkDefaults::PUBLIC_SCHEMA);
    } catch (const CancellationError &) {
      throw;
    } catch (const std::exception &e) {
      add("source_read_permission", CheckStatus::FAIL, e.what());
    }
  }

  std::optional<ServerIdentity> destIdentity;
  try {
    destIdentity = connections.probeDestination(token);
    add("destination_connectivity", CheckStatus::PASS,
        "connected to " + spec.destination.host + ":" +
            std::to_string(spec.destination.port) + " (" +
            destIdentity->version + ")");
  } catch (const CancellationError &) {
    throw;
  } catch (const std::exception &e) {
    add("destination_connectivity", CheckStatus::FAIL, e.what());
  }

  if (sourceIdentity && destIdentity) {
    bool sameServer = StrategyPlanner::isSameServer(
        spec.source, spec.destination, sourceIdentity, destIdentity);
    if (sameServer && StrategyPlanner::canUseTemplateClone(spec)) {
      add("fork_mode", CheckStatus::PASS, "same server: template clone");
    } else if (sameServer) {
      add("fork_mode", CheckStatus::PASS,
          "same server, but table filters or schema/data-only mode use the "
          "streaming transfer");
    } else {
      add("fork_mode", CheckStatus::PASS, "cross server: streaming transfer");
    }
  }

  if (!destIdentity)
    return report;

  try {
    auto admin = connections.openAdmin(token);
    bool exists = admin->databaseExists(spec.targetDatabase);
    const std::string &target = spec.targetDatabase;
    if (spec.dataOnly) {
      if (exists) {
        add("target_database", CheckStatus::PASS,
            target + " exists; data-only mode fills it");
      } else {
        add("target_database", CheckStatus::FAIL,
            target + " does not exist; data-only mode needs an existing "
                     "schema");
      }
    } else if (exists && !spec.dropIfExists) {
      add("target_database", CheckStatus::FAIL,
          target + " already exists (enable drop_if_exists to replace it)");
    } else if (exists) {
      add("target_database", CheckStatus::WARN,
          target + " exists and will be dropped");
    } else {
      add("target_database", CheckStatus::PASS, target + " does not exist yet");
    }

    if (!spec.dataOnly) {
      if (admin->canCreateDatabases()) {
        add("destination_createdb_permission", CheckStatus::PASS,
            "role " + spec.destination.username + " may create databases");
      } else {
        add("destination_createdb_permission", CheckStatus::FAIL,
            "role " + spec.destination.username +
                " does not have CREATEDB permission");
      }
    }
  } catch (const CancellationError &) {
    throw;
  } catch (const std::exception &e) {
    add("target_database", CheckStatus::FAIL, e.what());
  }

  return report;
}
