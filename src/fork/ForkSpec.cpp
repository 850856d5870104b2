#include "fork/ForkSpec.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <set>

namespace {
void validateEndpoint(const std::string &prefix, const ConnectionConfig &config,
                      bool requireDatabase,
                      std::vector<FieldViolation> &violations) {
  if (config.host.empty())
    violations.push_back({prefix + ".host", "is required"});
  if (config.username.empty())
    violations.push_back({prefix + ".username", "is required"});
  if (requireDatabase && config.database.empty())
    violations.push_back({prefix + ".database", "is required"});
  if (config.port <= 0 || config.port > 65535)
    violations.push_back(
        {prefix + ".port", "must be between 1 and 65535, got " +
                               std::to_string(config.port)});

  bool knownMode = false;
  for (size_t i = 0; i < ForkDefaults::SSL_MODE_COUNT; ++i) {
    if (config.sslmode == ForkDefaults::SSL_MODES[i])
      knownMode = true;
  }
  if (!knownMode)
    violations.push_back({prefix + ".sslmode",
                          "must be one of disable, allow, prefer, require, "
                          "verify-ca, verify-full, got '" +
                              config.sslmode + "'"});
}

void validateTableNames(const std::string &field,
                        const std::vector<std::string> &tables,
                        std::vector<FieldViolation> &violations) {
  std::set<std::string> seen;
  for (const auto &table : tables) {
    if (StringUtils::trim(table).empty()) {
      violations.push_back({field, "contains an empty table name"});
    } else if (!seen.insert(table).second) {
      violations.push_back({field, "lists '" + table + "' more than once"});
    }
  }
}
} // namespace

// Collects every problem instead of stopping at the first one so that a
// configuration can be fixed in a single pass. Checks endpoint fields, the
// target name, numeric limits, filter overlap, mutually exclusive modes,
// forking a database onto itself and resume prerequisites.
std::vector<FieldViolation> ForkSpec::validate() const {
  std::vector<FieldViolation> violations;

  validateEndpoint("source", source, true, violations);
  validateEndpoint("destination", destination, false, violations);

  if (targetDatabase.empty()) {
    violations.push_back({"target_database", "is required"});
  } else if (targetDatabase.length() > ForkDefaults::MAX_IDENTIFIER_LENGTH) {
    violations.push_back(
        {"target_database",
         "must be at most " +
             std::to_string(ForkDefaults::MAX_IDENTIFIER_LENGTH) +
             " characters"});
  } else if (targetDatabase.find("{{") != std::string::npos) {
    violations.push_back(
        {"target_database", "contains an unresolved template placeholder"});
  }

  if (maxConnections < ForkDefaults::MIN_MAX_CONNECTIONS ||
      maxConnections > ForkDefaults::MAX_MAX_CONNECTIONS) {
    violations.push_back(
        {"max_connections",
         "must be between " + std::to_string(ForkDefaults::MIN_MAX_CONNECTIONS) +
             " and " + std::to_string(ForkDefaults::MAX_MAX_CONNECTIONS)});
  }

  if (chunkSize < ForkDefaults::MIN_CHUNK_SIZE ||
      chunkSize > ForkDefaults::MAX_CHUNK_SIZE) {
    violations.push_back(
        {"chunk_size",
         "must be between " + std::to_string(ForkDefaults::MIN_CHUNK_SIZE) +
             " and " + std::to_string(ForkDefaults::MAX_CHUNK_SIZE)});
  }

  if (timeout.count() < ForkDefaults::MIN_TIMEOUT_SECONDS ||
      timeout.count() > ForkDefaults::MAX_TIMEOUT_SECONDS) {
    violations.push_back({"timeout", "must be between 1m and 24h"});
  }

  if (retry.maxAttempts < 1)
    violations.push_back({"retry.max_attempts", "must be at least 1"});
  if (retry.initialDelay.count() <= 0)
    violations.push_back({"retry.initial_delay_ms", "must be positive"});
  if (retry.maxDelay < retry.initialDelay)
    violations.push_back(
        {"retry.max_delay_ms", "must not be less than initial_delay_ms"});
  if (retry.backoffFactor < 1.0)
    violations.push_back({"retry.backoff_factor", "must be at least 1.0"});

  validateTableNames("include_tables", includeTables, violations);
  validateTableNames("exclude_tables", excludeTables, violations);

  std::vector<std::string> overlap;
  for (const auto &table : includeTables) {
    if (std::find(excludeTables.begin(), excludeTables.end(), table) !=
        excludeTables.end())
      overlap.push_back(table);
  }
  if (!overlap.empty()) {
    violations.push_back({"include_tables",
                          "and exclude_tables both contain: " +
                              StringUtils::join(overlap, ", ")});
  }

  if (schemaOnly && dataOnly) {
    violations.push_back(
        {"schema_only", "cannot be combined with data_only"});
  }

  if (dataOnly && dropIfExists) {
    violations.push_back(
        {"drop_if_exists",
         "cannot be combined with data_only, which needs the existing "
         "target schema"});
  }

  if (sourceAndDestinationOnSameServer() &&
      targetDatabase == source.database && !targetDatabase.empty()) {
    violations.push_back({"target_database",
                          "must differ from the source database when both "
                          "are on the same server"});
  }

  if (resume && jobId.empty()) {
    violations.push_back({"job_id", "is required when resume is requested"});
  }

  return violations;
}

// Configuration-level comparison only; the planner refines it with what the
// servers report about themselves.
bool ForkSpec::sourceAndDestinationOnSameServer() const {
  return source.host == destination.host && source.port == destination.port;
}

bool ForkSpec::hasTableFilters() const {
  return !includeTables.empty() || !excludeTables.empty();
}
