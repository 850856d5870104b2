#ifndef FORK_SPEC_H
#define FORK_SPEC_H

#include "core/connection_config.h"
#include "core/fork_defaults.h"
#include "core/fork_errors.h"
#include <chrono>
#include <string>
#include <vector>

struct RetrySettings {
  int maxAttempts = ForkDefaults::DEFAULT_RETRY_ATTEMPTS;
  std::chrono::milliseconds initialDelay{
      ForkDefaults::DEFAULT_RETRY_INITIAL_DELAY_MS};
  std::chrono::milliseconds maxDelay{ForkDefaults::DEFAULT_RETRY_MAX_DELAY_MS};
  double backoffFactor = ForkDefaults::DEFAULT_RETRY_BACKOFF_FACTOR;
};

// Everything one fork needs, as handed over by the configuration layer.
struct ForkSpec {
  ConnectionConfig source;
  ConnectionConfig destination;
  std::string targetDatabase;
  bool dropIfExists = false;

  std::vector<std::string> includeTables;
  std::vector<std::string> excludeTables;

  bool schemaOnly = false;
  bool dataOnly = false;
  bool dryRun = false;

  size_t maxConnections = ForkDefaults::DEFAULT_MAX_CONNECTIONS;
  size_t chunkSize = ForkDefaults::DEFAULT_CHUNK_SIZE;
  std::chrono::seconds timeout{ForkDefaults::DEFAULT_TIMEOUT_SECONDS};

  std::string jobId;
  bool resume = false;
  std::string stateDir;
  std::string progressFile;

  RetrySettings retry;

  // Field-level checks run before any connection is opened. An empty result
  // means the spec is usable.
  std::vector<FieldViolation> validate() const;

  bool sourceAndDestinationOnSameServer() const;
  bool hasTableFilters() const;
};

#endif
