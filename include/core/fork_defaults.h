#ifndef FORK_DEFAULTS_H
#define FORK_DEFAULTS_H

#include <cstddef>

namespace ForkDefaults {
constexpr int DEFAULT_PORT = 5432;
constexpr const char *DEFAULT_SSLMODE = "prefer";
constexpr const char *MAINTENANCE_DATABASE = "postgres";
constexpr const char *TEMPLATE_DATABASE = "template1";
constexpr const char *PUBLIC_SCHEMA = "public";
constexpr const char *DEFAULT_CONFIG_FILE = "pgfork.json";
constexpr const char *STATE_SUBDIRECTORY = "pgfork/jobs";

constexpr const char *SSL_MODES[] = {"disable", "allow",     "prefer",
                                     "require", "verify-ca", "verify-full"};
constexpr size_t SSL_MODE_COUNT = 6;

constexpr size_t MAX_IDENTIFIER_LENGTH = 63;

constexpr size_t DEFAULT_MAX_CONNECTIONS = 4;
constexpr size_t MIN_MAX_CONNECTIONS = 1;
constexpr size_t MAX_MAX_CONNECTIONS = 100;

constexpr size_t DEFAULT_CHUNK_SIZE = 1000;
constexpr size_t MIN_CHUNK_SIZE = 100;
constexpr size_t MAX_CHUNK_SIZE = 100000;

constexpr long long DEFAULT_TIMEOUT_SECONDS = 30 * 60;
constexpr long long MIN_TIMEOUT_SECONDS = 60;
constexpr long long MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

constexpr int DEFAULT_RETRY_ATTEMPTS = 3;
constexpr long long DEFAULT_RETRY_INITIAL_DELAY_MS = 1000;
constexpr long long DEFAULT_RETRY_MAX_DELAY_MS = 30000;
constexpr double DEFAULT_RETRY_BACKOFF_FACTOR = 2.0;

constexpr long long PROGRESS_MIN_WRITE_INTERVAL_MS = 1000;
constexpr long long PROGRESS_LOG_INTERVAL_MS = 30000;
constexpr long long RATE_WINDOW_MS = 30000;

constexpr size_t LOG_FILE_MAX_BYTES = 10 * 1024 * 1024;
constexpr int LOG_FILE_BACKUPS = 5;

// Rows per INSERT statement inside one chunk transaction.
constexpr size_t INSERT_BATCH_ROWS = 500;
} // namespace ForkDefaults

#endif
