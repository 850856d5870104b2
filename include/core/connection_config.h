#ifndef CONNECTION_CONFIG_H
#define CONNECTION_CONFIG_H

#include "core/fork_defaults.h"
#include <string>

// One PostgreSQL endpoint. Immutable once a fork starts; sessions for other
// databases on the same server are derived with withDatabase().
struct ConnectionConfig {
  std::string host;
  int port = ForkDefaults::DEFAULT_PORT;
  std::string username;
  std::string password;
  std::string database;
  std::string sslmode = ForkDefaults::DEFAULT_SSLMODE;

  std::string toConnectionString() const;
  std::string toConnectionStringForLogging() const;
  std::string describe() const;

  ConnectionConfig withDatabase(const std::string &databaseName) const;
  bool sameServerAndRole(const ConnectionConfig &other) const;

  static std::string escapeConnectionParam(const std::string &param);
};

#endif
