#include "core/connection_config.h"

// Quotes a value for a libpq keyword/value connection string. Values are
// always wrapped in single quotes with backslashes and quotes escaped, so
// passwords containing spaces or '=' survive intact.
std::string ConnectionConfig::escapeConnectionParam(const std::string &param) {
  std::string escaped = "'";
  for (char c : param) {
    if (c == '\\' || c == '\'')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

std::string ConnectionConfig::toConnectionString() const {
  std::string connStr = "host=" + escapeConnectionParam(host) +
                        " port=" + std::to_string(port) +
                        " dbname=" + escapeConnectionParam(database) +
                        " user=" + escapeConnectionParam(username);
  if (!password.empty())
    connStr += " password=" + escapeConnectionParam(password);
  if (!sslmode.empty())
    connStr += " sslmode=" + escapeConnectionParam(sslmode);
  return connStr;
}

std::string ConnectionConfig::toConnectionStringForLogging() const {
  std::string connStr = "host=" + escapeConnectionParam(host) +
                        " port=" + std::to_string(port) +
                        " dbname=" + escapeConnectionParam(database) +
                        " user=" + escapeConnectionParam(username) +
                        " password=***";
  if (!sslmode.empty())
    connStr += " sslmode=" + escapeConnectionParam(sslmode);
  return connStr;
}

std::string ConnectionConfig::describe() const {
  return username + "@" + host + ":" + std::to_string(port) + "/" + database;
}

ConnectionConfig
ConnectionConfig::withDatabase(const std::string &databaseName) const {
  ConnectionConfig copy = *this;
  copy.database = databaseName;
  return copy;
}

bool ConnectionConfig::sameServerAndRole(const ConnectionConfig &other) const {
  return host == other.host && port == other.port &&
         username == other.username;
}
