#ifndef CONNECTION_UTILS_H
#define CONNECTION_UTILS_H

#include "core/connection_config.h"
#include <optional>
#include <string>
#include <string_view>

// Parses postgres:// and postgresql:// URIs into a ConnectionConfig.
class ConnectionUriParser {
public:
  static std::optional<ConnectionConfig> parse(std::string_view uri);

private:
  static std::string percentDecode(const std::string &str);
  static bool parsePort(const std::string &value, int &port);
};

#endif
