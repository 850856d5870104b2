#include "engines/database_session.h"

// Stored generated columns are recomputed by the destination and cannot be
// written explicitly.
std::vector<std::string> TableSchema::copyableColumns() const {
  std::vector<std::string> names;
  for (const auto &column : columns) {
    if (!column.isGenerated())
      names.push_back(column.name);
  }
  return names;
}
