#ifndef STRATEGY_PLANNER_H
#define STRATEGY_PLANNER_H

#include "core/cancellation.h"
#include "core/logger.h"
#include "fork/ConnectionManager.h"
#include "fork/ForkTypes.h"
#include "fork/SchemaExtractor.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class StrategyPlanner {
  ConnectionManager &connections_;
  SchemaExtractor &extractor_;
  std::shared_ptr<Logger> logger_;

public:
  StrategyPlanner(ConnectionManager &connections, SchemaExtractor &extractor,
                  std::shared_ptr<Logger> logger);

  // Probes both servers, resolves the table selection and produces the plan
  // the rest of the fork executes. Throws PlanningError when the fork cannot
  // start: missing source, conflicting target, empty filtered selection.
  TransferPlan buildPlan(const ForkSpec &spec, const CancellationToken &token);

  // include (when non-empty) is an allow-list, exclude is applied after it.
  // Source order is kept.
  static std::vector<std::string>
  filterTables(const std::vector<std::string> &sourceTables,
               const std::vector<std::string> &includeTables,
               const std::vector<std::string> &excludeTables);

  static bool isSameServer(const ConnectionConfig &source,
                           const ConnectionConfig &destination,
                           const std::optional<ServerIdentity> &sourceIdentity,
                           const std::optional<ServerIdentity> &destIdentity);

  // The template clone copies the whole database, so it is only usable when
  // the fork copies schema and data of every table.
  static bool canUseTemplateClone(const ForkSpec &spec);
};

#endif
