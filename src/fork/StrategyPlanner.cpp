#include "fork/StrategyPlanner.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <unordered_set>

StrategyPlanner::StrategyPlanner(ConnectionManager &connections,
                                 SchemaExtractor &extractor,
                                 std::shared_ptr<Logger> logger)
    : connections_(connections), extractor_(extractor),
      logger_(std::move(logger)) {}

std::vector<std::string>
StrategyPlanner::filterTables(const std::vector<std::string> &sourceTables,
                              const std::vector<std::string> &includeTables,
                              const std::vector<std::string> &excludeTables) {
  std::unordered_set<std::string> include(includeTables.begin(),
                                          includeTables.end());
  std::unordered_set<std::string> exclude(excludeTables.begin(),
                                          excludeTables.end());

  std::vector<std::string> selected;
  for (const auto &table : sourceTables) {
    if (!include.empty() && include.find(table) == include.end())
      continue;
    if (exclude.find(table) != exclude.end())
      continue;
    selected.push_back(table);
  }
  return selected;
}

// Configured host, port and user decide first. When both probes answered, the
// addresses the servers report for themselves also count, which catches
// "localhost" against "127.0.0.1" style aliases. Unix-socket probes report no
// address and fall back to the configured values.
bool StrategyPlanner::isSameServer(
    const ConnectionConfig &source, const ConnectionConfig &destination,
    const std::optional<ServerIdentity> &sourceIdentity,
    const std::optional<ServerIdentity> &destIdentity) {
  if (source.sameServerAndRole(destination))
    return true;

  if (!sourceIdentity || !destIdentity)
    return false;
  if (sourceIdentity->address.empty() || destIdentity->address.empty())
    return false;

  return sourceIdentity->address == destIdentity->address &&
         sourceIdentity->port == destIdentity->port &&
         sourceIdentity->role == destIdentity->role;
}

bool StrategyPlanner::canUseTemplateClone(const ForkSpec &spec) {
  return !spec.hasTableFilters() && !spec.schemaOnly && !spec.dataOnly;
}

TransferPlan StrategyPlanner::buildPlan(const ForkSpec &spec,
                                        const CancellationToken &token) {
  logger_->info(LogCategory::PLANNING, "buildPlan",
                "Planning fork of " + spec.source.describe() + " into " +
                    spec.targetDatabase + " on " + spec.destination.host +
                    ":" + std::to_string(spec.destination.port));

  std::optional<ServerIdentity> sourceIdentity;
  try {
    sourceIdentity = connections_.probeSource(token);
  } catch (const PlanningError &e) {
    throw PlanningError("source database " + spec.source.database +
                        " does not exist: " + e.what());
  }
  std::optional<ServerIdentity> destIdentity =
      connections_.probeDestination(token);

  TransferPlan plan;
  bool sameServer = isSameServer(spec.source, spec.destination,
                                 sourceIdentity, destIdentity);
  if (sameServer && canUseTemplateClone(spec)) {
    plan.strategy = TransferStrategy::SAME_SERVER;
  } else {
    plan.strategy = TransferStrategy::CROSS_SERVER;
    if (sameServer) {
      logger_->info(LogCategory::PLANNING, "buildPlan",
                    "Source and destination share a server, but table "
                    "filters or schema/data-only mode require the "
                    "streaming transfer");
    }
  }
  logger_->info(LogCategory::PLANNING, "buildPlan",
                "Strategy: " + strategyToString(plan.strategy) +
                    " (source server " + sourceIdentity->version + ")");

  {
    auto admin = connections_.openAdmin(token);
    plan.targetExists = admin->databaseExists(spec.targetDatabase);
  }

  if (spec.dataOnly) {
    if (!plan.targetExists) {
      throw PlanningError("target database " + spec.targetDatabase +
                          " does not exist; data-only mode needs an existing "
                          "schema");
    }
  } else if (plan.targetExists && !spec.dropIfExists) {
    throw PlanningError("target database " + spec.targetDatabase +
                        " already exists (enable drop_if_exists to replace "
                        "it)");
  }

  SourceLease source = connections_.acquireSource(token);
  std::vector<std::string> sourceTables = source->listTables();

  for (const auto &name : spec.includeTables) {
    if (std::find(sourceTables.begin(), sourceTables.end(), name) ==
        sourceTables.end()) {
      logger_->warning(LogCategory::PLANNING, "buildPlan",
                       "Included table " + name +
                           " does not exist in the source database");
    }
  }

  std::vector<std::string> selected =
      filterTables(sourceTables, spec.includeTables, spec.excludeTables);
  if (selected.empty() && spec.hasTableFilters()) {
    throw PlanningError("table filters matched none of the " +
                        std::to_string(sourceTables.size()) +
                        " source tables");
  }

  for (const auto &table : selected) {
    token.throwIfStopped("planning", table);
    TableTask task;
    task.name = table;
    task.estimatedRows = source->estimateRowCount(table);
    plan.tables.push_back(task);
  }

  if (plan.strategy == TransferStrategy::SAME_SERVER) {
    DdlStatement clone;
    clone.id = "database:clone";
    clone.kind = DdlKind::CLONE_DATABASE;
    clone.sql = "CREATE DATABASE " + quoteIdentifier(spec.targetDatabase) +
                " WITH TEMPLATE " + quoteIdentifier(spec.source.database);
    plan.statements.push_back(clone);
  } else {
    std::vector<TableSchema> schemas =
        extractor_.describeTables(*source, selected, token);
    for (size_t i = 0; i < schemas.size(); ++i)
      plan.tables[i].columns = schemas[i].copyableColumns();

    if (!spec.dataOnly) {
      DdlStatement create;
      create.id = "database:create";
      create.kind = DdlKind::CREATE_DATABASE;
      create.sql = "CREATE DATABASE " + quoteIdentifier(spec.targetDatabase) +
                   " WITH TEMPLATE " +
                   quoteIdentifier(ForkDefaults::TEMPLATE_DATABASE);
      plan.statements.push_back(create);
    }

    std::vector<ExtensionInfo> extensions = source->listExtensions();
    std::vector<UserTypeInfo> types =
        extractor_.describeTypes(*source, schemas, token);
    auto statements = extractor_.buildStatements(schemas, extensions, types);
    plan.statements.insert(plan.statements.end(), statements.begin(),
                           statements.end());
  }

  int64_t totalRows = plan.estimatedTotalRows();
  logger_->info(LogCategory::PLANNING, "buildPlan",
                "Planned " + std::to_string(plan.tables.size()) + " of " +
                    std::to_string(sourceTables.size()) + " tables, " +
                    (totalRows < 0 ? std::string("unknown")
                                   : std::to_string(totalRows)) +
                    " estimated rows, " +
                    std::to_string(plan.statements.size()) + " statements");
  return plan;
}
