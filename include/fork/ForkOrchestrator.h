#ifndef FORK_ORCHESTRATOR_H
#define FORK_ORCHESTRATOR_H

#include "core/cancellation.h"
#include "core/logger.h"
#include "engines/database_session.h"
#include "fork/ForkTypes.h"
#include <chrono>
#include <initializer_list>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

struct ForkResult {
  bool success = false;
  std::string targetDatabase;
  TransferStrategy strategy = TransferStrategy::CROSS_SERVER;
  std::string jobId;
  bool dryRun = false;
  size_t tablesCompleted = 0;
  size_t tablesTotal = 0;
  int64_t rowsTransferred = 0;
  std::chrono::milliseconds duration{0};

  ErrorKind errorKind = ErrorKind::NONE;
  std::string errorMessage;
  std::string failedTable;

  TransferPlan plan;

  nlohmann::json toJson() const;
};

class ConnectionManager;
class JobStateStore;
class ProgressTracker;
class RetryPolicy;
class SchemaExtractor;
class StrategyPlanner;

// Runs one fork from planning to its terminal state:
//
//   planning -> [cleanup] -> schema -> data -> verify -> done
//
// with failed reachable from every non-terminal phase. The call blocks until
// the fork is done or failed and never throws for fork-level failures; they
// are reported in the result, classified, with the failing table if any.
class ForkOrchestrator {
private:
  std::shared_ptr<IDatabaseDriver> driver_;
  std::shared_ptr<Logger> logger_;

  struct Run;

  void enterPhase(Run &run, ForkPhase phase);
  bool loadResumableJob(Run &run);
  void cleanupTarget(Run &run);
  void createTargetDatabase(Run &run, const DdlStatement &statement);
  void applyStatements(Run &run, std::initializer_list<DdlKind> kinds);
  void completeWithoutData(Run &run);
  void runSameServer(Run &run);
  void runCrossServer(Run &run);
  void verifyRowCounts(Run &run, const std::vector<std::string> &tables);

  void fillResult(Run &run, ForkResult &result);

public:
  ForkOrchestrator(std::shared_ptr<IDatabaseDriver> driver,
                   std::shared_ptr<Logger> logger);

  ForkResult fork(CancellationToken &token, const ForkSpec &spec);
};

#endif
