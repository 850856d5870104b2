#include "core/file_log_writer.h"
#include "core/fork_config.h"
#include "engines/postgres_session.h"
#include "fork/DatabaseCleaner.h"
#include "fork/ForkOrchestrator.h"
#include "fork/ForkPreflight.h"
#include "fork/JobStateStore.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_PLANNING_ERROR = 3;
constexpr int EXIT_PERMISSION_ERROR = 4;
constexpr int EXIT_CONNECTION_ERROR = 5;
constexpr int EXIT_SCHEMA_MISMATCH = 6;
constexpr int EXIT_RESUME_MISMATCH = 7;
constexpr int EXIT_CANCELLED = 8;
constexpr int EXIT_FAILURE_CODE = 9;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

struct CliOptions {
  std::string configPath = ForkDefaults::DEFAULT_CONFIG_FILE;
  bool configExplicit = false;
  std::string jobId;
  bool resume = false;
  bool dryRun = false;
  bool quiet = false;
  std::optional<OutputFormat> outputFormat;
  std::string logLevel;
  bool listJobs = false;
  std::optional<long long> cleanupHours;
  std::string cleanupPattern;
  std::optional<long long> olderThanHours;
  std::vector<std::string> exclude;
  bool force = false;
  bool validate = false;
};

bool parseHours(const char *value, const char *flag,
                std::optional<long long> &hours) {
  char *end = nullptr;
  long long parsed = std::strtoll(value, &end, 10);
  if (!end || *end != '\0' || parsed < 0) {
    std::cerr << "Invalid " << flag << " value: " << value << "\n";
    return false;
  }
  hours = parsed;
  return true;
}

void printUsage(const char *program) {
  std::cout
      << "Usage: " << program << " [options]\n"
      << "  -c, --config FILE           configuration file (default "
      << ForkDefaults::DEFAULT_CONFIG_FILE << ")\n"
      << "  -j, --job-id ID             job identifier\n"
      << "  -r, --resume                resume the job given by --job-id\n"
      << "  -n, --dry-run               plan only, write nothing\n"
      << "  -q, --quiet                 only print the result\n"
      << "  -o, --output-format FORMAT  text or json\n"
      << "  -l, --log-level LEVEL       DEBUG, INFO, WARNING, ERROR\n"
      << "      --list-jobs             list stored jobs and exit\n"
      << "      --cleanup-jobs HOURS    remove finished jobs older than HOURS\n"
      << "      --cleanup-databases PATTERN\n"
      << "                              drop destination databases matching "
         "PATTERN\n"
      << "      --older-than HOURS      only drop databases older than HOURS\n"
      << "      --exclude NAMES         comma separated databases to keep\n"
      << "      --force                 drop matches regardless of age\n"
      << "      --validate              check configuration, connectivity and "
         "permissions\n"
      << "  -h, --help                  show this help\n";
}

// Returns the exit code to stop with, or nothing to continue.
std::optional<int> parseArguments(int argc, char *argv[], CliOptions &opts) {
  enum {
    OPT_LIST_JOBS = 1000,
    OPT_CLEANUP_JOBS,
    OPT_CLEANUP_DATABASES,
    OPT_OLDER_THAN,
    OPT_EXCLUDE,
    OPT_FORCE,
    OPT_VALIDATE
  };
  static struct option longOpts[] = {
      {"config", required_argument, nullptr, 'c'},
      {"job-id", required_argument, nullptr, 'j'},
      {"resume", no_argument, nullptr, 'r'},
      {"dry-run", no_argument, nullptr, 'n'},
      {"quiet", no_argument, nullptr, 'q'},
      {"output-format", required_argument, nullptr, 'o'},
      {"log-level", required_argument, nullptr, 'l'},
      {"list-jobs", no_argument, nullptr, OPT_LIST_JOBS},
      {"cleanup-jobs", required_argument, nullptr, OPT_CLEANUP_JOBS},
      {"cleanup-databases", required_argument, nullptr, OPT_CLEANUP_DATABASES},
      {"older-than", required_argument, nullptr, OPT_OLDER_THAN},
      {"exclude", required_argument, nullptr, OPT_EXCLUDE},
      {"force", no_argument, nullptr, OPT_FORCE},
      {"validate", no_argument, nullptr, OPT_VALIDATE},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  int opt;
  while ((opt = getopt_long(argc, argv, "c:j:rnqo:l:h", longOpts, nullptr)) !=
         -1) {
    switch (opt) {
    case 'c':
      opts.configPath = optarg;
      opts.configExplicit = true;
      break;
    case 'j':
      opts.jobId = optarg;
      break;
    case 'r':
      opts.resume = true;
      break;
    case 'n':
      opts.dryRun = true;
      break;
    case 'q':
      opts.quiet = true;
      break;
    case 'o': {
      OutputFormat format;
      if (!parseOutputFormat(optarg, format)) {
        std::cerr << "Invalid output format: " << optarg << "\n";
        return EXIT_CONFIG_ERROR;
      }
      opts.outputFormat = format;
      break;
    }
    case 'l':
      opts.logLevel = optarg;
      break;
    case OPT_LIST_JOBS:
      opts.listJobs = true;
      break;
    case OPT_CLEANUP_JOBS:
      if (!parseHours(optarg, "--cleanup-jobs", opts.cleanupHours))
        return EXIT_CONFIG_ERROR;
      break;
    case OPT_CLEANUP_DATABASES:
      opts.cleanupPattern = optarg;
      break;
    case OPT_OLDER_THAN:
      if (!parseHours(optarg, "--older-than", opts.olderThanHours))
        return EXIT_CONFIG_ERROR;
      break;
    case OPT_EXCLUDE:
      for (auto &name : StringUtils::splitList(optarg))
        opts.exclude.push_back(name);
      break;
    case OPT_FORCE:
      opts.force = true;
      break;
    case OPT_VALIDATE:
      opts.validate = true;
      break;
    case 'h':
      printUsage(argv[0]);
      return EXIT_SUCCESS_CODE;
    default:
      printUsage(argv[0]);
      return EXIT_CONFIG_ERROR;
    }
  }

  if (optind < argc) {
    std::cerr << "Unexpected argument: " << argv[optind] << "\n";
    return EXIT_CONFIG_ERROR;
  }
  return std::nullopt;
}

int exitCodeFor(const ForkResult &result) {
  if (result.success)
    return EXIT_SUCCESS_CODE;
  switch (result.errorKind) {
  case ErrorKind::VALIDATION:
  case ErrorKind::TEMPLATE:
    return EXIT_CONFIG_ERROR;
  case ErrorKind::PLANNING:
    return EXIT_PLANNING_ERROR;
  case ErrorKind::PERMISSION:
    return EXIT_PERMISSION_ERROR;
  case ErrorKind::CONNECTION:
  case ErrorKind::TIMEOUT:
  case ErrorKind::EXHAUSTED_RETRIES:
    return EXIT_CONNECTION_ERROR;
  case ErrorKind::SCHEMA_MISMATCH:
    return EXIT_SCHEMA_MISMATCH;
  case ErrorKind::RESUME_MISMATCH:
    return EXIT_RESUME_MISMATCH;
  case ErrorKind::CANCELLED:
    return EXIT_CANCELLED;
  default:
    return EXIT_FAILURE_CODE;
  }
}

void printResult(const ForkResult &result, OutputFormat format) {
  if (format == OutputFormat::JSON) {
    std::cout << result.toJson().dump(2) << std::endl;
    return;
  }

  if (result.success) {
    std::cout << (result.dryRun ? "Dry run completed" : "Fork completed")
              << ": " << result.targetDatabase << "\n"
              << "  strategy:    " << strategyToString(result.strategy) << "\n"
              << "  job:         " << result.jobId << "\n"
              << "  tables:      " << result.tablesCompleted << "/"
              << result.tablesTotal << "\n"
              << "  rows:        " << result.rowsTransferred << "\n"
              << "  duration:    " << TimeUtils::formatDuration(result.duration)
              << "\n";
    if (result.dryRun) {
      for (const auto &task : result.plan.tables) {
        std::cout << "  table " << task.name << " (~"
                  << (task.estimatedRows < 0
                          ? std::string("unknown")
                          : std::to_string(task.estimatedRows))
                  << " rows)\n";
      }
      for (const auto &statement : result.plan.statements)
        std::cout << "  " << statement.id << "\n";
    }
    return;
  }

  std::cout << "Fork failed: " << result.errorMessage << "\n"
            << "  kind:        " << errorKindToString(result.errorKind) << "\n";
  if (!result.failedTable.empty())
    std::cout << "  table:       " << result.failedTable << "\n";
  if (!result.jobId.empty())
    std::cout << "  job:         " << result.jobId << "\n";
  std::cout << "  tables:      " << result.tablesCompleted << "/"
            << result.tablesTotal << " completed\n";
}

void printJobs(const std::vector<ForkJob> &jobs) {
  if (jobs.empty()) {
    std::cout << "No stored fork jobs\n";
    return;
  }
  for (const auto &job : jobs) {
    std::cout << job.id << "  " << phaseToString(job.phase) << "  "
              << job.spec.source.database << " -> " << job.spec.targetDatabase
              << "  " << job.countTasks(TableTaskStatus::COMPLETED) << "/"
              << job.plan.tables.size() << " tables  updated "
              << TimeUtils::toIso8601(job.updatedAt);
    if (!job.lastError.empty())
      std::cout << "  error: " << job.lastError;
    std::cout << "\n";
  }
}

void printCleanup(const CleanupReport &report, OutputFormat format) {
  if (format == OutputFormat::JSON) {
    std::cout << report.toJson().dump(2) << std::endl;
    return;
  }
  const char *verb = report.dryRun ? "Would drop" : "Dropped";
  for (const auto &name : report.deleted)
    std::cout << verb << " " << name << "\n";
  for (const auto &name : report.skipped)
    std::cout << "Kept " << name << "\n";
  for (const auto &name : report.failed)
    std::cout << "Failed to drop " << name << "\n";
  std::cout << report.deleted.size() << " "
            << (report.dryRun ? "would be dropped" : "dropped") << ", "
            << report.skipped.size() << " kept, " << report.failed.size()
            << " failed in " << TimeUtils::formatDuration(report.duration)
            << "\n";
}

void printPreflight(const PreflightReport &report, OutputFormat format) {
  if (format == OutputFormat::JSON) {
    std::cout << report.toJson().dump(2) << std::endl;
    return;
  }
  for (const auto &check : report.checks) {
    std::cout << "[" << StringUtils::toUpper(checkStatusToString(check.status))
              << "] " << check.name << ": " << check.message << "\n";
  }
  std::cout << (report.passed() ? "Validation passed" : "Validation failed")
            << "\n";
}
} // namespace

int main(int argc, char *argv[]) {
  CliOptions opts;
  if (std::optional<int> exitCode = parseArguments(argc, argv, opts))
    return *exitCode;

  std::shared_ptr<Logger> logger = Logger::createConsoleLogger(
      opts.quiet ? LogLevel::ERROR : LogLevel::INFO);

  try {
    ForkConfigLoader loader(logger);
    ForkConfig config = loader.load(opts.configPath, opts.configExplicit);

    if (!opts.jobId.empty())
      config.spec.jobId = opts.jobId;
    if (opts.resume)
      config.spec.resume = true;
    if (opts.dryRun)
      config.spec.dryRun = true;
    if (opts.outputFormat)
      config.outputFormat = *opts.outputFormat;
    if (!opts.logLevel.empty())
      config.logLevel = opts.logLevel;

    if (!opts.quiet && !logger->setLogLevel(config.logLevel)) {
      std::cerr << "Invalid log level: " << config.logLevel << "\n";
      return EXIT_CONFIG_ERROR;
    }
    if (!config.logFile.empty())
      logger->addWriter(std::make_shared<FileLogWriter>(config.logFile));

    if (opts.listJobs || opts.cleanupHours) {
      JobStateStore store(config.spec.stateDir, logger);
      if (opts.cleanupHours) {
        size_t removed =
            store.cleanupOldJobs(std::chrono::hours(*opts.cleanupHours));
        std::cout << "Removed " << removed << " finished jobs from "
                  << store.stateDir() << "\n";
      }
      if (opts.listJobs)
        printJobs(store.listJobs());
      logger->shutdown();
      return EXIT_SUCCESS_CODE;
    }

    if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
        std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register signal handlers" << std::endl;
      return EXIT_FAILURE_CODE;
    }

    auto driver = std::make_shared<PostgresDriver>(logger);
    CancellationToken token;

    if (!opts.cleanupPattern.empty()) {
      CleanupOptions cleanup;
      cleanup.pattern = opts.cleanupPattern;
      if (opts.olderThanHours)
        cleanup.olderThan = std::chrono::hours(*opts.olderThanHours);
      cleanup.exclude = opts.exclude;
      cleanup.force = opts.force;
      cleanup.dryRun = opts.dryRun;

      CleanupReport report;
      {
        ShutdownWatcher watcher(g_shutdownRequested, token, logger);
        RetryPolicy retry(config.spec.retry, logger);
        DatabaseCleaner cleaner(driver, config.spec.destination, retry, logger);
        report = cleaner.cleanup(cleanup, token);
      }
      printCleanup(report, config.outputFormat);
      logger->shutdown();
      return report.success() ? EXIT_SUCCESS_CODE : EXIT_PERMISSION_ERROR;
    }

    if (opts.validate) {
      PreflightReport report;
      {
        ShutdownWatcher watcher(g_shutdownRequested, token, logger);
        ForkPreflight preflight(driver, logger);
        report = preflight.run(config.spec, token);
      }
      printPreflight(report, config.outputFormat);
      logger->shutdown();
      return report.passed() ? EXIT_SUCCESS_CODE : EXIT_PLANNING_ERROR;
    }

    logger->info(LogCategory::SYSTEM, "main",
                 "pgfork starting: " + config.spec.source.describe() + " -> " +
                     config.spec.targetDatabase + " on " +
                     config.spec.destination.host);

    ForkResult result;
    {
      ShutdownWatcher watcher(g_shutdownRequested, token, logger);
      ForkOrchestrator orchestrator(driver, logger);
      result = orchestrator.fork(token, config.spec);
    }

    printResult(result, config.outputFormat);
    logger->shutdown();
    return exitCodeFor(result);
  } catch (const ForkError &e) {
    std::cerr << errorKindToString(e.kind()) << " error: " << e.what()
              << std::endl;
    logger->shutdown();
    switch (e.kind()) {
    case ErrorKind::VALIDATION:
    case ErrorKind::TEMPLATE:
      return EXIT_CONFIG_ERROR;
    case ErrorKind::PERMISSION:
      return EXIT_PERMISSION_ERROR;
    case ErrorKind::CONNECTION:
    case ErrorKind::TIMEOUT:
    case ErrorKind::EXHAUSTED_RETRIES:
      return EXIT_CONNECTION_ERROR;
    case ErrorKind::CANCELLED:
      return EXIT_CANCELLED;
    default:
      return EXIT_FAILURE_CODE;
    }
  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    logger->shutdown();
    return EXIT_FAILURE_CODE;
  }
}
