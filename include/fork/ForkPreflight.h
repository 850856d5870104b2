#ifndef FORK_PREFLIGHT_H
#define FORK_PREFLIGHT_H

#include "core/cancellation.h"
#include "core/logger.h"
#include "engines/database_session.h"
#include "fork/ForkSpec.h"
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

enum class CheckStatus { PASS, WARN, FAIL };

std::string checkStatusToString(CheckStatus status);

struct PreflightCheck {
  std::string name;
  CheckStatus status = CheckStatus::PASS;
  std::string message;
};

struct PreflightReport {
  std::vector<PreflightCheck> checks;

  // Warnings do not fail the report.
  bool passed() const;
  const PreflightCheck *find(const std::string &name) const;
  nlohmann::json toJson() const;
};

// Answers "would this fork start?" without writing anything: configuration,
// connectivity to both servers, read access on the source, the state of the
// target database and the right to create it.
class ForkPreflight {
  std::shared_ptr<IDatabaseDriver> driver_;
  std::shared_ptr<Logger> logger_;

public:
  ForkPreflight(std::shared_ptr<IDatabaseDriver> driver,
                std::shared_ptr<Logger> logger);

  // Failed checks are reported, not thrown. Only cancellation escapes.
  PreflightReport run(const ForkSpec &spec, const CancellationToken &token);
};

#endif
