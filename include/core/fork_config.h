#ifndef FORK_CONFIG_H
#define FORK_CONFIG_H

#include "core/logger.h"
#include "fork/ForkSpec.h"
#include "utils/name_template.h"
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>

enum class OutputFormat { TEXT, JSON };

bool parseOutputFormat(const std::string &value, OutputFormat &out);

// Everything the command line needs: the fork itself plus how to report it.
struct ForkConfig {
  ForkSpec spec;
  std::string logLevel = "INFO";
  std::string logFile;
  OutputFormat outputFormat = OutputFormat::TEXT;
  TemplateVars templateVars;
};

// Builds a ForkConfig from a JSON file and PGFORK_* environment variables,
// in that order of precedence (environment wins). Malformed input is
// reported as a ValidationError naming the offending field; range checks are
// left to ForkSpec::validate().
class ForkConfigLoader {
private:
  std::shared_ptr<Logger> logger_;

  void applyConnection(const nlohmann::json &node, const std::string &field,
                       ConnectionConfig &config) const;
  void applyConnectionEnvironment(const std::string &prefix,
                                  const std::string &field,
                                  ConnectionConfig &config) const;

public:
  explicit ForkConfigLoader(std::shared_ptr<Logger> logger);

  // Port 0 and an empty sslmode mark endpoint fields nobody set yet, so
  // finalize() can tell inherited values from explicit ones.
  static ForkConfig emptyConfig();

  // A missing file is an error only when the path was given explicitly;
  // the default path may be absent and everything comes from the
  // environment.
  ForkConfig load(const std::string &configPath, bool pathExplicit) const;

  void applyJson(const nlohmann::json &document, ForkConfig &config) const;
  void applyEnvironment(ForkConfig &config) const;

  // Destination fields left empty take the source's values, the default port
  // and sslmode fill the gaps, and the target name template is resolved.
  void finalize(ForkConfig &config) const;
};

#endif
