#include "core/fork_config.h"
#include "utils/connection_utils.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>

extern char **environ;

using json = nlohmann::json;

namespace {

constexpr const char *ENV_PREFIX = "PGFORK_";
constexpr const char *ENV_VAR_PREFIX = "PGFORK_VAR_";

std::string envValue(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  return (value && *value) ? value : "";
}

[[noreturn]] void invalidField(const std::string &field,
                               const std::string &message) {
  throw ValidationError({{field, message}});
}

long long parseInteger(const std::string &field, const std::string &value) {
  try {
    size_t consumed = 0;
    long long number = std::stoll(value, &consumed);
    if (consumed != value.size())
      invalidField(field, "not a number: " + value);
    return number;
  } catch (const std::invalid_argument &) {
    invalidField(field, "not a number: " + value);
  } catch (const std::out_of_range &) {
    invalidField(field, "out of range: " + value);
  }
}

bool parseFlag(const std::string &field, const std::string &value) {
  bool flag = false;
  if (!StringUtils::parseBool(value, flag))
    invalidField(field, "not a boolean: " + value);
  return flag;
}

// Negative counts become 0, which validation rejects, instead of wrapping
// around to a huge size_t.
size_t jsonCount(const json &node) {
  long long value = node.get<long long>();
  return value < 0 ? 0 : static_cast<size_t>(value);
}

} // namespace

bool parseOutputFormat(const std::string &value, OutputFormat &out) {
  std::string lowered = StringUtils::toLower(StringUtils::trim(value));
  if (lowered == "text") {
    out = OutputFormat::TEXT;
    return true;
  }
  if (lowered == "json") {
    out = OutputFormat::JSON;
    return true;
  }
  return false;
}

ForkConfigLoader::ForkConfigLoader(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

ForkConfig ForkConfigLoader::emptyConfig() {
  ForkConfig config;
  config.spec.source.port = 0;
  config.spec.source.sslmode.clear();
  config.spec.destination.port = 0;
  config.spec.destination.sslmode.clear();
  return config;
}

// Loads the JSON file (if any), then the environment, then derives the
// remaining values. A file that exists but cannot be parsed is always an
// error; silently falling back would fork with the wrong settings.
ForkConfig ForkConfigLoader::load(const std::string &configPath,
                                  bool pathExplicit) const {
  ForkConfig config = emptyConfig();

  std::ifstream configFile(configPath);
  if (configFile.is_open()) {
    json document;
    try {
      configFile >> document;
    } catch (const json::exception &e) {
      invalidField("config", "cannot parse " + configPath + ": " + e.what());
    }
    applyJson(document, config);
    logger_->debug(LogCategory::CONFIG, "load",
                   "Loaded configuration from " + configPath);
  } else if (pathExplicit) {
    invalidField("config", "cannot open configuration file " + configPath);
  } else {
    logger_->debug(LogCategory::CONFIG, "load",
                   "No configuration file at " + configPath +
                       ", using environment variables");
  }

  applyEnvironment(config);
  finalize(config);
  return config;
}

// An endpoint is either a uri, individual fields, or both; explicit fields
// override what the uri says.
void ForkConfigLoader::applyConnection(const json &node,
                                       const std::string &field,
                                       ConnectionConfig &config) const {
  if (!node.is_object())
    invalidField(field, "must be an object");

  if (node.contains("uri")) {
    std::string uri = node.at("uri").get<std::string>();
    std::optional<ConnectionConfig> parsed = ConnectionUriParser::parse(uri);
    if (!parsed)
      invalidField(field + ".uri", "not a valid postgres:// URI");
    config = *parsed;
  }

  if (node.contains("host"))
    config.host = node.at("host").get<std::string>();
  if (node.contains("port")) {
    const json &port = node.at("port");
    config.port = port.is_string()
                      ? static_cast<int>(parseInteger(field + ".port",
                                                      port.get<std::string>()))
                      : port.get<int>();
  }
  if (node.contains("username"))
    config.username = node.at("username").get<std::string>();
  else if (node.contains("user"))
    config.username = node.at("user").get<std::string>();
  if (node.contains("password"))
    config.password = node.at("password").get<std::string>();
  if (node.contains("database"))
    config.database = node.at("database").get<std::string>();
  if (node.contains("sslmode"))
    config.sslmode = node.at("sslmode").get<std::string>();
}

void ForkConfigLoader::applyJson(const json &document,
                                 ForkConfig &config) const {
  if (!document.is_object())
    invalidField("config", "top level must be a JSON object");

  ForkSpec &spec = config.spec;
  try {
    if (document.contains("source"))
      applyConnection(document.at("source"), "source", spec.source);
    if (document.contains("destination"))
      applyConnection(document.at("destination"), "destination",
                      spec.destination);

    if (document.contains("target_database"))
      spec.targetDatabase = document.at("target_database").get<std::string>();
    spec.dropIfExists = document.value("drop_if_exists", spec.dropIfExists);
    if (document.contains("max_connections"))
      spec.maxConnections = jsonCount(document.at("max_connections"));
    if (document.contains("chunk_size"))
      spec.chunkSize = jsonCount(document.at("chunk_size"));
    if (document.contains("timeout_seconds")) {
      spec.timeout =
          std::chrono::seconds(document.at("timeout_seconds").get<long long>());
    }
    if (document.contains("include_tables")) {
      spec.includeTables =
          document.at("include_tables").get<std::vector<std::string>>();
    }
    if (document.contains("exclude_tables")) {
      spec.excludeTables =
          document.at("exclude_tables").get<std::vector<std::string>>();
    }
    spec.schemaOnly = document.value("schema_only", spec.schemaOnly);
    spec.dataOnly = document.value("data_only", spec.dataOnly);
    spec.dryRun = document.value("dry_run", spec.dryRun);
    spec.jobId = document.value("job_id", spec.jobId);
    spec.resume = document.value("resume", spec.resume);
    spec.stateDir = document.value("state_dir", spec.stateDir);
    spec.progressFile = document.value("progress_file", spec.progressFile);

    if (document.contains("retry")) {
      const json &retry = document.at("retry");
      spec.retry.maxAttempts =
          retry.value("max_attempts", spec.retry.maxAttempts);
      spec.retry.initialDelay = std::chrono::milliseconds(retry.value(
          "initial_delay_ms",
          static_cast<long long>(spec.retry.initialDelay.count())));
      spec.retry.maxDelay = std::chrono::milliseconds(retry.value(
          "max_delay_ms", static_cast<long long>(spec.retry.maxDelay.count())));
      spec.retry.backoffFactor =
          retry.value("backoff_factor", spec.retry.backoffFactor);
    }

    config.logLevel = document.value("log_level", config.logLevel);
    config.logFile = document.value("log_file", config.logFile);
    if (document.contains("output_format")) {
      std::string format = document.at("output_format").get<std::string>();
      if (!parseOutputFormat(format, config.outputFormat))
        invalidField("output_format", "must be text or json");
    }
    if (document.contains("template_vars")) {
      for (const auto &item : document.at("template_vars").items())
        config.templateVars[item.key()] = item.value().get<std::string>();
    }
  } catch (const json::exception &e) {
    invalidField("config", e.what());
  }
}

void ForkConfigLoader::applyConnectionEnvironment(
    const std::string &prefix, const std::string &field,
    ConnectionConfig &config) const {
  std::string uri = envValue(prefix + "URI");
  if (!uri.empty()) {
    std::optional<ConnectionConfig> parsed = ConnectionUriParser::parse(uri);
    if (!parsed)
      invalidField(field + ".uri", "not a valid postgres:// URI");
    config = *parsed;
  }

  std::string value;
  if (!(value = envValue(prefix + "HOST")).empty())
    config.host = value;
  if (!(value = envValue(prefix + "PORT")).empty())
    config.port = static_cast<int>(parseInteger(field + ".port", value));
  if (!(value = envValue(prefix + "USER")).empty())
    config.username = value;
  if (!(value = envValue(prefix + "PASSWORD")).empty())
    config.password = value;
  if (!(value = envValue(prefix + "DATABASE")).empty())
    config.database = value;
  if (!(value = envValue(prefix + "SSLMODE")).empty())
    config.sslmode = value;
}

void ForkConfigLoader::applyEnvironment(ForkConfig &config) const {
  ForkSpec &spec = config.spec;
  applyConnectionEnvironment("PGFORK_SOURCE_", "source", spec.source);
  applyConnectionEnvironment("PGFORK_DEST_", "destination", spec.destination);

  std::string value;
  if (!(value = envValue("PGFORK_TARGET_DATABASE")).empty())
    spec.targetDatabase = value;
  if (!(value = envValue("PGFORK_MAX_CONNECTIONS")).empty()) {
    long long number = parseInteger("max_connections", value);
    spec.maxConnections = number < 0 ? 0 : static_cast<size_t>(number);
  }
  if (!(value = envValue("PGFORK_CHUNK_SIZE")).empty()) {
    long long number = parseInteger("chunk_size", value);
    spec.chunkSize = number < 0 ? 0 : static_cast<size_t>(number);
  }
  if (!(value = envValue("PGFORK_TIMEOUT")).empty())
    spec.timeout = std::chrono::seconds(parseInteger("timeout_seconds", value));
  if (!(value = envValue("PGFORK_INCLUDE_TABLES")).empty())
    spec.includeTables = StringUtils::splitList(value, ',');
  if (!(value = envValue("PGFORK_EXCLUDE_TABLES")).empty())
    spec.excludeTables = StringUtils::splitList(value, ',');
  if (!(value = envValue("PGFORK_DROP_IF_EXISTS")).empty())
    spec.dropIfExists = parseFlag("drop_if_exists", value);
  if (!(value = envValue("PGFORK_SCHEMA_ONLY")).empty())
    spec.schemaOnly = parseFlag("schema_only", value);
  if (!(value = envValue("PGFORK_DATA_ONLY")).empty())
    spec.dataOnly = parseFlag("data_only", value);
  if (!(value = envValue("PGFORK_DRY_RUN")).empty())
    spec.dryRun = parseFlag("dry_run", value);
  if (!(value = envValue("PGFORK_RESUME")).empty())
    spec.resume = parseFlag("resume", value);
  if (!(value = envValue("PGFORK_JOB_ID")).empty())
    spec.jobId = value;
  if (!(value = envValue("PGFORK_STATE_DIR")).empty())
    spec.stateDir = value;
  if (!(value = envValue("PGFORK_PROGRESS_FILE")).empty())
    spec.progressFile = value;
  if (!(value = envValue("PGFORK_LOG_LEVEL")).empty())
    config.logLevel = value;
  if (!(value = envValue("PGFORK_LOG_FILE")).empty())
    config.logFile = value;
  if (!(value = envValue("PGFORK_OUTPUT_FORMAT")).empty()) {
    if (!parseOutputFormat(value, config.outputFormat))
      invalidField("output_format", "must be text or json");
  }

  size_t varPrefixLength = std::strlen(ENV_VAR_PREFIX);
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string pair(*entry);
    if (!StringUtils::startsWith(pair, ENV_VAR_PREFIX))
      continue;
    size_t equals = pair.find('=');
    if (equals == std::string::npos || equals <= varPrefixLength)
      continue;
    config.templateVars[pair.substr(varPrefixLength, equals - varPrefixLength)] =
        pair.substr(equals + 1);
  }
}

void ForkConfigLoader::finalize(ForkConfig &config) const {
  ConnectionConfig &source = config.spec.source;
  ConnectionConfig &destination = config.spec.destination;

  if (source.port == 0)
    source.port = ForkDefaults::DEFAULT_PORT;
  if (source.sslmode.empty())
    source.sslmode = ForkDefaults::DEFAULT_SSLMODE;

  if (destination.host.empty())
    destination.host = source.host;
  if (destination.port == 0)
    destination.port = source.port;
  if (destination.username.empty())
    destination.username = source.username;
  if (destination.password.empty())
    destination.password = source.password;
  if (destination.sslmode.empty())
    destination.sslmode = source.sslmode;
  if (destination.database.empty())
    destination.database = ForkDefaults::MAINTENANCE_DATABASE;

  TemplateVars vars = collectCiTemplateVars();
  for (const auto &entry : config.templateVars)
    vars[entry.first] = entry.second;

  std::string &target = config.spec.targetDatabase;
  if (hasTemplatePlaceholders(target)) {
    std::string pattern = target;
    target = resolveNameTemplate(pattern, vars);
    logger_->info(LogCategory::CONFIG, "finalize",
                  "Resolved target database name " + pattern + " -> " +
                      target);
  }

  if (config.spec.source.password.empty()) {
    logger_->warning(LogCategory::CONFIG, "finalize",
                     "No source password configured (" +
                         std::string(ENV_PREFIX) +
                         "SOURCE_PASSWORD); relying on .pgpass or trust "
                         "authentication");
  }
}
