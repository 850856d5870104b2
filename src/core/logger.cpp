#include "core/logger.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},     {"DATABASE", LogCategory::DATABASE},
    {"TRANSFER", LogCategory::TRANSFER}, {"CONFIG", LogCategory::CONFIG},
    {"VALIDATION", LogCategory::VALIDATION},
    {"PLANNING", LogCategory::PLANNING}, {"SCHEMA", LogCategory::SCHEMA},
    {"RETRY", LogCategory::RETRY},       {"PROGRESS", LogCategory::PROGRESS},
    {"STATE", LogCategory::STATE}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

Logger::Logger(LogLevel level) : currentLogLevel_(level) {}

Logger::~Logger() { shutdown(); }

// Returns the shared fallback logger used by callers that were not handed a
// logger of their own (mostly tests and tools). It is built exactly once and
// nothing in the library mutates it afterwards, so two forks running in the
// same process cannot change each other's log configuration through it.
std::shared_ptr<Logger> Logger::defaultLogger() {
  static const std::shared_ptr<Logger> instance =
      createConsoleLogger(LogLevel::INFO);
  return instance;
}

std::shared_ptr<Logger> Logger::createConsoleLogger(LogLevel level) {
  auto logger = std::make_shared<Logger>(level);
  logger->addWriter(std::make_shared<ConsoleLogWriter>());
  return logger;
}

void Logger::addWriter(std::shared_ptr<ILogWriter> writer) {
  if (!writer)
    return;
  std::lock_guard<std::mutex> lock(writersMutex_);
  writers_.push_back(std::move(writer));
}

size_t Logger::writerCount() const {
  std::lock_guard<std::mutex> lock(writersMutex_);
  return writers_.size();
}

void Logger::flush() {
  std::lock_guard<std::mutex> lock(writersMutex_);
  for (auto &writer : writers_) {
    if (writer->isOpen())
      writer->flush();
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(writersMutex_);
  for (auto &writer : writers_) {
    if (writer->isOpen())
      writer->flush();
  }
  writers_.clear();
}

std::string Logger::formatLogMessage(const std::string &timestamp,
                                     const std::string &levelStr,
                                     const std::string &categoryStr,
                                     const std::string &function,
                                     const std::string &message) {
  std::ostringstream oss;
  oss << "[" << timestamp << "] [" << levelStr << "] [" << categoryStr << "]";
  if (!function.empty()) {
    oss << " [" << function << "]";
  }
  oss << " " << message;
  return oss.str();
}

std::string Logger::getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  struct tm tm_buf;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  localtime_r(&time_t, &tm_buf);
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// Formats once and fans the line out to every open writer. A writer that
// fails to write is skipped; logging never throws into the caller.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  if (!isEnabled(level)) {
    return;
  }

  std::string line =
      formatLogMessage(getCurrentTimestamp(), getLevelString(level),
                       getCategoryString(category), function, message);

  std::lock_guard<std::mutex> lock(writersMutex_);
  for (auto &writer : writers_) {
    if (writer->isOpen()) {
      writer->write(line);
    }
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  currentLogLevel_ = level;
}

// Accepts "DEBUG", "INFO", "WARN"/"WARNING", "ERROR", "FATAL"/"CRITICAL" in
// any case. Unknown strings leave the level unchanged and return false.
bool Logger::setLogLevel(const std::string &levelStr) {
  LogLevel parsed;
  if (!parseLogLevel(levelStr, parsed)) {
    return false;
  }
  setLogLevel(parsed);
  return true;
}

LogLevel Logger::getCurrentLogLevel() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return currentLogLevel_;
}

bool Logger::isEnabled(LogLevel level) const {
  return level >= getCurrentLogLevel();
}

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCategoryString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::VALIDATION:
    return "VALIDATION";
  case LogCategory::PLANNING:
    return "PLANNING";
  case LogCategory::SCHEMA:
    return "SCHEMA";
  case LogCategory::RETRY:
    return "RETRY";
  case LogCategory::PROGRESS:
    return "PROGRESS";
  case LogCategory::STATE:
    return "STATE";
  default:
    return "UNKNOWN";
  }
}

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(categoryStr);
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}

bool Logger::parseLogLevel(const std::string &levelStr, LogLevel &out) {
  if (levelStr.empty()) {
    return false;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);

  auto it = levelMap.find(upperLevelStr);
  if (it == levelMap.end()) {
    return false;
  }
  out = it->second;
  return true;
}
