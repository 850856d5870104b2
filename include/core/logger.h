#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  TRANSFER = 2,
  CONFIG = 3,
  VALIDATION = 4,
  PLANNING = 5,
  SCHEMA = 6,
  RETRY = 7,
  PROGRESS = 8,
  STATE = 9,
  UNKNOWN = 99
};

// Logger instances are passed explicitly to every component that logs. The
// process-wide default logger is created once on first use and only ever
// writes to stderr at INFO; it is never reconfigured by library code.
class Logger {
private:
  std::vector<std::shared_ptr<ILogWriter>> writers_;
  mutable std::mutex writersMutex_;

  LogLevel currentLogLevel_;
  mutable std::mutex configMutex_;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message);
  static std::string getCurrentTimestamp();

  void writeLog(LogLevel level, LogCategory category,
                const std::string &function, const std::string &message);

public:
  explicit Logger(LogLevel level = LogLevel::INFO);
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static std::shared_ptr<Logger> defaultLogger();
  static std::shared_ptr<Logger> createConsoleLogger(LogLevel level);

  void addWriter(std::shared_ptr<ILogWriter> writer);
  size_t writerCount() const;
  void flush();
  void shutdown();

  void debug(LogCategory category, const std::string &message) {
    writeLog(LogLevel::DEBUG, category, "", message);
  }

  void info(LogCategory category, const std::string &message) {
    writeLog(LogLevel::INFO, category, "", message);
  }

  void warning(LogCategory category, const std::string &message) {
    writeLog(LogLevel::WARNING, category, "", message);
  }

  void error(LogCategory category, const std::string &message) {
    writeLog(LogLevel::ERROR, category, "", message);
  }

  void critical(LogCategory category, const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, "", message);
  }

  void debug(LogCategory category, const std::string &function,
             const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  void info(LogCategory category, const std::string &function,
            const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  void warning(LogCategory category, const std::string &function,
               const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  void error(LogCategory category, const std::string &function,
             const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  void critical(LogCategory category, const std::string &function,
                const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  void log(LogLevel level, LogCategory category, const std::string &function,
           const std::string &message) {
    writeLog(level, category, function, message);
  }

  void setLogLevel(LogLevel level);
  bool setLogLevel(const std::string &levelStr);
  LogLevel getCurrentLogLevel() const;
  bool isEnabled(LogLevel level) const;

  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static LogCategory stringToCategory(const std::string &categoryStr);
  static bool parseLogLevel(const std::string &levelStr, LogLevel &out);
};

#endif
