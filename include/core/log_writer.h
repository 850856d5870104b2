#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <atomic>
#include <mutex>
#include <string>

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &formattedMessage) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

// Writes formatted lines to stderr so stdout stays free for the fork result.
class ConsoleLogWriter : public ILogWriter {
private:
  std::mutex mutex_;
  std::atomic<bool> open_{true};

public:
  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
};

#endif
