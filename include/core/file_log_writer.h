#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/fork_defaults.h"
#include "core/log_writer.h"
#include <fstream>
#include <mutex>
#include <string>

// Appends log lines to the file named by the log_file setting. Once the file
// reaches maxBytes it is renamed to <file>.1, older backups shift up by one
// and anything past maxBackups is deleted. Throws ValidationError (field
// log_file) when the file cannot be opened.
class FileLogWriter : public ILogWriter {
private:
  std::string path_;
  size_t maxBytes_;
  int maxBackups_;

  std::mutex mutex_;
  std::ofstream file_;
  size_t bytesWritten_ = 0;
  size_t rotations_ = 0;

  void openLocked();
  void rotateLocked();
  std::string backupPath(int index) const;

public:
  explicit FileLogWriter(const std::string &path,
                         size_t maxBytes = ForkDefaults::LOG_FILE_MAX_BYTES,
                         int maxBackups = ForkDefaults::LOG_FILE_BACKUPS);
  ~FileLogWriter() override { close(); }

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;

  const std::string &path() const { return path_; }
  size_t rotations();
};

#endif
