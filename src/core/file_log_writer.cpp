#include "core/file_log_writer.h"
#include "core/fork_errors.h"
#include <algorithm>
#include <filesystem>

FileLogWriter::FileLogWriter(const std::string &path, size_t maxBytes,
                             int maxBackups)
    : path_(path), maxBytes_(maxBytes), maxBackups_(std::max(0, maxBackups)) {
  std::lock_guard<std::mutex> lock(mutex_);
  openLocked();
  if (!file_.is_open()) {
    throw ValidationError(std::vector<FieldViolation>{
        {"log_file", "cannot open " + path_ + " for appending"}});
  }
}

std::string FileLogWriter::backupPath(int index) const {
  return path_ + "." + std::to_string(index);
}

// Picks up the size of a file left by an earlier run so a restarted fork
// keeps rotating at the same threshold.
void FileLogWriter::openLocked() {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty())
    std::filesystem::create_directories(parent, ec);

  file_.open(path_, std::ios::app);
  auto existing = std::filesystem::file_size(path_, ec);
  bytesWritten_ = ec ? 0 : static_cast<size_t>(existing);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  if (bytesWritten_ > 0 && bytesWritten_ + formattedMessage.size() + 1 > maxBytes_) {
    rotateLocked();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  bytesWritten_ += formattedMessage.size() + 1;
  return file_.good();
}

// A rename that fails keeps the current file; losing a backup is preferred
// over losing lines.
void FileLogWriter::rotateLocked() {
  file_.close();

  std::error_code ec;
  if (maxBackups_ == 0) {
    std::filesystem::remove(path_, ec);
  } else {
    std::filesystem::remove(backupPath(maxBackups_), ec);
    for (int i = maxBackups_ - 1; i > 0; --i) {
      if (std::filesystem::exists(backupPath(i), ec))
        std::filesystem::rename(backupPath(i), backupPath(i + 1), ec);
    }
    std::filesystem::rename(path_, backupPath(1), ec);
  }
  ++rotations_;
  openLocked();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const { return file_.is_open(); }

size_t FileLogWriter::rotations() {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotations_;
}
