#include "core/log_writer.h"
#include <iostream>

bool ConsoleLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_)
    return false;
  std::cerr << formattedMessage << '\n';
  return std::cerr.good();
}

void ConsoleLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

void ConsoleLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_) {
    std::cerr.flush();
    open_ = false;
  }
}

bool ConsoleLogWriter::isOpen() const { return open_; }
