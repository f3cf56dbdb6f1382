#include "core/console_log_writer.h"
#include <iostream>

ConsoleLogWriter::ConsoleLogWriter() : out_(std::cerr) {}

ConsoleLogWriter::ConsoleLogWriter(std::ostream &out) : out_(out) {}

bool ConsoleLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_)
    return false;
  out_ << formattedMessage << '\n';
  return out_.good();
}

void ConsoleLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

void ConsoleLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_) {
    out_.flush();
    open_ = false;
  }
}
