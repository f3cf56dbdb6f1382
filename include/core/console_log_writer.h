#ifndef CONSOLE_LOG_WRITER_H
#define CONSOLE_LOG_WRITER_H

#include "core/log_writer.h"
#include <mutex>
#include <ostream>

// Writes formatted log lines to a stream, stderr by default so that stdout
// stays free for command output.
class ConsoleLogWriter : public ILogWriter {
private:
  std::ostream &out_;
  std::mutex mutex_;
  bool open_ = true;

public:
  ConsoleLogWriter();
  explicit ConsoleLogWriter(std::ostream &out);

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override { return open_; }
};

#endif
