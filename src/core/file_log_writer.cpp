#include "core/file_log_writer.h"

// Opens the log file in append mode. The size already on disk counts towards
// the rotation threshold so a restarted process keeps rotating at the same
// boundary. A file that cannot be opened leaves the writer closed and every
// write() returns false.
FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  std::error_code ec;
  auto existing = std::filesystem::file_size(fileName_, ec);
  if (!ec)
    bytesWritten_ = static_cast<size_t>(existing);
  file_.open(fileName_, std::ios::app);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  if (maxFileSize_ > 0 && bytesWritten_ + formattedMessage.size() + 1 >
                              maxFileSize_) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  bytesWritten_ += formattedMessage.size() + 1;
  return file_.good();
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

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Shifts app.log.N-1 -> app.log.N down to app.log -> app.log.1, dropping the
// oldest backup, then reopens an empty file. Filesystem errors are reported
// through error_code so a failed rename never throws out of a log call.
void FileLogWriter::rotateUnlocked() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }

  std::error_code ec;
  if (maxBackupFiles_ > 0) {
    std::string oldest = fileName_ + "." + std::to_string(maxBackupFiles_);
    std::filesystem::remove(oldest, ec);

    for (int i = maxBackupFiles_ - 1; i > 0; --i) {
      std::string oldFile = fileName_ + "." + std::to_string(i);
      std::string newFile = fileName_ + "." + std::to_string(i + 1);
      if (std::filesystem::exists(oldFile, ec))
        std::filesystem::rename(oldFile, newFile, ec);
    }

    if (std::filesystem::exists(fileName_, ec))
      std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  } else {
    std::filesystem::remove(fileName_, ec);
  }

  file_.open(fileName_, std::ios::app);
  bytesWritten_ = 0;
}
