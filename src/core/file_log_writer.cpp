#include "core/file_log_writer.h"
#include <filesystem>

namespace fs = std::filesystem;

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles) {
  open();
}

void FileLogWriter::open() {
  file_.open(fileName_, std::ios::app);
  std::error_code ec;
  auto size = fs::file_size(fileName_, ec);
  bytesWritten_ = ec ? 0 : static_cast<size_t>(size);
}

bool FileLogWriter::write(const LogEntry &entry) {
  const std::string line = formatLogLine(entry) + "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  // A single oversized line still goes into an empty file.
  if (bytesWritten_ > 0 && bytesWritten_ + line.size() > maxFileSize_) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << line;
  file_.flush();
  bytesWritten_ += line.size();
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.close();
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotate() {
  std::lock_guard<std::mutex> lock(mutex_);
  rotateUnlocked();
}

// Rename failures (permissions, a backup removed underneath us) are ignored;
// logging continues in whatever file can be opened afterwards.
void FileLogWriter::rotateUnlocked() {
  if (file_.is_open())
    file_.close();

  std::error_code ec;
  if (maxBackupFiles_ > 0) {
    fs::remove(fileName_ + "." + std::to_string(maxBackupFiles_), ec);
    for (int i = maxBackupFiles_ - 1; i >= 1; --i) {
      fs::rename(fileName_ + "." + std::to_string(i),
                 fileName_ + "." + std::to_string(i + 1), ec);
    }
    fs::rename(fileName_, fileName_ + ".1", ec);
  } else {
    fs::remove(fileName_, ec);
  }

  open();
}
