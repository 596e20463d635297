#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include "core/migration_defaults.h"
#include <fstream>
#include <mutex>
#include <string>

// Appends formatted lines to a file. When the next line would push the file
// past maxFileSize it is renamed to <file>.1 (older backups shift up to
// <file>.<maxBackupFiles>, the oldest is dropped) and a new file is started.
class FileLogWriter : public ILogWriter {
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  size_t bytesWritten_ = 0;
  mutable std::mutex mutex_;

  void open();
  void rotateUnlocked();

public:
  explicit FileLogWriter(
      const std::string &fileName,
      size_t maxFileSize = MigrationDefaults::LOG_FILE_MAX_SIZE,
      int maxBackupFiles = MigrationDefaults::LOG_FILE_MAX_BACKUPS);
  ~FileLogWriter() override { close(); }

  bool write(const LogEntry &entry) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;
  void rotate();
};

#endif
