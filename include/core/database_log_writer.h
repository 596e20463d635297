#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Inserts log entries into a PostgreSQL table so runs against many instances
// can be inspected in one place. Expected columns:
// (ts timestamp, level text, category text, component text, message text).
// The writer turns itself off on the first broken connection.
class DatabaseLogWriter : public ILogWriter {
  std::unique_ptr<pqxx::connection> conn_;
  std::string tableName_;
  mutable std::mutex mutex_;

  void disconnect(const std::string &why);

public:
  DatabaseLogWriter(const std::string &connectionString,
                    const std::string &tableName);
  ~DatabaseLogWriter() override { close(); }

  bool write(const LogEntry &entry) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;
};

#endif
