#include "core/database_log_writer.h"
#include "utils/string_utils.h"
#include <iostream>

namespace {
constexpr size_t MAX_COMPONENT_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;
constexpr const char *INSERT_STATEMENT = "migration_log_insert";
} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString,
                                     const std::string &tableName)
    : tableName_(tableName) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString);
    conn_->prepare(INSERT_STATEMENT,
                   "INSERT INTO " + tableName_ +
                       " (ts, level, category, component, message) "
                       "VALUES ($1::timestamp, $2, $3, $4, $5)");
  } catch (const std::exception &e) {
    conn_.reset();
    std::cerr << "DatabaseLogWriter: " << tableName_
              << " unavailable: " << e.what() << std::endl;
  }
}

// Called with mutex_ held.
void DatabaseLogWriter::disconnect(const std::string &why) {
  conn_.reset();
  std::cerr << "DatabaseLogWriter: logging to " << tableName_
            << " stopped: " << why << std::endl;
}

bool DatabaseLogWriter::write(const LogEntry &entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!conn_)
    return false;

  std::string component = StringUtils::sanitizeUTF8(entry.component);
  if (component.length() > MAX_COMPONENT_LENGTH)
    component.resize(MAX_COMPONENT_LENGTH);
  std::string message = StringUtils::sanitizeUTF8(entry.message);
  if (message.length() > MAX_MESSAGE_LENGTH)
    message.resize(MAX_MESSAGE_LENGTH);

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared(INSERT_STATEMENT, entry.timestamp,
                      logLevelName(entry.level),
                      logCategoryName(entry.category), component, message);
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    disconnect(e.what());
  } catch (const pqxx::sql_error &e) {
    // A rejected row (bad table, constraint) loses this entry only.
    std::cerr << "DatabaseLogWriter: insert failed: " << e.what() << std::endl;
  } catch (const std::exception &e) {
    disconnect(e.what());
  }
  return false;
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open();
}
