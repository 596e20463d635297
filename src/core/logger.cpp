#include "core/logger.h"
#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include "core/migration_defaults.h"
#include "utils/string_utils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unordered_map>

std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::writersMutex_;

LogLevel Logger::currentLogLevel_ = LogLevel::INFO;
std::mutex Logger::levelMutex_;

namespace {
const std::unordered_map<std::string, LogLevel> LEVEL_NAMES = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;

  struct tm local;
  localtime_r(&seconds, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << millis.count();
  return oss.str();
}
} // namespace

std::string logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string logCategoryName(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::VALIDATION:
    return "VALIDATION";
  case LogCategory::SCRIPTING:
    return "SCRIPTING";
  case LogCategory::UNKNOWN:
    break;
  }
  return "UNKNOWN";
}

std::string formatLogLine(const LogEntry &entry) {
  std::string line = "[" + entry.timestamp + "] [" + logLevelName(entry.level) +
                     "] [" + logCategoryName(entry.category) + "]";
  if (!entry.component.empty())
    line += " [" + entry.component + "]";
  return line + " " + entry.message;
}

void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &component,
                      const std::string &message) {
  if (!isEnabled(level))
    return;

  LogEntry entry{currentTimestamp(), level, category, component, message};

  std::lock_guard<std::mutex> lock(writersMutex_);
  for (auto &writer : writers_) {
    if (writer->isOpen())
      writer->write(entry);
  }
}

// Installs the sinks named by the settings, replacing any present: the
// console unless disabled, a rotating file when a path is given, PostgreSQL
// when a connection string is given. A sink that cannot be opened is
// reported on stderr and left out; the run goes on without it.
void Logger::initialize(const LogSettings &settings) {
  setLogLevel(settings.level);

  std::vector<std::unique_ptr<ILogWriter>> writers;
  if (settings.console) {
    writers.push_back(std::make_unique<ConsoleLogWriter>(std::cerr));
  }

  if (!settings.file.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(settings.file);
    if (fileWriter->isOpen()) {
      writers.push_back(std::move(fileWriter));
    } else {
      std::cerr << "Warning: Could not open log file '" << settings.file
                << "'. File logging disabled." << std::endl;
    }
  }

  if (!settings.postgresConnection.empty()) {
    auto dbWriter = std::make_unique<DatabaseLogWriter>(
        settings.postgresConnection, settings.postgresTable.empty()
                                         ? MigrationDefaults::DEFAULT_LOG_TABLE
                                         : settings.postgresTable);
    if (dbWriter->isOpen()) {
      writers.push_back(std::move(dbWriter));
    } else {
      std::cerr << "Warning: Could not reach the log database. Database "
                   "logging disabled."
                << std::endl;
    }
  }

  std::lock_guard<std::mutex> lock(writersMutex_);
  writers_ = std::move(writers);
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(writersMutex_);
  for (auto &writer : writers_) {
    writer->close();
  }
  writers_.clear();
}

void Logger::addWriter(std::unique_ptr<ILogWriter> writer) {
  std::lock_guard<std::mutex> lock(writersMutex_);
  writers_.push_back(std::move(writer));
}

void Logger::clearWriters() {
  std::lock_guard<std::mutex> lock(writersMutex_);
  writers_.clear();
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(levelMutex_);
  currentLogLevel_ = level;
}

void Logger::setLogLevel(const std::string &levelStr) {
  auto it = LEVEL_NAMES.find(StringUtils::toUpper(StringUtils::trim(levelStr)));
  if (it != LEVEL_NAMES.end())
    setLogLevel(it->second);
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(levelMutex_);
  return currentLogLevel_;
}
