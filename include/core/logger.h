#ifndef LOGGER_H
#define LOGGER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct LogSettings {
  std::string level = "INFO";
  std::string file;
  std::string postgresConnection;
  std::string postgresTable;
  bool console = true;
};

// Process-wide logger. Entries below the current level are dropped, the rest
// go to every installed writer. With no writers installed (the state before
// initialize() and after shutdown()) logging is silent.
class Logger {
private:
  static std::vector<std::unique_ptr<ILogWriter>> writers_;
  static std::mutex writersMutex_;

  static LogLevel currentLogLevel_;
  static std::mutex levelMutex_;

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &component,
                       const std::string &message);

public:
  static void initialize(const LogSettings &settings);
  static void shutdown();

  static void addWriter(std::unique_ptr<ILogWriter> writer);
  static void clearWriters();

  static void debug(LogCategory category, const std::string &component,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, component, message);
  }

  static void info(LogCategory category, const std::string &component,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, component, message);
  }

  static void warning(LogCategory category, const std::string &component,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, component, message);
  }

  static void error(LogCategory category, const std::string &component,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, component, message);
  }

  static void critical(LogCategory category, const std::string &component,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, component, message);
  }

  static void setLogLevel(LogLevel level);
  // DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case. Anything
  // else leaves the level unchanged.
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
  static bool isEnabled(LogLevel level) {
    return level >= getCurrentLogLevel();
  }
};

#endif
