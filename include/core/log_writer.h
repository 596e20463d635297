#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  TRANSFER = 2,
  CONFIG = 3,
  VALIDATION = 4,
  SCRIPTING = 5,
  UNKNOWN = 99
};

std::string logLevelName(LogLevel level);
std::string logCategoryName(LogCategory category);

struct LogEntry {
  std::string timestamp; // local time, millisecond precision
  LogLevel level = LogLevel::INFO;
  LogCategory category = LogCategory::SYSTEM;
  std::string component;
  std::string message;
};

// "[ts] [LEVEL] [CATEGORY] [component] message"; the component bracket is
// left out when empty.
std::string formatLogLine(const LogEntry &entry);

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const LogEntry &entry) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

class ConsoleLogWriter : public ILogWriter {
  std::ostream &out_;
  std::mutex mutex_;

public:
  explicit ConsoleLogWriter(std::ostream &out = std::cerr) : out_(out) {}

  bool write(const LogEntry &entry) override {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << formatLogLine(entry) << '\n';
    return out_.good();
  }
  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
  }
  void close() override { flush(); }
  bool isOpen() const override { return true; }
};

#endif
