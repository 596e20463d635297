#include "../TestRunner.h"
#include "core/file_log_writer.h"
#include "core/logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
std::string readFile(const std::string &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
} // namespace

int main() {
  TestRunner runner;

  runner.runTest("Messages below the level are dropped", [&]() {
    std::ostringstream out;
    Logger::clearWriters();
    Logger::addWriter(std::make_unique<ConsoleLogWriter>(out));
    Logger::setLogLevel("warning");

    Logger::info(LogCategory::TRANSFER, "ScriptApplier", "applied 3");
    Logger::warning(LogCategory::TRANSFER, "ScriptApplier", "failed 1");

    runner.assertTrue(out.str().find("applied 3") == std::string::npos,
                      "info suppressed");
    runner.assertContains(out.str(), "failed 1", "warning written");
    Logger::clearWriters();
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("Line carries level, category and function", [&]() {
    std::ostringstream out;
    Logger::clearWriters();
    Logger::addWriter(std::make_unique<ConsoleLogWriter>(out));
    Logger::setLogLevel(LogLevel::DEBUG);

    Logger::debug(LogCategory::SCRIPTING, "ScriptGenerator", "object skipped");
    runner.assertContains(out.str(), "[DEBUG] [SCRIPTING] [ScriptGenerator] "
                                     "object skipped",
                          "formatted line");
    Logger::clearWriters();
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("formatLogLine omits an empty component", [&]() {
    LogEntry entry;
    entry.timestamp = "2024-05-01 12:00:00.250";
    entry.level = LogLevel::ERROR;
    entry.category = LogCategory::DATABASE;
    entry.message = "login failed";
    runner.assertEquals("[2024-05-01 12:00:00.250] [ERROR] [DATABASE] "
                        "login failed",
                        formatLogLine(entry), "no component bracket");
    entry.component = "MSSQLConnector";
    runner.assertEquals("[2024-05-01 12:00:00.250] [ERROR] [DATABASE] "
                        "[MSSQLConnector] login failed",
                        formatLogLine(entry), "component bracket");
  });

  runner.runTest("Unknown level strings keep the current level", [&]() {
    Logger::setLogLevel(LogLevel::ERROR);
    Logger::setLogLevel("verbose");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::ERROR,
                      "level unchanged");
    Logger::setLogLevel("fatal");
    runner.assertTrue(Logger::getCurrentLogLevel() == LogLevel::CRITICAL,
                      "FATAL maps to CRITICAL");
    Logger::setLogLevel(LogLevel::INFO);
  });

  runner.runTest("File writer rotates when the size limit is reached", [&]() {
    std::string path = (std::filesystem::temp_directory_path() /
                        "sysdb_migrate_rotation_test.log")
                           .string();
    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");
    std::filesystem::remove(path + ".2");

    {
      FileLogWriter writer(path, 64, 3);
      runner.assertTrue(writer.isOpen(), "file opened");
      LogEntry entry;
      entry.timestamp = "2024-01-01 00:00:00.000";
      entry.message = std::string(80, 'a');
      runner.assertTrue(writer.write(entry), "oversized first line written");
      entry.message = "second line";
      runner.assertTrue(writer.write(entry), "second line written");
      writer.close();
      runner.assertFalse(writer.isOpen(), "closed");
    }

    runner.assertTrue(std::filesystem::exists(path + ".1"), "backup created");
    runner.assertContains(readFile(path + ".1"), std::string(80, 'a'),
                          "first line in the backup");
    runner.assertContains(readFile(path), "second line",
                          "new line in the fresh file");

    std::filesystem::remove(path);
    std::filesystem::remove(path + ".1");
  });

  runner.runTest("initialize installs a file sink", [&]() {
    std::string path = (std::filesystem::temp_directory_path() /
                        "sysdb_migrate_logger_test.log")
                           .string();
    std::filesystem::remove(path);

    LogSettings settings;
    settings.level = "INFO";
    settings.file = path;
    settings.console = false;
    Logger::initialize(settings);
    Logger::info(LogCategory::CONFIG, "MigrationConfig", "loaded");
    Logger::shutdown();

    runner.assertContains(readFile(path), "[INFO] [CONFIG] [MigrationConfig] "
                                          "loaded",
                          "line written to file");
    std::filesystem::remove(path);
  });

  runner.printSummary();
  return 0;
}
