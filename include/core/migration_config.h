#ifndef MIGRATION_CONFIG_H
#define MIGRATION_CONFIG_H

#include "core/logger.h"
#include "core/migration_defaults.h"
#include "engines/database_engine.h"
#include "transfer/TransferPolicy.h"
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct OdbcSettings {
  std::string driver = MigrationDefaults::DEFAULT_ODBC_DRIVER;
  bool encrypt = true;
  bool trustServerCertificate = true;
  int loginTimeoutSeconds = MigrationDefaults::LOGIN_TIMEOUT_SECONDS;
  int connectRetries = MigrationDefaults::CONNECT_RETRIES;
};

// Process-wide run configuration: the JSON file first, then environment
// overrides, then whatever the command line sets. Invalid values throw
// std::invalid_argument.
class MigrationConfig {
private:
  static ServerEndpoint source_;
  static std::vector<ServerEndpoint> destinations_;
  static OdbcSettings odbc_;
  static TransferPolicy policy_;
  static bool dryRun_;
  static bool interactive_;
  static size_t maxParallelDestinations_;
  static LogSettings logSettings_;
  static std::string reportFile_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void loadFromJsonUnlocked(const nlohmann::json &config);
  static void loadFromEnvUnlocked();
  static ServerEndpoint parseEndpoint(const nlohmann::json &node,
                                      const std::string &section);

public:
  // A missing file is an error only when required; otherwise the
  // environment alone is used.
  static void loadFromFile(const std::string &configPath =
                               MigrationDefaults::DEFAULT_CONFIG_FILE,
                           bool required = false);
  static void loadFromJson(const nlohmann::json &config);
  static void loadFromEnv();
  static void reset();

  static void setSource(const ServerEndpoint &source);
  static void addDestination(const ServerEndpoint &destination);
  static void clearDestinations();
  static void setPolicy(const TransferPolicy &policy);
  static void setDryRun(bool dryRun);
  static void setInteractive(bool interactive);
  static void setMaxParallelDestinations(size_t workers);
  static void setLogLevel(const std::string &level);
  static void setReportFile(const std::string &path);

  // Throws std::invalid_argument unless a source and at least one
  // destination are configured.
  static void validate();

  static ServerEndpoint getSource() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return source_;
  }
  static std::vector<ServerEndpoint> getDestinations() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return destinations_;
  }
  static OdbcSettings getOdbcSettings() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return odbc_;
  }
  static TransferPolicy getPolicy() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return policy_;
  }
  static bool isDryRun() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return dryRun_;
  }
  static bool isInteractive() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return interactive_;
  }
  static size_t getMaxParallelDestinations() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return maxParallelDestinations_;
  }
  static LogSettings getLogSettings() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return logSettings_;
  }
  static std::string getReportFile() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return reportFile_;
  }
  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
