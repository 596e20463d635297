#include "core/migration_config.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

ServerEndpoint MigrationConfig::source_;
std::vector<ServerEndpoint> MigrationConfig::destinations_;
OdbcSettings MigrationConfig::odbc_;
TransferPolicy MigrationConfig::policy_;
bool MigrationConfig::dryRun_ = false;
bool MigrationConfig::interactive_ = false;
size_t MigrationConfig::maxParallelDestinations_ =
    MigrationDefaults::MIN_PARALLEL_DESTINATIONS;
LogSettings MigrationConfig::logSettings_;
std::string MigrationConfig::reportFile_;
bool MigrationConfig::initialized_ = false;
std::mutex MigrationConfig::configMutex_;

namespace {
const char *envValue(const char *name) {
  const char *value = std::getenv(name);
  return (value && strlen(value) > 0) ? value : nullptr;
}

std::string normalizeLogLevel(const std::string &level) {
  std::string upper = StringUtils::toUpper(StringUtils::trim(level));
  if (upper == "WARN")
    upper = "WARNING";
  if (upper != "DEBUG" && upper != "INFO" && upper != "WARNING" &&
      upper != "ERROR" && upper != "CRITICAL") {
    throw std::invalid_argument("Invalid log level: " + level);
  }
  return upper;
}

size_t checkedParallelism(long long workers) {
  if (workers < static_cast<long long>(
                    MigrationDefaults::MIN_PARALLEL_DESTINATIONS) ||
      workers > static_cast<long long>(
                    MigrationDefaults::MAX_PARALLEL_DESTINATIONS)) {
    throw std::invalid_argument(
        "max_parallel_destinations must be between " +
        std::to_string(MigrationDefaults::MIN_PARALLEL_DESTINATIONS) + " and " +
        std::to_string(MigrationDefaults::MAX_PARALLEL_DESTINATIONS) +
        ", got " + std::to_string(workers));
  }
  return static_cast<size_t>(workers);
}

int checkedPositive(const json &value, const std::string &key, int maxValue) {
  if (!value.is_number_integer()) {
    throw std::invalid_argument("'" + key + "' must be an integer");
  }
  long long number = value.get<long long>();
  if (number < 1 || number > maxValue) {
    throw std::invalid_argument("'" + key + "' must be between 1 and " +
                                std::to_string(maxValue));
  }
  return static_cast<int>(number);
}

bool readBool(const json &section, const std::string &key, bool fallback) {
  if (!section.contains(key))
    return fallback;
  if (!section[key].is_boolean()) {
    throw std::invalid_argument("'" + key + "' must be true or false");
  }
  return section[key].get<bool>();
}

std::string readString(const json &section, const std::string &key,
                       const std::string &fallback) {
  if (!section.contains(key) || section[key].is_null())
    return fallback;
  if (!section[key].is_string()) {
    throw std::invalid_argument("'" + key + "' must be a string");
  }
  return section[key].get<std::string>();
}
} // namespace

ServerEndpoint MigrationConfig::parseEndpoint(const json &node,
                                              const std::string &section) {
  ServerEndpoint endpoint;
  if (node.is_string()) {
    endpoint.address = node.get<std::string>();
  } else if (node.is_object()) {
    endpoint.address = readString(node, "address", "");
    endpoint.user = readString(node, "user", "");
    endpoint.password = readString(node, "password", "");
  } else {
    throw std::invalid_argument("'" + section +
                                "' entries must be objects or strings");
  }
  if (StringUtils::trim(endpoint.address).empty()) {
    throw std::invalid_argument("'" + section + "' entry without an address");
  }
  return endpoint;
}

void MigrationConfig::loadFromFile(const std::string &configPath,
                                   bool required) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    if (required) {
      throw std::invalid_argument("Could not open config file '" + configPath +
                                  "'");
    }
    Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults and environment variables");
    loadFromEnv();
    return;
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Config file '" + configPath +
                                "' is not valid JSON: " + e.what());
  }

  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromJsonUnlocked(config);
  loadFromEnvUnlocked();
  initialized_ = true;
}

void MigrationConfig::loadFromJson(const json &config) {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromJsonUnlocked(config);
  initialized_ = true;
}

void MigrationConfig::loadFromJsonUnlocked(const json &config) {
  if (!config.is_object()) {
    throw std::invalid_argument("Configuration must be a JSON object");
  }

  try {
    if (config.contains("source")) {
      source_ = parseEndpoint(config["source"], "source");
    }

    if (config.contains("destinations")) {
      const json &list = config["destinations"];
      if (!list.is_array()) {
        throw std::invalid_argument("'destinations' must be an array");
      }
      destinations_.clear();
      for (const auto &entry : list) {
        destinations_.push_back(parseEndpoint(entry, "destinations"));
      }
    }

    if (config.contains("odbc")) {
      const json &odbc = config["odbc"];
      odbc_.driver = readString(odbc, "driver", odbc_.driver);
      odbc_.encrypt = readBool(odbc, "encrypt", odbc_.encrypt);
      odbc_.trustServerCertificate = readBool(odbc, "trust_server_certificate",
                                              odbc_.trustServerCertificate);
      if (odbc.contains("login_timeout_seconds"))
        odbc_.loginTimeoutSeconds = checkedPositive(
            odbc["login_timeout_seconds"], "login_timeout_seconds", 600);
      if (odbc.contains("connect_retries"))
        odbc_.connectRetries =
            checkedPositive(odbc["connect_retries"], "connect_retries", 10);
    }

    if (config.contains("policy")) {
      policy_ = TransferPolicy::fromJson(config["policy"], policy_);
    }

    if (config.contains("execution")) {
      const json &execution = config["execution"];
      dryRun_ = readBool(execution, "dry_run", dryRun_);
      interactive_ = readBool(execution, "interactive", interactive_);
      if (execution.contains("max_parallel_destinations")) {
        const json &workers = execution["max_parallel_destinations"];
        if (!workers.is_number_integer()) {
          throw std::invalid_argument(
              "'max_parallel_destinations' must be an integer");
        }
        maxParallelDestinations_ = checkedParallelism(workers.get<long long>());
      }
    }

    if (config.contains("logging")) {
      const json &logging = config["logging"];
      logSettings_.level =
          normalizeLogLevel(readString(logging, "level", logSettings_.level));
      logSettings_.file = readString(logging, "file", logSettings_.file);
      logSettings_.postgresConnection = readString(
          logging, "postgres_connection", logSettings_.postgresConnection);
      logSettings_.postgresTable =
          readString(logging, "postgres_table", logSettings_.postgresTable);
      logSettings_.console =
          readBool(logging, "console", logSettings_.console);
    }

    if (config.contains("report")) {
      reportFile_ = readString(config["report"], "file", reportFile_);
    }
  } catch (const json::exception &e) {
    throw std::invalid_argument(std::string("Invalid configuration: ") +
                                e.what());
  }
}

void MigrationConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
  initialized_ = true;
}

// SYSDB_SOURCE_USER / SYSDB_SOURCE_PASSWORD replace the source credentials;
// SYSDB_DEST_USER / SYSDB_DEST_PASSWORD fill destinations that have none.
void MigrationConfig::loadFromEnvUnlocked() {
  if (const char *user = envValue("SYSDB_SOURCE_USER"))
    source_.user = user;
  if (const char *password = std::getenv("SYSDB_SOURCE_PASSWORD"))
    source_.password = password;

  const char *destUser = envValue("SYSDB_DEST_USER");
  const char *destPassword = std::getenv("SYSDB_DEST_PASSWORD");
  for (auto &destination : destinations_) {
    if (destination.user.empty() && destUser) {
      destination.user = destUser;
      if (destPassword)
        destination.password = destPassword;
    }
  }

  if (const char *driver = envValue("SYSDB_ODBC_DRIVER"))
    odbc_.driver = driver;
  if (const char *level = envValue("SYSDB_LOG_LEVEL"))
    logSettings_.level = normalizeLogLevel(level);

  if (!source_.user.empty() && source_.password.empty()) {
    Logger::warning(LogCategory::CONFIG, "MigrationConfig",
                    "Source user set without a password; the login may fail");
  }
}

void MigrationConfig::reset() {
  std::lock_guard<std::mutex> lock(configMutex_);
  source_ = ServerEndpoint();
  destinations_.clear();
  odbc_ = OdbcSettings();
  policy_ = TransferPolicy();
  dryRun_ = false;
  interactive_ = false;
  maxParallelDestinations_ = MigrationDefaults::MIN_PARALLEL_DESTINATIONS;
  logSettings_ = LogSettings();
  reportFile_.clear();
  initialized_ = false;
}

void MigrationConfig::setSource(const ServerEndpoint &source) {
  std::lock_guard<std::mutex> lock(configMutex_);
  source_ = source;
}

void MigrationConfig::addDestination(const ServerEndpoint &destination) {
  std::lock_guard<std::mutex> lock(configMutex_);
  destinations_.push_back(destination);
}

void MigrationConfig::clearDestinations() {
  std::lock_guard<std::mutex> lock(configMutex_);
  destinations_.clear();
}

void MigrationConfig::setPolicy(const TransferPolicy &policy) {
  std::lock_guard<std::mutex> lock(configMutex_);
  policy_ = policy;
}

void MigrationConfig::setDryRun(bool dryRun) {
  std::lock_guard<std::mutex> lock(configMutex_);
  dryRun_ = dryRun;
}

void MigrationConfig::setInteractive(bool interactive) {
  std::lock_guard<std::mutex> lock(configMutex_);
  interactive_ = interactive;
}

void MigrationConfig::setMaxParallelDestinations(size_t workers) {
  size_t checked = checkedParallelism(static_cast<long long>(workers));
  std::lock_guard<std::mutex> lock(configMutex_);
  maxParallelDestinations_ = checked;
}

void MigrationConfig::setLogLevel(const std::string &level) {
  std::string normalized = normalizeLogLevel(level);
  std::lock_guard<std::mutex> lock(configMutex_);
  logSettings_.level = normalized;
}

void MigrationConfig::setReportFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(configMutex_);
  reportFile_ = path;
}

void MigrationConfig::validate() {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (source_.address.empty()) {
    throw std::invalid_argument("No source instance configured");
  }
  if (destinations_.empty()) {
    throw std::invalid_argument("No destination instances configured");
  }
  if (dryRun_ && interactive_) {
    Logger::info(LogCategory::CONFIG, "MigrationConfig",
                 "Dry run requested; interactive confirmation is ignored");
  }
}
