#include "core/logger.h"
#include "core/migration_config.h"
#include "core/migration_errors.h"
#include "engines/mssql_engine.h"
#include "transfer/MigrationOrchestrator.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_PASS_FAILURES = 1;
constexpr int EXIT_SOURCE_ABORTED = 2;
constexpr int EXIT_CONFIG_ERROR = 3;
constexpr int EXIT_CANCELLED = 4;

std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void printUsage(const char *program) {
  std::cout
      << "Usage: " << program << " [options]\n"
      << "  --config FILE              configuration file (default "
      << MigrationDefaults::DEFAULT_CONFIG_FILE << ")\n"
      << "  --source ADDR              source instance\n"
      << "  --destination ADDR         destination instance, repeatable\n"
      << "  --exclude CATEGORY         skip an object category, repeatable\n"
      << "  --include-dependencies     also copy referenced objects of "
         "excluded categories\n"
      << "  --no-permissions           skip GRANT/DENY statements\n"
      << "  --no-role-memberships      skip ALTER ROLE ... ADD MEMBER\n"
      << "  --no-indexes               skip non-key indexes\n"
      << "  --include-system-objects   also copy built-in objects\n"
      << "  --no-preserve-owner        create objects in the default schema\n"
      << "  --stop-on-generation-error abort a pass on an unscriptable "
         "object\n"
      << "  --dry-run                  record statements without executing\n"
      << "  --interactive              confirm every statement\n"
      << "  --parallel N               destinations migrated concurrently\n"
      << "  --report FILE              write the JSON report to FILE\n"
      << "  --verbose | --quiet        DEBUG or WARNING log level\n";
}

struct CommandLine {
  std::string configFile = MigrationDefaults::DEFAULT_CONFIG_FILE;
  bool configRequired = false;
  std::string source;
  std::vector<std::string> destinations;
  std::vector<std::string> excluded;
  std::vector<std::pair<PolicyFlag, bool>> flags;
  bool dryRun = false;
  bool interactive = false;
  long long parallel = 0;
  std::string reportFile;
  std::string logLevel;
  bool help = false;
};

CommandLine parseCommandLine(int argc, char *argv[]) {
  CommandLine cl;
  auto value = [&](int &i, const std::string &option) -> std::string {
    if (i + 1 >= argc) {
      throw std::invalid_argument(option + " requires a value");
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      cl.help = true;
    } else if (arg == "--config") {
      cl.configFile = value(i, arg);
      cl.configRequired = true;
    } else if (arg == "--source") {
      cl.source = value(i, arg);
    } else if (arg == "--destination") {
      cl.destinations.push_back(value(i, arg));
    } else if (arg == "--exclude") {
      cl.excluded.push_back(value(i, arg));
    } else if (arg == "--include-dependencies") {
      cl.flags.emplace_back(PolicyFlag::INCLUDE_DEPENDENCIES, true);
    } else if (arg == "--no-permissions") {
      cl.flags.emplace_back(PolicyFlag::INCLUDE_PERMISSIONS, false);
    } else if (arg == "--no-role-memberships") {
      cl.flags.emplace_back(PolicyFlag::INCLUDE_ROLE_MEMBERSHIPS, false);
    } else if (arg == "--no-indexes") {
      cl.flags.emplace_back(PolicyFlag::INCLUDE_INDEXES, false);
    } else if (arg == "--include-system-objects") {
      cl.flags.emplace_back(PolicyFlag::INCLUDE_SYSTEM_OBJECTS, true);
    } else if (arg == "--no-preserve-owner") {
      cl.flags.emplace_back(PolicyFlag::PRESERVE_OWNER_SCHEMA, false);
    } else if (arg == "--stop-on-generation-error") {
      cl.flags.emplace_back(PolicyFlag::CONTINUE_ON_GENERATION_ERROR, false);
    } else if (arg == "--dry-run") {
      cl.dryRun = true;
    } else if (arg == "--interactive") {
      cl.interactive = true;
    } else if (arg == "--parallel") {
      std::string workers = value(i, arg);
      try {
        cl.parallel = std::stoll(workers);
      } catch (const std::exception &) {
        throw std::invalid_argument("--parallel expects a number, got '" +
                                    workers + "'");
      }
    } else if (arg == "--report") {
      cl.reportFile = value(i, arg);
    } else if (arg == "--verbose") {
      cl.logLevel = "DEBUG";
    } else if (arg == "--quiet") {
      cl.logLevel = "WARNING";
    } else {
      throw std::invalid_argument("Unknown option: " + arg);
    }
  }
  return cl;
}

void applyCommandLine(const CommandLine &cl) {
  if (!cl.source.empty()) {
    ServerEndpoint source = MigrationConfig::getSource();
    source.address = cl.source;
    MigrationConfig::setSource(source);
  }
  if (!cl.destinations.empty()) {
    MigrationConfig::clearDestinations();
    for (const auto &address : cl.destinations) {
      ServerEndpoint destination;
      destination.address = address;
      MigrationConfig::addDestination(destination);
    }
    // Destination credentials from the environment apply to these too.
    MigrationConfig::loadFromEnv();
  }

  TransferPolicy policy = MigrationConfig::getPolicy();
  for (const auto &name : cl.excluded) {
    policy = policy.withCategory(parseObjectCategory(name), false);
  }
  for (const auto &flag : cl.flags) {
    policy = policy.withFlag(flag.first, flag.second);
  }
  MigrationConfig::setPolicy(policy);

  if (cl.dryRun)
    MigrationConfig::setDryRun(true);
  if (cl.interactive)
    MigrationConfig::setInteractive(true);
  if (cl.parallel != 0) {
    if (cl.parallel < 0) {
      throw std::invalid_argument("--parallel must be positive");
    }
    MigrationConfig::setMaxParallelDestinations(
        static_cast<size_t>(cl.parallel));
  }
  if (!cl.reportFile.empty())
    MigrationConfig::setReportFile(cl.reportFile);
  if (!cl.logLevel.empty())
    MigrationConfig::setLogLevel(cl.logLevel);
}

void writeReport(const MigrationReport &report, const std::string &path) {
  std::ofstream out(path);
  if (!out.is_open()) {
    Logger::error(LogCategory::SYSTEM, "main",
                  "Could not open report file '" + path + "'");
    return;
  }
  out << report.toJson().dump(2) << std::endl;
  Logger::info(LogCategory::SYSTEM, "main", "Report written to " + path);
}
} // namespace

int main(int argc, char *argv[]) {
  CommandLine cl;
  try {
    cl = parseCommandLine(argc, argv);
    if (cl.help) {
      printUsage(argv[0]);
      return EXIT_SUCCESS_CODE;
    }

    MigrationConfig::loadFromFile(cl.configFile, cl.configRequired);
    applyCommandLine(cl);
    MigrationConfig::validate();
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    printUsage(argv[0]);
    return EXIT_CONFIG_ERROR;
  }

  Logger::initialize(MigrationConfig::getLogSettings());

  if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
      std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    Logger::warning(LogCategory::SYSTEM, "main",
                    "Failed to register signal handlers; cancellation "
                    "is unavailable");
  }

  const ServerEndpoint source = MigrationConfig::getSource();
  const std::vector<ServerEndpoint> destinations =
      MigrationConfig::getDestinations();
  const TransferPolicy policy = MigrationConfig::getPolicy();

  Logger::info(LogCategory::SYSTEM, "main",
               "SysDbMigrate started: source " + source.toSafeString() +
                   ", " + std::to_string(destinations.size()) +
                   " destination(s)");

  MSSQLConnector connector(MigrationConfig::getOdbcSettings());
  ConsoleConfirmationGate gate;

  MigrationOptions options;
  options.dryRun = MigrationConfig::isDryRun();
  options.maxParallelDestinations =
      MigrationConfig::getMaxParallelDestinations();
  if (MigrationConfig::isInteractive() && !options.dryRun) {
    options.gate = &gate;
  }
  options.shouldStop = []() { return g_shutdownRequested.load(); };

  MigrationReport report;
  try {
    MigrationOrchestrator orchestrator(connector);
    report = orchestrator.run(source, destinations, policy, options);
  } catch (const ConnectionError &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     std::string("Source unavailable: ") + e.what());
    std::cerr << "Source unavailable: " << e.what() << std::endl;
    Logger::shutdown();
    return EXIT_SOURCE_ABORTED;
  } catch (const PrivilegeError &e) {
    Logger::critical(LogCategory::SYSTEM, "main", e.what());
    std::cerr << e.what() << std::endl;
    Logger::shutdown();
    return EXIT_SOURCE_ABORTED;
  } catch (const MigrationError &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     std::string("Migration aborted: ") + e.what());
    std::cerr << "Migration aborted: " << e.what() << std::endl;
    Logger::shutdown();
    return EXIT_SOURCE_ABORTED;
  }

  std::cout << report.summaryTable() << std::flush;

  std::string reportFile = MigrationConfig::getReportFile();
  if (!reportFile.empty()) {
    writeReport(report, reportFile);
  }

  int exitCode = EXIT_SUCCESS_CODE;
  if (report.wasCancelled()) {
    exitCode = EXIT_CANCELLED;
  } else if (!report.succeeded()) {
    exitCode = EXIT_PASS_FAILURES;
  }

  Logger::info(LogCategory::SYSTEM, "main",
               "SysDbMigrate finished with exit code " +
                   std::to_string(exitCode));
  Logger::shutdown();
  return exitCode;
}
