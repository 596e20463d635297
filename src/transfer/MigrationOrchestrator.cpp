#include "transfer/MigrationOrchestrator.h"
#include "core/logger.h"
#include "core/migration_errors.h"
#include "transfer/DestinationWorkerPool.h"
#include "transfer/ObjectEnumerator.h"
#include "transfer/ScriptApplier.h"
#include "transfer/ScriptGenerator.h"
#include <algorithm>
#include <map>

namespace {
bool stopRequested(const MigrationOptions &options) {
  return options.shouldStop && options.shouldStop();
}
} // namespace

MigrationOrchestrator::MigrationOrchestrator(IServerConnector &connector)
    : connector_(connector) {}

std::vector<std::string> MigrationOrchestrator::destinationIds(
    const std::vector<ServerEndpoint> &destinations) {
  std::vector<std::string> ids;
  std::map<std::string, int> seen;
  for (const auto &destination : destinations) {
    int occurrence = ++seen[destination.address];
    ids.push_back(occurrence == 1
                      ? destination.address
                      : destination.address + "#" + std::to_string(occurrence));
  }
  return ids;
}

std::vector<PassResult>
MigrationOrchestrator::unattemptedPasses(const std::string &id,
                                         PassStatus status,
                                         const std::string &reason) {
  std::vector<PassResult> passes;
  for (SystemDatabase database : SYSTEM_DATABASES) {
    PassResult pass;
    pass.destinationId = id;
    pass.database = database;
    pass.status = status;
    pass.reason = reason;
    pass.outcome.target = id;
    pass.outcome.database = systemDatabaseName(database);
    passes.push_back(std::move(pass));
  }
  return passes;
}

std::unique_ptr<IServerConnection>
MigrationOrchestrator::connectSource(const ServerEndpoint &source) {
  Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
               "Connecting to source " + source.toSafeString());
  std::unique_ptr<IServerConnection> connection = connector_.connect(source);
  if (!connection) {
    throw ConnectionError(source.address, "connector returned no connection");
  }
  if (!connection->hasAdministrativePrivilege()) {
    throw PrivilegeError(connection->instanceName(),
                         "sysadmin membership is required on the source");
  }
  return connection;
}

PassResult MigrationOrchestrator::runPass(
    IServerConnection &source, IServerConnection &destination,
    const std::string &destinationId, SystemDatabase database,
    const TransferPolicy &policy, bool dryRun, IConfirmationGate *gate) {
  PassResult pass;
  pass.destinationId = destinationId;
  pass.database = database;
  pass.outcome.target = destination.instanceName();
  pass.outcome.database = systemDatabaseName(database);
  pass.outcome.dryRun = dryRun;

  GenerationResult generated;
  try {
    std::vector<ObjectDescriptor> objects =
        ObjectEnumerator::enumerate(source, database, policy);
    generated = ScriptGenerator::generate(objects, policy);
  } catch (const GenerationError &e) {
    pass.status = PassStatus::GENERATION_ABORTED;
    pass.reason = e.what();
    return pass;
  } catch (const MigrationError &e) {
    pass.status = PassStatus::GENERATION_ABORTED;
    pass.reason = std::string("Reading source catalog failed: ") + e.what();
    Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                  destinationId + "/" + systemDatabaseName(database) + ": " +
                      pass.reason);
    return pass;
  } catch (const std::exception &e) {
    // Malformed catalog values and the like; the other passes still run.
    pass.status = PassStatus::GENERATION_ABORTED;
    pass.reason = std::string("Script generation failed: ") + e.what();
    Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                  destinationId + "/" + systemDatabaseName(database) + ": " +
                      pass.reason);
    return pass;
  }

  pass.diagnostics = std::move(generated.diagnostics);
  pass.outcome =
      ScriptApplier::apply(destination, database, generated.script, dryRun, gate);
  pass.status = PassStatus::COMPLETED;
  return pass;
}

std::vector<PassResult> MigrationOrchestrator::migrateDestination(
    IServerConnection &source, const ServerEndpoint &destination,
    const std::string &destinationId, const TransferPolicy &policy,
    const MigrationOptions &options) {
  if (stopRequested(options)) {
    return unattemptedPasses(destinationId, PassStatus::CANCELLED,
                             "Cancelled before the destination was started");
  }

  std::unique_ptr<IServerConnection> target;
  try {
    target = connector_.connect(destination);
    if (!target) {
      throw ConnectionError(destination.address,
                            "connector returned no connection");
    }
    if (!target->hasAdministrativePrivilege()) {
      throw PrivilegeError(target->instanceName(),
                           "sysadmin membership is required on the "
                           "destination");
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::TRANSFER, "MigrationOrchestrator",
                  "Skipping destination " + destinationId + ": " + e.what());
    return unattemptedPasses(destinationId, PassStatus::NOT_ATTEMPTED,
                             e.what());
  }

  std::vector<PassResult> passes;
  for (SystemDatabase database : SYSTEM_DATABASES) {
    if (stopRequested(options)) {
      PassResult cancelled;
      cancelled.destinationId = destinationId;
      cancelled.database = database;
      cancelled.status = PassStatus::CANCELLED;
      cancelled.reason = "Cancelled before the pass was started";
      cancelled.outcome.target = target->instanceName();
      cancelled.outcome.database = systemDatabaseName(database);
      passes.push_back(std::move(cancelled));
      continue;
    }

    Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
                 "Migrating " + systemDatabaseName(database) + " from " +
                     source.instanceName() + " to " + destinationId +
                     (options.dryRun ? " (dry run)" : ""));
    passes.push_back(runPass(source, *target, destinationId, database, policy,
                             options.dryRun, options.gate));
  }
  return passes;
}

MigrationReport
MigrationOrchestrator::run(const ServerEndpoint &source,
                           const std::vector<ServerEndpoint> &destinations,
                           const TransferPolicy &policy,
                           const MigrationOptions &options) {
  if (destinations.empty()) {
    throw std::invalid_argument("At least one destination is required");
  }

  std::unique_ptr<IServerConnection> sourceConnection = connectSource(source);
  Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
               "Source " + sourceConnection->instanceName() + " ready; policy " +
                   policy.describe());

  MigrationReport report(sourceConnection->instanceName(), options.dryRun);
  const std::vector<std::string> ids = destinationIds(destinations);
  std::vector<std::vector<PassResult>> results(destinations.size());

  size_t workers = std::min(options.maxParallelDestinations, destinations.size());
  if (workers <= 1) {
    for (size_t i = 0; i < destinations.size(); ++i) {
      results[i] = migrateDestination(*sourceConnection, destinations[i],
                                      ids[i], policy, options);
    }
  } else {
    // Each task owns its destination connection and writes only its own slot
    // of results; the source connection is shared for catalog reads.
    DestinationWorkerPool pool(workers);
    for (size_t i = 0; i < destinations.size(); ++i) {
      pool.submitTask(DestinationTask{i, ids[i], [&, i]() {
                                        results[i] = migrateDestination(
                                            *sourceConnection, destinations[i],
                                            ids[i], policy, options);
                                      }});
    }
    pool.waitForCompletion();
  }

  for (size_t i = 0; i < results.size(); ++i) {
    if (results[i].empty()) {
      results[i] = unattemptedPasses(ids[i], PassStatus::NOT_ATTEMPTED,
                                     "Destination worker failed");
    }
    for (auto &pass : results[i]) {
      report.add(std::move(pass));
    }
  }

  Logger::info(LogCategory::TRANSFER, "MigrationOrchestrator",
               "Migration finished: applied " +
                   std::to_string(report.totalApplied()) +
                   ", already existed " + std::to_string(report.totalSkipped()) +
                   ", failed " + std::to_string(report.totalFailed()));
  return report;
}
