#ifndef MIGRATIONORCHESTRATOR_H
#define MIGRATIONORCHESTRATOR_H

#include "engines/database_engine.h"
#include "transfer/ConfirmationGate.h"
#include "transfer/MigrationReport.h"
#include "transfer/TransferPolicy.h"
#include <functional>
#include <string>
#include <vector>

struct MigrationOptions {
  bool dryRun = false;
  size_t maxParallelDestinations = 1;
  IConfirmationGate *gate = nullptr;
  // Polled between passes; returning true cancels the passes not yet
  // started. A pass already running is finished first.
  std::function<bool()> shouldStop;
};

class MigrationOrchestrator {
  IServerConnector &connector_;

public:
  explicit MigrationOrchestrator(IServerConnector &connector);

  // Copies the user objects of master, model and msdb from source to every
  // destination. ConnectionError or PrivilegeError for the source propagate
  // before any destination is touched; destination failures are recorded in
  // the report and the next destination proceeds.
  MigrationReport run(const ServerEndpoint &source,
                      const std::vector<ServerEndpoint> &destinations,
                      const TransferPolicy &policy,
                      const MigrationOptions &options = MigrationOptions());

  // One (database, destination) pass on connections the caller already
  // holds: enumerate, generate a fresh script, apply.
  static PassResult runPass(IServerConnection &source,
                            IServerConnection &destination,
                            const std::string &destinationId,
                            SystemDatabase database,
                            const TransferPolicy &policy, bool dryRun,
                            IConfirmationGate *gate = nullptr);

  // Destination addresses, suffixed #2, #3 ... when an address repeats.
  static std::vector<std::string>
  destinationIds(const std::vector<ServerEndpoint> &destinations);

private:
  std::unique_ptr<IServerConnection> connectSource(const ServerEndpoint &source);

  std::vector<PassResult> migrateDestination(IServerConnection &source,
                                             const ServerEndpoint &destination,
                                             const std::string &destinationId,
                                             const TransferPolicy &policy,
                                             const MigrationOptions &options);

  static std::vector<PassResult> unattemptedPasses(const std::string &id,
                                                   PassStatus status,
                                                   const std::string &reason);
};

#endif
