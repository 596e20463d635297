#ifndef MIGRATIONREPORT_H
#define MIGRATIONREPORT_H

#include "transfer/ApplyOutcome.h"
#include "transfer/SystemDatabase.h"
#include "transfer/TransferScript.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class PassStatus {
  COMPLETED,          // script applied; individual statements may have failed
  NOT_ATTEMPTED,      // destination unreachable or not privileged
  GENERATION_ABORTED, // an object could not be scripted and the policy stops
  CANCELLED           // stop requested before the pass started
};

std::string passStatusName(PassStatus status);

struct PassResult {
  std::string destinationId;
  SystemDatabase database = SystemDatabase::MASTER;
  PassStatus status = PassStatus::NOT_ATTEMPTED;
  std::string reason; // why the pass did not complete
  ApplyOutcome outcome;
  std::vector<GenerationDiagnostic> diagnostics;

  bool completed() const { return status == PassStatus::COMPLETED; }

  nlohmann::json toJson() const;
};

// Outcome of a whole run, one entry per (destination, database) pair, kept
// in destination order then master, model, msdb.
class MigrationReport {
  std::vector<PassResult> passes_;
  std::string sourceInstance_;
  bool dryRun_ = false;

public:
  MigrationReport() = default;
  MigrationReport(std::string sourceInstance, bool dryRun)
      : sourceInstance_(std::move(sourceInstance)), dryRun_(dryRun) {}

  void add(PassResult pass) { passes_.push_back(std::move(pass)); }

  const std::vector<PassResult> &passes() const { return passes_; }
  const PassResult *find(const std::string &destinationId,
                         SystemDatabase database) const;

  const std::string &sourceInstance() const { return sourceInstance_; }
  bool dryRun() const { return dryRun_; }

  size_t totalApplied() const;
  size_t totalSkipped() const;
  size_t totalFailed() const;

  // Every attempted pass completed and no statement failed beyond tolerated
  // already-exists skips. Passes that were not attempted count as failures.
  bool succeeded() const;
  bool wasCancelled() const;

  nlohmann::json toJson() const;
  std::string summaryTable() const;
};

#endif
