#include "transfer/MigrationReport.h"
#include "utils/string_utils.h"
#include <iomanip>
#include <sstream>

std::string passStatusName(PassStatus status) {
  switch (status) {
  case PassStatus::COMPLETED:
    return "Completed";
  case PassStatus::NOT_ATTEMPTED:
    return "NotAttempted";
  case PassStatus::GENERATION_ABORTED:
    return "GenerationAborted";
  case PassStatus::CANCELLED:
    return "Cancelled";
  }
  return "Unknown";
}

nlohmann::json PassResult::toJson() const {
  nlohmann::json result = outcome.toJson();
  result["destination"] = destinationId;
  result["database"] = systemDatabaseName(database);
  result["status"] = passStatusName(status);
  result["completed"] = completed();
  if (!reason.empty())
    result["reason"] = reason;

  nlohmann::json skipped = nlohmann::json::array();
  for (const auto &diagnostic : diagnostics) {
    skipped.push_back({{"object", diagnostic.objectName},
                       {"category", objectCategoryName(diagnostic.category)},
                       {"reason", diagnostic.reason}});
  }
  result["generation_diagnostics"] = skipped;
  return result;
}

const PassResult *MigrationReport::find(const std::string &destinationId,
                                        SystemDatabase database) const {
  for (const auto &pass : passes_) {
    if (pass.destinationId == destinationId && pass.database == database)
      return &pass;
  }
  return nullptr;
}

size_t MigrationReport::totalApplied() const {
  size_t total = 0;
  for (const auto &pass : passes_)
    total += pass.outcome.applied();
  return total;
}

size_t MigrationReport::totalSkipped() const {
  size_t total = 0;
  for (const auto &pass : passes_)
    total += pass.outcome.skippedAlreadyExists();
  return total;
}

size_t MigrationReport::totalFailed() const {
  size_t total = 0;
  for (const auto &pass : passes_)
    total += pass.outcome.failed();
  return total;
}

bool MigrationReport::succeeded() const {
  for (const auto &pass : passes_) {
    if (pass.status == PassStatus::NOT_ATTEMPTED ||
        pass.status == PassStatus::GENERATION_ABORTED)
      return false;
    if (pass.outcome.failed() > 0)
      return false;
  }
  return true;
}

bool MigrationReport::wasCancelled() const {
  for (const auto &pass : passes_) {
    if (pass.status == PassStatus::CANCELLED)
      return true;
  }
  return false;
}

nlohmann::json MigrationReport::toJson() const {
  nlohmann::json result;
  result["source"] = sourceInstance_;
  result["dry_run"] = dryRun_;
  result["succeeded"] = succeeded();
  result["totals"] = {{"applied", totalApplied()},
                      {"skipped_already_exists", totalSkipped()},
                      {"failed", totalFailed()}};

  nlohmann::json passes = nlohmann::json::array();
  for (const auto &pass : passes_) {
    passes.push_back(pass.toJson());
  }
  result["passes"] = passes;
  return result;
}

std::string MigrationReport::summaryTable() const {
  std::ostringstream oss;
  oss << std::left << std::setw(28) << "Destination" << std::setw(8)
      << "Database" << std::setw(19) << "Status" << std::right << std::setw(9)
      << "Applied" << std::setw(9) << "Exists" << std::setw(8) << "Failed"
      << std::setw(8) << "NotRun" << std::setw(12) << "Unscripted" << "\n";
  oss << std::string(99, '-') << "\n";

  for (const auto &pass : passes_) {
    size_t notRun = pass.outcome.previewed() + pass.outcome.declined();
    oss << std::left << std::setw(28) << pass.destinationId << std::setw(8)
        << systemDatabaseName(pass.database) << std::setw(19)
        << passStatusName(pass.status) << std::right << std::setw(9)
        << pass.outcome.applied() << std::setw(9)
        << pass.outcome.skippedAlreadyExists() << std::setw(8)
        << pass.outcome.failed() << std::setw(8) << notRun << std::setw(12)
        << pass.diagnostics.size() << "\n";
    if (!pass.reason.empty()) {
      oss << "    " << pass.reason << "\n";
    }
    for (const auto &statement : pass.outcome.statements) {
      if (statement.status == StatementStatus::FAILED) {
        oss << "    failed " << statement.objectName << ": "
            << StringUtils::previewStatement(statement.statement, 70) << "\n";
      }
    }
  }
  return oss.str();
}
