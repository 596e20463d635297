#include "transfer/ApplyOutcome.h"
#include <algorithm>

std::string statementStatusName(StatementStatus status) {
  switch (status) {
  case StatementStatus::APPLIED:
    return "Applied";
  case StatementStatus::SKIPPED_ALREADY_EXISTS:
    return "SkippedAlreadyExists";
  case StatementStatus::FAILED:
    return "Failed";
  case StatementStatus::PREVIEWED:
    return "Previewed";
  case StatementStatus::DECLINED:
    return "Declined";
  }
  return "Unknown";
}

size_t ApplyOutcome::count(StatementStatus status) const {
  return static_cast<size_t>(
      std::count_if(statements.begin(), statements.end(),
                    [status](const StatementOutcome &outcome) {
                      return outcome.status == status;
                    }));
}

nlohmann::json ApplyOutcome::toJson(bool includeApplied) const {
  nlohmann::json result;
  result["target"] = target;
  result["database"] = database;
  result["dry_run"] = dryRun;
  result["applied"] = applied();
  result["skipped_already_exists"] = skippedAlreadyExists();
  result["failed"] = failed();
  result["previewed"] = previewed();
  result["declined"] = declined();

  nlohmann::json details = nlohmann::json::array();
  for (const auto &outcome : statements) {
    if (outcome.status == StatementStatus::APPLIED && !includeApplied)
      continue;
    nlohmann::json entry;
    entry["status"] = statementStatusName(outcome.status);
    entry["object"] = outcome.objectName;
    entry["category"] = objectCategoryName(outcome.category);
    entry["statement"] = outcome.statement;
    if (!outcome.reason.empty())
      entry["reason"] = outcome.reason;
    if (outcome.nativeError != 0)
      entry["native_error"] = outcome.nativeError;
    if (!outcome.sqlState.empty())
      entry["sql_state"] = outcome.sqlState;
    details.push_back(entry);
  }
  result["statements"] = details;
  return result;
}
