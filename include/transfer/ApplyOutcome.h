#ifndef APPLYOUTCOME_H
#define APPLYOUTCOME_H

#include "transfer/TransferScript.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class StatementStatus {
  APPLIED,
  SKIPPED_ALREADY_EXISTS,
  FAILED,
  PREVIEWED, // dry run, not executed
  DECLINED   // refused by the confirmation gate, not executed
};

std::string statementStatusName(StatementStatus status);

struct StatementOutcome {
  StatementStatus status = StatementStatus::APPLIED;
  std::string statement;
  std::string objectName;
  ObjectCategory category = ObjectCategory::TABLE;
  std::string reason; // server message, or why the statement did not run
  std::string sqlState;
  int nativeError = 0;
};

// Result of applying one transfer script to one destination database.
struct ApplyOutcome {
  std::string target;
  std::string database;
  bool dryRun = false;
  std::vector<StatementOutcome> statements;

  size_t count(StatementStatus status) const;
  size_t applied() const { return count(StatementStatus::APPLIED); }
  size_t skippedAlreadyExists() const {
    return count(StatementStatus::SKIPPED_ALREADY_EXISTS);
  }
  size_t failed() const { return count(StatementStatus::FAILED); }
  size_t previewed() const { return count(StatementStatus::PREVIEWED); }
  size_t declined() const { return count(StatementStatus::DECLINED); }

  nlohmann::json toJson(bool includeApplied = false) const;
};

#endif
