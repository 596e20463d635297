#include "transfer/ScriptApplier.h"
#include "core/logger.h"
#include "core/migration_defaults.h"
#include "utils/string_utils.h"

namespace {
// Full statement text and the reason it did not run, for every statement
// that was not applied.
void logNotApplied(const std::string &where, const StatementOutcome &result) {
  Logger::debug(LogCategory::TRANSFER, "ScriptApplier",
                statementStatusName(result.status) + " on " + where + ": " +
                    result.objectName + " - " + result.reason + "\n" +
                    result.statement);
}
} // namespace

bool ScriptApplier::isAlreadyExists(const StatementError &error) {
  for (int code : MigrationDefaults::ALREADY_EXISTS_NATIVE_ERRORS) {
    if (error.nativeError() == code)
      return true;
  }
  for (const char *state : MigrationDefaults::ALREADY_EXISTS_SQLSTATES) {
    if (error.sqlState() == state)
      return true;
  }

  std::string message = error.what();
  return StringUtils::containsIgnoreCase(message, "already exists") ||
         StringUtils::containsIgnoreCase(message,
                                         "There is already an object named");
}

ApplyOutcome ScriptApplier::apply(IServerConnection &target,
                                  SystemDatabase database,
                                  const TransferScript &script, bool dryRun,
                                  IConfirmationGate *gate) {
  ApplyOutcome outcome;
  outcome.target = target.instanceName();
  outcome.database = systemDatabaseName(database);
  outcome.dryRun = dryRun;
  outcome.statements.reserve(script.size());

  const std::string where = outcome.target + "/" + outcome.database;

  for (const auto &statement : script) {
    StatementOutcome result;
    result.statement = statement.text;
    result.objectName = statement.objectName;
    result.category = statement.category;

    if (dryRun) {
      result.status = StatementStatus::PREVIEWED;
      Logger::info(LogCategory::TRANSFER, "ScriptApplier",
                   "[dry run] " + where + ": " + statement.text);
      outcome.statements.push_back(std::move(result));
      continue;
    }

    if (gate && !gate->confirm(where, statement.text)) {
      result.status = StatementStatus::DECLINED;
      result.reason = "declined at the confirmation prompt";
      logNotApplied(where, result);
      outcome.statements.push_back(std::move(result));
      continue;
    }

    try {
      target.execute(database, statement.text);
      result.status = StatementStatus::APPLIED;
    } catch (const StatementError &e) {
      result.reason = e.what();
      result.sqlState = e.sqlState();
      result.nativeError = e.nativeError();
      result.status = isAlreadyExists(e) ? StatementStatus::SKIPPED_ALREADY_EXISTS
                                         : StatementStatus::FAILED;
    } catch (const MigrationError &e) {
      // Anything else the connection reports for this statement, for example
      // a dropped link; the remaining statements are still attempted.
      result.status = StatementStatus::FAILED;
      result.reason = e.what();
    } catch (const std::exception &e) {
      result.status = StatementStatus::FAILED;
      result.reason = std::string("Unexpected error: ") + e.what();
    }

    if (result.status == StatementStatus::FAILED) {
      Logger::warning(LogCategory::TRANSFER, "ScriptApplier",
                      "Failed on " + where + ": " + result.objectName + " - " +
                          result.reason);
    }
    if (result.status != StatementStatus::APPLIED)
      logNotApplied(where, result);

    outcome.statements.push_back(std::move(result));
  }

  Logger::info(LogCategory::TRANSFER, "ScriptApplier",
               where + ": applied " + std::to_string(outcome.applied()) +
                   ", already existed " +
                   std::to_string(outcome.skippedAlreadyExists()) +
                   ", failed " + std::to_string(outcome.failed()) +
                   (dryRun ? ", previewed " +
                                 std::to_string(outcome.previewed())
                           : "") +
                   (outcome.declined() > 0
                        ? ", declined " + std::to_string(outcome.declined())
                        : ""));
  return outcome;
}
