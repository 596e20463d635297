#ifndef SCRIPTAPPLIER_H
#define SCRIPTAPPLIER_H

#include "core/migration_errors.h"
#include "engines/database_engine.h"
#include "transfer/ApplyOutcome.h"
#include "transfer/ConfirmationGate.h"
#include "transfer/TransferScript.h"

class ScriptApplier {
public:
  // Executes the script in order. A failing statement is classified and
  // recorded, and the next statement still runs. Nothing is rolled back.
  // With dryRun nothing executes and every statement comes back PREVIEWED.
  // gate may be null; when present a declined statement is recorded as
  // DECLINED and not executed.
  static ApplyOutcome apply(IServerConnection &target, SystemDatabase database,
                            const TransferScript &script, bool dryRun,
                            IConfirmationGate *gate = nullptr);

  // True when the server rejected the statement only because the object,
  // principal or permission it creates is already present.
  static bool isAlreadyExists(const StatementError &error);
};

#endif
