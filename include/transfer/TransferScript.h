#ifndef TRANSFERSCRIPT_H
#define TRANSFERSCRIPT_H

#include "transfer/ObjectDescriptor.h"
#include <string>
#include <vector>

struct ScriptStatement {
  std::string text;
  ScriptStage stage = ScriptStage::SCHEMAS;
  ObjectCategory category = ObjectCategory::SCHEMA; // category of the source object
  std::string objectName;                           // schema.name of the source object
};

using TransferScript = std::vector<ScriptStatement>;

struct GenerationDiagnostic {
  ObjectCategory category = ObjectCategory::TABLE;
  std::string objectName;
  std::string reason;
};

struct GenerationResult {
  TransferScript script;
  std::vector<GenerationDiagnostic> diagnostics;
  size_t scriptedObjects = 0;
};

#endif
