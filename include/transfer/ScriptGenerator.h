#ifndef SCRIPTGENERATOR_H
#define SCRIPTGENERATOR_H

#include "transfer/TransferPolicy.h"
#include "transfer/TransferScript.h"
#include <string>
#include <vector>

// Turns enumerated objects into T-SQL statements in fixed stage order:
// schemas, types, sequences, tables (indexes after each table, foreign keys
// after all tables), views, defaults and rules, procedures/functions/
// aggregates, synonyms, assemblies, database triggers, object triggers,
// principals (roles, users, memberships, owner transfers), user grants,
// object permissions.
//
// The order follows categories only. It does not look at references between
// individual objects, so a cross-category reference against the stage order
// fails at apply time and is reported there.
class ScriptGenerator {
public:
  // Throws GenerationError for the first object that cannot be scripted when
  // the policy does not continue on generation errors. Otherwise such objects
  // are left out and listed in the result's diagnostics.
  static GenerationResult generate(const std::vector<ObjectDescriptor> &objects,
                                   const TransferPolicy &policy);

  static std::string formatDataType(const ColumnDefinition &column);

private:
  struct RankedStatement {
    int rank;
    ScriptStatement statement;
  };

  static bool isWanted(const ObjectDescriptor &object,
                       const TransferPolicy &policy);

  static void addStatement(const ObjectDescriptor &object, std::string text,
                           ScriptStage stage, int sub,
                           std::vector<RankedStatement> &out);

  // The CREATE statements of one object and what belongs directly to its
  // definition (indexes, foreign keys, DISABLE TRIGGER).
  static void scriptDefinition(const ObjectDescriptor &object,
                               const TransferPolicy &policy,
                               std::vector<RankedStatement> &out);

  // Grants-only objects contribute memberships and permissions alone.
  static void scriptObject(const ObjectDescriptor &object,
                           const TransferPolicy &policy,
                           std::vector<RankedStatement> &out);
};

#endif
