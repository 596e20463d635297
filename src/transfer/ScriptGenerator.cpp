#include "transfer/ScriptGenerator.h"
#include "core/logger.h"
#include "core/migration_errors.h"
#include "utils/string_utils.h"
#include <algorithm>

using StringUtils::quoteName;

namespace {
constexpr int SUB_DEFAULT = 0;
constexpr int SUB_USERS = 1;
constexpr int SUB_MEMBERSHIPS = 2;
constexpr int SUB_OWNERS = 3;
constexpr int SUB_FOREIGN_KEYS = 5;

int rankOf(ScriptStage stage, int sub = SUB_DEFAULT) {
  return static_cast<int>(stage) * 10 + sub;
}

// Schema-qualified when owners are preserved, bare otherwise so the object
// lands in the destination's default schema.
std::string targetName(const std::string &schema, const std::string &name,
                       bool preserveOwnerSchema) {
  if (preserveOwnerSchema && !schema.empty()) {
    return quoteName(schema) + "." + quoteName(name);
  }
  return quoteName(name);
}

std::string targetName(const ObjectDescriptor &object,
                       const TransferPolicy &policy) {
  return targetName(object.schema, object.name, policy.preserveOwnerSchema());
}

// Table types take no constraint names, so namedConstraints is false for
// them.
std::string columnDefinition(const ColumnDefinition &column,
                             bool namedConstraints) {
  std::string sql = quoteName(column.name);

  if (!column.computedDefinition.empty()) {
    sql += " AS " + column.computedDefinition;
    if (column.isPersisted)
      sql += " PERSISTED";
    return sql;
  }

  sql += " " + ScriptGenerator::formatDataType(column);
  if (!column.collation.empty())
    sql += " COLLATE " + column.collation;
  if (column.isIdentity) {
    sql += " IDENTITY(" +
           (column.identitySeed.empty() ? "1" : column.identitySeed) + "," +
           (column.identityIncrement.empty() ? "1" : column.identityIncrement) +
           ")";
  }
  sql += column.isNullable ? " NULL" : " NOT NULL";
  if (!column.defaultDefinition.empty()) {
    if (namedConstraints && !column.defaultConstraintName.empty())
      sql += " CONSTRAINT " + quoteName(column.defaultConstraintName);
    sql += " DEFAULT " + column.defaultDefinition;
  }
  return sql;
}

std::string keyConstraintDefinition(const IndexDefinition &index,
                                    bool namedConstraints) {
  std::string sql =
      namedConstraints ? "CONSTRAINT " + quoteName(index.name) + " " : "";
  sql += (index.isPrimaryKey ? "PRIMARY KEY " : "UNIQUE ") +
         (index.typeDesc.empty() ? "NONCLUSTERED" : index.typeDesc) + " (" +
         StringUtils::join(index.keyColumns, ", ") + ")";
  return sql;
}

// Body of CREATE TABLE / CREATE TYPE ... AS TABLE: columns, key constraints
// and check constraints.
std::string tableBody(const ObjectDescriptor &object, bool namedConstraints) {
  if (object.columns.empty()) {
    throw GenerationError(object.qualifiedName(), "no column metadata");
  }

  std::vector<std::string> lines;
  for (const auto &column : object.columns) {
    lines.push_back("    " + columnDefinition(column, namedConstraints));
  }
  for (const auto &index : object.indexes) {
    if (index.isPrimaryKey || index.isUniqueConstraint) {
      if (index.keyColumns.empty()) {
        throw GenerationError(object.qualifiedName(),
                              "key constraint " + index.name +
                                  " has no columns");
      }
      lines.push_back("    " +
                      keyConstraintDefinition(index, namedConstraints));
    }
  }
  for (const auto &constraint : object.constraints) {
    if (constraint.kind != ConstraintDefinition::Kind::CHECK)
      continue;
    std::string check = "CHECK " + constraint.definition;
    if (namedConstraints)
      check = "CONSTRAINT " + quoteName(constraint.name) + " " + check;
    lines.push_back("    " + check);
  }
  return "(\n" + StringUtils::join(lines, ",\n") + "\n)";
}

std::string indexStatement(const ObjectDescriptor &table,
                           const IndexDefinition &index,
                           const TransferPolicy &policy) {
  std::string sql = "CREATE ";
  if (index.isUnique)
    sql += "UNIQUE ";
  sql += (index.typeDesc.empty() ? "NONCLUSTERED" : index.typeDesc) +
         " INDEX " + quoteName(index.name) + " ON " +
         targetName(table, policy) + " (" +
         StringUtils::join(index.keyColumns, ", ") + ")";
  if (!index.includedColumns.empty()) {
    sql += " INCLUDE (" + StringUtils::join(index.includedColumns, ", ") + ")";
  }
  if (!index.filterDefinition.empty()) {
    sql += " WHERE " + index.filterDefinition;
  }
  return sql;
}

std::string referentialAction(const std::string &action) {
  std::string upper = StringUtils::toUpper(action);
  std::replace(upper.begin(), upper.end(), '_', ' ');
  return upper;
}

std::string foreignKeyStatement(const ObjectDescriptor &table,
                                const ConstraintDefinition &fk,
                                const TransferPolicy &policy) {
  if (fk.columns.empty() || fk.columns.size() != fk.referencedColumns.size()) {
    throw GenerationError(table.qualifiedName(),
                          "foreign key " + fk.name + " has mismatched columns");
  }

  std::vector<std::string> columns;
  std::vector<std::string> referenced;
  for (const auto &column : fk.columns)
    columns.push_back(quoteName(column));
  for (const auto &column : fk.referencedColumns)
    referenced.push_back(quoteName(column));

  std::string sql = "ALTER TABLE " + targetName(table, policy) +
                    " ADD CONSTRAINT " + quoteName(fk.name) + " FOREIGN KEY (" +
                    StringUtils::join(columns, ", ") + ") REFERENCES " +
                    targetName(fk.referencedSchema, fk.referencedTable,
                               policy.preserveOwnerSchema()) +
                    " (" + StringUtils::join(referenced, ", ") + ")";
  if (!fk.onDelete.empty() && referentialAction(fk.onDelete) != "NO ACTION")
    sql += " ON DELETE " + referentialAction(fk.onDelete);
  if (!fk.onUpdate.empty() && referentialAction(fk.onUpdate) != "NO ACTION")
    sql += " ON UPDATE " + referentialAction(fk.onUpdate);
  return sql;
}

std::string securableClause(const ObjectDescriptor &object,
                            const PermissionEntry &entry,
                            const TransferPolicy &policy) {
  switch (entry.scope) {
  case PermissionEntry::Scope::DATABASE:
    return "";
  case PermissionEntry::Scope::SCHEMA:
    return " ON SCHEMA::" + quoteName(object.name);
  case PermissionEntry::Scope::TYPE:
    return " ON TYPE::" + targetName(object, policy);
  case PermissionEntry::Scope::ASSEMBLY:
    return " ON ASSEMBLY::" + quoteName(object.name);
  case PermissionEntry::Scope::OBJECT:
    break;
  }
  std::string clause = " ON OBJECT::" + targetName(object, policy);
  if (!entry.column.empty())
    clause += " (" + quoteName(entry.column) + ")";
  return clause;
}

std::string permissionStatement(const ObjectDescriptor &object,
                                const PermissionEntry &entry,
                                const TransferPolicy &policy) {
  if (entry.permission.empty() || entry.grantee.empty()) {
    throw GenerationError(object.qualifiedName(),
                          "permission entry without permission or grantee");
  }

  std::string state = StringUtils::toUpper(entry.state);
  bool withGrantOption = state == "GRANT_WITH_GRANT_OPTION" || state == "W";
  std::string verb = (state == "DENY" || state == "D") ? "DENY" : "GRANT";

  std::string sql = verb + " " + StringUtils::toUpper(entry.permission) +
                    securableClause(object, entry, policy) + " TO " +
                    quoteName(entry.grantee);
  if (withGrantOption)
    sql += " WITH GRANT OPTION";
  return sql;
}

std::string moduleDefinition(const ObjectDescriptor &object,
                             const TransferPolicy &policy) {
  std::string body = StringUtils::trim(object.definition);
  if (!body.empty())
    return body;

  std::string externalName = object.attribute("external_name");
  if (externalName.empty()) {
    throw GenerationError(object.qualifiedName(),
                          "definition unavailable (encrypted or missing)");
  }

  std::string parameters = object.attribute("parameters");
  switch (object.category) {
  case ObjectCategory::STORED_PROCEDURE:
    return "CREATE PROCEDURE " + targetName(object, policy) +
           (parameters.empty() ? "" : " " + parameters) +
           " AS EXTERNAL NAME " + externalName;
  case ObjectCategory::USER_DEFINED_FUNCTION: {
    std::string returns = object.attribute("returns");
    if (returns.empty()) {
      throw GenerationError(object.qualifiedName(),
                            "CLR function without return type");
    }
    return "CREATE FUNCTION " + targetName(object, policy) + "(" + parameters +
           ") RETURNS " + returns + " AS EXTERNAL NAME " + externalName;
  }
  default:
    throw GenerationError(object.qualifiedName(),
                          "CLR " + objectCategoryName(object.category) +
                              " cannot be scripted");
  }
}

std::string sequenceStatement(const ObjectDescriptor &object,
                              const TransferPolicy &policy) {
  std::string sql = "CREATE SEQUENCE " + targetName(object, policy) + " AS " +
                    object.attribute("type", "bigint");
  auto append = [&](const char *clause, const std::string &key) {
    std::string value = object.attribute(key);
    if (!value.empty())
      sql += std::string(" ") + clause + " " + value;
  };
  append("START WITH", "start_value");
  append("INCREMENT BY", "increment");
  append("MINVALUE", "minimum_value");
  append("MAXVALUE", "maximum_value");
  sql += object.attribute("is_cycling") == "1" ? " CYCLE" : " NO CYCLE";
  if (object.attribute("is_cached") == "0") {
    sql += " NO CACHE";
  } else if (!object.attribute("cache_size").empty()) {
    sql += " CACHE " + object.attribute("cache_size");
  }
  return sql;
}

std::string userStatement(const ObjectDescriptor &object) {
  std::string type = StringUtils::toUpper(object.attribute("type", "SQL_USER"));
  std::string login = object.attribute("login");
  std::string defaultSchema = object.attribute("default_schema");
  std::string authentication =
      StringUtils::toUpper(object.attribute("authentication", "INSTANCE"));

  if (type == "CERTIFICATE_MAPPED_USER" || type == "ASYMMETRIC_KEY_MAPPED_USER") {
    throw GenerationError(object.name, "key-mapped users are not supported");
  }
  if (authentication == "DATABASE") {
    throw GenerationError(object.name,
                          "contained database users cannot be scripted "
                          "without their password hash");
  }

  std::string sql = "CREATE USER " + quoteName(object.name);
  if (!login.empty()) {
    sql += " FOR LOGIN " + quoteName(login);
  } else if (type == "SQL_USER") {
    sql += " WITHOUT LOGIN";
  }
  if (!defaultSchema.empty() && type != "WINDOWS_GROUP") {
    sql += " WITH DEFAULT_SCHEMA = " + quoteName(defaultSchema);
  }
  return sql;
}

std::string assemblyStatement(const ObjectDescriptor &object) {
  if (!StringUtils::startsWith(object.definition, "0x")) {
    throw GenerationError(object.name, "assembly binary is unavailable");
  }
  return "CREATE ASSEMBLY " + quoteName(object.name) + " FROM " +
         object.definition + " WITH PERMISSION_SET = " +
         StringUtils::toUpper(object.attribute("permission_set", "SAFE"));
}

std::string clrReference(const ObjectDescriptor &object) {
  std::string assembly = object.attribute("assembly");
  std::string className = object.attribute("class");
  if (assembly.empty() || className.empty()) {
    throw GenerationError(object.qualifiedName(),
                          "assembly or class name unavailable");
  }
  return quoteName(assembly) + "." + quoteName(className);
}

// Securable clause of ALTER AUTHORIZATION, empty for categories whose owner
// is not transferred.
std::string ownerSecurable(const ObjectDescriptor &object,
                           const TransferPolicy &policy) {
  switch (object.category) {
  case ObjectCategory::SCHEMA:
    return "SCHEMA::" + quoteName(object.name);
  case ObjectCategory::ROLE:
    return "ROLE::" + quoteName(object.name);
  case ObjectCategory::ASSEMBLY:
    return "ASSEMBLY::" + quoteName(object.name);
  case ObjectCategory::USER_DEFINED_DATA_TYPE:
  case ObjectCategory::USER_DEFINED_TYPE:
  case ObjectCategory::USER_DEFINED_TABLE_TYPE:
    return "TYPE::" + targetName(object, policy);
  case ObjectCategory::TABLE:
  case ObjectCategory::VIEW:
  case ObjectCategory::STORED_PROCEDURE:
  case ObjectCategory::USER_DEFINED_FUNCTION:
  case ObjectCategory::USER_DEFINED_AGGREGATE:
  case ObjectCategory::SEQUENCE:
  case ObjectCategory::SYNONYM:
    return "OBJECT::" + targetName(object, policy);
  default:
    return "";
  }
}
} // namespace

std::string ScriptGenerator::formatDataType(const ColumnDefinition &column) {
  if (column.isUserDefinedType) {
    return column.typeSchema.empty()
               ? quoteName(column.typeName)
               : quoteName(column.typeSchema) + "." + quoteName(column.typeName);
  }

  std::string type = StringUtils::toLower(column.typeName);
  if (type == "varchar" || type == "char" || type == "varbinary" ||
      type == "binary") {
    return type + "(" +
           (column.maxLength == -1 ? "max" : std::to_string(column.maxLength)) +
           ")";
  }
  if (type == "nvarchar" || type == "nchar") {
    return type + "(" +
           (column.maxLength == -1 ? "max"
                                   : std::to_string(column.maxLength / 2)) +
           ")";
  }
  if (type == "decimal" || type == "numeric") {
    return type + "(" + std::to_string(column.precision) + "," +
           std::to_string(column.scale) + ")";
  }
  if (type == "datetime2" || type == "time" || type == "datetimeoffset") {
    return type + "(" + std::to_string(column.scale) + ")";
  }
  if (type == "float" && column.precision > 0 && column.precision != 53) {
    return type + "(" + std::to_string(column.precision) + ")";
  }
  return type;
}

bool ScriptGenerator::isWanted(const ObjectDescriptor &object,
                               const TransferPolicy &policy) {
  if (object.isDependency) {
    return policy.includeDependencies();
  }
  return policy.includes(object.category);
}

void ScriptGenerator::addStatement(const ObjectDescriptor &object,
                                   std::string text, ScriptStage stage, int sub,
                                   std::vector<RankedStatement> &out) {
  out.push_back(RankedStatement{
      rankOf(stage, sub), ScriptStatement{std::move(text), stage,
                                          object.category,
                                          object.qualifiedName()}});
}

void ScriptGenerator::scriptDefinition(const ObjectDescriptor &object,
                                       const TransferPolicy &policy,
                                       std::vector<RankedStatement> &out) {
  const ScriptStage stage = stageForCategory(object.category);
  const std::string name = targetName(object, policy);
  auto emit = [&](std::string text, ScriptStage at, int sub) {
    addStatement(object, std::move(text), at, sub, out);
  };

  switch (object.category) {
  case ObjectCategory::SCHEMA:
    emit("CREATE SCHEMA " + quoteName(object.name), stage, SUB_DEFAULT);
    break;
  case ObjectCategory::USER_DEFINED_DATA_TYPE: {
    if (object.columns.empty()) {
      throw GenerationError(object.qualifiedName(), "base type unknown");
    }
    const ColumnDefinition &base = object.columns.front();
    emit("CREATE TYPE " + name + " FROM " + formatDataType(base) +
             (base.isNullable ? " NULL" : " NOT NULL"),
         stage, SUB_DEFAULT);
    break;
  }
  case ObjectCategory::USER_DEFINED_TYPE:
    emit("CREATE TYPE " + name + " EXTERNAL NAME " + clrReference(object),
         stage, SUB_DEFAULT);
    break;
  case ObjectCategory::USER_DEFINED_TABLE_TYPE:
    emit("CREATE TYPE " + name + " AS TABLE " + tableBody(object, false), stage,
         SUB_DEFAULT);
    break;
  case ObjectCategory::SEQUENCE:
    emit(sequenceStatement(object, policy), stage, SUB_DEFAULT);
    break;
  case ObjectCategory::TABLE: {
    emit("CREATE TABLE " + name + " " + tableBody(object, true), stage,
         SUB_DEFAULT);
    if (policy.includeIndexes()) {
      for (const auto &index : object.indexes) {
        if (index.isPrimaryKey || index.isUniqueConstraint)
          continue;
        if (index.keyColumns.empty()) {
          throw GenerationError(object.qualifiedName(),
                                "index " + index.name + " has no key columns");
        }
        emit(indexStatement(object, index, policy), stage, SUB_DEFAULT);
      }
    }
    for (const auto &constraint : object.constraints) {
      if (constraint.kind == ConstraintDefinition::Kind::FOREIGN_KEY) {
        emit(foreignKeyStatement(object, constraint, policy), stage,
             SUB_FOREIGN_KEYS);
      }
    }
    break;
  }
  case ObjectCategory::VIEW:
  case ObjectCategory::DEFAULT:
  case ObjectCategory::RULE:
  case ObjectCategory::STORED_PROCEDURE:
  case ObjectCategory::USER_DEFINED_FUNCTION:
  case ObjectCategory::DATABASE_TRIGGER:
  case ObjectCategory::TRIGGER:
    emit(moduleDefinition(object, policy), stage, SUB_DEFAULT);
    if (object.isDisabled && object.category == ObjectCategory::TRIGGER) {
      emit("DISABLE TRIGGER " + name + " ON " +
               targetName(object.parentSchema, object.parentName,
                          policy.preserveOwnerSchema()),
           stage, SUB_DEFAULT);
    } else if (object.isDisabled &&
               object.category == ObjectCategory::DATABASE_TRIGGER) {
      emit("DISABLE TRIGGER " + quoteName(object.name) + " ON DATABASE", stage,
           SUB_DEFAULT);
    }
    break;
  case ObjectCategory::USER_DEFINED_AGGREGATE: {
    std::string returns = object.attribute("returns");
    if (returns.empty()) {
      throw GenerationError(object.qualifiedName(), "return type unavailable");
    }
    emit("CREATE AGGREGATE " + name + "(" + object.attribute("parameters") +
             ") RETURNS " + returns + " EXTERNAL NAME " + clrReference(object),
         stage, SUB_DEFAULT);
    break;
  }
  case ObjectCategory::SYNONYM:
    if (object.definition.empty()) {
      throw GenerationError(object.qualifiedName(), "base object unknown");
    }
    emit("CREATE SYNONYM " + name + " FOR " + object.definition, stage,
         SUB_DEFAULT);
    break;
  case ObjectCategory::ASSEMBLY:
    emit(assemblyStatement(object), stage, SUB_DEFAULT);
    break;
  case ObjectCategory::ROLE:
    emit("CREATE ROLE " + quoteName(object.name), stage, SUB_DEFAULT);
    break;
  case ObjectCategory::USER:
    emit(userStatement(object), stage, SUB_USERS);
    break;
  }
}

// Owners are transferred in the principals stage, after users and role
// memberships, since the owner is often a principal created there.
void ScriptGenerator::scriptObject(const ObjectDescriptor &object,
                                   const TransferPolicy &policy,
                                   std::vector<RankedStatement> &out) {
  if (!object.isGrantsOnly)
    scriptDefinition(object, policy, out);

  if (object.category == ObjectCategory::ROLE &&
      policy.includeRoleMemberships()) {
    for (const auto &member : object.members) {
      addStatement(object,
                   "ALTER ROLE " + quoteName(object.name) + " ADD MEMBER " +
                       quoteName(member),
                   ScriptStage::PRINCIPALS, SUB_MEMBERSHIPS, out);
    }
  }

  if (!object.isGrantsOnly && policy.preserveOwnerSchema() &&
      !object.owner.empty()) {
    std::string securable = ownerSecurable(object, policy);
    if (!securable.empty()) {
      addStatement(object,
                   "ALTER AUTHORIZATION ON " + securable + " TO " +
                       quoteName(object.owner),
                   ScriptStage::PRINCIPALS, SUB_OWNERS, out);
    }
  }

  if (policy.includePermissions()) {
    for (const auto &entry : object.permissions) {
      ScriptStage at = entry.scope == PermissionEntry::Scope::DATABASE
                           ? ScriptStage::USER_GRANTS
                           : ScriptStage::PERMISSIONS;
      addStatement(object, permissionStatement(object, entry, policy), at,
                   SUB_DEFAULT, out);
    }
  }
}

GenerationResult
ScriptGenerator::generate(const std::vector<ObjectDescriptor> &objects,
                          const TransferPolicy &policy) {
  GenerationResult result;
  std::vector<RankedStatement> ranked;

  for (const auto &object : objects) {
    if (!isWanted(object, policy))
      continue;

    std::vector<RankedStatement> statements;
    try {
      scriptObject(object, policy, statements);
    } catch (const GenerationError &e) {
      if (!policy.continueOnGenerationError()) {
        Logger::error(LogCategory::SCRIPTING, "ScriptGenerator",
                      std::string(e.what()) + "; aborting script generation");
        throw;
      }
      Logger::warning(LogCategory::SCRIPTING, "ScriptGenerator",
                      std::string(e.what()) + "; object skipped");
      result.diagnostics.push_back(
          GenerationDiagnostic{object.category, object.qualifiedName(),
                               e.what()});
      continue;
    }

    for (auto &statement : statements) {
      ranked.push_back(std::move(statement));
    }
    result.scriptedObjects++;
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedStatement &a, const RankedStatement &b) {
                     return a.rank < b.rank;
                   });

  result.script.reserve(ranked.size());
  for (auto &entry : ranked) {
    result.script.push_back(std::move(entry.statement));
  }

  Logger::info(LogCategory::SCRIPTING, "ScriptGenerator",
               "Generated " + std::to_string(result.script.size()) +
                   " statements for " + std::to_string(result.scriptedObjects) +
                   " objects (" + std::to_string(result.diagnostics.size()) +
                   " skipped)");
  return result;
}
