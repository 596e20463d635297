#include "engines/mssql_catalog.h"
#include "core/logger.h"
#include "engines/mssql_engine.h"
#include "transfer/ScriptGenerator.h"
#include "utils/string_utils.h"
#include <map>

namespace {
// Objects Microsoft ships, including the ones SSMS marks through the
// microsoft_database_tools_support extended property.
const std::string SYSTEM_OBJECT_FLAG =
    "CASE WHEN o.is_ms_shipped = 1 OR EXISTS (SELECT 1 FROM "
    "sys.extended_properties ep WHERE ep.class = 1 AND ep.major_id = "
    "o.object_id AND ep.minor_id = 0 AND ep.name = "
    "N'microsoft_database_tools_support') THEN 1 ELSE 0 END";

// Whether a principal other than the built-in ones holds a permission on the
// object; only then are the permissions of a built-in object read.
const std::string USER_GRANTS_FLAG =
    "CASE WHEN EXISTS (SELECT 1 FROM sys.database_permissions dp "
    "JOIN sys.database_principals gp ON gp.principal_id = "
    "dp.grantee_principal_id WHERE dp.class = 1 AND dp.major_id = "
    "o.object_id AND gp.principal_id > 4 AND gp.is_fixed_role = 0) "
    "THEN 1 ELSE 0 END";

const std::string PERMISSION_COLUMNS =
    "SELECT perm.state_desc, perm.permission_name, g.name, "
    "ISNULL(COL_NAME(perm.major_id, perm.minor_id), '') "
    "FROM sys.database_permissions perm "
    "JOIN sys.database_principals g ON g.principal_id = "
    "perm.grantee_principal_id ";

int toInt(const std::string &value) {
  if (value.empty())
    return 0;
  return std::stoi(value);
}

bool toBool(const std::string &value) { return value == "1"; }

std::string nullIfEmpty(const std::string &value) {
  return value.empty() ? "NULL" : value;
}

// sys.objects.type codes of the objects a module can reference.
bool categoryForObjectType(const std::string &type, ObjectCategory &category) {
  static const std::map<std::string, ObjectCategory> types = {
      {"U", ObjectCategory::TABLE},
      {"V", ObjectCategory::VIEW},
      {"P", ObjectCategory::STORED_PROCEDURE},
      {"PC", ObjectCategory::STORED_PROCEDURE},
      {"FN", ObjectCategory::USER_DEFINED_FUNCTION},
      {"IF", ObjectCategory::USER_DEFINED_FUNCTION},
      {"TF", ObjectCategory::USER_DEFINED_FUNCTION},
      {"FS", ObjectCategory::USER_DEFINED_FUNCTION},
      {"FT", ObjectCategory::USER_DEFINED_FUNCTION},
      {"AF", ObjectCategory::USER_DEFINED_AGGREGATE},
      {"SN", ObjectCategory::SYNONYM},
      {"SO", ObjectCategory::SEQUENCE},
      {"D", ObjectCategory::DEFAULT},
      {"R", ObjectCategory::RULE},
      {"TR", ObjectCategory::TRIGGER},
      {"TA", ObjectCategory::TRIGGER},
      {"TT", ObjectCategory::USER_DEFINED_TABLE_TYPE},
      {"UT", ObjectCategory::USER_DEFINED_TYPE},
      {"AT", ObjectCategory::USER_DEFINED_DATA_TYPE}};
  auto it = types.find(StringUtils::trim(type));
  if (it == types.end())
    return false;
  category = it->second;
  return true;
}

bool hasObjectId(ObjectCategory category) {
  switch (category) {
  case ObjectCategory::SCHEMA:
  case ObjectCategory::USER_DEFINED_DATA_TYPE:
  case ObjectCategory::USER_DEFINED_TYPE:
  case ObjectCategory::ASSEMBLY:
  case ObjectCategory::DATABASE_TRIGGER:
  case ObjectCategory::ROLE:
  case ObjectCategory::USER:
    return false;
  default:
    return true;
  }
}
} // namespace

MSSQLCatalog::MSSQLCatalog(MSSQLServerConnection &connection)
    : connection_(connection) {}

MSSQLCatalog::Rows MSSQLCatalog::rows(SystemDatabase database,
                                      const std::string &sql) {
  return connection_.query(database, sql);
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readObjects(SystemDatabase database, ObjectCategory category) {
  switch (category) {
  case ObjectCategory::SCHEMA:
    return readSchemas(database);
  case ObjectCategory::USER_DEFINED_DATA_TYPE:
    return readAliasTypes(database);
  case ObjectCategory::USER_DEFINED_TYPE:
    return readClrTypes(database);
  case ObjectCategory::USER_DEFINED_TABLE_TYPE:
    return readTableTypes(database);
  case ObjectCategory::SEQUENCE:
    return readSequences(database);
  case ObjectCategory::TABLE:
    return readTables(database);
  case ObjectCategory::VIEW:
    return readModules(database, category, "'V'");
  case ObjectCategory::DEFAULT:
    return readModules(database, category, "'D'");
  case ObjectCategory::RULE:
    return readModules(database, category, "'R'");
  case ObjectCategory::STORED_PROCEDURE:
    return readModules(database, category, "'P', 'PC'");
  case ObjectCategory::USER_DEFINED_FUNCTION:
    return readModules(database, category, "'FN', 'IF', 'TF', 'FS', 'FT'");
  case ObjectCategory::USER_DEFINED_AGGREGATE:
    return readAggregates(database);
  case ObjectCategory::SYNONYM:
    return readSynonyms(database);
  case ObjectCategory::ASSEMBLY:
    return readAssemblies(database);
  case ObjectCategory::DATABASE_TRIGGER:
    return readTriggers(database, true);
  case ObjectCategory::TRIGGER:
    return readTriggers(database, false);
  case ObjectCategory::ROLE:
    return readRoles(database);
  case ObjectCategory::USER:
    return readUsers(database);
  }
  return {};
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readSchemas(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT s.schema_id, s.name, p.name, "
                     "CASE WHEN s.schema_id < 5 OR s.schema_id >= 16384 "
                     "THEN 1 ELSE 0 END "
                     "FROM sys.schemas s "
                     "JOIN sys.database_principals p ON p.principal_id = "
                     "s.principal_id ORDER BY s.name");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::SCHEMA;
    object.name = row[1];
    object.owner = row[2];
    object.isSystemObject = toBool(row[3]);
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::SCHEMA, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readAliasTypes(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT t.user_type_id, SCHEMA_NAME(t.schema_id), t.name, "
                     "bt.name, t.max_length, t.precision, t.scale, "
                     "t.is_nullable, ISNULL(USER_NAME(t.principal_id), '') "
                     "FROM sys.types t "
                     "JOIN sys.types bt ON bt.user_type_id = t.system_type_id "
                     "WHERE t.is_user_defined = 1 AND t.is_assembly_type = 0 "
                     "AND t.is_table_type = 0");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::USER_DEFINED_DATA_TYPE;
    object.schema = row[1];
    object.name = row[2];
    object.owner = row[8];

    ColumnDefinition base;
    base.typeName = row[3];
    base.maxLength = toInt(row[4]);
    base.precision = toInt(row[5]);
    base.scale = toInt(row[6]);
    base.isNullable = toBool(row[7]);
    object.columns.push_back(base);

    object.permissions =
        readPermissions(database, PermissionEntry::Scope::TYPE, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readClrTypes(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT at.user_type_id, SCHEMA_NAME(at.schema_id), "
                     "at.name, a.name, at.assembly_class, "
                     "ISNULL(USER_NAME(at.principal_id), '') "
                     "FROM sys.assembly_types at "
                     "JOIN sys.assemblies a ON a.assembly_id = at.assembly_id "
                     "WHERE at.is_user_defined = 1");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::USER_DEFINED_TYPE;
    object.schema = row[1];
    object.name = row[2];
    object.attributes["assembly"] = row[3];
    object.attributes["class"] = row[4];
    object.owner = row[5];
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::TYPE, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readTableTypes(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT tt.user_type_id, SCHEMA_NAME(tt.schema_id), "
                     "tt.name, tt.type_table_object_id, "
                     "ISNULL(USER_NAME(tt.principal_id), '') "
                     "FROM sys.table_types tt WHERE tt.is_user_defined = 1");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::USER_DEFINED_TABLE_TYPE;
    object.schema = row[1];
    object.name = row[2];
    object.owner = row[4];
    object.columns = readColumns(database, row[3]);
    object.indexes = readIndexes(database, row[3], true);
    object.constraints = readConstraints(database, row[3]);
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::TYPE, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readSequences(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(
      database,
      "SELECT o.object_id, SCHEMA_NAME(o.schema_id), o.name, " +
          SYSTEM_OBJECT_FLAG +
          ", ISNULL(USER_NAME(o.principal_id), ''), TYPE_NAME(o.user_type_id), "
          "CONVERT(varchar(40), o.start_value), "
          "CONVERT(varchar(40), o.increment), "
          "CONVERT(varchar(40), o.minimum_value), "
          "CONVERT(varchar(40), o.maximum_value), o.is_cycling, o.is_cached, "
          "ISNULL(CONVERT(varchar(20), o.cache_size), '') "
          "FROM sys.sequences o");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::SEQUENCE;
    object.schema = row[1];
    object.name = row[2];
    object.isSystemObject = toBool(row[3]);
    object.owner = row[4];
    object.attributes["type"] = row[5];
    object.attributes["start_value"] = row[6];
    object.attributes["increment"] = row[7];
    object.attributes["minimum_value"] = row[8];
    object.attributes["maximum_value"] = row[9];
    object.attributes["is_cycling"] = row[10];
    object.attributes["is_cached"] = row[11];
    object.attributes["cache_size"] = row[12];
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::OBJECT, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readTables(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT o.object_id, SCHEMA_NAME(o.schema_id), o.name, " +
                         SYSTEM_OBJECT_FLAG +
                         ", ISNULL(USER_NAME(o.principal_id), ''), " +
                         USER_GRANTS_FLAG + " FROM sys.tables o ORDER BY 2, 3");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::TABLE;
    object.schema = row[1];
    object.name = row[2];
    object.isSystemObject = toBool(row[3]);
    object.owner = row[4];
    // Built-in tables are never created; only their grants may be scripted.
    if (!object.isSystemObject) {
      object.columns = readColumns(database, row[0]);
      object.indexes = readIndexes(database, row[0], false);
      object.constraints = readConstraints(database, row[0]);
    }
    if (!object.isSystemObject || toBool(row[5])) {
      object.permissions =
          readPermissions(database, PermissionEntry::Scope::OBJECT, row[0]);
    }
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readModules(SystemDatabase database, ObjectCategory category,
                          const std::string &typeList) {
  std::vector<ObjectDescriptor> objects;
  std::string sql =
      "SELECT o.object_id, SCHEMA_NAME(o.schema_id), o.name, " +
      SYSTEM_OBJECT_FLAG +
      ", ISNULL(USER_NAME(o.principal_id), ''), ISNULL(m.definition, ''), "
      "CASE WHEN am.object_id IS NULL THEN '' ELSE QUOTENAME(a.name) + '.' + "
      "QUOTENAME(am.assembly_class) + '.' + QUOTENAME(am.assembly_method) END, " +
      USER_GRANTS_FLAG +
      " FROM sys.objects o "
      "LEFT JOIN sys.sql_modules m ON m.object_id = o.object_id "
      "LEFT JOIN sys.assembly_modules am ON am.object_id = o.object_id "
      "LEFT JOIN sys.assemblies a ON a.assembly_id = am.assembly_id "
      "WHERE o.type IN (" +
      typeList + ")";
  // Bound defaults and rules stand alone; column defaults belong to tables.
  if (category == ObjectCategory::DEFAULT || category == ObjectCategory::RULE)
    sql += " AND o.parent_object_id = 0";

  for (const auto &row : rows(database, sql)) {
    ObjectDescriptor object;
    object.category = category;
    object.schema = row[1];
    object.name = row[2];
    object.isSystemObject = toBool(row[3]);
    object.owner = row[4];
    object.definition = row[5];
    if (object.definition.empty() && !row[6].empty()) {
      object.attributes["external_name"] = row[6];
      readClrSignature(database, row[0], object);
    }
    if (!object.isSystemObject || toBool(row[7])) {
      object.permissions =
          readPermissions(database, PermissionEntry::Scope::OBJECT, row[0]);
    }
    objects.push_back(std::move(object));
  }
  return objects;
}

void MSSQLCatalog::readClrSignature(SystemDatabase database,
                                    const std::string &objectId,
                                    ObjectDescriptor &object) {
  auto result = rows(database,
                     "SELECT p.parameter_id, p.name, TYPE_NAME(p.user_type_id), "
                     "p.max_length, p.precision, p.scale, p.is_output "
                     "FROM sys.parameters p WHERE p.object_id = " +
                         objectId + " ORDER BY p.parameter_id");
  std::vector<std::string> parameters;
  for (const auto &row : result) {
    ColumnDefinition type;
    type.typeName = row[2];
    type.maxLength = toInt(row[3]);
    type.precision = toInt(row[4]);
    type.scale = toInt(row[5]);
    std::string formatted = ScriptGenerator::formatDataType(type);
    if (row[0] == "0") {
      object.attributes["returns"] = formatted;
      continue;
    }
    std::string parameter = row[1] + " " + formatted;
    if (toBool(row[6]))
      parameter += " OUTPUT";
    parameters.push_back(parameter);
  }
  object.attributes["parameters"] = StringUtils::join(parameters, ", ");
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readAggregates(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT o.object_id, SCHEMA_NAME(o.schema_id), o.name, " +
                         SYSTEM_OBJECT_FLAG +
                         ", ISNULL(USER_NAME(o.principal_id), ''), a.name, "
                         "am.assembly_class "
                         "FROM sys.objects o "
                         "JOIN sys.assembly_modules am ON am.object_id = "
                         "o.object_id "
                         "JOIN sys.assemblies a ON a.assembly_id = "
                         "am.assembly_id "
                         "WHERE o.type = 'AF'");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::USER_DEFINED_AGGREGATE;
    object.schema = row[1];
    object.name = row[2];
    object.isSystemObject = toBool(row[3]);
    object.owner = row[4];
    object.attributes["assembly"] = row[5];
    object.attributes["class"] = row[6];
    readClrSignature(database, row[0], object);
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::OBJECT, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readSynonyms(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT o.object_id, SCHEMA_NAME(o.schema_id), o.name, " +
                         SYSTEM_OBJECT_FLAG +
                         ", ISNULL(USER_NAME(o.principal_id), ''), "
                         "o.base_object_name FROM sys.synonyms o");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::SYNONYM;
    object.schema = row[1];
    object.name = row[2];
    object.isSystemObject = toBool(row[3]);
    object.owner = row[4];
    object.definition = row[5];
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::OBJECT, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readAssemblies(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT a.assembly_id, a.name, "
                     "CASE WHEN a.is_user_defined = 1 THEN 0 ELSE 1 END, "
                     "ISNULL(USER_NAME(a.principal_id), ''), "
                     "CASE a.permission_set WHEN 1 THEN 'SAFE' "
                     "WHEN 2 THEN 'EXTERNAL_ACCESS' ELSE 'UNSAFE' END, "
                     "ISNULL(CONVERT(varchar(max), f.content, 1), '') "
                     "FROM sys.assemblies a "
                     "LEFT JOIN sys.assembly_files f ON f.assembly_id = "
                     "a.assembly_id AND f.file_id = 1");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::ASSEMBLY;
    object.name = row[1];
    object.isSystemObject = toBool(row[2]);
    object.owner = row[3];
    object.attributes["permission_set"] = row[4];
    object.definition = row[5];
    object.permissions =
        readPermissions(database, PermissionEntry::Scope::ASSEMBLY, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor>
MSSQLCatalog::readTriggers(SystemDatabase database, bool databaseScoped) {
  std::vector<ObjectDescriptor> objects;
  std::string sql;
  if (databaseScoped) {
    sql = "SELECT t.object_id, '', t.name, t.is_ms_shipped, "
          "ISNULL(m.definition, ''), t.is_disabled, '', '' "
          "FROM sys.triggers t "
          "LEFT JOIN sys.sql_modules m ON m.object_id = t.object_id "
          "WHERE t.parent_class = 0";
  } else {
    sql = "SELECT t.object_id, SCHEMA_NAME(o.schema_id), t.name, " +
          SYSTEM_OBJECT_FLAG +
          ", ISNULL(m.definition, ''), t.is_disabled, "
          "SCHEMA_NAME(po.schema_id), po.name "
          "FROM sys.triggers t "
          "JOIN sys.objects o ON o.object_id = t.object_id "
          "JOIN sys.objects po ON po.object_id = t.parent_id "
          "LEFT JOIN sys.sql_modules m ON m.object_id = t.object_id "
          "WHERE t.parent_class = 1";
  }

  for (const auto &row : rows(database, sql)) {
    ObjectDescriptor object;
    object.category = databaseScoped ? ObjectCategory::DATABASE_TRIGGER
                                     : ObjectCategory::TRIGGER;
    object.schema = row[1];
    object.name = row[2];
    object.isSystemObject = toBool(row[3]);
    object.definition = row[4];
    object.isDisabled = toBool(row[5]);
    object.parentSchema = row[6];
    object.parentName = row[7];
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor> MSSQLCatalog::readRoles(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result = rows(database,
                     "SELECT p.principal_id, p.name, "
                     "CASE WHEN p.is_fixed_role = 1 OR p.name = 'public' "
                     "THEN 1 ELSE 0 END, "
                     "ISNULL(USER_NAME(p.owning_principal_id), '') "
                     "FROM sys.database_principals p WHERE p.type = 'R'");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::ROLE;
    object.name = row[1];
    object.isSystemObject = toBool(row[2]);
    object.owner = row[3];

    for (const auto &member :
         rows(database, "SELECT m.name FROM sys.database_role_members rm "
                        "JOIN sys.database_principals m ON m.principal_id = "
                        "rm.member_principal_id WHERE rm.role_principal_id = " +
                            row[0] + " ORDER BY m.name")) {
      object.members.push_back(member[0]);
    }
    object.permissions = readDatabasePermissions(database, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ObjectDescriptor> MSSQLCatalog::readUsers(SystemDatabase database) {
  std::vector<ObjectDescriptor> objects;
  auto result =
      rows(database,
           "SELECT p.principal_id, p.name, "
           "CASE WHEN p.principal_id < 5 OR p.name LIKE '##%' "
           "THEN 1 ELSE 0 END, "
           "p.type_desc, ISNULL(SUSER_SNAME(p.sid), ''), "
           "ISNULL(p.default_schema_name, ''), p.authentication_type_desc "
           "FROM sys.database_principals p "
           "WHERE p.type IN ('S', 'U', 'G', 'E', 'X', 'C', 'K')");
  for (const auto &row : result) {
    ObjectDescriptor object;
    object.category = ObjectCategory::USER;
    object.name = row[1];
    object.isSystemObject = toBool(row[2]);
    object.attributes["type"] = row[3];
    object.attributes["login"] = row[4];
    object.attributes["default_schema"] = row[5];
    object.attributes["authentication"] = row[6];
    object.permissions = readDatabasePermissions(database, row[0]);
    objects.push_back(std::move(object));
  }
  return objects;
}

std::vector<ColumnDefinition>
MSSQLCatalog::readColumns(SystemDatabase database, const std::string &objectId) {
  std::vector<ColumnDefinition> columns;
  auto result = rows(
      database,
      "SELECT c.name, t.name, SCHEMA_NAME(t.schema_id), t.is_user_defined, "
      "c.max_length, c.precision, c.scale, c.is_nullable, c.is_identity, "
      "ISNULL(CONVERT(varchar(40), ic.seed_value), ''), "
      "ISNULL(CONVERT(varchar(40), ic.increment_value), ''), "
      "ISNULL(cc.definition, ''), ISNULL(cc.is_persisted, 0), "
      "ISNULL(dc.name, ''), ISNULL(dc.definition, ''), "
      "CASE WHEN c.collation_name <> CONVERT(sysname, "
      "DATABASEPROPERTYEX(DB_NAME(), 'Collation')) THEN c.collation_name "
      "ELSE '' END "
      "FROM sys.columns c "
      "JOIN sys.types t ON t.user_type_id = c.user_type_id "
      "LEFT JOIN sys.identity_columns ic ON ic.object_id = c.object_id AND "
      "ic.column_id = c.column_id "
      "LEFT JOIN sys.computed_columns cc ON cc.object_id = c.object_id AND "
      "cc.column_id = c.column_id "
      "LEFT JOIN sys.default_constraints dc ON dc.parent_object_id = "
      "c.object_id AND dc.parent_column_id = c.column_id "
      "WHERE c.object_id = " +
          objectId + " ORDER BY c.column_id");
  for (const auto &row : result) {
    ColumnDefinition column;
    column.name = row[0];
    column.typeName = row[1];
    column.isUserDefinedType = toBool(row[3]);
    if (column.isUserDefinedType)
      column.typeSchema = row[2];
    column.maxLength = toInt(row[4]);
    column.precision = toInt(row[5]);
    column.scale = toInt(row[6]);
    column.isNullable = toBool(row[7]);
    column.isIdentity = toBool(row[8]);
    column.identitySeed = row[9];
    column.identityIncrement = row[10];
    column.computedDefinition = row[11];
    column.isPersisted = toBool(row[12]);
    column.defaultConstraintName = row[13];
    column.defaultDefinition = row[14];
    column.collation = row[15];
    columns.push_back(std::move(column));
  }
  return columns;
}

std::vector<IndexDefinition>
MSSQLCatalog::readIndexes(SystemDatabase database, const std::string &objectId,
                          bool keysOnly) {
  std::vector<IndexDefinition> indexes;
  std::map<std::string, size_t> positions;

  std::string sql = "SELECT i.index_id, ISNULL(i.name, ''), i.type_desc, "
                    "i.is_primary_key, i.is_unique_constraint, i.is_unique, "
                    "ISNULL(i.filter_definition, '') "
                    "FROM sys.indexes i WHERE i.object_id = " +
                    objectId +
                    " AND i.type IN (1, 2) AND i.is_hypothetical = 0";
  if (keysOnly)
    sql += " AND (i.is_primary_key = 1 OR i.is_unique_constraint = 1)";

  for (const auto &row : rows(database, sql + " ORDER BY i.index_id")) {
    IndexDefinition index;
    index.name = row[1];
    index.typeDesc = row[2];
    index.isPrimaryKey = toBool(row[3]);
    index.isUniqueConstraint = toBool(row[4]);
    index.isUnique = toBool(row[5]);
    index.filterDefinition = row[6];
    positions[row[0]] = indexes.size();
    indexes.push_back(std::move(index));
  }
  if (indexes.empty())
    return indexes;

  auto columns = rows(database,
                      "SELECT ic.index_id, c.name, ic.is_descending_key, "
                      "ic.is_included_column FROM sys.index_columns ic "
                      "JOIN sys.columns c ON c.object_id = ic.object_id AND "
                      "c.column_id = ic.column_id WHERE ic.object_id = " +
                          objectId +
                          " ORDER BY ic.index_id, ic.key_ordinal, "
                          "ic.index_column_id");
  for (const auto &row : columns) {
    auto it = positions.find(row[0]);
    if (it == positions.end())
      continue;
    IndexDefinition &index = indexes[it->second];
    std::string column = StringUtils::quoteName(row[1]);
    if (toBool(row[3])) {
      index.includedColumns.push_back(column);
    } else {
      index.keyColumns.push_back(column + (toBool(row[2]) ? " DESC" : " ASC"));
    }
  }
  return indexes;
}

std::vector<ConstraintDefinition>
MSSQLCatalog::readConstraints(SystemDatabase database,
                              const std::string &objectId) {
  std::vector<ConstraintDefinition> constraints;
  for (const auto &row :
       rows(database, "SELECT name, definition FROM sys.check_constraints "
                      "WHERE parent_object_id = " +
                          objectId + " ORDER BY name")) {
    ConstraintDefinition check;
    check.kind = ConstraintDefinition::Kind::CHECK;
    check.name = row[0];
    check.definition = row[1];
    constraints.push_back(std::move(check));
  }

  std::map<std::string, size_t> positions;
  auto keys = rows(database,
                   "SELECT fk.object_id, fk.name, SCHEMA_NAME(rt.schema_id), "
                   "rt.name, fk.delete_referential_action_desc, "
                   "fk.update_referential_action_desc "
                   "FROM sys.foreign_keys fk "
                   "JOIN sys.objects rt ON rt.object_id = "
                   "fk.referenced_object_id WHERE fk.parent_object_id = " +
                       objectId + " ORDER BY fk.name");
  if (keys.empty())
    return constraints;

  for (const auto &row : keys) {
    ConstraintDefinition fk;
    fk.kind = ConstraintDefinition::Kind::FOREIGN_KEY;
    fk.name = row[1];
    fk.referencedSchema = row[2];
    fk.referencedTable = row[3];
    fk.onDelete = row[4];
    fk.onUpdate = row[5];
    positions[row[0]] = constraints.size();
    constraints.push_back(std::move(fk));
  }

  auto columns = rows(database,
                      "SELECT fkc.constraint_object_id, pc.name, rc.name "
                      "FROM sys.foreign_key_columns fkc "
                      "JOIN sys.columns pc ON pc.object_id = "
                      "fkc.parent_object_id AND pc.column_id = "
                      "fkc.parent_column_id "
                      "JOIN sys.columns rc ON rc.object_id = "
                      "fkc.referenced_object_id AND rc.column_id = "
                      "fkc.referenced_column_id "
                      "WHERE fkc.parent_object_id = " +
                          objectId +
                          " ORDER BY fkc.constraint_object_id, "
                          "fkc.constraint_column_id");
  for (const auto &row : columns) {
    auto it = positions.find(row[0]);
    if (it == positions.end())
      continue;
    constraints[it->second].columns.push_back(row[1]);
    constraints[it->second].referencedColumns.push_back(row[2]);
  }
  return constraints;
}

std::vector<PermissionEntry>
MSSQLCatalog::readPermissions(SystemDatabase database,
                              PermissionEntry::Scope scope,
                              const std::string &majorId) {
  // sys.database_permissions.class: 1 object, 3 schema, 5 assembly, 6 type
  std::string permissionClass = "1";
  switch (scope) {
  case PermissionEntry::Scope::SCHEMA:
    permissionClass = "3";
    break;
  case PermissionEntry::Scope::ASSEMBLY:
    permissionClass = "5";
    break;
  case PermissionEntry::Scope::TYPE:
    permissionClass = "6";
    break;
  default:
    break;
  }

  std::vector<PermissionEntry> entries;
  for (const auto &row :
       rows(database, PERMISSION_COLUMNS + "WHERE perm.class = " +
                          permissionClass + " AND perm.major_id = " + majorId +
                          " AND perm.state IN ('G', 'D', 'W')")) {
    PermissionEntry entry;
    entry.scope = scope;
    entry.state = row[0];
    entry.permission = row[1];
    entry.grantee = row[2];
    entry.column = row[3];
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<PermissionEntry>
MSSQLCatalog::readDatabasePermissions(SystemDatabase database,
                                      const std::string &principalId) {
  std::vector<PermissionEntry> entries;
  for (const auto &row :
       rows(database, PERMISSION_COLUMNS +
                          "WHERE perm.class = 0 AND perm.grantee_principal_id = " +
                          principalId + " AND perm.state IN ('G', 'D', 'W')")) {
    PermissionEntry entry;
    entry.scope = PermissionEntry::Scope::DATABASE;
    entry.state = row[0];
    entry.permission = row[1];
    entry.grantee = row[2];
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<ObjectReference>
MSSQLCatalog::readReferences(SystemDatabase database,
                             const ObjectDescriptor &object) {
  std::vector<ObjectReference> references;
  if (!hasObjectId(object.category))
    return references;

  const std::string literal = StringUtils::quoteLiteral(
      StringUtils::quoteName(object.schema) + "." +
      StringUtils::quoteName(object.name));
  const std::string id =
      object.category == ObjectCategory::USER_DEFINED_TABLE_TYPE
          ? "(SELECT type_table_object_id FROM sys.table_types WHERE "
            "user_type_id = TYPE_ID(" +
                literal + "))"
          : "OBJECT_ID(" + literal + ")";
  const std::string typeCode =
      "CASE WHEN t.is_table_type = 1 THEN 'TT' WHEN t.is_assembly_type = 1 "
      "THEN 'UT' ELSE 'AT' END";

  std::string sql =
      "SELECT SCHEMA_NAME(o.schema_id), o.name, o.type "
      "FROM sys.sql_expression_dependencies d "
      "JOIN sys.objects o ON o.object_id = d.referenced_id "
      "WHERE d.referencing_id = " +
      id +
      " AND d.referenced_class = 1 "
      "UNION SELECT SCHEMA_NAME(t.schema_id), t.name, " +
      typeCode +
      " FROM sys.sql_expression_dependencies d "
      "JOIN sys.types t ON t.user_type_id = d.referenced_id "
      "WHERE d.referencing_id = " +
      id +
      " AND d.referenced_class = 6 "
      "UNION SELECT SCHEMA_NAME(t.schema_id), t.name, " +
      typeCode +
      " FROM sys.columns c JOIN sys.types t ON t.user_type_id = "
      "c.user_type_id WHERE c.object_id = " +
      id +
      " AND t.is_user_defined = 1 "
      "UNION SELECT SCHEMA_NAME(o.schema_id), o.name, o.type "
      "FROM sys.foreign_keys fk JOIN sys.objects o ON o.object_id = "
      "fk.referenced_object_id WHERE fk.parent_object_id = " +
      id +
      " UNION SELECT SCHEMA_NAME(o.schema_id), o.name, o.type "
      "FROM sys.triggers tr JOIN sys.objects o ON o.object_id = tr.parent_id "
      "WHERE tr.object_id = " +
      id;

  for (const auto &row : rows(database, sql)) {
    ObjectReference reference;
    if (!categoryForObjectType(row[2], reference.category)) {
      Logger::debug(LogCategory::DATABASE, "MSSQLCatalog",
                    "Ignoring reference from " + object.qualifiedName() +
                        " to " + row[0] + "." + row[1] + " of type " +
                        nullIfEmpty(row[2]));
      continue;
    }
    reference.schema = row[0];
    reference.name = row[1];
    if (reference.schema == object.schema && reference.name == object.name)
      continue;
    references.push_back(std::move(reference));
  }
  return references;
}
