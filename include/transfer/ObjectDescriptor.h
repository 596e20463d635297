#ifndef OBJECTDESCRIPTOR_H
#define OBJECTDESCRIPTOR_H

#include <map>
#include <string>
#include <vector>

enum class ObjectCategory {
  SCHEMA,
  USER_DEFINED_DATA_TYPE,
  USER_DEFINED_TYPE,
  USER_DEFINED_TABLE_TYPE,
  SEQUENCE,
  TABLE,
  VIEW,
  DEFAULT,
  RULE,
  STORED_PROCEDURE,
  USER_DEFINED_FUNCTION,
  USER_DEFINED_AGGREGATE,
  SYNONYM,
  ASSEMBLY,
  DATABASE_TRIGGER,
  TRIGGER,
  ROLE,
  USER
};

constexpr ObjectCategory ALL_OBJECT_CATEGORIES[] = {
    ObjectCategory::SCHEMA,
    ObjectCategory::USER_DEFINED_DATA_TYPE,
    ObjectCategory::USER_DEFINED_TYPE,
    ObjectCategory::USER_DEFINED_TABLE_TYPE,
    ObjectCategory::SEQUENCE,
    ObjectCategory::TABLE,
    ObjectCategory::VIEW,
    ObjectCategory::DEFAULT,
    ObjectCategory::RULE,
    ObjectCategory::STORED_PROCEDURE,
    ObjectCategory::USER_DEFINED_FUNCTION,
    ObjectCategory::USER_DEFINED_AGGREGATE,
    ObjectCategory::SYNONYM,
    ObjectCategory::ASSEMBLY,
    ObjectCategory::DATABASE_TRIGGER,
    ObjectCategory::TRIGGER,
    ObjectCategory::ROLE,
    ObjectCategory::USER};

// Fixed emission order of the transfer script. Categories map onto stages,
// dependent statements (indexes, memberships, grants) get their own.
enum class ScriptStage {
  SCHEMAS = 1,
  TYPES = 2,
  SEQUENCES = 3,
  TABLES = 4,
  VIEWS = 5,
  DEFAULTS_AND_RULES = 6,
  PROGRAMMABILITY = 7,
  SYNONYMS = 8,
  ASSEMBLIES = 9,
  DATABASE_TRIGGERS = 10,
  OBJECT_TRIGGERS = 11,
  PRINCIPALS = 12,
  USER_GRANTS = 13,
  PERMISSIONS = 14
};

struct ColumnDefinition {
  std::string name;
  std::string typeName;
  std::string typeSchema; // set for alias and CLR types
  bool isUserDefinedType = false;
  int maxLength = 0;      // bytes, -1 for (max)
  int precision = 0;
  int scale = 0;
  bool isNullable = true;
  bool isIdentity = false;
  std::string identitySeed;
  std::string identityIncrement;
  std::string computedDefinition;
  bool isPersisted = false;
  std::string defaultConstraintName;
  std::string defaultDefinition;
  std::string collation;
};

struct IndexDefinition {
  std::string name;
  std::string typeDesc; // CLUSTERED, NONCLUSTERED
  bool isPrimaryKey = false;
  bool isUniqueConstraint = false;
  bool isUnique = false;
  std::vector<std::string> keyColumns; // "[col] ASC"
  std::vector<std::string> includedColumns;
  std::string filterDefinition;
};

struct ConstraintDefinition {
  enum class Kind { CHECK, FOREIGN_KEY };
  Kind kind = Kind::CHECK;
  std::string name;
  std::string definition; // CHECK expression
  std::vector<std::string> columns;
  std::string referencedSchema;
  std::string referencedTable;
  std::vector<std::string> referencedColumns;
  std::string onDelete; // NO_ACTION, CASCADE, SET_NULL, SET_DEFAULT
  std::string onUpdate;
};

// One row of sys.database_permissions, seen from the securable's or the
// grantee's descriptor.
struct PermissionEntry {
  enum class Scope { DATABASE, SCHEMA, OBJECT, TYPE, ASSEMBLY };
  Scope scope = Scope::OBJECT;
  std::string state; // GRANT, DENY, GRANT_WITH_GRANT_OPTION
  std::string permission;
  std::string grantee;
  std::string column; // column-level grants
};

struct ObjectDescriptor {
  ObjectCategory category = ObjectCategory::TABLE;
  std::string schema; // empty for schemas, principals, assemblies, DDL triggers
  std::string name;
  std::string owner; // explicit owner, empty when inherited from the schema
  std::string parentSchema;
  std::string parentName;
  std::string definition; // module text as stored on the source
  bool isSystemObject = false;
  bool isDependency = false; // only pulled in as a referenced object
  bool isDisabled = false;   // triggers
  // Built-in securable kept only for memberships and grants that name
  // migrated principals; never created or re-owned.
  bool isGrantsOnly = false;

  std::vector<ColumnDefinition> columns;
  std::vector<IndexDefinition> indexes;
  std::vector<ConstraintDefinition> constraints;
  std::vector<PermissionEntry> permissions;
  std::vector<std::string> members;

  // Category specific values: sequence parameters, alias base type, user
  // login, assembly class names and the like.
  std::map<std::string, std::string> attributes;

  std::string attribute(const std::string &key,
                        const std::string &fallback = "") const {
    auto it = attributes.find(key);
    return it != attributes.end() ? it->second : fallback;
  }

  std::string qualifiedName() const {
    return schema.empty() ? name : schema + "." + name;
  }
};

// A reference from one catalog object to another, as reported by the
// source's dependency views.
struct ObjectReference {
  ObjectCategory category = ObjectCategory::TABLE;
  std::string schema;
  std::string name;
};

std::string objectCategoryName(ObjectCategory category);

// Accepts the snake_case names used in configuration ("stored_procedures",
// "user_defined_table_types", ...); throws std::invalid_argument otherwise.
ObjectCategory parseObjectCategory(const std::string &name);

ScriptStage stageForCategory(ObjectCategory category);

#endif
