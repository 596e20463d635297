#include "transfer/ObjectDescriptor.h"
#include "utils/string_utils.h"
#include <stdexcept>

std::string objectCategoryName(ObjectCategory category) {
  switch (category) {
  case ObjectCategory::SCHEMA:
    return "schemas";
  case ObjectCategory::USER_DEFINED_DATA_TYPE:
    return "user_defined_data_types";
  case ObjectCategory::USER_DEFINED_TYPE:
    return "user_defined_types";
  case ObjectCategory::USER_DEFINED_TABLE_TYPE:
    return "user_defined_table_types";
  case ObjectCategory::SEQUENCE:
    return "sequences";
  case ObjectCategory::TABLE:
    return "tables";
  case ObjectCategory::VIEW:
    return "views";
  case ObjectCategory::DEFAULT:
    return "defaults";
  case ObjectCategory::RULE:
    return "rules";
  case ObjectCategory::STORED_PROCEDURE:
    return "stored_procedures";
  case ObjectCategory::USER_DEFINED_FUNCTION:
    return "user_defined_functions";
  case ObjectCategory::USER_DEFINED_AGGREGATE:
    return "user_defined_aggregates";
  case ObjectCategory::SYNONYM:
    return "synonyms";
  case ObjectCategory::ASSEMBLY:
    return "assemblies";
  case ObjectCategory::DATABASE_TRIGGER:
    return "database_triggers";
  case ObjectCategory::TRIGGER:
    return "triggers";
  case ObjectCategory::ROLE:
    return "roles";
  case ObjectCategory::USER:
    return "users";
  }
  return "unknown";
}

ObjectCategory parseObjectCategory(const std::string &name) {
  std::string key = StringUtils::toLower(StringUtils::trim(name));
  for (ObjectCategory category : ALL_OBJECT_CATEGORIES) {
    if (objectCategoryName(category) == key) {
      return category;
    }
  }
  throw std::invalid_argument("Unknown object category: " + name);
}

ScriptStage stageForCategory(ObjectCategory category) {
  switch (category) {
  case ObjectCategory::SCHEMA:
    return ScriptStage::SCHEMAS;
  case ObjectCategory::USER_DEFINED_DATA_TYPE:
  case ObjectCategory::USER_DEFINED_TYPE:
  case ObjectCategory::USER_DEFINED_TABLE_TYPE:
    return ScriptStage::TYPES;
  case ObjectCategory::SEQUENCE:
    return ScriptStage::SEQUENCES;
  case ObjectCategory::TABLE:
    return ScriptStage::TABLES;
  case ObjectCategory::VIEW:
    return ScriptStage::VIEWS;
  case ObjectCategory::DEFAULT:
  case ObjectCategory::RULE:
    return ScriptStage::DEFAULTS_AND_RULES;
  case ObjectCategory::STORED_PROCEDURE:
  case ObjectCategory::USER_DEFINED_FUNCTION:
  case ObjectCategory::USER_DEFINED_AGGREGATE:
    return ScriptStage::PROGRAMMABILITY;
  case ObjectCategory::SYNONYM:
    return ScriptStage::SYNONYMS;
  case ObjectCategory::ASSEMBLY:
    return ScriptStage::ASSEMBLIES;
  case ObjectCategory::DATABASE_TRIGGER:
    return ScriptStage::DATABASE_TRIGGERS;
  case ObjectCategory::TRIGGER:
    return ScriptStage::OBJECT_TRIGGERS;
  case ObjectCategory::ROLE:
  case ObjectCategory::USER:
    return ScriptStage::PRINCIPALS;
  }
  return ScriptStage::PERMISSIONS;
}
