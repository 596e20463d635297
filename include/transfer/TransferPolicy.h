#ifndef TRANSFERPOLICY_H
#define TRANSFERPOLICY_H

#include "transfer/ObjectDescriptor.h"
#include <nlohmann/json.hpp>
#include <set>
#include <string>

enum class PolicyFlag {
  PRESERVE_OWNER_SCHEMA,
  INCLUDE_SYSTEM_OBJECTS,
  INCLUDE_DEPENDENCIES,
  INCLUDE_PERMISSIONS,
  INCLUDE_ROLE_MEMBERSHIPS,
  INCLUDE_INDEXES,
  CONTINUE_ON_GENERATION_ERROR
};

// What a migration copies. A value type: the with*() methods return a
// modified copy and never change the policy they are called on.
class TransferPolicy {
  std::set<ObjectCategory> includedCategories_;
  bool preserveOwnerSchema_ = true;
  bool includeSystemObjects_ = false;
  bool includeDependencies_ = false;
  bool includePermissions_ = true;
  bool includeRoleMemberships_ = true;
  bool includeIndexes_ = true;
  bool continueOnGenerationError_ = true;

public:
  // Every category included, flags at their defaults.
  TransferPolicy();

  // Applies the "policy" section of the configuration on top of base:
  //   {"categories": {"users": false, ...}, "include_indexes": true, ...}
  // Unknown keys and non-boolean values throw std::invalid_argument.
  static TransferPolicy fromJson(const nlohmann::json &overrides,
                                 const TransferPolicy &base = TransferPolicy());

  bool includes(ObjectCategory category) const {
    return includedCategories_.count(category) > 0;
  }
  bool flag(PolicyFlag flag) const;

  bool preserveOwnerSchema() const { return preserveOwnerSchema_; }
  bool includeSystemObjects() const { return includeSystemObjects_; }
  bool includeDependencies() const { return includeDependencies_; }
  bool includePermissions() const { return includePermissions_; }
  bool includeRoleMemberships() const { return includeRoleMemberships_; }
  bool includeIndexes() const { return includeIndexes_; }
  bool continueOnGenerationError() const { return continueOnGenerationError_; }

  TransferPolicy withCategory(ObjectCategory category, bool included) const;
  TransferPolicy withFlag(PolicyFlag flag, bool value) const;

  nlohmann::json toJson() const;
  std::string describe() const;
};

#endif
