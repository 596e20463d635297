#include "transfer/TransferPolicy.h"
#include "utils/string_utils.h"
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace {
struct FlagKey {
  PolicyFlag flag;
  const char *key;
};

constexpr FlagKey FLAG_KEYS[] = {
    {PolicyFlag::PRESERVE_OWNER_SCHEMA, "preserve_owner_schema"},
    {PolicyFlag::INCLUDE_SYSTEM_OBJECTS, "include_system_objects"},
    {PolicyFlag::INCLUDE_DEPENDENCIES, "include_dependencies"},
    {PolicyFlag::INCLUDE_PERMISSIONS, "include_permissions"},
    {PolicyFlag::INCLUDE_ROLE_MEMBERSHIPS, "include_role_memberships"},
    {PolicyFlag::INCLUDE_INDEXES, "include_indexes"},
    {PolicyFlag::CONTINUE_ON_GENERATION_ERROR, "continue_on_generation_error"}};

bool requireBool(const json &value, const std::string &key) {
  if (!value.is_boolean()) {
    throw std::invalid_argument("Policy setting '" + key +
                                "' must be true or false");
  }
  return value.get<bool>();
}
} // namespace

TransferPolicy::TransferPolicy()
    : includedCategories_(std::begin(ALL_OBJECT_CATEGORIES),
                          std::end(ALL_OBJECT_CATEGORIES)) {}

TransferPolicy TransferPolicy::fromJson(const json &overrides,
                                        const TransferPolicy &base) {
  if (overrides.is_null()) {
    return base;
  }
  if (!overrides.is_object()) {
    throw std::invalid_argument("Policy section must be a JSON object");
  }

  TransferPolicy policy = base;
  for (auto it = overrides.begin(); it != overrides.end(); ++it) {
    const std::string &key = it.key();

    if (key == "categories") {
      if (!it.value().is_object()) {
        throw std::invalid_argument("'categories' must be a JSON object");
      }
      for (auto cat = it.value().begin(); cat != it.value().end(); ++cat) {
        policy = policy.withCategory(parseObjectCategory(cat.key()),
                                     requireBool(cat.value(), cat.key()));
      }
      continue;
    }

    bool matched = false;
    for (const auto &flagKey : FLAG_KEYS) {
      if (key == flagKey.key) {
        policy = policy.withFlag(flagKey.flag, requireBool(it.value(), key));
        matched = true;
        break;
      }
    }
    if (!matched) {
      throw std::invalid_argument("Unknown policy setting: " + key);
    }
  }
  return policy;
}

bool TransferPolicy::flag(PolicyFlag flag) const {
  switch (flag) {
  case PolicyFlag::PRESERVE_OWNER_SCHEMA:
    return preserveOwnerSchema_;
  case PolicyFlag::INCLUDE_SYSTEM_OBJECTS:
    return includeSystemObjects_;
  case PolicyFlag::INCLUDE_DEPENDENCIES:
    return includeDependencies_;
  case PolicyFlag::INCLUDE_PERMISSIONS:
    return includePermissions_;
  case PolicyFlag::INCLUDE_ROLE_MEMBERSHIPS:
    return includeRoleMemberships_;
  case PolicyFlag::INCLUDE_INDEXES:
    return includeIndexes_;
  case PolicyFlag::CONTINUE_ON_GENERATION_ERROR:
    return continueOnGenerationError_;
  }
  return false;
}

TransferPolicy TransferPolicy::withCategory(ObjectCategory category,
                                            bool included) const {
  TransferPolicy copy = *this;
  if (included) {
    copy.includedCategories_.insert(category);
  } else {
    copy.includedCategories_.erase(category);
  }
  return copy;
}

TransferPolicy TransferPolicy::withFlag(PolicyFlag flag, bool value) const {
  TransferPolicy copy = *this;
  switch (flag) {
  case PolicyFlag::PRESERVE_OWNER_SCHEMA:
    copy.preserveOwnerSchema_ = value;
    break;
  case PolicyFlag::INCLUDE_SYSTEM_OBJECTS:
    copy.includeSystemObjects_ = value;
    break;
  case PolicyFlag::INCLUDE_DEPENDENCIES:
    copy.includeDependencies_ = value;
    break;
  case PolicyFlag::INCLUDE_PERMISSIONS:
    copy.includePermissions_ = value;
    break;
  case PolicyFlag::INCLUDE_ROLE_MEMBERSHIPS:
    copy.includeRoleMemberships_ = value;
    break;
  case PolicyFlag::INCLUDE_INDEXES:
    copy.includeIndexes_ = value;
    break;
  case PolicyFlag::CONTINUE_ON_GENERATION_ERROR:
    copy.continueOnGenerationError_ = value;
    break;
  }
  return copy;
}

json TransferPolicy::toJson() const {
  json result;
  json categories = json::object();
  for (ObjectCategory category : ALL_OBJECT_CATEGORIES) {
    categories[objectCategoryName(category)] = includes(category);
  }
  result["categories"] = categories;
  for (const auto &flagKey : FLAG_KEYS) {
    result[flagKey.key] = flag(flagKey.flag);
  }
  return result;
}

std::string TransferPolicy::describe() const {
  std::vector<std::string> excluded;
  for (ObjectCategory category : ALL_OBJECT_CATEGORIES) {
    if (!includes(category))
      excluded.push_back(objectCategoryName(category));
  }

  std::vector<std::string> flags;
  for (const auto &flagKey : FLAG_KEYS) {
    flags.push_back(std::string(flagKey.key) + "=" +
                    (flag(flagKey.flag) ? "true" : "false"));
  }

  return "excluded categories: [" + StringUtils::join(excluded, ", ") +
         "] " + StringUtils::join(flags, " ");
}
