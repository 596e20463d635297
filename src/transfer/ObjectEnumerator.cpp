#include "transfer/ObjectEnumerator.h"
#include "core/logger.h"
#include <algorithm>
#include <map>
#include <set>
#include <tuple>

namespace {
using ObjectKey = std::tuple<ObjectCategory, std::string, std::string>;

ObjectKey keyOf(ObjectCategory category, const std::string &schema,
                const std::string &name) {
  return ObjectKey{category, schema, name};
}

// Strips a built-in securable down to the memberships and grants naming one
// of the given principals. False when nothing is left.
bool reduceToGrants(ObjectDescriptor &object,
                    const std::set<std::string> &principals) {
  auto unknown = [&](const std::string &name) {
    return principals.count(name) == 0;
  };
  object.members.erase(
      std::remove_if(object.members.begin(), object.members.end(), unknown),
      object.members.end());
  object.permissions.erase(
      std::remove_if(object.permissions.begin(), object.permissions.end(),
                     [&](const PermissionEntry &entry) {
                       return unknown(entry.grantee);
                     }),
      object.permissions.end());
  return !object.members.empty() || !object.permissions.empty();
}
} // namespace

std::vector<ObjectDescriptor>
ObjectEnumerator::enumerate(IServerConnection &source, SystemDatabase database,
                            const TransferPolicy &policy) {
  ISourceCatalog &catalog = source.catalog();
  std::vector<ObjectDescriptor> objects;
  std::vector<ObjectDescriptor> builtIn;

  for (ObjectCategory category : ALL_OBJECT_CATEGORIES) {
    if (!policy.includes(category))
      continue;

    for (auto &object : catalog.readObjects(database, category)) {
      object.isDependency = false;
      if (isSelectable(object, policy)) {
        objects.push_back(std::move(object));
      } else {
        builtIn.push_back(std::move(object));
      }
    }
  }

  // A built-in role or securable is kept for the memberships and grants of
  // principals this pass migrates, e.g. a user added to db_datareader.
  std::set<std::string> principals;
  for (const auto &object : objects) {
    if (object.category == ObjectCategory::USER ||
        object.category == ObjectCategory::ROLE) {
      principals.insert(object.name);
    }
  }
  size_t skippedSystemObjects = 0;
  size_t grantsOnly = 0;
  for (auto &object : builtIn) {
    if (!reduceToGrants(object, principals)) {
      skippedSystemObjects++;
      continue;
    }
    object.isGrantsOnly = true;
    objects.push_back(std::move(object));
    grantsOnly++;
  }

  if (policy.includeDependencies()) {
    addDependencies(catalog, database, policy, objects);
  }

  sortForScripting(objects);

  Logger::info(LogCategory::TRANSFER, "ObjectEnumerator",
               source.instanceName() + "/" + systemDatabaseName(database) +
                   ": " + std::to_string(objects.size()) +
                   " objects selected, " +
                   std::to_string(skippedSystemObjects) +
                   " system objects skipped, " + std::to_string(grantsOnly) +
                   " kept for grants only");
  return objects;
}

bool ObjectEnumerator::isSelectable(const ObjectDescriptor &object,
                                    const TransferPolicy &policy) {
  return policy.includeSystemObjects() || !object.isSystemObject;
}

// Walks references breadth first. Only objects outside the selected
// categories are added; selected ones are already in the list. Each object is
// visited once, so reference cycles terminate.
void ObjectEnumerator::addDependencies(ISourceCatalog &catalog,
                                       SystemDatabase database,
                                       const TransferPolicy &policy,
                                       std::vector<ObjectDescriptor> &objects) {
  std::set<ObjectKey> known;
  for (const auto &object : objects) {
    known.insert(keyOf(object.category, object.schema, object.name));
  }

  std::map<ObjectCategory, std::vector<ObjectDescriptor>> excludedCache;
  auto lookup = [&](const ObjectReference &ref) -> const ObjectDescriptor * {
    auto cached = excludedCache.find(ref.category);
    if (cached == excludedCache.end()) {
      cached = excludedCache
                   .emplace(ref.category,
                            catalog.readObjects(database, ref.category))
                   .first;
    }
    for (const auto &candidate : cached->second) {
      if (candidate.schema == ref.schema && candidate.name == ref.name)
        return &candidate;
    }
    return nullptr;
  };

  size_t added = 0;
  for (size_t i = 0; i < objects.size(); ++i) {
    if (objects[i].isGrantsOnly)
      continue;
    std::vector<ObjectReference> references =
        catalog.readReferences(database, objects[i]);

    for (const auto &ref : references) {
      ObjectKey key = keyOf(ref.category, ref.schema, ref.name);
      if (known.count(key) > 0 || policy.includes(ref.category))
        continue;

      known.insert(key);
      const ObjectDescriptor *found = lookup(ref);
      if (!found) {
        Logger::warning(LogCategory::TRANSFER, "ObjectEnumerator",
                        "Referenced object not found in catalog: " +
                            objectCategoryName(ref.category) + " " +
                            (ref.schema.empty() ? ref.name
                                                : ref.schema + "." + ref.name));
        continue;
      }
      if (!isSelectable(*found, policy))
        continue;

      ObjectDescriptor dependency = *found;
      dependency.isDependency = true;
      objects.push_back(std::move(dependency));
      added++;
    }
  }

  if (added > 0) {
    Logger::debug(LogCategory::TRANSFER, "ObjectEnumerator",
                  "Added " + std::to_string(added) + " dependency objects");
  }
}

void ObjectEnumerator::sortForScripting(std::vector<ObjectDescriptor> &objects) {
  std::stable_sort(objects.begin(), objects.end(),
                   [](const ObjectDescriptor &a, const ObjectDescriptor &b) {
                     auto stageA = static_cast<int>(stageForCategory(a.category));
                     auto stageB = static_cast<int>(stageForCategory(b.category));
                     return std::tie(stageA, a.schema, a.name) <
                            std::tie(stageB, b.schema, b.name);
                   });
}
