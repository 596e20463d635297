#ifndef OBJECTENUMERATOR_H
#define OBJECTENUMERATOR_H

#include "engines/database_engine.h"
#include "transfer/TransferPolicy.h"
#include <vector>

// Selects the objects of one system database that a policy migrates.
class ObjectEnumerator {
public:
  // Reads the live source catalog on every call; two calls may differ if the
  // source changed in between. Results are in script stage order, then
  // schema and name. With includeDependencies, referenced objects of excluded
  // categories are added with isDependency set. Built-in objects excluded
  // by the policy still come back, with isGrantsOnly set, when their role
  // members or grantees include a user or role selected in the same call.
  static std::vector<ObjectDescriptor> enumerate(IServerConnection &source,
                                                 SystemDatabase database,
                                                 const TransferPolicy &policy);

private:
  static bool isSelectable(const ObjectDescriptor &object,
                           const TransferPolicy &policy);

  static void addDependencies(ISourceCatalog &catalog, SystemDatabase database,
                              const TransferPolicy &policy,
                              std::vector<ObjectDescriptor> &objects);

  static void sortForScripting(std::vector<ObjectDescriptor> &objects);
};

#endif
