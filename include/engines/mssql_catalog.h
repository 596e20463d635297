#ifndef MSSQL_CATALOG_H
#define MSSQL_CATALOG_H

#include "engines/database_engine.h"
#include <string>
#include <vector>

class MSSQLServerConnection;

// Reads object metadata from the sys.* catalog views of master, model and
// msdb. Every read goes through the owning connection and is re-run on each
// call.
class MSSQLCatalog : public ISourceCatalog {
  MSSQLServerConnection &connection_;

public:
  explicit MSSQLCatalog(MSSQLServerConnection &connection);

  std::vector<ObjectDescriptor> readObjects(SystemDatabase database,
                                            ObjectCategory category) override;

  std::vector<ObjectReference>
  readReferences(SystemDatabase database,
                 const ObjectDescriptor &object) override;

private:
  using Rows = std::vector<std::vector<std::string>>;

  Rows rows(SystemDatabase database, const std::string &sql);

  std::vector<ObjectDescriptor> readSchemas(SystemDatabase database);
  std::vector<ObjectDescriptor> readAliasTypes(SystemDatabase database);
  std::vector<ObjectDescriptor> readClrTypes(SystemDatabase database);
  std::vector<ObjectDescriptor> readTableTypes(SystemDatabase database);
  std::vector<ObjectDescriptor> readSequences(SystemDatabase database);
  std::vector<ObjectDescriptor> readTables(SystemDatabase database);
  std::vector<ObjectDescriptor> readModules(SystemDatabase database,
                                            ObjectCategory category,
                                            const std::string &typeList);
  std::vector<ObjectDescriptor> readAggregates(SystemDatabase database);
  std::vector<ObjectDescriptor> readSynonyms(SystemDatabase database);
  std::vector<ObjectDescriptor> readAssemblies(SystemDatabase database);
  std::vector<ObjectDescriptor> readTriggers(SystemDatabase database,
                                             bool databaseScoped);
  std::vector<ObjectDescriptor> readRoles(SystemDatabase database);
  std::vector<ObjectDescriptor> readUsers(SystemDatabase database);

  std::vector<ColumnDefinition> readColumns(SystemDatabase database,
                                            const std::string &objectId);
  std::vector<IndexDefinition> readIndexes(SystemDatabase database,
                                           const std::string &objectId,
                                           bool keysOnly);
  std::vector<ConstraintDefinition> readConstraints(SystemDatabase database,
                                                    const std::string &objectId);
  std::vector<PermissionEntry> readPermissions(SystemDatabase database,
                                               PermissionEntry::Scope scope,
                                               const std::string &majorId);
  std::vector<PermissionEntry>
  readDatabasePermissions(SystemDatabase database,
                          const std::string &principalId);
  void readClrSignature(SystemDatabase database, const std::string &objectId,
                        ObjectDescriptor &object);
};

#endif
