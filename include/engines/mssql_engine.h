#ifndef MSSQL_ENGINE_H
#define MSSQL_ENGINE_H

#include "core/logger.h"
#include "core/migration_config.h"
#include "core/migration_defaults.h"
#include "engines/database_engine.h"
#include "engines/mssql_catalog.h"
#include <memory>
#include <mutex>
#include <sql.h>
#include <sqlext.h>
#include <string>
#include <vector>

class ODBCConnection {
  SQLHENV env_{SQL_NULL_HANDLE};
  SQLHDBC dbc_{SQL_NULL_HANDLE};
  bool valid_{false};
  std::string lastSqlState_;
  std::string lastError_;

public:
  ODBCConnection(const std::string &connectionString, int loginTimeoutSeconds);
  ~ODBCConnection();

  ODBCConnection(const ODBCConnection &) = delete;
  ODBCConnection &operator=(const ODBCConnection &) = delete;

  ODBCConnection(ODBCConnection &&other) noexcept;
  ODBCConnection &operator=(ODBCConnection &&other) noexcept;

  SQLHDBC getDbc() const { return dbc_; }
  bool isValid() const { return valid_; }
  const std::string &lastSqlState() const { return lastSqlState_; }
  const std::string &lastError() const { return lastError_; }

private:
  void release();
};

using QueryRow = std::vector<std::string>;

// One open SQL Server instance. All ODBC traffic on the handle is
// serialized, so a source connection can serve several destination workers.
class MSSQLServerConnection : public IServerConnection {
  std::unique_ptr<ODBCConnection> conn_;
  std::string instanceName_;
  std::mutex mutex_;
  MSSQLCatalog catalog_;

public:
  MSSQLServerConnection(std::unique_ptr<ODBCConnection> conn,
                        const std::string &address);

  const std::string &instanceName() const override { return instanceName_; }
  ISourceCatalog &catalog() override { return catalog_; }
  void execute(SystemDatabase database, const std::string &statement) override;
  bool hasAdministrativePrivilege() override;

  // Rows of the first result set, NULL columns as empty strings. Throws
  // StatementError.
  std::vector<QueryRow> query(SystemDatabase database, const std::string &sql);

private:
  std::vector<QueryRow> queryUnlocked(const std::string &sql);
  void useDatabaseUnlocked(SystemDatabase database);
  void executeUnlocked(const std::string &statement);
};

class MSSQLConnector : public IServerConnector {
  OdbcSettings settings_;

public:
  explicit MSSQLConnector(OdbcSettings settings = OdbcSettings());

  std::unique_ptr<IServerConnection>
  connect(const ServerEndpoint &endpoint) override;

  std::string buildConnectionString(const ServerEndpoint &endpoint) const;
};

#endif
