#ifndef DATABASE_ENGINE_H
#define DATABASE_ENGINE_H

#include "transfer/ObjectDescriptor.h"
#include "transfer/SystemDatabase.h"
#include <memory>
#include <string>
#include <vector>

struct ServerEndpoint {
  std::string address; // host, host\instance or host,port
  std::string user;    // empty for integrated authentication
  std::string password;

  std::string toSafeString() const {
    return address + " (" + (user.empty() ? "integrated" : "user=" + user) +
           ")";
  }
};

// Read-only view of the user objects stored in one instance's system
// databases. Objects are returned unfiltered; isSystemObject tells built-in
// objects apart.
class ISourceCatalog {
public:
  virtual ~ISourceCatalog() = default;

  virtual std::vector<ObjectDescriptor>
  readObjects(SystemDatabase database, ObjectCategory category) = 0;

  virtual std::vector<ObjectReference>
  readReferences(SystemDatabase database, const ObjectDescriptor &object) = 0;
};

// An open, authenticated connection to one instance. The engine borrows it;
// whoever obtained it from the connector owns it.
class IServerConnection {
public:
  virtual ~IServerConnection() = default;

  virtual const std::string &instanceName() const = 0;

  virtual ISourceCatalog &catalog() = 0;

  // Runs one statement in the context of database. Throws StatementError
  // carrying the server's SQLSTATE and native error number.
  virtual void execute(SystemDatabase database,
                       const std::string &statement) = 0;

  virtual bool hasAdministrativePrivilege() = 0;
};

class IServerConnector {
public:
  virtual ~IServerConnector() = default;

  // Throws ConnectionError when the instance cannot be reached or the
  // credentials are rejected.
  virtual std::unique_ptr<IServerConnection>
  connect(const ServerEndpoint &endpoint) = 0;
};

#endif
