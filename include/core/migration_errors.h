#ifndef MIGRATION_ERRORS_H
#define MIGRATION_ERRORS_H

#include <stdexcept>
#include <string>

class MigrationError : public std::runtime_error {
public:
  explicit MigrationError(const std::string &message)
      : std::runtime_error(message) {}
};

// Cannot establish or authenticate a connection to an instance.
class ConnectionError : public MigrationError {
  std::string address_;

public:
  ConnectionError(const std::string &address, const std::string &message)
      : MigrationError("Connection to " + address + " failed: " + message),
        address_(address) {}

  const std::string &address() const { return address_; }
};

// Caller lacks the administrative rights required on an instance.
class PrivilegeError : public MigrationError {
  std::string instance_;

public:
  PrivilegeError(const std::string &instance, const std::string &message)
      : MigrationError("Insufficient privileges on " + instance + ": " +
                       message),
        instance_(instance) {}

  const std::string &instance() const { return instance_; }
};

// A single object's definition could not be turned into statements.
class GenerationError : public MigrationError {
  std::string objectName_;

public:
  GenerationError(const std::string &objectName, const std::string &reason)
      : MigrationError("Cannot script " + objectName + ": " + reason),
        objectName_(objectName) {}

  const std::string &objectName() const { return objectName_; }
};

// A statement failed on the server. sqlState and nativeError come from the
// first ODBC diagnostic record.
class StatementError : public MigrationError {
  std::string sqlState_;
  int nativeError_;

public:
  StatementError(const std::string &sqlState, int nativeError,
                 const std::string &message)
      : MigrationError(message), sqlState_(sqlState),
        nativeError_(nativeError) {}

  const std::string &sqlState() const { return sqlState_; }
  int nativeError() const { return nativeError_; }
};

#endif
