#ifndef SYSTEMDATABASE_H
#define SYSTEMDATABASE_H

#include <array>
#include <string>

enum class SystemDatabase { MASTER, MODEL, MSDB };

// Migration order of the system databases.
constexpr std::array<SystemDatabase, 3> SYSTEM_DATABASES = {
    SystemDatabase::MASTER, SystemDatabase::MODEL, SystemDatabase::MSDB};

inline std::string systemDatabaseName(SystemDatabase database) {
  switch (database) {
  case SystemDatabase::MASTER:
    return "master";
  case SystemDatabase::MODEL:
    return "model";
  case SystemDatabase::MSDB:
    return "msdb";
  }
  return "master";
}

#endif
