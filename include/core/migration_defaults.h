#ifndef MIGRATION_DEFAULTS_H
#define MIGRATION_DEFAULTS_H

#include <cstddef>

namespace MigrationDefaults {
constexpr int BUFFER_SIZE = 1024;
constexpr int DEFAULT_SQLSERVER_PORT = 1433;
constexpr int LOGIN_TIMEOUT_SECONDS = 15;
constexpr int CONNECT_RETRIES = 3;
constexpr int INITIAL_BACKOFF_MS = 100;

constexpr size_t MIN_PARALLEL_DESTINATIONS = 1;
constexpr size_t MAX_PARALLEL_DESTINATIONS = 16;

constexpr const char *DEFAULT_ODBC_DRIVER = "ODBC Driver 18 for SQL Server";
constexpr const char *DEFAULT_CONFIG_FILE = "config.json";
constexpr const char *DEFAULT_LOG_TABLE = "metadata.migration_logs";

constexpr size_t LOG_FILE_MAX_SIZE = 10 * 1024 * 1024;
constexpr int LOG_FILE_MAX_BACKUPS = 5;

// Native SQL Server error numbers raised when the object being created is
// already present on the target.
constexpr int ALREADY_EXISTS_NATIVE_ERRORS[] = {
    2714,  // There is already an object named '%s' in the database
    15023, // User, group, or role '%s' already exists
    15025, // The server principal '%s' already exists
    1913,  // Index or statistics with name '%s' already exists
    1781,  // Column already has a DEFAULT bound to it
    6246,  // Assembly '%s' already exists in database
    219,   // The type '%s' already exists
};

constexpr const char *ALREADY_EXISTS_SQLSTATES[] = {"42S01", "42S11",
                                                    "42S21"};
} // namespace MigrationDefaults

#endif
