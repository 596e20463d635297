#include "engines/mssql_engine.h"
#include "core/migration_errors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace {
struct Diagnostic {
  std::string sqlState;
  int nativeError = 0;
  std::string message;
};

// First record supplies SQLSTATE and native code; messages of all records
// are joined since SQL Server often reports the cause in a later one.
Diagnostic readDiagnostic(SQLSMALLINT handleType, SQLHANDLE handle) {
  Diagnostic diag;
  SQLCHAR sqlState[6];
  SQLCHAR msg[SQL_MAX_MESSAGE_LENGTH];
  SQLINTEGER nativeError = 0;
  SQLSMALLINT msgLen = 0;

  for (SQLSMALLINT record = 1;; ++record) {
    SQLRETURN ret = SQLGetDiagRec(handleType, handle, record, sqlState,
                                  &nativeError, msg, sizeof(msg), &msgLen);
    if (!SQL_SUCCEEDED(ret))
      break;
    if (record == 1) {
      diag.sqlState = std::string((char *)sqlState);
      diag.nativeError = static_cast<int>(nativeError);
    }
    if (!diag.message.empty())
      diag.message += " ";
    diag.message += std::string((char *)msg);
  }
  if (diag.message.empty())
    diag.message = "unknown ODBC error";
  return diag;
}

StatementError statementError(SQLHSTMT stmt) {
  Diagnostic diag = readDiagnostic(SQL_HANDLE_STMT, stmt);
  return StatementError(diag.sqlState, diag.nativeError, diag.message);
}

class StatementHandle {
  SQLHSTMT stmt_{SQL_NULL_HANDLE};

public:
  explicit StatementHandle(SQLHDBC dbc) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt_);
    if (!SQL_SUCCEEDED(ret)) {
      Diagnostic diag = readDiagnostic(SQL_HANDLE_DBC, dbc);
      throw StatementError(diag.sqlState, diag.nativeError,
                           "Failed to allocate statement handle: " +
                               diag.message);
    }
  }
  ~StatementHandle() {
    if (stmt_ != SQL_NULL_HANDLE)
      SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
  }
  StatementHandle(const StatementHandle &) = delete;
  StatementHandle &operator=(const StatementHandle &) = delete;

  SQLHSTMT get() const { return stmt_; }
};

std::string escapeConnectionValue(const std::string &value) {
  std::string escaped = "{";
  for (char c : value) {
    escaped += c;
    if (c == '}')
      escaped += '}';
  }
  return escaped + "}";
}
} // namespace

ODBCConnection::ODBCConnection(const std::string &connectionString,
                               int loginTimeoutSeconds) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = "Failed to allocate environment handle";
    Logger::error(LogCategory::DATABASE, "ODBCConnection", lastError_);
    return;
  }

  ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
  if (!SQL_SUCCEEDED(ret)) {
    release();
    lastError_ = "Failed to set ODBC version";
    Logger::error(LogCategory::DATABASE, "ODBCConnection", lastError_);
    return;
  }

  ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
  if (!SQL_SUCCEEDED(ret)) {
    release();
    lastError_ = "Failed to allocate connection handle";
    Logger::error(LogCategory::DATABASE, "ODBCConnection", lastError_);
    return;
  }

  SQLSetConnectAttr(dbc_, SQL_ATTR_LOGIN_TIMEOUT,
                    (SQLPOINTER)(intptr_t)loginTimeoutSeconds, 0);

  SQLCHAR outConnStr[MigrationDefaults::BUFFER_SIZE];
  SQLSMALLINT outConnStrLen;
  ret = SQLDriverConnect(dbc_, nullptr, (SQLCHAR *)connectionString.c_str(),
                         SQL_NTS, outConnStr, sizeof(outConnStr),
                         &outConnStrLen, SQL_DRIVER_NOPROMPT);
  if (!SQL_SUCCEEDED(ret)) {
    Diagnostic diag = readDiagnostic(SQL_HANDLE_DBC, dbc_);
    lastSqlState_ = diag.sqlState;
    lastError_ = diag.message;
    Logger::error(LogCategory::DATABASE, "ODBCConnection",
                  "Connection failed: " + lastError_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
    release();
    return;
  }

  valid_ = true;
}

void ODBCConnection::release() {
  if (dbc_ != SQL_NULL_HANDLE) {
    if (valid_)
      SQLDisconnect(dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
  }
  if (env_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
  }
  valid_ = false;
}

ODBCConnection::~ODBCConnection() { release(); }

ODBCConnection::ODBCConnection(ODBCConnection &&other) noexcept
    : env_(other.env_), dbc_(other.dbc_), valid_(other.valid_),
      lastSqlState_(std::move(other.lastSqlState_)),
      lastError_(std::move(other.lastError_)) {
  other.env_ = SQL_NULL_HANDLE;
  other.dbc_ = SQL_NULL_HANDLE;
  other.valid_ = false;
}

ODBCConnection &ODBCConnection::operator=(ODBCConnection &&other) noexcept {
  if (this != &other) {
    release();

    env_ = other.env_;
    dbc_ = other.dbc_;
    valid_ = other.valid_;
    lastSqlState_ = std::move(other.lastSqlState_);
    lastError_ = std::move(other.lastError_);

    other.env_ = SQL_NULL_HANDLE;
    other.dbc_ = SQL_NULL_HANDLE;
    other.valid_ = false;
  }
  return *this;
}

MSSQLServerConnection::MSSQLServerConnection(
    std::unique_ptr<ODBCConnection> conn, const std::string &address)
    : conn_(std::move(conn)), instanceName_(address), catalog_(*this) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto rows = queryUnlocked("SELECT @@SERVERNAME");
  if (!rows.empty() && !rows[0].empty() && !rows[0][0].empty()) {
    instanceName_ = rows[0][0];
  }
}

void MSSQLServerConnection::useDatabaseUnlocked(SystemDatabase database) {
  executeUnlocked("USE " + StringUtils::quoteName(systemDatabaseName(database)));
}

void MSSQLServerConnection::executeUnlocked(const std::string &statement) {
  StatementHandle stmt(conn_->getDbc());

  SQLRETURN ret =
      SQLExecDirect(stmt.get(), (SQLCHAR *)statement.c_str(), SQL_NTS);
  if (ret != SQL_NO_DATA && !SQL_SUCCEEDED(ret)) {
    throw statementError(stmt.get());
  }

  // Errors raised later in a batch surface on the following result.
  while ((ret = SQLMoreResults(stmt.get())) != SQL_NO_DATA) {
    if (!SQL_SUCCEEDED(ret)) {
      throw statementError(stmt.get());
    }
  }
}

void MSSQLServerConnection::execute(SystemDatabase database,
                                    const std::string &statement) {
  std::lock_guard<std::mutex> lock(mutex_);
  useDatabaseUnlocked(database);
  executeUnlocked(statement);
}

std::vector<QueryRow>
MSSQLServerConnection::queryUnlocked(const std::string &sql) {
  std::vector<QueryRow> results;
  StatementHandle stmt(conn_->getDbc());

  SQLRETURN ret = SQLExecDirect(stmt.get(), (SQLCHAR *)sql.c_str(), SQL_NTS);
  if (!SQL_SUCCEEDED(ret)) {
    throw statementError(stmt.get());
  }

  // Skip row counts and other column-less results ahead of the first set.
  SQLSMALLINT numCols = 0;
  for (;;) {
    ret = SQLNumResultCols(stmt.get(), &numCols);
    if (!SQL_SUCCEEDED(ret)) {
      throw statementError(stmt.get());
    }
    if (numCols > 0)
      break;
    ret = SQLMoreResults(stmt.get());
    if (ret == SQL_NO_DATA)
      return results;
    if (!SQL_SUCCEEDED(ret)) {
      throw statementError(stmt.get());
    }
  }

  SQLRETURN fetchRet;
  while ((fetchRet = SQLFetch(stmt.get())) == SQL_SUCCESS ||
         fetchRet == SQL_SUCCESS_WITH_INFO) {
    QueryRow row;
    for (SQLSMALLINT i = 1; i <= numCols; i++) {
      std::string cellValue;
      SQLLEN len = 0;
      constexpr SQLLEN CHUNK_SIZE = MigrationDefaults::BUFFER_SIZE - 1;
      char buffer[MigrationDefaults::BUFFER_SIZE];

      // Module definitions and assembly binaries span many chunks.
      do {
        ret = SQLGetData(stmt.get(), i, SQL_C_CHAR, buffer, sizeof(buffer),
                         &len);
        if (ret == SQL_SUCCESS || ret == SQL_SUCCESS_WITH_INFO) {
          if (len == SQL_NULL_DATA)
            break;
          SQLLEN copyLen =
              (len == SQL_NO_TOTAL || len > CHUNK_SIZE) ? CHUNK_SIZE : len;
          cellValue.append(buffer, copyLen);
        } else if (ret == SQL_NO_DATA) {
          break;
        } else {
          throw statementError(stmt.get());
        }
      } while (ret == SQL_SUCCESS_WITH_INFO);

      row.push_back(std::move(cellValue));
    }
    results.push_back(std::move(row));
  }

  if (fetchRet != SQL_NO_DATA && !SQL_SUCCEEDED(fetchRet)) {
    throw statementError(stmt.get());
  }
  return results;
}

std::vector<QueryRow> MSSQLServerConnection::query(SystemDatabase database,
                                                   const std::string &sql) {
  std::lock_guard<std::mutex> lock(mutex_);
  useDatabaseUnlocked(database);
  return queryUnlocked(sql);
}

bool MSSQLServerConnection::hasAdministrativePrivilege() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto rows = queryUnlocked("SELECT IS_SRVROLEMEMBER('sysadmin')");
  return !rows.empty() && !rows[0].empty() && rows[0][0] == "1";
}

MSSQLConnector::MSSQLConnector(OdbcSettings settings)
    : settings_(std::move(settings)) {}

std::string
MSSQLConnector::buildConnectionString(const ServerEndpoint &endpoint) const {
  std::string connStr = "Driver={" + settings_.driver + "};Server=" +
                        escapeConnectionValue(endpoint.address) + ";";
  if (endpoint.user.empty()) {
    connStr += "Trusted_Connection=yes;";
  } else {
    connStr += "UID=" + escapeConnectionValue(endpoint.user) +
               ";PWD=" + escapeConnectionValue(endpoint.password) + ";";
  }
  connStr += std::string("Encrypt=") + (settings_.encrypt ? "yes" : "no") + ";";
  connStr += std::string("TrustServerCertificate=") +
             (settings_.trustServerCertificate ? "yes" : "no") + ";";
  return connStr;
}

std::unique_ptr<IServerConnection>
MSSQLConnector::connect(const ServerEndpoint &endpoint) {
  const std::string connStr = buildConnectionString(endpoint);
  const int maxRetries = std::max(1, settings_.connectRetries);
  std::string lastError;

  for (int attempt = 1; attempt <= maxRetries; ++attempt) {
    auto conn = std::make_unique<ODBCConnection>(
        connStr, settings_.loginTimeoutSeconds);
    if (conn->isValid()) {
      if (attempt > 1) {
        Logger::info(LogCategory::DATABASE, "MSSQLConnector",
                     "Connection to " + endpoint.address +
                         " successful on attempt " + std::to_string(attempt));
      }
      try {
        return std::make_unique<MSSQLServerConnection>(std::move(conn),
                                                       endpoint.address);
      } catch (const StatementError &e) {
        throw ConnectionError(endpoint.address, e.what());
      }
    }

    lastError = conn->lastError();
    // Rejected credentials will not get better by retrying.
    if (conn->lastSqlState() == "28000")
      break;

    if (attempt < maxRetries) {
      int backoffMs = MigrationDefaults::INITIAL_BACKOFF_MS * (1 << (attempt - 1));
      Logger::warning(LogCategory::DATABASE, "MSSQLConnector",
                      "Connection attempt " + std::to_string(attempt) +
                          " to " + endpoint.address + " failed, retrying in " +
                          std::to_string(backoffMs) + "ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  throw ConnectionError(endpoint.address, lastError);
}
