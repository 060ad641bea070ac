#include "postgres_connection.hpp"
#include "observability/logger.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace settlement {
namespace database {

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  const std::string port = std::to_string(config_.port);
  const std::string timeout = std::to_string(config_.connection_timeout);
  std::vector<const char*> keywords = {"host", "port", "dbname", "user",
                                       "connect_timeout", "application_name"};
  std::vector<const char*> values = {config_.host.c_str(), port.c_str(),
                                     config_.database.c_str(), config_.username.c_str(),
                                     timeout.c_str(), config_.application_name.c_str()};
  if (!config_.password.empty()) {
    keywords.push_back("password");
    values.push_back(config_.password.c_str());
  }
  keywords.push_back(nullptr);
  values.push_back(nullptr);

  connection_ = PQconnectdbParams(keywords.data(), values.data(), 0);

  if (PQstatus(connection_) != CONNECTION_OK) {
    SETTLEMENT_LOG_ERROR(std::string("Database connection failed: ") + PQerrorMessage(connection_));
    disconnectLocked();
    return false;
  }

  // Settlement writes must be durable before a result is reported
  if (!executeQuery("SET SESSION synchronous_commit = on;")) {
    SETTLEMENT_LOG_WARN("Could not enable synchronous_commit for this session");
  }

  SETTLEMENT_LOG_INFO("Connected to PostgreSQL database: " + getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      rollbackTransaction();
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::ensureConnectedLocked() {
  if (!connection_) return false;
  if (PQstatus(connection_) == CONNECTION_OK) return true;

  // A reset inside a transaction would silently drop its earlier statements
  if (in_transaction_) return false;

  SETTLEMENT_LOG_WARN("Database connection lost, resetting: " + getConnectionInfo());
  PQreset(connection_);
  if (PQstatus(connection_) != CONNECTION_OK) {
    SETTLEMENT_LOG_ERROR(std::string("Database reconnect failed: ") + PQerrorMessage(connection_));
    return false;
  }
  return true;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (!ensureConnectedLocked()) return false;

  ResultPtr result(PQexec(connection_, query.c_str()));
  if (!result) {
    SETTLEMENT_LOG_ERROR("Query execution failed: connection lost");
    return false;
  }

  ExecStatusType status = PQresultStatus(result.get());
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);
  if (!success) {
    SETTLEMENT_LOG_ERROR(std::string("Query failed: ") + PQresultErrorMessage(result.get()));
  }
  return success;
}

ResultPtr PostgresConnection::executeParameterized(const std::string& query,
                                                   const std::vector<std::string>& params) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (!ensureConnectedLocked()) return nullptr;

  // The strings in `params` outlive the call, so their c_str() stays valid
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param.c_str());
  }

  ResultPtr result(PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                                nullptr, values.data(), nullptr, nullptr, 0));
  if (!result) {
    SETTLEMENT_LOG_ERROR("Parameterized query execution failed: connection lost");
    return nullptr;
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    SETTLEMENT_LOG_ERROR(std::string("Parameterized query failed: ") +
                         PQresultErrorMessage(result.get()));
    return nullptr;
  }
  return result;
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (in_transaction_ || !executeQuery("BEGIN")) {
    return false;
  }
  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }
  bool success = executeQuery("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }
  bool success = executeQuery("ROLLBACK");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::recursive_mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }
  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), session_lock_(conn.sessionMutex()), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw std::runtime_error("Failed to begin transaction");
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

bool TransactionGuard::commit() {
  if (finished_) return false;
  finished_ = true;
  return conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

}  // namespace database
}  // namespace settlement
