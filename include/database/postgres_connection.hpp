#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include <memory>
#include <string>
#include <mutex>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace settlement {
namespace database {

/**
 * Owning handle for a PGresult; PQclear on destruction.
 */
struct PGresultDeleter {
  void operator()(PGresult* result) const {
    if (result) PQclear(result);
  }
};
using ResultPtr = std::unique_ptr<PGresult, PGresultDeleter>;

/**
 * PostgreSQL connection wrapper.
 * One libpq session shared by the settlement stores. All calls are
 * serialized on a recursive session mutex, which TransactionGuard holds for
 * the lifetime of a transaction.
 */
class PostgresConnection {
 public:
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "settlement";
    std::string username = "settlement_user";
    std::string password = "";
    int connection_timeout = 10;  // seconds
    std::string application_name = "settlement_core";
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  bool connect();
  void disconnect();
  bool isConnected() const;

  /**
   * Execute a statement that doesn't return rows. A dropped session is
   * reset first unless a transaction is open.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized statement. Returns null on failure; the error
   * is logged.
   */
  ResultPtr executeParameterized(const std::string& query,
                                 const std::vector<std::string>& params);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();
  bool inTransaction() const;

  std::string getLastError() const;

  /**
   * Connection info for logging, without the password.
   */
  std::string getConnectionInfo() const;

  std::recursive_mutex& sessionMutex() { return mutex_; }

 private:
  void disconnectLocked();
  bool ensureConnectedLocked();

  Config config_;
  PGconn* connection_;
  mutable std::recursive_mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Holds the session mutex until it
 * commits or rolls back, so no other thread interleaves statements.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Returns false if COMMIT failed.
   */
  bool commit();

  /**
   * Roll back the transaction (also done by the destructor if not committed).
   */
  void rollback();

 private:
  PostgresConnection& conn_;
  std::unique_lock<std::recursive_mutex> session_lock_;
  bool finished_;
};

}  // namespace database
}  // namespace settlement

#endif  // POSTGRES_CONNECTION_HPP_
