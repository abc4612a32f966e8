#ifndef WALLET_POSTGRES_CONNECTION_HPP_
#define WALLET_POSTGRES_CONNECTION_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace wallet {
namespace database {

struct PGresultDeleter {
  void operator()(PGresult* result) const {
    if (result) {
      PQclear(result);
    }
  }
};

// Owning handle for a libpq result.
using ResultPtr = std::unique_ptr<PGresult, PGresultDeleter>;

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management and basic query execution.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "wallet_ledger";
    std::string username = "wallet_user";
    std::string password = "";
    int connection_timeout = 30;  // seconds
    int max_connections = 10;
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Drops any previous connection first.
   */
  bool connect();

  void disconnect();

  bool isConnected() const;

  /**
   * Execute a statement that doesn't return rows.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a query and get results. Null on failure; see getLastError().
   */
  ResultPtr executeQueryWithResult(const std::string& query);

  /**
   * Execute a parameterized query with text parameters.
   */
  ResultPtr executeParameterizedQuery(const std::string& query,
                                      const std::vector<std::string>& params);

  /**
   * Begin a transaction, optionally at SERIALIZABLE isolation.
   */
  bool beginTransaction(bool serializable = false);
  bool commitTransaction();
  bool rollbackTransaction();

  bool inTransaction() const;

  /**
   * Get last error message.
   */
  std::string getLastError() const;

  /**
   * SQLSTATE of the last failed statement, empty if the failure had none
   * (e.g. the connection was lost).
   */
  std::string getLastSqlState() const;

  /**
   * Get connection info for logging.
   */
  std::string getConnectionInfo() const;

 private:
  // Require mutex_ held.
  void disconnectLocked();
  bool executeQueryLocked(const std::string& query);
  ResultPtr checkResultLocked(PGresult* raw, const std::string& query);

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
  std::string last_error_;
  std::string last_sqlstate_;
};

/**
 * RAII wrapper for database transactions. Rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn, bool serializable = false);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Returns false if the server rejected the commit.
   */
  bool commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

class ConnectionPool;

/**
 * Connection borrowed from a ConnectionPool; returned when destroyed.
 */
class PooledConnection {
 public:
  PooledConnection() = default;
  PooledConnection(ConnectionPool* pool, PostgresConnection* conn);
  ~PooledConnection();

  PooledConnection(PooledConnection&& other) noexcept;
  PooledConnection& operator=(PooledConnection&& other) noexcept;

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  PostgresConnection* operator->() const { return conn_; }
  PostgresConnection& operator*() const { return *conn_; }
  explicit operator bool() const { return conn_ != nullptr; }

 private:
  void release();

  ConnectionPool* pool_ = nullptr;
  PostgresConnection* conn_ = nullptr;
};

/**
 * Fixed-size pool of up to Config::max_connections connections.
 */
class ConnectionPool {
 public:
  explicit ConnectionPool(const PostgresConnection::Config& config);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Opens every connection. Returns false if the first one cannot connect.
   */
  bool open();
  void close();

  /**
   * Borrows an idle connection, reconnecting it if it went bad.
   * Returns an empty handle if none becomes available within `timeout`
   * or the database cannot be reached.
   */
  PooledConnection acquire(std::chrono::milliseconds timeout);

  std::size_t size() const;
  std::size_t idleCount() const;

 private:
  friend class PooledConnection;
  void giveBack(PostgresConnection* conn);

  PostgresConnection::Config config_;
  std::vector<std::unique_ptr<PostgresConnection>> connections_;
  std::deque<PostgresConnection*> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_;
  bool open_;
};

}  // namespace database
}  // namespace wallet

#endif  // WALLET_POSTGRES_CONNECTION_HPP_
