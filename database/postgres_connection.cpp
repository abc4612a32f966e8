#include "database/postgres_connection.hpp"

#include "observability/logger.hpp"

#include <sstream>
#include <stdexcept>

namespace wallet {
namespace database {

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  const std::string port = std::to_string(config_.port);
  const std::string timeout = std::to_string(config_.connection_timeout);
  const char* keywords[] = {"host", "port", "dbname", "user", "password",
                            "connect_timeout", "application_name", nullptr};
  const char* values[] = {config_.host.c_str(), port.c_str(), config_.database.c_str(),
                          config_.username.c_str(), config_.password.c_str(),
                          timeout.c_str(), "wallet_ledger", nullptr};

  connection_ = PQconnectdbParams(keywords, values, 0);

  if (PQstatus(connection_) != CONNECTION_OK) {
    last_error_ = PQerrorMessage(connection_);
    last_sqlstate_.clear();
    LOG_BUILDER(observability::LogLevel::ERROR, "Database connection failed")
        .field("target", getConnectionInfo())
        .field("error", last_error_);
    disconnectLocked();
    return false;
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Connected to PostgreSQL database")
      .field("target", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      executeQueryLocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeQueryLocked(query);
}

bool PostgresConnection::executeQueryLocked(const std::string& query) {
  if (!connection_) {
    last_error_ = "Not connected";
    last_sqlstate_.clear();
    return false;
  }

  ResultPtr result = checkResultLocked(PQexec(connection_, query.c_str()), query);
  return result != nullptr;
}

ResultPtr PostgresConnection::executeQueryWithResult(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    last_error_ = "Not connected";
    last_sqlstate_.clear();
    return nullptr;
  }

  return checkResultLocked(PQexec(connection_, query.c_str()), query);
}

ResultPtr PostgresConnection::executeParameterizedQuery(const std::string& query,
                                                        const std::vector<std::string>& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    last_error_ = "Not connected";
    last_sqlstate_.clear();
    return nullptr;
  }

  // Pointers stay valid because `params` outlives the call
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param.c_str());
  }

  PGresult* raw = PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0);
  return checkResultLocked(raw, query);
}

ResultPtr PostgresConnection::checkResultLocked(PGresult* raw, const std::string& query) {
  ResultPtr result(raw);

  if (!result) {
    last_error_ = PQerrorMessage(connection_);
    last_sqlstate_.clear();
    LOG_BUILDER(observability::LogLevel::ERROR, "Query execution failed: connection lost")
        .field("error", last_error_);
    return nullptr;
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    last_error_ = PQresultErrorMessage(result.get());
    const char* sqlstate = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
    last_sqlstate_ = sqlstate ? sqlstate : "";

    // Serialization failures are routine under SERIALIZABLE and retried by callers
    const bool routine = last_sqlstate_ == "40001" || last_sqlstate_ == "40P01";
    LOG_BUILDER(routine ? observability::LogLevel::DEBUG : observability::LogLevel::ERROR,
                "Query failed")
        .field("sqlstate", last_sqlstate_)
        .field("error", last_error_)
        .field("query", query.substr(0, 80));
    return nullptr;
  }

  last_sqlstate_.clear();
  return result;
}

bool PostgresConnection::beginTransaction(bool serializable) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!executeQueryLocked(serializable ? "BEGIN ISOLATION LEVEL SERIALIZABLE" : "BEGIN")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeQueryLocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  // Keep the error of the statement that caused the rollback
  const std::string error = last_error_;
  const std::string sqlstate = last_sqlstate_;
  bool success = executeQueryLocked("ROLLBACK");
  in_transaction_ = false;
  last_error_ = error;
  last_sqlstate_ = sqlstate;
  return success;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_ && last_error_.empty()) {
    return "Not connected";
  }

  return last_error_;
}

std::string PostgresConnection::getLastSqlState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sqlstate_;
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn, bool serializable)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction(serializable)) {
    throw std::runtime_error("Failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

bool TransactionGuard::commit() {
  if (finished_) {
    return false;
  }
  finished_ = true;
  return conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

// PooledConnection implementation
PooledConnection::PooledConnection(ConnectionPool* pool, PostgresConnection* conn)
    : pool_(pool), conn_(conn) {
}

PooledConnection::~PooledConnection() {
  release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), conn_(other.conn_) {
  other.pool_ = nullptr;
  other.conn_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    conn_ = other.conn_;
    other.pool_ = nullptr;
    other.conn_ = nullptr;
  }
  return *this;
}

void PooledConnection::release() {
  if (pool_ && conn_) {
    pool_->giveBack(conn_);
  }
  pool_ = nullptr;
  conn_ = nullptr;
}

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const PostgresConnection::Config& config)
    : config_(config), open_(false) {
}

ConnectionPool::~ConnectionPool() {
  close();
}

bool ConnectionPool::open() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (open_) {
    return true;
  }

  const int count = config_.max_connections > 0 ? config_.max_connections : 1;
  for (int i = 0; i < count; ++i) {
    auto conn = std::make_unique<PostgresConnection>(config_);
    if (!conn->connect()) {
      if (i == 0) {
        return false;
      }
      // Reconnected lazily by acquire()
      LOG_BUILDER(observability::LogLevel::WARN, "Pooled connection not established")
          .field("index", i);
    }
    idle_.push_back(conn.get());
    connections_.push_back(std::move(conn));
  }

  open_ = true;
  LOG_BUILDER(observability::LogLevel::INFO, "Connection pool opened")
      .field("connections", count);
  return true;
}

void ConnectionPool::close() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!open_) {
    return;
  }

  open_ = false;
  for (auto& conn : connections_) {
    conn->disconnect();
  }
  available_.notify_all();
}

PooledConnection ConnectionPool::acquire(std::chrono::milliseconds timeout) {
  PostgresConnection* conn = nullptr;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !open_ || !idle_.empty(); })) {
      LOG_WARN("Timed out waiting for a pooled connection");
      return PooledConnection();
    }
    if (!open_) {
      return PooledConnection();
    }
    conn = idle_.front();
    idle_.pop_front();
  }

  if (!conn->isConnected() && !conn->connect()) {
    giveBack(conn);
    return PooledConnection();
  }

  return PooledConnection(this, conn);
}

void ConnectionPool::giveBack(PostgresConnection* conn) {
  // A connection abandoned mid-transaction must not leak its state
  if (conn->inTransaction()) {
    conn->rollbackTransaction();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(conn);
  }
  available_.notify_one();
}

std::size_t ConnectionPool::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t ConnectionPool::idleCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace database
}  // namespace wallet
