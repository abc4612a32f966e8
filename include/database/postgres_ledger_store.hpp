#ifndef WALLET_POSTGRES_LEDGER_STORE_HPP_
#define WALLET_POSTGRES_LEDGER_STORE_HPP_

#include "database/postgres_connection.hpp"
#include "store/ledger_store.hpp"

#include <chrono>
#include <string>

namespace wallet {
namespace database {

/**
 * LedgerStore backed by PostgreSQL.
 *
 * Documents live in `ledger_documents`, append-only collections in
 * `ledger_records` (see database/schema.sql). Transactions run at
 * SERIALIZABLE isolation on a pooled connection; serialization failures,
 * deadlocks and failed conditional writes are retried with exponential
 * backoff. Change events are published in-process after commit, so only
 * listeners attached to this store instance observe them.
 */
class PostgresLedgerStore : public store::LedgerStore {
 public:
  struct Config {
    PostgresConnection::Config connection;
    std::string schema_path = "database/schema.sql";
    std::chrono::milliseconds acquire_timeout{5000};
  };

  explicit PostgresLedgerStore(const Config& config);
  ~PostgresLedgerStore() override;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Opens the connection pool and applies the schema file.
   */
  bool open() override;
  void close() override;

  store::VersionedDocument Get(const std::string& key) override;
  store::IncrementResult AtomicIncrement(const std::string& key, const std::string& field,
                                         std::int64_t delta,
                                         const store::Document& initial) override;
  void RunTransaction(const store::TransactionFunction& fn,
                      const store::TransactionOptions& options) override;
  store::AppendResult Append(const std::string& collection,
                             const store::Document& record) override;
  std::vector<store::Document> List(const std::string& collection) override;
  std::uint64_t Subscribe(const std::string& key_or_collection,
                          store::ChangeListener listener) override;
  void Unsubscribe(std::uint64_t subscription_id) override;

 private:
  class PostgresTransaction;

  PooledConnection acquire();
  bool applySchema(PostgresConnection& conn);

  Config config_;
  ConnectionPool pool_;
  store::ChangeFeed feed_;
};

}  // namespace database
}  // namespace wallet

#endif  // WALLET_POSTGRES_LEDGER_STORE_HPP_
