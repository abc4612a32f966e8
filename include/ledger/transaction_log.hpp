#ifndef WALLET_TRANSACTION_LOG_HPP_
#define WALLET_TRANSACTION_LOG_HPP_

#include "ledger/ledger_types.hpp"
#include "store/ledger_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wallet {
namespace ledger {

/**
 * Append-only, per-account transaction history.
 *
 * Records are kept in store arrival order; there is no server-side ordering
 * index. Use sortNewestFirst() before display.
 */
class TransactionLog {
 public:
  explicit TransactionLog(store::LedgerStore& store);

  // Store collection holding an account's records.
  static std::string collectionFor(const AccountId& account_id);

  /**
   * Appends `record` to its account's collection and returns it with the
   * store-assigned id, timestamp and sequence.
   * Throws LedgerError(LOG_WRITE_FAILED) if the store rejects the write.
   */
  TransactionRecord Append(const TransactionRecord& record);

  /**
   * Stages `record` inside a running store transaction; it is written only
   * if that transaction commits.
   */
  void AppendWithin(store::Transaction& tx, const TransactionRecord& record);

  /**
   * All records of an account in arrival order.
   * Throws LedgerError(TRANSIENT_STORE_ERROR) if the store is unreachable.
   */
  std::vector<TransactionRecord> List(const AccountId& account_id);

  // Decodes a stored record; nullopt (and a warning) if it is malformed.
  static std::optional<TransactionRecord> fromDocument(const store::Document& doc);

  static TransactionRecord makeDeposit(const AccountId& account_id, Amount amount);
  static TransactionRecord makeTransferSent(const AccountId& sender, const AccountId& recipient,
                                            Amount amount);
  static TransactionRecord makeTransferReceived(const AccountId& recipient,
                                                const AccountId& sender, Amount amount);

 private:
  store::LedgerStore& store_;
};

/**
 * Orders records for display: newest timestamp first, records without a
 * timestamp last (as epoch 0), ties broken by later arrival first.
 */
void sortNewestFirst(std::vector<TransactionRecord>& records);

}  // namespace ledger
}  // namespace wallet

#endif  // WALLET_TRANSACTION_LOG_HPP_
