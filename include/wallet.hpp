#ifndef WALLET_WALLET_HPP_
#define WALLET_WALLET_HPP_

#include "concurrent/notification_fanout.hpp"
#include "ledger/ledger_types.hpp"

#include <vector>

namespace wallet {

/**
 * Caller-facing wallet operations.
 * Money-moving operations report failures through OperationResult; reads
 * and subscriptions throw LedgerError when the ledger is unreachable.
 */
class Wallet {
 public:
  virtual ~Wallet() = default;

  /**
   * Adds `amount` (> 0) to the account and records a DEPOSIT entry.
   */
  virtual OperationResult Deposit(const AccountId& account_id, Amount amount) = 0;

  /**
   * Moves `amount` from sender to recipient and records both sides.
   */
  virtual OperationResult Transfer(const AccountId& sender, const AccountId& recipient,
                                   Amount amount) = 0;

  /**
   * Current balance; 0 for an account that has never been touched.
   */
  virtual Amount GetBalance(const AccountId& account_id) = 0;

  /**
   * Transaction records in store arrival order.
   */
  virtual std::vector<TransactionRecord> ListTransactions(const AccountId& account_id) = 0;

  virtual concurrent::Subscription SubscribeBalance(
      const AccountId& account_id, concurrent::BalanceCallback on_balance,
      concurrent::ErrorCallback on_error = nullptr) = 0;

  virtual concurrent::Subscription SubscribeTransactions(
      const AccountId& account_id, concurrent::TransactionCallback on_record,
      concurrent::ErrorCallback on_error = nullptr) = 0;

  /**
   * Creates a zero balance for a newly seen account. Idempotent.
   */
  virtual void EnsureInitialized(const AccountId& account_id) = 0;
};

}  // namespace wallet

#endif  // WALLET_WALLET_HPP_
