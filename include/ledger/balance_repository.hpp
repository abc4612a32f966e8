#ifndef WALLET_BALANCE_REPOSITORY_HPP_
#define WALLET_BALANCE_REPOSITORY_HPP_

#include "ledger/ledger_types.hpp"
#include "store/ledger_store.hpp"

#include <functional>
#include <optional>
#include <string>

namespace wallet {
namespace ledger {

/**
 * Owns the account-id -> balance mapping. All balance mutations go through
 * the store's atomic primitives; nothing else writes balance documents.
 *
 * Failures are raised as LedgerError: InvalidAmount, InsufficientFunds,
 * TransientStoreError (conflict retries exhausted or store unreachable) and
 * Timeout (deadline passed before the mutation was submitted).
 */
class BalanceRepository {
 public:
  // Runs inside the transfer transaction, after both balances are staged.
  using TransferHook = std::function<void(store::Transaction&)>;

  BalanceRepository(store::LedgerStore& store, const store::TransactionOptions& options);

  // Store key of an account's balance document.
  static std::string keyFor(const AccountId& account_id);

  /**
   * Current balance, 0 when the account has no record. Never creates one.
   */
  Amount GetBalance(const AccountId& account_id);

  /**
   * Full balance record, or nullopt when the account has no record.
   */
  std::optional<AccountBalance> Find(const AccountId& account_id);

  /**
   * Creates a zero balance if absent. Never overwrites an existing balance.
   */
  void EnsureInitialized(const AccountId& account_id);

  /**
   * Atomically adds `amount` (> 0) and returns the new balance.
   */
  Amount Deposit(const AccountId& account_id, Amount amount,
                 std::optional<Deadline> deadline = std::nullopt);

  /**
   * Moves `amount` (> 0) from sender to recipient in one serializable
   * transaction, creating the recipient's record if absent.
   */
  void Transfer(const AccountId& sender, const AccountId& recipient, Amount amount,
                const TransferHook& hook = nullptr,
                std::optional<Deadline> deadline = std::nullopt);

 private:
  store::LedgerStore& store_;
  store::TransactionOptions options_;
};

}  // namespace ledger
}  // namespace wallet

#endif  // WALLET_BALANCE_REPOSITORY_HPP_
