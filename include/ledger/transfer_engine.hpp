#ifndef WALLET_TRANSFER_ENGINE_HPP_
#define WALLET_TRANSFER_ENGINE_HPP_

#include "ledger/balance_repository.hpp"
#include "ledger/ledger_types.hpp"
#include "ledger/transaction_log.hpp"
#include "observability/metrics.hpp"

#include <optional>
#include <string>

namespace wallet {
namespace ledger {

/**
 * Ephemeral transfer input; validated and discarded.
 */
struct TransferRequest {
  AccountId sender;
  AccountId recipient;
  Amount amount = 0;
};

struct EngineOptions {
  // Commit the sender's TRANSFER_SENT record in the balance transaction.
  bool atomic_sender_log = false;
};

/**
 * Validates deposits and transfers, drives the balance mutation and then
 * appends the transaction records.
 *
 * The balance mutation and the log appends are two separately consistent
 * phases. A failed synchronous append (deposit, sender side) is reported as
 * LOG_WRITE_FAILED without undoing the committed balance change; a failed
 * recipient append is only logged.
 */
class TransferEngine {
 public:
  TransferEngine(BalanceRepository& balances, TransactionLog& log,
                 observability::MetricsCollector& metrics,
                 const EngineOptions& options = EngineOptions());

  OperationResult Deposit(const AccountId& account_id, Amount amount,
                          std::optional<Deadline> deadline = std::nullopt);

  OperationResult Transfer(const TransferRequest& request,
                           std::optional<Deadline> deadline = std::nullopt);

  // 1..128 characters of [A-Za-z0-9_-].
  static bool isWellFormedAccountId(const std::string& account_id);

  const EngineOptions& options() const { return options_; }

 private:
  OperationResult executeTransfer(const TransferRequest& request,
                                  std::optional<Deadline> deadline);
  void appendRecipientRecord(const TransferRequest& request);
  OperationResult record(const std::string& operation, OperationResult result);

  BalanceRepository& balances_;
  TransactionLog& log_;
  observability::MetricsCollector& metrics_;
  EngineOptions options_;
};

}  // namespace ledger
}  // namespace wallet

#endif  // WALLET_TRANSFER_ENGINE_HPP_
