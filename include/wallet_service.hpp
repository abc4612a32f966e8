#ifndef WALLET_WALLET_SERVICE_HPP_
#define WALLET_WALLET_SERVICE_HPP_

#include "wallet.hpp"
#include "concurrent/notification_fanout.hpp"
#include "ledger/balance_repository.hpp"
#include "ledger/transaction_log.hpp"
#include "ledger/transfer_engine.hpp"
#include "observability/metrics.hpp"
#include "store/ledger_store.hpp"

#include <chrono>
#include <optional>

namespace wallet {

/**
 * Wallet composed over an injected LedgerStore. The store's lifecycle
 * (open/close) belongs to the caller; start()/stop() only drive the
 * notification dispatcher.
 */
class WalletService : public Wallet {
 public:
  struct Options {
    store::TransactionOptions transactions;
    ledger::EngineOptions engine;
    concurrent::NotificationFanout::Options notifications;
    // Deadline for submitting a balance mutation; zero disables it.
    std::chrono::milliseconds request_timeout{0};
  };

  explicit WalletService(store::LedgerStore& store) : WalletService(store, Options()) {}
  explicit WalletService(store::LedgerStore& store, const Options& options);
  ~WalletService() override;

  // Non-copyable
  WalletService(const WalletService&) = delete;
  WalletService& operator=(const WalletService&) = delete;

  bool start();
  void stop();

  OperationResult Deposit(const AccountId& account_id, Amount amount) override;
  OperationResult Transfer(const AccountId& sender, const AccountId& recipient,
                           Amount amount) override;
  Amount GetBalance(const AccountId& account_id) override;
  std::vector<TransactionRecord> ListTransactions(const AccountId& account_id) override;
  concurrent::Subscription SubscribeBalance(const AccountId& account_id,
                                            concurrent::BalanceCallback on_balance,
                                            concurrent::ErrorCallback on_error = nullptr) override;
  concurrent::Subscription SubscribeTransactions(
      const AccountId& account_id, concurrent::TransactionCallback on_record,
      concurrent::ErrorCallback on_error = nullptr) override;
  void EnsureInitialized(const AccountId& account_id) override;

  /**
   * Prometheus text of all wallet metrics, fan-out gauges refreshed.
   */
  std::string exportMetrics();

  observability::MetricsCollector& metrics() { return metrics_; }
  concurrent::NotificationFanout::Stats notificationStats() const;

 private:
  std::optional<Deadline> deadline() const;

  Options options_;
  observability::MetricsCollector metrics_;
  ledger::BalanceRepository balances_;
  ledger::TransactionLog log_;
  ledger::TransferEngine engine_;
  concurrent::NotificationFanout fanout_;
};

}  // namespace wallet

#endif  // WALLET_WALLET_SERVICE_HPP_
