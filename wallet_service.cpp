#include "wallet_service.hpp"

#include "observability/logger.hpp"

namespace wallet {

WalletService::WalletService(store::LedgerStore& store, const Options& options)
    : options_(options),
      balances_(store, options.transactions),
      log_(store),
      engine_(balances_, log_, metrics_, options.engine),
      fanout_(store, options.notifications) {
}

WalletService::~WalletService() {
  stop();
}

bool WalletService::start() {
  if (!fanout_.start()) {
    return false;
  }
  LOG_BUILDER(observability::LogLevel::INFO, "Wallet service started")
      .field("atomic_sender_log", options_.engine.atomic_sender_log)
      .field("max_attempts", options_.transactions.max_attempts);
  return true;
}

void WalletService::stop() {
  if (fanout_.isRunning()) {
    fanout_.stop();
    LOG_INFO("Wallet service stopped");
  }
}

std::optional<Deadline> WalletService::deadline() const {
  if (options_.request_timeout.count() <= 0) {
    return std::nullopt;
  }
  return std::chrono::steady_clock::now() + options_.request_timeout;
}

OperationResult WalletService::Deposit(const AccountId& account_id, Amount amount) {
  return engine_.Deposit(account_id, amount, deadline());
}

OperationResult WalletService::Transfer(const AccountId& sender, const AccountId& recipient,
                                        Amount amount) {
  ledger::TransferRequest request;
  request.sender = sender;
  request.recipient = recipient;
  request.amount = amount;
  return engine_.Transfer(request, deadline());
}

Amount WalletService::GetBalance(const AccountId& account_id) {
  return balances_.GetBalance(account_id);
}

std::vector<TransactionRecord> WalletService::ListTransactions(const AccountId& account_id) {
  return log_.List(account_id);
}

concurrent::Subscription WalletService::SubscribeBalance(const AccountId& account_id,
                                                         concurrent::BalanceCallback on_balance,
                                                         concurrent::ErrorCallback on_error) {
  return fanout_.SubscribeBalance(account_id, std::move(on_balance), std::move(on_error));
}

concurrent::Subscription WalletService::SubscribeTransactions(
    const AccountId& account_id, concurrent::TransactionCallback on_record,
    concurrent::ErrorCallback on_error) {
  return fanout_.SubscribeTransactions(account_id, std::move(on_record), std::move(on_error));
}

void WalletService::EnsureInitialized(const AccountId& account_id) {
  balances_.EnsureInitialized(account_id);
}

concurrent::NotificationFanout::Stats WalletService::notificationStats() const {
  return fanout_.getStats();
}

std::string WalletService::exportMetrics() {
  auto stats = fanout_.getStats();
  metrics_.setGauge("wallet_notification_queue_depth", static_cast<double>(stats.queue_depth));
  metrics_.setGauge("wallet_notification_subscriptions",
                    static_cast<double>(stats.active_subscriptions));
  metrics_.setGauge("wallet_notification_deliveries", static_cast<double>(stats.deliveries));
  metrics_.setGauge("wallet_notification_coalesced_events",
                    static_cast<double>(stats.coalesced_events));
  metrics_.setGauge("wallet_notification_tracked_record_ids",
                    static_cast<double>(stats.tracked_record_ids));
  return metrics_.exportMetrics();
}

}  // namespace wallet
