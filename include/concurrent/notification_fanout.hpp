#ifndef WALLET_NOTIFICATION_FANOUT_HPP_
#define WALLET_NOTIFICATION_FANOUT_HPP_

#include "ledger/ledger_types.hpp"
#include "store/ledger_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace wallet {
namespace concurrent {

class FanoutState;

using BalanceCallback = std::function<void(const AccountBalance&)>;
using TransactionCallback = std::function<void(const TransactionRecord&)>;
using ErrorCallback = std::function<void(ErrorKind, const std::string&)>;

/**
 * Handle of one subscription. Destroying it cancels the subscription.
 */
class Subscription {
 public:
  Subscription() = default;
  Subscription(std::weak_ptr<FanoutState> state, std::uint64_t id);
  ~Subscription();

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  /**
   * Stops delivery. Once this returns no further callback runs, except that
   * a callback currently executing on the calling thread finishes normally.
   */
  void cancel();

  bool active() const { return id_ != 0; }
  std::uint64_t id() const { return id_; }

 private:
  std::weak_ptr<FanoutState> state_;
  std::uint64_t id_ = 0;
};

/**
 * Pushes balance and transaction-log changes to subscribers.
 *
 * Store change events are queued on a lock-free MPSC queue and delivered by
 * one dispatcher thread. Every subscription first receives the snapshot read
 * when it was created, then only changes newer than that snapshot:
 * balances never go backwards in version and may be coalesced to the newest
 * value; log records are delivered once each by id and never coalesced.
 */
class NotificationFanout {
 public:
  struct Options {
    std::size_t batch_size = 64;
  };

  struct Stats {
    std::size_t events_processed;
    std::size_t deliveries;
    std::size_t coalesced_events;
    std::size_t queue_depth;
    std::size_t active_subscriptions;
    // Record ids held for snapshot de-duplication, over all subscribers
    std::size_t tracked_record_ids;
  };

  explicit NotificationFanout(store::LedgerStore& store) : NotificationFanout(store, Options()) {}
  explicit NotificationFanout(store::LedgerStore& store, const Options& options);
  ~NotificationFanout();

  // Non-copyable
  NotificationFanout(const NotificationFanout&) = delete;
  NotificationFanout& operator=(const NotificationFanout&) = delete;

  /**
   * Start the dispatcher thread.
   */
  bool start();

  /**
   * Stop the dispatcher thread. Queued events are discarded.
   */
  void stop();

  bool isRunning() const { return running_; }

  /**
   * Subscribes to an account's balance. The current balance (0 for an
   * unknown account) is delivered first. Throws LedgerError if the snapshot
   * cannot be read.
   */
  Subscription SubscribeBalance(const AccountId& account_id, BalanceCallback on_balance,
                                ErrorCallback on_error = nullptr);

  /**
   * Subscribes to an account's transaction log. Existing records are
   * delivered first in arrival order, then each new record once.
   */
  Subscription SubscribeTransactions(const AccountId& account_id,
                                     TransactionCallback on_record,
                                     ErrorCallback on_error = nullptr);

  Stats getStats() const;

 private:
  void dispatcherThread();

  std::shared_ptr<FanoutState> state_;
  std::size_t batch_size_;
  std::unique_ptr<std::thread> dispatcher_;
  std::atomic<bool> running_;
};

}  // namespace concurrent
}  // namespace wallet

#endif  // WALLET_NOTIFICATION_FANOUT_HPP_
