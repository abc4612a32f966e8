#include "concurrent/notification_fanout.hpp"

#include "concurrent/lockfree_queue.hpp"
#include "ledger/balance_repository.hpp"
#include "ledger/transaction_log.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace wallet {
namespace concurrent {

namespace {

struct FanoutTask {
  enum class Kind {
    CHANGE,
    SNAPSHOT
  };

  Kind kind = Kind::CHANGE;
  store::ChangeEvent event;

  // SNAPSHOT only
  std::uint64_t subscriber_id = 0;
  std::uint64_t snapshot_version = 0;
  store::Document snapshot;
};

struct Subscriber {
  enum class Stream {
    BALANCE,
    TRANSACTIONS
  };

  std::uint64_t id = 0;
  Stream stream = Stream::BALANCE;
  AccountId account_id;
  std::string key;

  BalanceCallback on_balance;
  TransactionCallback on_record;
  ErrorCallback on_error;

  std::atomic<bool> active{true};
  // Size of seen_ids, readable from any thread
  std::atomic<std::size_t> tracked_ids{0};
  // Held for the duration of every callback
  std::mutex delivery_mutex;

  // Touched by the dispatcher thread only
  bool primed = false;
  std::uint64_t last_version = 0;
  // Highest sequence in the snapshot; later records cannot repeat
  std::uint64_t snapshot_sequence = 0;
  std::unordered_set<std::string> seen_ids;
  std::vector<store::ChangeEvent> pending;
};

}  // namespace

/**
 * Subscriber registry and delivery logic shared between the fan-out, its
 * Subscription handles and the store listeners.
 */
class FanoutState : public std::enable_shared_from_this<FanoutState> {
 public:
  explicit FanoutState(store::LedgerStore& store)
      : store_(store),
        dispatcher_id_(std::thread::id()),
        events_processed_(0),
        deliveries_(0),
        coalesced_(0) {}

  store::LedgerStore& store() { return store_; }

  std::shared_ptr<Subscriber> add(Subscriber::Stream stream, const AccountId& account_id,
                                  const std::string& key) {
    auto sub = std::make_shared<Subscriber>();
    sub->stream = stream;
    sub->account_id = account_id;
    sub->key = key;

    std::lock_guard<std::mutex> lock(mutex_);
    sub->id = next_id_++;

    auto listener = listeners_.find(key);
    if (listener == listeners_.end()) {
      std::weak_ptr<FanoutState> weak = shared_from_this();
      // Runs on the committing thread; must only enqueue
      const std::uint64_t store_id = store_.Subscribe(key, [weak](const store::ChangeEvent& e) {
        if (auto state = weak.lock()) {
          FanoutTask task;
          task.event = e;
          state->enqueue(std::move(task));
        }
      });
      listener = listeners_.emplace(key, KeyListener{store_id, 0}).first;
    }
    listener->second.refs += 1;

    subscribers_.emplace(sub->id, sub);
    by_key_[key].push_back(sub->id);
    return sub;
  }

  void cancel(std::uint64_t id) {
    std::shared_ptr<Subscriber> sub;
    std::optional<std::uint64_t> store_id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = subscribers_.find(id);
      if (it == subscribers_.end()) {
        return;
      }
      sub = it->second;
      subscribers_.erase(it);

      auto& ids = by_key_[sub->key];
      ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
      if (ids.empty()) {
        by_key_.erase(sub->key);
      }

      auto listener = listeners_.find(sub->key);
      if (listener != listeners_.end() && --listener->second.refs == 0) {
        store_id = listener->second.store_subscription;
        listeners_.erase(listener);
      }
    }

    if (store_id) {
      store_.Unsubscribe(*store_id);
    }

    sub->active = false;
    if (std::this_thread::get_id() != dispatcher_id_.load()) {
      // Wait out a delivery in flight
      std::lock_guard<std::mutex> wait(sub->delivery_mutex);
    }
  }

  void detachAll() {
    std::vector<std::uint64_t> ids;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& entry : subscribers_) {
        ids.push_back(entry.first);
      }
    }
    for (std::uint64_t id : ids) {
      cancel(id);
    }
  }

  void enqueue(FanoutTask task) {
    queue_.enqueue(std::move(task));
  }

  void setDispatcherThread(std::thread::id id) {
    dispatcher_id_.store(id);
  }

  void processBatch(std::vector<FanoutTask>& batch) {
    // Newest balance version per key within this batch
    std::unordered_map<std::string, std::uint64_t> newest;
    for (const auto& task : batch) {
      if (task.kind == FanoutTask::Kind::CHANGE &&
          task.event.kind == store::ChangeEvent::Kind::DOCUMENT_CHANGED) {
        auto& version = newest[task.event.key];
        version = std::max(version, task.event.version);
      }
    }

    for (auto& task : batch) {
      events_processed_.fetch_add(1);

      if (task.kind == FanoutTask::Kind::SNAPSHOT) {
        handleSnapshot(task);
      } else if (task.event.kind == store::ChangeEvent::Kind::DOCUMENT_CHANGED) {
        if (task.event.version < newest[task.event.key]) {
          coalesced_.fetch_add(1);
          continue;
        }
        handleBalanceChange(task.event);
      } else {
        handleRecordAppended(task.event);
      }
    }
  }

  std::size_t queueDepth() const { return queue_.size(); }

  std::vector<FanoutTask> dequeueBatch(std::size_t max_items) {
    return queue_.dequeueBatch(max_items);
  }

  std::size_t subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

  std::size_t trackedRecordIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& pair : subscribers_) {
      total += pair.second->tracked_ids.load();
    }
    return total;
  }

  std::size_t eventsProcessed() const { return events_processed_.load(); }
  std::size_t deliveries() const { return deliveries_.load(); }
  std::size_t coalesced() const { return coalesced_.load(); }

 private:
  struct KeyListener {
    std::uint64_t store_subscription;
    std::size_t refs;
  };

  std::shared_ptr<Subscriber> find(std::uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(id);
    return it == subscribers_.end() ? nullptr : it->second;
  }

  std::vector<std::shared_ptr<Subscriber>> subscribersFor(const std::string& key) const {
    std::vector<std::shared_ptr<Subscriber>> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto ids = by_key_.find(key);
    if (ids == by_key_.end()) {
      return result;
    }
    for (std::uint64_t id : ids->second) {
      auto it = subscribers_.find(id);
      if (it != subscribers_.end()) {
        result.push_back(it->second);
      }
    }
    return result;
  }

  void handleSnapshot(const FanoutTask& task) {
    auto sub = find(task.subscriber_id);
    if (!sub) {
      return;
    }

    if (sub->stream == Subscriber::Stream::BALANCE) {
      sub->last_version = task.snapshot_version;
      deliverBalance(*sub, task.snapshot);
      sub->primed = true;
      for (const auto& event : sub->pending) {
        applyBalanceChange(*sub, event);
      }
    } else {
      for (const auto& record : task.snapshot) {
        sub->snapshot_sequence =
            std::max(sub->snapshot_sequence, record.value("sequence", std::uint64_t(0)));
      }
      for (const auto& record : task.snapshot) {
        deliverRecordOnce(*sub, record);
      }
      sub->primed = true;
      for (const auto& event : sub->pending) {
        deliverRecordOnce(*sub, event.data);
      }
    }
    sub->pending.clear();
  }

  void handleBalanceChange(const store::ChangeEvent& event) {
    for (const auto& sub : subscribersFor(event.key)) {
      if (!sub->primed) {
        sub->pending.push_back(event);
      } else {
        applyBalanceChange(*sub, event);
      }
    }
  }

  void handleRecordAppended(const store::ChangeEvent& event) {
    for (const auto& sub : subscribersFor(event.key)) {
      if (!sub->primed) {
        sub->pending.push_back(event);
      } else {
        deliverRecordOnce(*sub, event.data);
      }
    }
  }

  void applyBalanceChange(Subscriber& sub, const store::ChangeEvent& event) {
    if (event.version <= sub.last_version) {
      return;
    }
    sub.last_version = event.version;
    deliverBalance(sub, event.data);
  }

  void deliverBalance(Subscriber& sub, const store::Document& doc) {
    AccountBalance balance;
    try {
      balance = doc.get<AccountBalance>();
    } catch (const std::exception& e) {
      reportError(sub, ErrorKind::TRANSIENT_STORE_ERROR,
                  std::string("Malformed balance document: ") + e.what());
      return;
    }
    if (balance.account_id.empty()) {
      balance.account_id = sub.account_id;
    }

    std::lock_guard<std::mutex> lock(sub.delivery_mutex);
    if (!sub.active) {
      return;
    }
    try {
      sub.on_balance(balance);
      deliveries_.fetch_add(1);
    } catch (const std::exception& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Balance subscriber threw")
          .field("account_id", sub.account_id)
          .field("error", e.what());
    }
  }

  void deliverRecordOnce(Subscriber& sub, const store::Document& doc) {
    auto record = ledger::TransactionLog::fromDocument(doc);
    if (!record) {
      reportError(sub, ErrorKind::TRANSIENT_STORE_ERROR, "Malformed transaction record");
      return;
    }
    // Only records at or below the snapshot can arrive twice, once in the
    // snapshot and once as a change event
    const bool may_repeat = !sub.primed || record->sequence <= sub.snapshot_sequence;
    if (may_repeat && !record->id.empty()) {
      if (!sub.seen_ids.insert(record->id).second) {
        return;
      }
      sub.tracked_ids.store(sub.seen_ids.size());
    }

    std::lock_guard<std::mutex> lock(sub.delivery_mutex);
    if (!sub.active) {
      return;
    }
    try {
      sub.on_record(*record);
      deliveries_.fetch_add(1);
    } catch (const std::exception& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Transaction subscriber threw")
          .field("account_id", sub.account_id)
          .field("error", e.what());
    }
  }

  void reportError(Subscriber& sub, ErrorKind kind, const std::string& message) {
    LOG_BUILDER(observability::LogLevel::WARN, "Notification delivery failed")
        .field("account_id", sub.account_id)
        .field("error", message);

    std::lock_guard<std::mutex> lock(sub.delivery_mutex);
    if (sub.active && sub.on_error) {
      try {
        sub.on_error(kind, message);
      } catch (const std::exception& e) {
        LOG_BUILDER(observability::LogLevel::ERROR, "Error callback threw")
            .field("error", e.what());
      }
    }
  }

  store::LedgerStore& store_;
  LockFreeQueue<FanoutTask> queue_;
  std::atomic<std::thread::id> dispatcher_id_;

  mutable std::mutex mutex_;
  std::uint64_t next_id_ = 1;
  std::unordered_map<std::uint64_t, std::shared_ptr<Subscriber>> subscribers_;
  std::unordered_map<std::string, std::vector<std::uint64_t>> by_key_;
  std::unordered_map<std::string, KeyListener> listeners_;

  std::atomic<std::size_t> events_processed_;
  std::atomic<std::size_t> deliveries_;
  std::atomic<std::size_t> coalesced_;
};

// Subscription implementation
Subscription::Subscription(std::weak_ptr<FanoutState> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {
}

Subscription::~Subscription() {
  cancel();
}

Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    cancel();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void Subscription::cancel() {
  if (id_ == 0) {
    return;
  }
  if (auto state = state_.lock()) {
    state->cancel(id_);
  }
  id_ = 0;
  state_.reset();
}

// NotificationFanout implementation
NotificationFanout::NotificationFanout(store::LedgerStore& store, const Options& options)
    : state_(std::make_shared<FanoutState>(store)),
      batch_size_(options.batch_size > 0 ? options.batch_size : 1),
      running_(false) {
}

NotificationFanout::~NotificationFanout() {
  stop();
  state_->detachAll();
}

bool NotificationFanout::start() {
  if (running_) return true;

  running_ = true;
  dispatcher_ = std::make_unique<std::thread>(&NotificationFanout::dispatcherThread, this);

  LOG_BUILDER(observability::LogLevel::INFO, "Notification fan-out started")
      .field("batch_size", static_cast<std::int64_t>(batch_size_));
  return true;
}

void NotificationFanout::stop() {
  if (!running_) return;

  running_ = false;
  if (dispatcher_ && dispatcher_->joinable()) {
    dispatcher_->join();
  }
  dispatcher_.reset();

  LOG_INFO("Notification fan-out stopped");
}

Subscription NotificationFanout::SubscribeBalance(const AccountId& account_id,
                                                  BalanceCallback on_balance,
                                                  ErrorCallback on_error) {
  const std::string key = ledger::BalanceRepository::keyFor(account_id);
  auto sub = state_->add(Subscriber::Stream::BALANCE, account_id, key);
  sub->on_balance = std::move(on_balance);
  sub->on_error = std::move(on_error);

  // Snapshot is read after the store listener is attached so no change is lost
  FanoutTask task;
  task.kind = FanoutTask::Kind::SNAPSHOT;
  task.subscriber_id = sub->id;
  try {
    store::VersionedDocument doc = state_->store().Get(key);
    AccountBalance balance;
    if (doc.exists()) {
      balance = doc.data.get<AccountBalance>();
    }
    balance.account_id = account_id;
    task.snapshot = balance;
    task.snapshot_version = doc.version;
  } catch (const store::StoreError& e) {
    state_->cancel(sub->id);
    throw LedgerError(ErrorKind::TRANSIENT_STORE_ERROR, e.what());
  }

  state_->enqueue(std::move(task));
  return Subscription(state_, sub->id);
}

Subscription NotificationFanout::SubscribeTransactions(const AccountId& account_id,
                                                       TransactionCallback on_record,
                                                       ErrorCallback on_error) {
  const std::string collection = ledger::TransactionLog::collectionFor(account_id);
  auto sub = state_->add(Subscriber::Stream::TRANSACTIONS, account_id, collection);
  sub->on_record = std::move(on_record);
  sub->on_error = std::move(on_error);

  FanoutTask task;
  task.kind = FanoutTask::Kind::SNAPSHOT;
  task.subscriber_id = sub->id;
  try {
    task.snapshot = state_->store().List(collection);
  } catch (const store::StoreError& e) {
    state_->cancel(sub->id);
    throw LedgerError(ErrorKind::TRANSIENT_STORE_ERROR, e.what());
  }

  state_->enqueue(std::move(task));
  return Subscription(state_, sub->id);
}

NotificationFanout::Stats NotificationFanout::getStats() const {
  Stats stats;
  stats.events_processed = state_->eventsProcessed();
  stats.deliveries = state_->deliveries();
  stats.coalesced_events = state_->coalesced();
  stats.queue_depth = state_->queueDepth();
  stats.active_subscriptions = state_->subscriberCount();
  stats.tracked_record_ids = state_->trackedRecordIds();
  return stats;
}

void NotificationFanout::dispatcherThread() {
  state_->setDispatcherThread(std::this_thread::get_id());

  while (running_) {
    auto batch = state_->dequeueBatch(batch_size_);
    if (batch.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }
    state_->processBatch(batch);
  }

  state_->setDispatcherThread(std::thread::id());
}

}  // namespace concurrent
}  // namespace wallet
