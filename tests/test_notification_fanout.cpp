#include "concurrent/notification_fanout.hpp"
#include "ledger/balance_repository.hpp"
#include "ledger/transaction_log.hpp"
#include "store/memory_ledger_store.hpp"

#include "fault_injecting_store.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace wallet;

namespace {

bool waitFor(const std::function<bool()>& predicate,
             std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return predicate();
}

// Runs `hook` once, just before the next snapshot read
class RacingStore : public test_support::FaultInjectingStore {
 public:
  using FaultInjectingStore::FaultInjectingStore;

  void beforeNextSnapshot(std::function<void()> hook) { hook_ = std::move(hook); }

  store::VersionedDocument Get(const std::string& key) override {
    fireHook();
    return FaultInjectingStore::Get(key);
  }

  std::vector<store::Document> List(const std::string& collection) override {
    fireHook();
    return FaultInjectingStore::List(collection);
  }

 private:
  void fireHook() {
    if (hook_) {
      auto hook = std::move(hook_);
      hook_ = nullptr;
      hook();
    }
  }

  std::function<void()> hook_;
};

template <typename T>
class Recorder {
 public:
  void add(const T& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.push_back(value);
  }

  std::vector<T> values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<T> values_;
};

}  // namespace

class NotificationFanoutTest : public ::testing::Test {
 protected:
  NotificationFanoutTest()
      : store_(memory_),
        balances_(store_, store::TransactionOptions()),
        log_(store_),
        fanout_(store_) {}

  void SetUp() override {
    memory_.open();
  }

  void TearDown() override {
    fanout_.stop();
  }

  concurrent::BalanceCallback recordBalance(Recorder<Amount>& recorder) {
    return [&recorder](const AccountBalance& balance) { recorder.add(balance.amount); };
  }

  concurrent::TransactionCallback recordIds(Recorder<std::string>& recorder) {
    return [&recorder](const TransactionRecord& record) { recorder.add(record.id); };
  }

  store::MemoryLedgerStore memory_;
  RacingStore store_;
  ledger::BalanceRepository balances_;
  ledger::TransactionLog log_;
  concurrent::NotificationFanout fanout_;
};

TEST_F(NotificationFanoutTest, SubscriberSeesSnapshotThenDeposit) {
  ASSERT_TRUE(fanout_.start());

  Recorder<Amount> seen;
  auto subscription = fanout_.SubscribeBalance("A", recordBalance(seen));
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 1; }));

  balances_.Deposit("A", 100);
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 2; }));

  EXPECT_EQ(seen.values(), (std::vector<Amount>{0, 100}));
}

TEST_F(NotificationFanoutTest, SnapshotCarriesExistingBalance) {
  balances_.Deposit("A", 250);
  ASSERT_TRUE(fanout_.start());

  std::vector<AccountBalance> received;
  std::mutex mutex;
  auto subscription = fanout_.SubscribeBalance("A", [&](const AccountBalance& balance) {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(balance);
  });

  ASSERT_TRUE(waitFor([&]() {
    std::lock_guard<std::mutex> lock(mutex);
    return !received.empty();
  }));
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(received[0].account_id, "A");
  EXPECT_EQ(received[0].amount, 250);
}

TEST_F(NotificationFanoutTest, QueuedBalanceChangesAreCoalesced) {
  Recorder<Amount> seen;
  auto subscription = fanout_.SubscribeBalance("A", recordBalance(seen));

  // Dispatcher is not running yet, so all ten changes queue up together
  for (int i = 0; i < 10; ++i) {
    balances_.Deposit("A", 10);
  }
  ASSERT_TRUE(fanout_.start());
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 2; }));

  EXPECT_EQ(seen.values(), (std::vector<Amount>{0, 100}));
  EXPECT_EQ(fanout_.getStats().coalesced_events, 9u);
}

TEST_F(NotificationFanoutTest, BalanceNeverGoesBackwards) {
  ASSERT_TRUE(fanout_.start());

  Recorder<Amount> seen;
  auto subscription = fanout_.SubscribeBalance("A", recordBalance(seen));

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([this]() {
      for (int i = 0; i < 50; ++i) {
        balances_.Deposit("A", 1);
      }
    });
  }
  for (auto& w : writers) w.join();

  ASSERT_TRUE(waitFor([&]() {
    auto values = seen.values();
    return !values.empty() && values.back() == 200;
  }));

  auto values = seen.values();
  for (std::size_t i = 1; i < values.size(); ++i) {
    EXPECT_LT(values[i - 1], values[i]);
  }
}

TEST_F(NotificationFanoutTest, ChangeRacingTheSnapshotIsNotRepeated) {
  ASSERT_TRUE(fanout_.start());

  // The deposit commits after the listener is attached but before the read
  store_.beforeNextSnapshot([this]() { balances_.Deposit("A", 100); });

  Recorder<Amount> seen;
  auto subscription = fanout_.SubscribeBalance("A", recordBalance(seen));
  ASSERT_TRUE(waitFor([&]() { return seen.size() >= 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(seen.values(), (std::vector<Amount>{100}));
}

TEST_F(NotificationFanoutTest, TransactionSnapshotThenNewRecords) {
  log_.Append(ledger::TransactionLog::makeDeposit("A", 100));
  log_.Append(ledger::TransactionLog::makeDeposit("A", 200));
  ASSERT_TRUE(fanout_.start());

  Recorder<std::string> seen;
  auto subscription = fanout_.SubscribeTransactions("A", recordIds(seen));
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 2; }));

  auto third = log_.Append(ledger::TransactionLog::makeDeposit("A", 300));
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 3; }));

  auto stored = log_.List("A");
  auto ids = seen.values();
  ASSERT_EQ(ids.size(), 3u);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    EXPECT_EQ(ids[i], stored[i].id);
  }
  EXPECT_EQ(ids[2], third.id);
}

TEST_F(NotificationFanoutTest, OnlySnapshotRecordIdsAreTracked) {
  log_.Append(ledger::TransactionLog::makeDeposit("A", 100));
  log_.Append(ledger::TransactionLog::makeDeposit("A", 200));
  ASSERT_TRUE(fanout_.start());

  Recorder<std::string> seen;
  auto subscription = fanout_.SubscribeTransactions("A", recordIds(seen));
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 2; }));

  for (int i = 0; i < 50; ++i) {
    log_.Append(ledger::TransactionLog::makeDeposit("A", 300 + i));
  }
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 52; }));

  auto ids = seen.values();
  EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 52u);
  EXPECT_EQ(fanout_.getStats().tracked_record_ids, 2u);

  subscription.cancel();
  EXPECT_EQ(fanout_.getStats().tracked_record_ids, 0u);
}

TEST_F(NotificationFanoutTest, QueuedRecordsAreNeverCoalesced) {
  Recorder<std::string> seen;
  auto subscription = fanout_.SubscribeTransactions("A", recordIds(seen));

  for (int i = 0; i < 5; ++i) {
    log_.Append(ledger::TransactionLog::makeDeposit("A", 10 + i));
  }
  ASSERT_TRUE(fanout_.start());
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 5; }));

  auto ids = seen.values();
  EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 5u);
}

TEST_F(NotificationFanoutTest, RecordRacingTheSnapshotIsDeliveredOnce) {
  ASSERT_TRUE(fanout_.start());
  store_.beforeNextSnapshot([this]() {
    log_.Append(ledger::TransactionLog::makeDeposit("A", 100));
  });

  Recorder<std::string> seen;
  auto subscription = fanout_.SubscribeTransactions("A", recordIds(seen));
  ASSERT_TRUE(waitFor([&]() { return seen.size() >= 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(seen.size(), 1u);
}

TEST_F(NotificationFanoutTest, CancelStopsDelivery) {
  ASSERT_TRUE(fanout_.start());

  Recorder<Amount> seen;
  auto subscription = fanout_.SubscribeBalance("A", recordBalance(seen));
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 1; }));
  EXPECT_EQ(fanout_.getStats().active_subscriptions, 1u);

  subscription.cancel();
  EXPECT_FALSE(subscription.active());
  EXPECT_EQ(fanout_.getStats().active_subscriptions, 0u);

  balances_.Deposit("A", 100);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(seen.size(), 1u);

  // Cancelling twice is harmless
  subscription.cancel();
}

TEST_F(NotificationFanoutTest, DestroyingHandleCancels) {
  ASSERT_TRUE(fanout_.start());

  Recorder<Amount> seen;
  {
    auto subscription = fanout_.SubscribeBalance("A", recordBalance(seen));
    ASSERT_TRUE(waitFor([&]() { return seen.size() == 1; }));
  }
  EXPECT_EQ(fanout_.getStats().active_subscriptions, 0u);

  balances_.Deposit("A", 100);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(seen.size(), 1u);
}

TEST_F(NotificationFanoutTest, CallbackMayCancelItsOwnSubscription) {
  ASSERT_TRUE(fanout_.start());

  Recorder<Amount> seen;
  concurrent::Subscription subscription;
  std::mutex handle_mutex;
  {
    std::lock_guard<std::mutex> lock(handle_mutex);
    subscription = fanout_.SubscribeBalance("A", [&](const AccountBalance& balance) {
      seen.add(balance.amount);
      if (balance.amount > 0) {
        std::lock_guard<std::mutex> inner(handle_mutex);
        subscription.cancel();
      }
    });
  }
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 1; }));

  balances_.Deposit("A", 100);
  ASSERT_TRUE(waitFor([&]() { return seen.size() == 2; }));
  balances_.Deposit("A", 100);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(seen.values(), (std::vector<Amount>{0, 100}));
  EXPECT_EQ(fanout_.getStats().active_subscriptions, 0u);
}

TEST_F(NotificationFanoutTest, EverySubscriberOfAnAccountIsNotified) {
  ASSERT_TRUE(fanout_.start());

  Recorder<Amount> first;
  Recorder<Amount> second;
  auto sub1 = fanout_.SubscribeBalance("A", recordBalance(first));
  auto sub2 = fanout_.SubscribeBalance("A", recordBalance(second));
  ASSERT_TRUE(waitFor([&]() { return first.size() == 1 && second.size() == 1; }));

  balances_.Deposit("A", 75);
  ASSERT_TRUE(waitFor([&]() { return first.size() == 2 && second.size() == 2; }));
  EXPECT_EQ(first.values().back(), 75);
  EXPECT_EQ(second.values().back(), 75);

  // Dropping one keeps the other flowing
  sub1.cancel();
  balances_.Deposit("A", 25);
  ASSERT_TRUE(waitFor([&]() { return second.size() == 3; }));
  EXPECT_EQ(second.values().back(), 100);
  EXPECT_EQ(first.size(), 2u);
}

TEST_F(NotificationFanoutTest, SnapshotFailureIsTransient) {
  memory_.close();
  try {
    fanout_.SubscribeBalance("A", [](const AccountBalance&) {});
    FAIL() << "expected LedgerError";
  } catch (const LedgerError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::TRANSIENT_STORE_ERROR);
  }
  EXPECT_EQ(fanout_.getStats().active_subscriptions, 0u);
}
