#include "ledger/transaction_log.hpp"
#include "store/memory_ledger_store.hpp"

#include <gtest/gtest.h>

using namespace wallet;

namespace {

TransactionRecord recordAt(std::optional<Timestamp> timestamp, std::uint64_t sequence,
                           const std::string& description) {
  TransactionRecord record = ledger::TransactionLog::makeDeposit("alice", 100);
  record.timestamp = timestamp;
  record.sequence = sequence;
  record.description = description;
  return record;
}

}  // namespace

class TransactionLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.open();
  }

  store::MemoryLedgerStore store_;
  ledger::TransactionLog log_{store_};
};

TEST_F(TransactionLogTest, AppendReturnsStoreAssignedFields) {
  auto stored = log_.Append(ledger::TransactionLog::makeDeposit("alice", 2500));

  EXPECT_EQ(stored.id.size(), 20u);
  ASSERT_TRUE(stored.timestamp.has_value());
  EXPECT_GT(*stored.timestamp, 0);
  EXPECT_EQ(stored.sequence, 1u);
  EXPECT_EQ(stored.kind, TransactionKind::DEPOSIT);
  EXPECT_EQ(stored.description, "Deposit to account");
}

TEST_F(TransactionLogTest, ListReturnsArrivalOrderPerAccount) {
  log_.Append(ledger::TransactionLog::makeDeposit("alice", 100));
  log_.Append(ledger::TransactionLog::makeTransferSent("alice", "bob", 40));
  log_.Append(ledger::TransactionLog::makeTransferReceived("bob", "alice", 40));

  auto alice = log_.List("alice");
  ASSERT_EQ(alice.size(), 2u);
  EXPECT_EQ(alice[0].kind, TransactionKind::DEPOSIT);
  EXPECT_EQ(alice[1].kind, TransactionKind::TRANSFER_SENT);
  EXPECT_EQ(alice[1].description, "Transfer sent to bob");
  ASSERT_TRUE(alice[1].counterparty.has_value());
  EXPECT_EQ(*alice[1].counterparty, "bob");

  auto bob = log_.List("bob");
  ASSERT_EQ(bob.size(), 1u);
  EXPECT_EQ(bob[0].description, "Transfer received from alice");
  EXPECT_EQ(bob[0].amount, 40);

  EXPECT_TRUE(log_.List("carol").empty());
}

TEST_F(TransactionLogTest, MalformedRecordsAreSkipped) {
  log_.Append(ledger::TransactionLog::makeDeposit("alice", 100));
  store_.Append(ledger::TransactionLog::collectionFor("alice"),
                store::Document{{"garbage", true}});
  log_.Append(ledger::TransactionLog::makeDeposit("alice", 200));

  auto records = log_.List("alice");
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1].amount, 200);
}

TEST_F(TransactionLogTest, StoreFailuresAreTyped) {
  store_.close();

  try {
    log_.Append(ledger::TransactionLog::makeDeposit("alice", 100));
    FAIL() << "expected LedgerError";
  } catch (const LedgerError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::LOG_WRITE_FAILED);
  }

  try {
    log_.List("alice");
    FAIL() << "expected LedgerError";
  } catch (const LedgerError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::TRANSIENT_STORE_ERROR);
  }
}

TEST(SortNewestFirstTest, OrdersByTimestampDescending) {
  std::vector<TransactionRecord> records = {
      recordAt(1000, 1, "old"),
      recordAt(3000, 2, "newest"),
      recordAt(2000, 3, "middle"),
  };

  ledger::sortNewestFirst(records);

  EXPECT_EQ(records[0].description, "newest");
  EXPECT_EQ(records[1].description, "middle");
  EXPECT_EQ(records[2].description, "old");
}

TEST(SortNewestFirstTest, UnresolvedTimestampsSortLast) {
  std::vector<TransactionRecord> records = {
      recordAt(std::nullopt, 3, "pending"),
      recordAt(5000, 1, "settled"),
  };

  ledger::sortNewestFirst(records);

  EXPECT_EQ(records[0].description, "settled");
  EXPECT_EQ(records[1].description, "pending");
}

TEST(SortNewestFirstTest, EqualTimestampsPutLaterArrivalFirst) {
  std::vector<TransactionRecord> records = {
      recordAt(4000, 1, "first"),
      recordAt(4000, 2, "second"),
      recordAt(4000, 3, "third"),
  };

  ledger::sortNewestFirst(records);

  EXPECT_EQ(records[0].description, "third");
  EXPECT_EQ(records[1].description, "second");
  EXPECT_EQ(records[2].description, "first");
}
