#ifndef WALLET_MEMORY_LEDGER_STORE_HPP_
#define WALLET_MEMORY_LEDGER_STORE_HPP_

#include "store/ledger_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace wallet {
namespace store {

/**
 * In-process LedgerStore with optimistic concurrency control.
 *
 * Transaction functions run without the store lock against committed state.
 * Commit re-checks, under the lock, that every key read or conditionally
 * written is still at the version observed; a mismatch is a write-write
 * conflict and the function is re-run after exponential backoff.
 * Change events are published under the lock so that listeners observe
 * changes of one key in commit order.
 */
class MemoryLedgerStore : public LedgerStore {
 public:
  MemoryLedgerStore();
  ~MemoryLedgerStore() override = default;

  // Non-copyable
  MemoryLedgerStore(const MemoryLedgerStore&) = delete;
  MemoryLedgerStore& operator=(const MemoryLedgerStore&) = delete;

  bool open() override;
  void close() override;

  VersionedDocument Get(const std::string& key) override;
  IncrementResult AtomicIncrement(const std::string& key, const std::string& field,
                                  std::int64_t delta, const Document& initial) override;
  void RunTransaction(const TransactionFunction& fn,
                      const TransactionOptions& options) override;
  AppendResult Append(const std::string& collection, const Document& record) override;
  std::vector<Document> List(const std::string& collection) override;
  std::uint64_t Subscribe(const std::string& key_or_collection,
                          ChangeListener listener) override;
  void Unsubscribe(std::uint64_t subscription_id) override;

  // Number of commits rejected because of a conflict since construction.
  std::uint64_t conflictCount() const { return conflicts_.load(); }

 private:
  class MemoryTransaction;

  struct StoredDocument {
    Document data;
    std::uint64_t version = 0;
  };

  struct StagedWrite {
    Document value;
    std::optional<std::uint64_t> expected_version;
  };

  struct StagedAppend {
    std::string collection;
    Document record;
  };

  // Returns false on conflict. Caller must not hold mutex_.
  bool tryCommit(const std::map<std::string, std::uint64_t>& read_versions,
                 const std::map<std::string, StagedWrite>& writes,
                 const std::vector<StagedAppend>& appends);

  // Requires mutex_ held.
  AppendResult appendLocked(const std::string& collection, const Document& record);
  Timestamp nextTimestampLocked();
  std::uint64_t versionOfLocked(const std::string& key) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, StoredDocument> documents_;
  std::unordered_map<std::string, std::vector<Document>> collections_;
  Timestamp last_timestamp_ = 0;
  bool open_ = false;

  ChangeFeed feed_;
  std::atomic<std::uint64_t> conflicts_;
};

}  // namespace store
}  // namespace wallet

#endif  // WALLET_MEMORY_LEDGER_STORE_HPP_
