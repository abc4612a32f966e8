#ifndef WALLET_LEDGER_STORE_HPP_
#define WALLET_LEDGER_STORE_HPP_

#include "ledger/ledger_types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace wallet {
namespace store {

using Document = nlohmann::json;

/**
 * Failure of the store itself (as opposed to a business rule).
 */
class StoreError : public std::runtime_error {
 public:
  enum class Code {
    CONFLICT_RETRIES_EXHAUSTED,
    UNAVAILABLE,
    TIMEOUT,
    OUT_OF_RANGE  // increment would leave the int64 range; nothing was written
  };

  StoreError(Code code, const std::string& message);

  Code code() const { return code_; }

 private:
  Code code_;
};

/**
 * A document together with its version. Version 0 means the key is absent.
 */
struct VersionedDocument {
  Document data;
  std::uint64_t version = 0;

  bool exists() const { return version != 0; }
};

struct IncrementResult {
  std::int64_t new_value = 0;
  std::uint64_t version = 0;
};

struct AppendResult {
  std::string id;
  std::uint64_t sequence = 0;
  Timestamp timestamp = 0;
};

/**
 * Committed change pushed to subscribers of a key or collection.
 *
 * DOCUMENT_CHANGED: `version` is the document's new version, `data` its body.
 * RECORD_APPENDED: `version` is the arrival sequence, `data` the stored record
 * including its assigned id, timestamp and sequence.
 */
struct ChangeEvent {
  enum class Kind {
    DOCUMENT_CHANGED,
    RECORD_APPENDED
  };

  Kind kind = Kind::DOCUMENT_CHANGED;
  std::string key;
  std::uint64_t version = 0;
  Document data;
};

using ChangeListener = std::function<void(const ChangeEvent&)>;

/**
 * Retry and deadline policy for RunTransaction.
 */
struct TransactionOptions {
  int max_attempts = 5;
  std::chrono::milliseconds initial_backoff{2};
  std::optional<Deadline> deadline;
};

/**
 * Handle passed to a transaction function. Reads see committed state; writes
 * and appends take effect only if the whole transaction commits.
 */
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual VersionedDocument Read(const std::string& key) = 0;
  virtual void Write(const std::string& key, const Document& value) = 0;

  /**
   * Writes only if the key is still at `expected_version` at commit time
   * (0 = key must not exist); otherwise the transaction conflicts and is retried.
   */
  virtual void ConditionalWrite(const std::string& key, const Document& value,
                                std::uint64_t expected_version) = 0;

  virtual void Append(const std::string& collection, const Document& record) = 0;
};

using TransactionFunction = std::function<void(Transaction&)>;

/**
 * Durable key/document storage consumed by the ledger core.
 *
 * Implementations provide atomic increments, serializable multi-key
 * transactions retried on write conflicts, append-only record collections and
 * change notification. Exceptions thrown by a transaction function abort the
 * transaction and propagate unchanged.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  virtual bool open() = 0;
  virtual void close() = 0;

  virtual VersionedDocument Get(const std::string& key) = 0;

  /**
   * Adds `delta` to the integer `field` of the document at `key`. An absent
   * document is created from `initial` with `field` set to `delta`.
   */
  virtual IncrementResult AtomicIncrement(const std::string& key, const std::string& field,
                                          std::int64_t delta, const Document& initial) = 0;

  virtual void RunTransaction(const TransactionFunction& fn,
                              const TransactionOptions& options) = 0;

  virtual AppendResult Append(const std::string& collection, const Document& record) = 0;

  // Records of a collection in arrival order.
  virtual std::vector<Document> List(const std::string& collection) = 0;

  virtual std::uint64_t Subscribe(const std::string& key_or_collection,
                                  ChangeListener listener) = 0;
  virtual void Unsubscribe(std::uint64_t subscription_id) = 0;
};

/**
 * Listener registry shared by store implementations.
 */
class ChangeFeed {
 public:
  ChangeFeed() = default;

  ChangeFeed(const ChangeFeed&) = delete;
  ChangeFeed& operator=(const ChangeFeed&) = delete;

  std::uint64_t subscribe(const std::string& key, ChangeListener listener);
  void unsubscribe(std::uint64_t subscription_id);

  // Invokes every listener registered for event.key on the calling thread.
  void publish(const ChangeEvent& event) const;

  std::size_t listenerCount() const;

 private:
  struct Entry {
    std::string key;
    ChangeListener listener;
  };

  mutable std::mutex mutex_;
  std::uint64_t next_id_ = 1;
  std::unordered_map<std::uint64_t, Entry> listeners_;
  std::unordered_multimap<std::string, std::uint64_t> by_key_;
};

// Random 20-character alphanumeric id for appended records.
std::string generateRecordId();

// Wall clock in epoch milliseconds.
Timestamp currentTimeMillis();

}  // namespace store
}  // namespace wallet

#endif  // WALLET_LEDGER_STORE_HPP_
