#include "store/memory_ledger_store.hpp"

#include "observability/logger.hpp"

#include <algorithm>
#include <limits>
#include <thread>

namespace wallet {
namespace store {

namespace {

bool deadlinePassed(const TransactionOptions& options) {
  return options.deadline && std::chrono::steady_clock::now() >= *options.deadline;
}

}  // namespace

// Buffers writes and appends; records the version of every key it reads.
class MemoryLedgerStore::MemoryTransaction : public Transaction {
 public:
  explicit MemoryTransaction(MemoryLedgerStore& store) : store_(store) {}

  VersionedDocument Read(const std::string& key) override {
    auto staged = writes_.find(key);
    if (staged != writes_.end()) {
      return {staged->second.value, read_versions_.count(key) ? read_versions_[key] : 0};
    }

    VersionedDocument doc;
    {
      std::lock_guard<std::mutex> lock(store_.mutex_);
      auto it = store_.documents_.find(key);
      if (it != store_.documents_.end()) {
        doc.data = it->second.data;
        doc.version = it->second.version;
      }
    }

    // Later reads of the same key must validate against the first observation
    read_versions_.emplace(key, doc.version);
    return doc;
  }

  void Write(const std::string& key, const Document& value) override {
    writes_[key] = StagedWrite{value, std::nullopt};
  }

  void ConditionalWrite(const std::string& key, const Document& value,
                        std::uint64_t expected_version) override {
    writes_[key] = StagedWrite{value, expected_version};
  }

  void Append(const std::string& collection, const Document& record) override {
    appends_.push_back(StagedAppend{collection, record});
  }

  bool commit() {
    return store_.tryCommit(read_versions_, writes_, appends_);
  }

 private:
  MemoryLedgerStore& store_;
  std::map<std::string, std::uint64_t> read_versions_;
  std::map<std::string, StagedWrite> writes_;
  std::vector<StagedAppend> appends_;
};

MemoryLedgerStore::MemoryLedgerStore() : conflicts_(0) {
}

bool MemoryLedgerStore::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  open_ = true;
  LOG_INFO("In-memory ledger store opened");
  return true;
}

void MemoryLedgerStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_) {
    open_ = false;
    LOG_INFO("In-memory ledger store closed");
  }
}

VersionedDocument MemoryLedgerStore::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Ledger store is not open");
  }

  auto it = documents_.find(key);
  if (it == documents_.end()) {
    return {};
  }
  return {it->second.data, it->second.version};
}

IncrementResult MemoryLedgerStore::AtomicIncrement(const std::string& key,
                                                   const std::string& field,
                                                   std::int64_t delta,
                                                   const Document& initial) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Ledger store is not open");
  }

  auto it = documents_.find(key);
  if (it == documents_.end()) {
    StoredDocument created{initial.is_object() ? initial : Document::object(), 1};
    created.data[field] = delta;
    it = documents_.emplace(key, std::move(created)).first;
  } else {
    const std::int64_t current = it->second.data.value(field, static_cast<std::int64_t>(0));
    if ((delta > 0 && current > std::numeric_limits<std::int64_t>::max() - delta) ||
        (delta < 0 && current < std::numeric_limits<std::int64_t>::min() - delta)) {
      throw StoreError(StoreError::Code::OUT_OF_RANGE,
                       "Increment of " + key + "." + field + " overflows");
    }
    it->second.data[field] = current + delta;
    it->second.version += 1;
  }

  IncrementResult result{it->second.data[field].get<std::int64_t>(), it->second.version};
  feed_.publish(ChangeEvent{ChangeEvent::Kind::DOCUMENT_CHANGED, key, result.version,
                            it->second.data});
  return result;
}

void MemoryLedgerStore::RunTransaction(const TransactionFunction& fn,
                                       const TransactionOptions& options) {
  const int max_attempts = std::max(1, options.max_attempts);

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (deadlinePassed(options)) {
      throw StoreError(StoreError::Code::TIMEOUT, "Transaction deadline passed before commit");
    }

    MemoryTransaction tx(*this);
    fn(tx);

    if (deadlinePassed(options)) {
      throw StoreError(StoreError::Code::TIMEOUT, "Transaction deadline passed before commit");
    }

    if (tx.commit()) {
      return;
    }

    conflicts_.fetch_add(1);
    LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction conflict, retrying")
        .field("attempt", attempt)
        .field("max_attempts", max_attempts);

    if (attempt < max_attempts) {
      const int shift = std::min(attempt - 1, 6);
      std::this_thread::sleep_for(options.initial_backoff * (1 << shift));
    }
  }

  throw StoreError(StoreError::Code::CONFLICT_RETRIES_EXHAUSTED,
                   "Transaction aborted after " + std::to_string(max_attempts) +
                   " conflicting attempts");
}

bool MemoryLedgerStore::tryCommit(const std::map<std::string, std::uint64_t>& read_versions,
                                  const std::map<std::string, StagedWrite>& writes,
                                  const std::vector<StagedAppend>& appends) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Ledger store is not open");
  }

  for (const auto& [key, version] : read_versions) {
    if (versionOfLocked(key) != version) {
      return false;
    }
  }
  for (const auto& [key, write] : writes) {
    if (write.expected_version && versionOfLocked(key) != *write.expected_version) {
      return false;
    }
  }

  std::vector<ChangeEvent> events;
  for (const auto& [key, write] : writes) {
    auto& stored = documents_[key];
    stored.data = write.value;
    stored.version += 1;
    events.push_back(ChangeEvent{ChangeEvent::Kind::DOCUMENT_CHANGED, key, stored.version,
                                 stored.data});
  }
  for (const auto& staged : appends) {
    appendLocked(staged.collection, staged.record);
    events.push_back(ChangeEvent{ChangeEvent::Kind::RECORD_APPENDED, staged.collection,
                                 collections_[staged.collection].size(),
                                 collections_[staged.collection].back()});
  }

  for (const auto& event : events) {
    feed_.publish(event);
  }
  return true;
}

AppendResult MemoryLedgerStore::Append(const std::string& collection, const Document& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Ledger store is not open");
  }

  AppendResult result = appendLocked(collection, record);
  feed_.publish(ChangeEvent{ChangeEvent::Kind::RECORD_APPENDED, collection, result.sequence,
                            collections_[collection].back()});
  return result;
}

std::vector<Document> MemoryLedgerStore::List(const std::string& collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Ledger store is not open");
  }

  auto it = collections_.find(collection);
  if (it == collections_.end()) {
    return {};
  }
  return it->second;
}

std::uint64_t MemoryLedgerStore::Subscribe(const std::string& key_or_collection,
                                           ChangeListener listener) {
  return feed_.subscribe(key_or_collection, std::move(listener));
}

void MemoryLedgerStore::Unsubscribe(std::uint64_t subscription_id) {
  feed_.unsubscribe(subscription_id);
}

AppendResult MemoryLedgerStore::appendLocked(const std::string& collection,
                                             const Document& record) {
  auto& records = collections_[collection];

  AppendResult result;
  result.id = generateRecordId();
  result.sequence = records.size() + 1;
  result.timestamp = nextTimestampLocked();

  Document stored = record.is_object() ? record : Document::object();
  stored["id"] = result.id;
  stored["timestamp"] = result.timestamp;
  stored["sequence"] = result.sequence;
  records.push_back(std::move(stored));

  return result;
}

Timestamp MemoryLedgerStore::nextTimestampLocked() {
  last_timestamp_ = std::max(last_timestamp_, currentTimeMillis());
  return last_timestamp_;
}

std::uint64_t MemoryLedgerStore::versionOfLocked(const std::string& key) const {
  auto it = documents_.find(key);
  return it == documents_.end() ? 0 : it->second.version;
}

}  // namespace store
}  // namespace wallet
