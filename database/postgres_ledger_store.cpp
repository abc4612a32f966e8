#include "database/postgres_ledger_store.hpp"

#include "observability/logger.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <thread>

namespace wallet {
namespace database {

using store::AppendResult;
using store::ChangeEvent;
using store::Document;
using store::IncrementResult;
using store::StoreError;
using store::TransactionOptions;
using store::VersionedDocument;

namespace {

// Raised inside a transaction attempt when the server reports a
// serialization failure or a conditional write finds a different version.
class ConflictDetected : public std::runtime_error {
 public:
  explicit ConflictDetected(const std::string& what) : std::runtime_error(what) {}
};

bool isConflictState(const std::string& sqlstate) {
  return sqlstate == "40001" || sqlstate == "40P01";
}

// numeric_value_out_of_range, raised by bigint arithmetic in the increment
bool isOutOfRangeState(const std::string& sqlstate) {
  return sqlstate == "22003";
}

[[noreturn]] void throwFailure(PostgresConnection& conn, const std::string& context) {
  const std::string sqlstate = conn.getLastSqlState();
  if (isConflictState(sqlstate)) {
    throw ConflictDetected(context + ": " + conn.getLastError());
  }
  if (isOutOfRangeState(sqlstate)) {
    throw StoreError(StoreError::Code::OUT_OF_RANGE, context + ": " + conn.getLastError());
  }
  throw StoreError(StoreError::Code::UNAVAILABLE, context + ": " + conn.getLastError());
}

bool deadlinePassed(const TransactionOptions& options) {
  return options.deadline && std::chrono::steady_clock::now() >= *options.deadline;
}

Document materializeRecord(const std::string& body, const std::string& id,
                           std::uint64_t sequence, Timestamp timestamp) {
  Document record = Document::parse(body);
  record["id"] = id;
  record["sequence"] = sequence;
  record["timestamp"] = timestamp;
  return record;
}

Document stripAssignedFields(const Document& record) {
  Document body = record.is_object() ? record : Document::object();
  body.erase("id");
  body.erase("sequence");
  body.erase("timestamp");
  return body;
}

const char* kInsertRecordSql = R"(
  INSERT INTO ledger_records (collection, record_id, body)
  VALUES ($1, $2, $3::jsonb)
  RETURNING sequence, server_time
)";

AppendResult insertRecord(PostgresConnection& conn, const std::string& collection,
                          const Document& record, Document& stored) {
  AppendResult result;
  result.id = store::generateRecordId();

  const Document body = stripAssignedFields(record);
  auto rows = conn.executeParameterizedQuery(kInsertRecordSql,
                                             {collection, result.id, body.dump()});
  if (!rows || PQntuples(rows.get()) != 1) {
    throwFailure(conn, "Append to " + collection + " failed");
  }

  result.sequence = std::stoull(PQgetvalue(rows.get(), 0, 0));
  result.timestamp = std::stoll(PQgetvalue(rows.get(), 0, 1));

  stored = body;
  stored["id"] = result.id;
  stored["sequence"] = result.sequence;
  stored["timestamp"] = result.timestamp;
  return result;
}

}  // namespace

// Reads go straight to the server inside the SERIALIZABLE transaction;
// writes and appends are buffered and applied just before COMMIT.
class PostgresLedgerStore::PostgresTransaction : public store::Transaction {
 public:
  explicit PostgresTransaction(PostgresConnection& conn) : conn_(conn) {}

  VersionedDocument Read(const std::string& key) override {
    auto staged = writes_.find(key);
    if (staged != writes_.end()) {
      return {staged->second.value, staged->second.expected_version.value_or(0)};
    }

    auto rows = conn_.executeParameterizedQuery(
        "SELECT body::text, version FROM ledger_documents WHERE doc_key = $1", {key});
    if (!rows) {
      throwFailure(conn_, "Read of " + key + " failed");
    }
    if (PQntuples(rows.get()) == 0) {
      return {};
    }
    return {Document::parse(PQgetvalue(rows.get(), 0, 0)),
            std::stoull(PQgetvalue(rows.get(), 0, 1))};
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

  // Applies buffered changes; returns the events to publish after COMMIT.
  std::vector<ChangeEvent> apply() {
    std::vector<ChangeEvent> events;

    for (const auto& [key, write] : writes_) {
      const std::string body = write.value.dump();
      ResultPtr rows;

      if (!write.expected_version) {
        rows = conn_.executeParameterizedQuery(R"(
          INSERT INTO ledger_documents (doc_key, body, version) VALUES ($1, $2::jsonb, 1)
          ON CONFLICT (doc_key) DO UPDATE
            SET body = EXCLUDED.body, version = ledger_documents.version + 1
          RETURNING version
        )", {key, body});
      } else if (*write.expected_version == 0) {
        rows = conn_.executeParameterizedQuery(R"(
          INSERT INTO ledger_documents (doc_key, body, version) VALUES ($1, $2::jsonb, 1)
          ON CONFLICT (doc_key) DO NOTHING
          RETURNING version
        )", {key, body});
      } else {
        rows = conn_.executeParameterizedQuery(R"(
          UPDATE ledger_documents SET body = $2::jsonb, version = version + 1
          WHERE doc_key = $1 AND version = $3
          RETURNING version
        )", {key, body, std::to_string(*write.expected_version)});
      }

      if (!rows) {
        throwFailure(conn_, "Write of " + key + " failed");
      }
      if (PQntuples(rows.get()) == 0) {
        throw ConflictDetected("Version of " + key + " changed");
      }

      events.push_back(ChangeEvent{ChangeEvent::Kind::DOCUMENT_CHANGED, key,
                                   std::stoull(PQgetvalue(rows.get(), 0, 0)), write.value});
    }

    for (const auto& staged : appends_) {
      Document stored;
      AppendResult appended = insertRecord(conn_, staged.collection, staged.record, stored);
      events.push_back(ChangeEvent{ChangeEvent::Kind::RECORD_APPENDED, staged.collection,
                                   appended.sequence, stored});
    }

    return events;
  }

 private:
  struct StagedWrite {
    Document value;
    std::optional<std::uint64_t> expected_version;
  };

  struct StagedAppend {
    std::string collection;
    Document record;
  };

  PostgresConnection& conn_;
  std::map<std::string, StagedWrite> writes_;
  std::vector<StagedAppend> appends_;
};

PostgresLedgerStore::PostgresLedgerStore(const Config& config)
    : config_(config), pool_(config.connection) {
}

PostgresLedgerStore::~PostgresLedgerStore() {
  close();
}

bool PostgresLedgerStore::open() {
  if (!pool_.open()) {
    LOG_ERROR("PostgreSQL ledger store could not connect");
    return false;
  }

  PooledConnection conn = pool_.acquire(config_.acquire_timeout);
  if (!conn || !applySchema(*conn)) {
    pool_.close();
    return false;
  }

  LOG_BUILDER(observability::LogLevel::INFO, "PostgreSQL ledger store opened")
      .field("target", conn->getConnectionInfo())
      .field("pool_size", static_cast<std::int64_t>(pool_.size()));
  return true;
}

void PostgresLedgerStore::close() {
  pool_.close();
}

bool PostgresLedgerStore::applySchema(PostgresConnection& conn) {
  std::ifstream schema_file(config_.schema_path);
  if (!schema_file.is_open()) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Could not open schema file")
        .field("path", config_.schema_path);
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();

  // PQexec runs a multi-statement script as one implicit transaction
  if (!conn.executeQuery(buffer.str())) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Failed to apply schema")
        .field("path", config_.schema_path)
        .field("error", conn.getLastError());
    return false;
  }
  return true;
}

PooledConnection PostgresLedgerStore::acquire() {
  PooledConnection conn = pool_.acquire(config_.acquire_timeout);
  if (!conn) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "No database connection available");
  }
  return conn;
}

VersionedDocument PostgresLedgerStore::Get(const std::string& key) {
  PooledConnection conn = acquire();

  auto rows = conn->executeParameterizedQuery(
      "SELECT body::text, version FROM ledger_documents WHERE doc_key = $1", {key});
  if (!rows) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Get of " + key + " failed: " +
                     conn->getLastError());
  }
  if (PQntuples(rows.get()) == 0) {
    return {};
  }
  return {Document::parse(PQgetvalue(rows.get(), 0, 0)),
          std::stoull(PQgetvalue(rows.get(), 0, 1))};
}

IncrementResult PostgresLedgerStore::AtomicIncrement(const std::string& key,
                                                     const std::string& field,
                                                     std::int64_t delta,
                                                     const Document& initial) {
  PooledConnection conn = acquire();

  const Document seed = initial.is_object() ? initial : Document::object();
  auto rows = conn->executeParameterizedQuery(R"(
    INSERT INTO ledger_documents (doc_key, body, version)
    VALUES ($1, jsonb_set($2::jsonb, ARRAY[$3::text], to_jsonb($4::bigint)), 1)
    ON CONFLICT (doc_key) DO UPDATE
      SET body = jsonb_set(ledger_documents.body, ARRAY[$3::text],
                           to_jsonb(COALESCE((ledger_documents.body ->> $3::text)::bigint, 0)
                                    + $4::bigint)),
          version = ledger_documents.version + 1
    RETURNING (body ->> $3::text)::bigint, version, body::text
  )", {key, seed.dump(), field, std::to_string(delta)});

  if (!rows && isOutOfRangeState(conn->getLastSqlState())) {
    throw StoreError(StoreError::Code::OUT_OF_RANGE, "Increment of " + key + " overflows: " +
                     conn->getLastError());
  }
  if (!rows || PQntuples(rows.get()) != 1) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "Increment of " + key + " failed: " +
                     conn->getLastError());
  }

  IncrementResult result;
  result.new_value = std::stoll(PQgetvalue(rows.get(), 0, 0));
  result.version = std::stoull(PQgetvalue(rows.get(), 0, 1));
  Document body = Document::parse(PQgetvalue(rows.get(), 0, 2));

  feed_.publish(ChangeEvent{ChangeEvent::Kind::DOCUMENT_CHANGED, key, result.version, body});
  return result;
}

void PostgresLedgerStore::RunTransaction(const store::TransactionFunction& fn,
                                         const TransactionOptions& options) {
  const int max_attempts = std::max(1, options.max_attempts);

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (deadlinePassed(options)) {
      throw StoreError(StoreError::Code::TIMEOUT, "Transaction deadline passed before commit");
    }

    PooledConnection conn = acquire();
    std::vector<ChangeEvent> events;
    bool committed = false;

    std::unique_ptr<TransactionGuard> guard;
    try {
      guard = std::make_unique<TransactionGuard>(*conn, true);
    } catch (const std::runtime_error& e) {
      throw StoreError(StoreError::Code::UNAVAILABLE, e.what());
    }

    try {
      PostgresTransaction tx(*conn);
      fn(tx);

      if (deadlinePassed(options)) {
        throw StoreError(StoreError::Code::TIMEOUT, "Transaction deadline passed before commit");
      }

      events = tx.apply();
      if (guard->commit()) {
        committed = true;
      } else if (!isConflictState(conn->getLastSqlState())) {
        throw StoreError(StoreError::Code::UNAVAILABLE, "Commit failed: " + conn->getLastError());
      }
    } catch (const ConflictDetected& e) {
      LOG_BUILDER(observability::LogLevel::DEBUG, "Serialization conflict")
          .field("detail", e.what());
    }

    if (committed) {
      for (const auto& event : events) {
        feed_.publish(event);
      }
      return;
    }

    guard.reset();
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

AppendResult PostgresLedgerStore::Append(const std::string& collection, const Document& record) {
  PooledConnection conn = acquire();

  Document stored;
  AppendResult result;
  try {
    result = insertRecord(*conn, collection, record, stored);
  } catch (const ConflictDetected& e) {
    throw StoreError(StoreError::Code::UNAVAILABLE, e.what());
  }

  feed_.publish(ChangeEvent{ChangeEvent::Kind::RECORD_APPENDED, collection, result.sequence,
                            stored});
  return result;
}

std::vector<Document> PostgresLedgerStore::List(const std::string& collection) {
  PooledConnection conn = acquire();

  auto rows = conn->executeParameterizedQuery(R"(
    SELECT record_id, sequence, server_time, body::text
    FROM ledger_records WHERE collection = $1
    ORDER BY sequence
  )", {collection});
  if (!rows) {
    throw StoreError(StoreError::Code::UNAVAILABLE, "List of " + collection + " failed: " +
                     conn->getLastError());
  }

  std::vector<Document> records;
  const int count = PQntuples(rows.get());
  records.reserve(count);
  for (int i = 0; i < count; ++i) {
    records.push_back(materializeRecord(PQgetvalue(rows.get(), i, 3),
                                        PQgetvalue(rows.get(), i, 0),
                                        std::stoull(PQgetvalue(rows.get(), i, 1)),
                                        std::stoll(PQgetvalue(rows.get(), i, 2))));
  }
  return records;
}

std::uint64_t PostgresLedgerStore::Subscribe(const std::string& key_or_collection,
                                             store::ChangeListener listener) {
  return feed_.subscribe(key_or_collection, std::move(listener));
}

void PostgresLedgerStore::Unsubscribe(std::uint64_t subscription_id) {
  feed_.unsubscribe(subscription_id);
}

}  // namespace database
}  // namespace wallet
