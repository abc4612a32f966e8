#include "ledger/transaction_log.hpp"

#include "observability/logger.hpp"

#include <algorithm>

namespace wallet {
namespace ledger {

TransactionLog::TransactionLog(store::LedgerStore& store) : store_(store) {
}

std::string TransactionLog::collectionFor(const AccountId& account_id) {
  return "transactions/" + account_id;
}

TransactionRecord TransactionLog::Append(const TransactionRecord& record) {
  TransactionRecord unassigned = record;
  unassigned.id.clear();
  unassigned.timestamp.reset();
  unassigned.sequence = 0;

  store::AppendResult appended;
  try {
    appended = store_.Append(collectionFor(record.account_id), unassigned);
  } catch (const store::StoreError& e) {
    throw LedgerError(ErrorKind::LOG_WRITE_FAILED, e.what());
  }

  TransactionRecord stored = unassigned;
  stored.id = appended.id;
  stored.timestamp = appended.timestamp;
  stored.sequence = appended.sequence;
  return stored;
}

void TransactionLog::AppendWithin(store::Transaction& tx, const TransactionRecord& record) {
  TransactionRecord unassigned = record;
  unassigned.id.clear();
  unassigned.timestamp.reset();
  unassigned.sequence = 0;
  tx.Append(collectionFor(record.account_id), unassigned);
}

std::vector<TransactionRecord> TransactionLog::List(const AccountId& account_id) {
  std::vector<store::Document> docs;
  try {
    docs = store_.List(collectionFor(account_id));
  } catch (const store::StoreError& e) {
    throw LedgerError(ErrorKind::TRANSIENT_STORE_ERROR, e.what());
  }

  std::vector<TransactionRecord> records;
  records.reserve(docs.size());
  for (const auto& doc : docs) {
    auto record = fromDocument(doc);
    if (record) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

std::optional<TransactionRecord> TransactionLog::fromDocument(const store::Document& doc) {
  try {
    return doc.get<TransactionRecord>();
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::WARN, "Skipping malformed transaction record")
        .field("error", e.what());
    return std::nullopt;
  }
}

TransactionRecord TransactionLog::makeDeposit(const AccountId& account_id, Amount amount) {
  TransactionRecord record;
  record.account_id = account_id;
  record.kind = TransactionKind::DEPOSIT;
  record.amount = amount;
  record.description = "Deposit to account";
  return record;
}

TransactionRecord TransactionLog::makeTransferSent(const AccountId& sender,
                                                   const AccountId& recipient, Amount amount) {
  TransactionRecord record;
  record.account_id = sender;
  record.kind = TransactionKind::TRANSFER_SENT;
  record.amount = amount;
  record.counterparty = recipient;
  record.description = "Transfer sent to " + recipient;
  return record;
}

TransactionRecord TransactionLog::makeTransferReceived(const AccountId& recipient,
                                                       const AccountId& sender, Amount amount) {
  TransactionRecord record;
  record.account_id = recipient;
  record.kind = TransactionKind::TRANSFER_RECEIVED;
  record.amount = amount;
  record.counterparty = sender;
  record.description = "Transfer received from " + sender;
  return record;
}

void sortNewestFirst(std::vector<TransactionRecord>& records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const TransactionRecord& a, const TransactionRecord& b) {
                     const Timestamp ta = a.timestamp.value_or(0);
                     const Timestamp tb = b.timestamp.value_or(0);
                     if (ta != tb) {
                       return ta > tb;
                     }
                     return a.sequence > b.sequence;
                   });
}

}  // namespace ledger
}  // namespace wallet
