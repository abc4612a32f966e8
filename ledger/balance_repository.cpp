#include "ledger/balance_repository.hpp"

#include "observability/logger.hpp"

#include <limits>

namespace wallet {
namespace ledger {

namespace {

const char kAmountField[] = "amount";

// Translates store failures into the caller-visible error kinds.
[[noreturn]] void rethrowStoreError(const store::StoreError& e, const std::string& operation) {
  LOG_BUILDER(observability::LogLevel::WARN, "Balance store operation failed")
      .field("operation", operation)
      .field("error", e.what());

  if (e.code() == store::StoreError::Code::TIMEOUT) {
    throw LedgerError(ErrorKind::TIMEOUT, e.what());
  }
  if (e.code() == store::StoreError::Code::OUT_OF_RANGE) {
    throw LedgerError(ErrorKind::INVALID_AMOUNT, e.what());
  }
  throw LedgerError(ErrorKind::TRANSIENT_STORE_ERROR, e.what());
}

store::Document newBalanceDocument(const AccountId& account_id, Amount amount) {
  AccountBalance balance;
  balance.account_id = account_id;
  balance.amount = amount;
  balance.created_at = store::currentTimeMillis();
  return balance;
}

}  // namespace

BalanceRepository::BalanceRepository(store::LedgerStore& store,
                                     const store::TransactionOptions& options)
    : store_(store), options_(options) {
}

std::string BalanceRepository::keyFor(const AccountId& account_id) {
  return "balances/" + account_id;
}

Amount BalanceRepository::GetBalance(const AccountId& account_id) {
  auto balance = Find(account_id);
  return balance ? balance->amount : 0;
}

std::optional<AccountBalance> BalanceRepository::Find(const AccountId& account_id) {
  store::VersionedDocument doc;
  try {
    doc = store_.Get(keyFor(account_id));
  } catch (const store::StoreError& e) {
    rethrowStoreError(e, "get_balance");
  }

  if (!doc.exists()) {
    return std::nullopt;
  }

  AccountBalance balance = doc.data.get<AccountBalance>();
  if (balance.account_id.empty()) {
    balance.account_id = account_id;
  }
  return balance;
}

void BalanceRepository::EnsureInitialized(const AccountId& account_id) {
  const std::string key = keyFor(account_id);

  try {
    store_.RunTransaction([&](store::Transaction& tx) {
      if (tx.Read(key).exists()) {
        return;
      }
      // Loses to any concurrent creation; the retry then sees the record
      tx.ConditionalWrite(key, newBalanceDocument(account_id, 0), 0);
    }, options_);
  } catch (const store::StoreError& e) {
    rethrowStoreError(e, "ensure_initialized");
  }
}

Amount BalanceRepository::Deposit(const AccountId& account_id, Amount amount,
                                  std::optional<Deadline> deadline) {
  if (amount <= 0) {
    throw LedgerError(ErrorKind::INVALID_AMOUNT, "Deposit amount must be positive");
  }
  if (deadline && std::chrono::steady_clock::now() >= *deadline) {
    throw LedgerError(ErrorKind::TIMEOUT, "Deposit deadline passed before submission");
  }

  try {
    auto result = store_.AtomicIncrement(keyFor(account_id), kAmountField, amount,
                                         newBalanceDocument(account_id, 0));
    return result.new_value;
  } catch (const store::StoreError& e) {
    rethrowStoreError(e, "deposit");
  }
}

void BalanceRepository::Transfer(const AccountId& sender, const AccountId& recipient,
                                 Amount amount, const TransferHook& hook,
                                 std::optional<Deadline> deadline) {
  if (amount <= 0) {
    throw LedgerError(ErrorKind::INVALID_AMOUNT, "Transfer amount must be positive");
  }
  if (sender == recipient) {
    throw LedgerError(ErrorKind::SELF_TRANSFER_NOT_ALLOWED, "");
  }

  const std::string sender_key = keyFor(sender);
  const std::string recipient_key = keyFor(recipient);

  store::TransactionOptions options = options_;
  if (deadline) {
    options.deadline = deadline;
  }

  try {
    store_.RunTransaction([&](store::Transaction& tx) {
      store::VersionedDocument sender_doc = tx.Read(sender_key);
      const Amount available =
          sender_doc.exists() ? sender_doc.data.value(kAmountField, static_cast<Amount>(0)) : 0;

      if (available < amount) {
        throw LedgerError(ErrorKind::INSUFFICIENT_FUNDS,
                          "Available " + formatAmount(available) + ", requested " +
                          formatAmount(amount));
      }

      store::VersionedDocument recipient_doc = tx.Read(recipient_key);
      const Amount held =
          recipient_doc.exists() ? recipient_doc.data.value(kAmountField, static_cast<Amount>(0))
                                 : 0;
      if (held > std::numeric_limits<Amount>::max() - amount) {
        throw LedgerError(ErrorKind::INVALID_AMOUNT,
                          "Transfer would overflow the balance of " + recipient);
      }

      store::Document updated_sender = sender_doc.data;
      updated_sender[kAmountField] = available - amount;
      tx.ConditionalWrite(sender_key, updated_sender, sender_doc.version);

      if (recipient_doc.exists()) {
        store::Document updated_recipient = recipient_doc.data;
        updated_recipient[kAmountField] = held + amount;
        tx.ConditionalWrite(recipient_key, updated_recipient, recipient_doc.version);
      } else {
        tx.ConditionalWrite(recipient_key, newBalanceDocument(recipient, amount), 0);
      }

      if (hook) {
        hook(tx);
      }
    }, options);
  } catch (const store::StoreError& e) {
    rethrowStoreError(e, "transfer");
  }
}

}  // namespace ledger
}  // namespace wallet
