#ifndef WALLET_LEDGER_TYPES_HPP_
#define WALLET_LEDGER_TYPES_HPP_

#include "money.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace wallet {

using AccountId = std::string;

// Server-assigned time in epoch milliseconds.
using Timestamp = std::int64_t;

using Deadline = std::chrono::steady_clock::time_point;

/**
 * Failure kinds visible to callers of the wallet API.
 */
enum class ErrorKind {
  INVALID_AMOUNT,
  SELF_TRANSFER_NOT_ALLOWED,
  INVALID_RECIPIENT,
  INSUFFICIENT_FUNDS,
  TRANSIENT_STORE_ERROR,
  LOG_WRITE_FAILED,
  TIMEOUT
};

std::string errorKindToString(ErrorKind kind);
std::optional<ErrorKind> errorKindFromString(const std::string& name);

// Short human-readable message for a failure kind.
std::string errorKindMessage(ErrorKind kind);

/**
 * Domain failure raised inside the ledger core; converted to an
 * OperationResult at the caller-facing API.
 */
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorKind kind, const std::string& detail);

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

/**
 * Outcome of a Deposit or Transfer.
 */
struct OperationResult {
  bool ok = false;
  std::optional<ErrorKind> error;
  std::string message;

  static OperationResult success(const std::string& message);
  static OperationResult failure(ErrorKind kind, const std::string& detail = "");
};

/**
 * Current balance of one account, owned by the Balance Repository.
 */
struct AccountBalance {
  AccountId account_id;
  Amount amount = 0;
  Timestamp created_at = 0;
};

enum class TransactionKind {
  DEPOSIT,
  TRANSFER_SENT,
  TRANSFER_RECEIVED
};

std::string transactionKindToString(TransactionKind kind);
TransactionKind transactionKindFromString(const std::string& name);

/**
 * Immutable entry of an account's transaction log.
 *
 * `id`, `timestamp` and `sequence` are assigned by the store when the record
 * is appended. A record whose write is still in flight has no timestamp and
 * sorts as the oldest entry.
 */
struct TransactionRecord {
  std::string id;
  AccountId account_id;
  TransactionKind kind = TransactionKind::DEPOSIT;
  Amount amount = 0;
  std::optional<AccountId> counterparty;
  std::string description;
  std::optional<Timestamp> timestamp;
  std::uint64_t sequence = 0;
};

void to_json(nlohmann::json& j, const TransactionRecord& record);
void from_json(const nlohmann::json& j, TransactionRecord& record);

void to_json(nlohmann::json& j, const AccountBalance& balance);
void from_json(const nlohmann::json& j, AccountBalance& balance);

}  // namespace wallet

#endif  // WALLET_LEDGER_TYPES_HPP_
