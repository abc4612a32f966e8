#include "ledger/ledger_types.hpp"

namespace wallet {

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_AMOUNT: return "INVALID_AMOUNT";
    case ErrorKind::SELF_TRANSFER_NOT_ALLOWED: return "SELF_TRANSFER_NOT_ALLOWED";
    case ErrorKind::INVALID_RECIPIENT: return "INVALID_RECIPIENT";
    case ErrorKind::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case ErrorKind::TRANSIENT_STORE_ERROR: return "TRANSIENT_STORE_ERROR";
    case ErrorKind::LOG_WRITE_FAILED: return "LOG_WRITE_FAILED";
    case ErrorKind::TIMEOUT: return "TIMEOUT";
  }
  return "UNKNOWN";
}

std::optional<ErrorKind> errorKindFromString(const std::string& name) {
  for (ErrorKind kind : {ErrorKind::INVALID_AMOUNT, ErrorKind::SELF_TRANSFER_NOT_ALLOWED,
                         ErrorKind::INVALID_RECIPIENT, ErrorKind::INSUFFICIENT_FUNDS,
                         ErrorKind::TRANSIENT_STORE_ERROR, ErrorKind::LOG_WRITE_FAILED,
                         ErrorKind::TIMEOUT}) {
    if (errorKindToString(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string errorKindMessage(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_AMOUNT: return "Invalid amount";
    case ErrorKind::SELF_TRANSFER_NOT_ALLOWED: return "Cannot transfer to your own account";
    case ErrorKind::INVALID_RECIPIENT: return "Invalid recipient id";
    case ErrorKind::INSUFFICIENT_FUNDS: return "Insufficient funds for the transfer";
    case ErrorKind::TRANSIENT_STORE_ERROR: return "Ledger temporarily unavailable, please retry";
    case ErrorKind::LOG_WRITE_FAILED: return "Balance updated but history may be incomplete";
    case ErrorKind::TIMEOUT: return "Operation timed out before it was submitted";
  }
  return "Unknown error";
}

LedgerError::LedgerError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(detail.empty() ? errorKindMessage(kind) : detail), kind_(kind) {
}

OperationResult OperationResult::success(const std::string& message) {
  OperationResult result;
  result.ok = true;
  result.message = message;
  return result;
}

OperationResult OperationResult::failure(ErrorKind kind, const std::string& detail) {
  OperationResult result;
  result.ok = false;
  result.error = kind;
  result.message = errorKindMessage(kind);
  if (!detail.empty() && detail != result.message) {
    result.message += ": " + detail;
  }
  return result;
}

std::string transactionKindToString(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::DEPOSIT: return "DEPOSIT";
    case TransactionKind::TRANSFER_SENT: return "TRANSFER_SENT";
    case TransactionKind::TRANSFER_RECEIVED: return "TRANSFER_RECEIVED";
  }
  return "UNKNOWN";
}

TransactionKind transactionKindFromString(const std::string& name) {
  if (name == "DEPOSIT") return TransactionKind::DEPOSIT;
  if (name == "TRANSFER_SENT") return TransactionKind::TRANSFER_SENT;
  if (name == "TRANSFER_RECEIVED") return TransactionKind::TRANSFER_RECEIVED;
  throw std::invalid_argument("Unknown transaction kind: " + name);
}

void to_json(nlohmann::json& j, const TransactionRecord& record) {
  j = nlohmann::json{
    {"account_id", record.account_id},
    {"kind", transactionKindToString(record.kind)},
    {"amount", record.amount},
    {"description", record.description}
  };
  if (!record.id.empty()) {
    j["id"] = record.id;
  }
  if (record.counterparty) {
    j["counterparty"] = *record.counterparty;
  }
  if (record.timestamp) {
    j["timestamp"] = *record.timestamp;
  }
  if (record.sequence != 0) {
    j["sequence"] = record.sequence;
  }
}

void from_json(const nlohmann::json& j, TransactionRecord& record) {
  record.id = j.value("id", std::string());
  j.at("account_id").get_to(record.account_id);
  record.kind = transactionKindFromString(j.at("kind").get<std::string>());
  j.at("amount").get_to(record.amount);
  record.description = j.value("description", std::string());

  auto counterparty = j.find("counterparty");
  if (counterparty != j.end() && !counterparty->is_null()) {
    record.counterparty = counterparty->get<AccountId>();
  } else {
    record.counterparty.reset();
  }

  auto timestamp = j.find("timestamp");
  if (timestamp != j.end() && !timestamp->is_null()) {
    record.timestamp = timestamp->get<Timestamp>();
  } else {
    record.timestamp.reset();
  }

  record.sequence = j.value("sequence", static_cast<std::uint64_t>(0));
}

void to_json(nlohmann::json& j, const AccountBalance& balance) {
  j = nlohmann::json{
    {"account_id", balance.account_id},
    {"amount", balance.amount},
    {"created_at", balance.created_at}
  };
}

void from_json(const nlohmann::json& j, AccountBalance& balance) {
  balance.account_id = j.value("account_id", std::string());
  balance.amount = j.value("amount", static_cast<Amount>(0));
  balance.created_at = j.value("created_at", static_cast<Timestamp>(0));
}

}  // namespace wallet
