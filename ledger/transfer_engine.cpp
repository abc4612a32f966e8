#include "ledger/transfer_engine.hpp"

#include "observability/logger.hpp"

#include <cctype>

namespace wallet {
namespace ledger {

namespace {

constexpr std::size_t kMaxAccountIdLength = 128;

}  // namespace

TransferEngine::TransferEngine(BalanceRepository& balances, TransactionLog& log,
                               observability::MetricsCollector& metrics,
                               const EngineOptions& options)
    : balances_(balances), log_(log), metrics_(metrics), options_(options) {
}

bool TransferEngine::isWellFormedAccountId(const std::string& account_id) {
  if (account_id.empty() || account_id.size() > kMaxAccountIdLength) {
    return false;
  }
  for (char c : account_id) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}

OperationResult TransferEngine::Deposit(const AccountId& account_id, Amount amount,
                                        std::optional<Deadline> deadline) {
  observability::MetricsCollector::Timer timer(
      metrics_, "wallet_operation_duration_seconds{operation=\"deposit\"}");

  if (amount <= 0) {
    return record("deposit", OperationResult::failure(ErrorKind::INVALID_AMOUNT,
                                                      "Deposit amount must be positive"));
  }

  try {
    balances_.Deposit(account_id, amount, deadline);
  } catch (const LedgerError& e) {
    return record("deposit", OperationResult::failure(e.kind(), e.what()));
  }

  try {
    log_.Append(TransactionLog::makeDeposit(account_id, amount));
  } catch (const LedgerError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Deposit committed but log append failed")
        .field("account_id", account_id)
        .field("amount", formatAmount(amount))
        .field("error", e.what());
    return record("deposit", OperationResult::failure(ErrorKind::LOG_WRITE_FAILED, e.what()));
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Deposit completed")
      .field("account_id", account_id)
      .field("amount", formatAmount(amount));
  return record("deposit",
                OperationResult::success("Deposited " + formatAmount(amount)));
}

OperationResult TransferEngine::Transfer(const TransferRequest& request,
                                         std::optional<Deadline> deadline) {
  observability::MetricsCollector::Timer timer(
      metrics_, "wallet_operation_duration_seconds{operation=\"transfer\"}");

  // First failing check wins; nothing touches the store before this passes
  if (request.amount <= 0) {
    return record("transfer", OperationResult::failure(ErrorKind::INVALID_AMOUNT,
                                                       "Transfer amount must be positive"));
  }
  if (request.recipient == request.sender) {
    return record("transfer", OperationResult::failure(ErrorKind::SELF_TRANSFER_NOT_ALLOWED));
  }
  if (!isWellFormedAccountId(request.recipient)) {
    return record("transfer", OperationResult::failure(ErrorKind::INVALID_RECIPIENT));
  }

  return record("transfer", executeTransfer(request, deadline));
}

OperationResult TransferEngine::executeTransfer(const TransferRequest& request,
                                                std::optional<Deadline> deadline) {
  const TransactionRecord sent =
      TransactionLog::makeTransferSent(request.sender, request.recipient, request.amount);

  BalanceRepository::TransferHook hook;
  if (options_.atomic_sender_log) {
    hook = [this, &sent](store::Transaction& tx) { log_.AppendWithin(tx, sent); };
  }

  try {
    balances_.Transfer(request.sender, request.recipient, request.amount, hook, deadline);
  } catch (const LedgerError& e) {
    LOG_BUILDER(observability::LogLevel::INFO, "Transfer rejected")
        .field("sender", request.sender)
        .field("recipient", request.recipient)
        .field("kind", errorKindToString(e.kind()))
        .field("error", e.what());
    return OperationResult::failure(e.kind(), e.what());
  }

  if (!options_.atomic_sender_log) {
    try {
      log_.Append(sent);
    } catch (const LedgerError& e) {
      appendRecipientRecord(request);
      LOG_BUILDER(observability::LogLevel::ERROR, "Transfer committed but sender log append failed")
          .field("sender", request.sender)
          .field("recipient", request.recipient)
          .field("amount", formatAmount(request.amount))
          .field("error", e.what());
      return OperationResult::failure(ErrorKind::LOG_WRITE_FAILED, e.what());
    }
  }

  appendRecipientRecord(request);

  LOG_BUILDER(observability::LogLevel::INFO, "Transfer completed")
      .field("sender", request.sender)
      .field("recipient", request.recipient)
      .field("amount", formatAmount(request.amount));
  return OperationResult::success("Transferred " + formatAmount(request.amount) + " to " +
                                  request.recipient);
}

void TransferEngine::appendRecipientRecord(const TransferRequest& request) {
  try {
    log_.Append(TransactionLog::makeTransferReceived(request.recipient, request.sender,
                                                     request.amount));
  } catch (const std::exception& e) {
    // Recipient balance is already credited; the missing record is not retried
    metrics_.incrementCounter("wallet_recipient_log_failures_total");
    LOG_BUILDER(observability::LogLevel::WARN, "Recipient log append failed")
        .field("sender", request.sender)
        .field("recipient", request.recipient)
        .field("amount", formatAmount(request.amount))
        .field("error", e.what());
  }
}

OperationResult TransferEngine::record(const std::string& operation, OperationResult result) {
  if (result.ok) {
    metrics_.incrementCounter("wallet_operations_total{operation=\"" + operation +
                              "\",result=\"success\"}");
  } else {
    metrics_.incrementCounter("wallet_operations_total{operation=\"" + operation +
                              "\",result=\"failure\"}");
    metrics_.incrementCounter("wallet_operation_failures_total{kind=\"" +
                              errorKindToString(*result.error) + "\"}");
  }
  return result;
}

}  // namespace ledger
}  // namespace wallet
