#ifndef WALLET_PROTOCOL_HPP_
#define WALLET_PROTOCOL_HPP_

#include "ledger/ledger_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wallet {
namespace network {
namespace protocol {

// Message types
enum class MessageType {
  AUTHENTICATE,
  DEPOSIT,
  TRANSFER,
  GET_BALANCE,
  LIST_TRANSACTIONS,
  SUBSCRIBE_BALANCE,
  SUBSCRIBE_TRANSACTIONS,
  UNSUBSCRIBE,
  GET_METRICS,
  HEARTBEAT
};

// Response status: one per wallet error kind plus transport-level outcomes
enum class Status {
  SUCCESS,
  ERROR,
  INVALID_REQUEST,
  UNAUTHORIZED,
  INVALID_AMOUNT,
  SELF_TRANSFER_NOT_ALLOWED,
  INVALID_RECIPIENT,
  INSUFFICIENT_FUNDS,
  TRANSIENT_STORE_ERROR,
  LOG_WRITE_FAILED,
  TIMEOUT
};

std::string messageTypeToString(MessageType type);
MessageType messageTypeFromString(const std::string& name);

std::string statusToString(Status status);
Status statusFromString(const std::string& name);
Status statusFromErrorKind(ErrorKind kind);

// Request base structure
struct Request {
  MessageType type = MessageType::HEARTBEAT;
  std::int64_t request_id = 0;
  std::string session_token;
  nlohmann::json payload = nlohmann::json::object();

  // Helper methods for specific request types
  static Request authenticate(std::int64_t request_id, const std::string& account_id);

  static Request deposit(std::int64_t request_id, const std::string& session_token,
                         const std::string& amount);

  static Request transfer(std::int64_t request_id, const std::string& session_token,
                          const std::string& recipient, const std::string& amount);

  static Request getBalance(std::int64_t request_id, const std::string& session_token);
  static Request listTransactions(std::int64_t request_id, const std::string& session_token);
  static Request subscribeBalance(std::int64_t request_id, const std::string& session_token);
  static Request subscribeTransactions(std::int64_t request_id,
                                       const std::string& session_token);
  static Request unsubscribe(std::int64_t request_id, const std::string& session_token,
                             std::uint64_t subscription_id);
  static Request getMetrics(std::int64_t request_id, const std::string& session_token);
  static Request heartbeat(std::int64_t request_id);
};

// Response base structure. `push` marks unsolicited subscription updates.
struct Response {
  Status status = Status::SUCCESS;
  std::string message;
  std::int64_t request_id = 0;
  bool push = false;
  nlohmann::json payload = nlohmann::json::object();

  bool ok() const { return status == Status::SUCCESS; }

  // Helper methods for specific response types
  static Response success(const std::string& message, std::int64_t request_id,
                          const nlohmann::json& payload = nlohmann::json::object());

  static Response error(Status status, const std::string& message, std::int64_t request_id);

  static Response fromResult(const OperationResult& result, std::int64_t request_id);

  static Response authenticated(const std::string& session_token, const AccountId& account_id,
                                std::int64_t request_id);
  static Response balanceResult(const AccountId& account_id, Amount balance,
                                std::int64_t request_id);
  static Response transactionsResult(const std::vector<TransactionRecord>& records,
                                     std::int64_t request_id);
  static Response subscribed(std::uint64_t subscription_id, std::int64_t request_id);

  // Pushed on the subscriber's connection
  static Response balanceUpdate(std::uint64_t subscription_id, const AccountBalance& balance);
  static Response transactionUpdate(std::uint64_t subscription_id,
                                    const TransactionRecord& record);
  static Response streamError(std::uint64_t subscription_id, ErrorKind kind,
                              const std::string& message);
};

// Wire form of a record: amounts travel as decimal text.
nlohmann::json recordToWire(const TransactionRecord& record);
TransactionRecord recordFromWire(const nlohmann::json& j);

// Serialization functions. Deserialization throws std::invalid_argument.
std::string serializeRequest(const Request& request);
Request deserializeRequest(const std::string& json_str);

std::string serializeResponse(const Response& response);
Response deserializeResponse(const std::string& json_str);

// Message framing for TCP transport: 8 hex digit length, then the body
class MessageFramer {
 public:
  static constexpr std::size_t kHeaderSize = 8;
  static constexpr std::size_t kMaxMessageSize = 16 * 1024 * 1024;

  static std::string frameMessage(const std::string& message);

  /**
   * Removes and returns the first complete message in `buffer`, or nullopt
   * if more bytes are needed. Throws std::runtime_error on a corrupt header.
   */
  static std::optional<std::string> popMessage(std::string& buffer);
};

}  // namespace protocol
}  // namespace network
}  // namespace wallet

#endif  // WALLET_PROTOCOL_HPP_
