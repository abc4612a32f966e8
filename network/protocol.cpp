#include "network/protocol.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace wallet {
namespace network {
namespace protocol {

namespace {

Request makeRequest(MessageType type, std::int64_t request_id, const std::string& session_token) {
  Request req;
  req.type = type;
  req.request_id = request_id;
  req.session_token = session_token;
  return req;
}

Response makePush(Status status, const std::string& message, std::uint64_t subscription_id,
                  nlohmann::json payload) {
  Response resp;
  resp.status = status;
  resp.message = message;
  resp.push = true;
  payload["subscription_id"] = subscription_id;
  resp.payload = std::move(payload);
  return resp;
}

}  // namespace

std::string messageTypeToString(MessageType type) {
  switch (type) {
    case MessageType::AUTHENTICATE: return "AUTHENTICATE";
    case MessageType::DEPOSIT: return "DEPOSIT";
    case MessageType::TRANSFER: return "TRANSFER";
    case MessageType::GET_BALANCE: return "GET_BALANCE";
    case MessageType::LIST_TRANSACTIONS: return "LIST_TRANSACTIONS";
    case MessageType::SUBSCRIBE_BALANCE: return "SUBSCRIBE_BALANCE";
    case MessageType::SUBSCRIBE_TRANSACTIONS: return "SUBSCRIBE_TRANSACTIONS";
    case MessageType::UNSUBSCRIBE: return "UNSUBSCRIBE";
    case MessageType::GET_METRICS: return "GET_METRICS";
    case MessageType::HEARTBEAT: return "HEARTBEAT";
  }
  return "UNKNOWN";
}

MessageType messageTypeFromString(const std::string& name) {
  for (MessageType type : {MessageType::AUTHENTICATE, MessageType::DEPOSIT,
                           MessageType::TRANSFER, MessageType::GET_BALANCE,
                           MessageType::LIST_TRANSACTIONS, MessageType::SUBSCRIBE_BALANCE,
                           MessageType::SUBSCRIBE_TRANSACTIONS, MessageType::UNSUBSCRIBE,
                           MessageType::GET_METRICS, MessageType::HEARTBEAT}) {
    if (messageTypeToString(type) == name) {
      return type;
    }
  }
  throw std::invalid_argument("Unknown message type: " + name);
}

std::string statusToString(Status status) {
  switch (status) {
    case Status::SUCCESS: return "SUCCESS";
    case Status::ERROR: return "ERROR";
    case Status::INVALID_REQUEST: return "INVALID_REQUEST";
    case Status::UNAUTHORIZED: return "UNAUTHORIZED";
    case Status::INVALID_AMOUNT: return "INVALID_AMOUNT";
    case Status::SELF_TRANSFER_NOT_ALLOWED: return "SELF_TRANSFER_NOT_ALLOWED";
    case Status::INVALID_RECIPIENT: return "INVALID_RECIPIENT";
    case Status::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case Status::TRANSIENT_STORE_ERROR: return "TRANSIENT_STORE_ERROR";
    case Status::LOG_WRITE_FAILED: return "LOG_WRITE_FAILED";
    case Status::TIMEOUT: return "TIMEOUT";
  }
  return "ERROR";
}

Status statusFromString(const std::string& name) {
  for (Status status : {Status::SUCCESS, Status::ERROR, Status::INVALID_REQUEST,
                        Status::UNAUTHORIZED, Status::INVALID_AMOUNT,
                        Status::SELF_TRANSFER_NOT_ALLOWED, Status::INVALID_RECIPIENT,
                        Status::INSUFFICIENT_FUNDS, Status::TRANSIENT_STORE_ERROR,
                        Status::LOG_WRITE_FAILED, Status::TIMEOUT}) {
    if (statusToString(status) == name) {
      return status;
    }
  }
  throw std::invalid_argument("Unknown status: " + name);
}

Status statusFromErrorKind(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_AMOUNT: return Status::INVALID_AMOUNT;
    case ErrorKind::SELF_TRANSFER_NOT_ALLOWED: return Status::SELF_TRANSFER_NOT_ALLOWED;
    case ErrorKind::INVALID_RECIPIENT: return Status::INVALID_RECIPIENT;
    case ErrorKind::INSUFFICIENT_FUNDS: return Status::INSUFFICIENT_FUNDS;
    case ErrorKind::TRANSIENT_STORE_ERROR: return Status::TRANSIENT_STORE_ERROR;
    case ErrorKind::LOG_WRITE_FAILED: return Status::LOG_WRITE_FAILED;
    case ErrorKind::TIMEOUT: return Status::TIMEOUT;
  }
  return Status::ERROR;
}

// Request helper methods
Request Request::authenticate(std::int64_t request_id, const std::string& account_id) {
  Request req = makeRequest(MessageType::AUTHENTICATE, request_id, "");
  req.payload["account_id"] = account_id;
  return req;
}

Request Request::deposit(std::int64_t request_id, const std::string& session_token,
                         const std::string& amount) {
  Request req = makeRequest(MessageType::DEPOSIT, request_id, session_token);
  req.payload["amount"] = amount;
  return req;
}

Request Request::transfer(std::int64_t request_id, const std::string& session_token,
                          const std::string& recipient, const std::string& amount) {
  Request req = makeRequest(MessageType::TRANSFER, request_id, session_token);
  req.payload["recipient"] = recipient;
  req.payload["amount"] = amount;
  return req;
}

Request Request::getBalance(std::int64_t request_id, const std::string& session_token) {
  return makeRequest(MessageType::GET_BALANCE, request_id, session_token);
}

Request Request::listTransactions(std::int64_t request_id, const std::string& session_token) {
  return makeRequest(MessageType::LIST_TRANSACTIONS, request_id, session_token);
}

Request Request::subscribeBalance(std::int64_t request_id, const std::string& session_token) {
  return makeRequest(MessageType::SUBSCRIBE_BALANCE, request_id, session_token);
}

Request Request::subscribeTransactions(std::int64_t request_id,
                                       const std::string& session_token) {
  return makeRequest(MessageType::SUBSCRIBE_TRANSACTIONS, request_id, session_token);
}

Request Request::unsubscribe(std::int64_t request_id, const std::string& session_token,
                             std::uint64_t subscription_id) {
  Request req = makeRequest(MessageType::UNSUBSCRIBE, request_id, session_token);
  req.payload["subscription_id"] = subscription_id;
  return req;
}

Request Request::getMetrics(std::int64_t request_id, const std::string& session_token) {
  return makeRequest(MessageType::GET_METRICS, request_id, session_token);
}

Request Request::heartbeat(std::int64_t request_id) {
  return makeRequest(MessageType::HEARTBEAT, request_id, "");
}

// Response helper methods
Response Response::success(const std::string& message, std::int64_t request_id,
                           const nlohmann::json& payload) {
  Response resp;
  resp.status = Status::SUCCESS;
  resp.message = message;
  resp.request_id = request_id;
  resp.payload = payload;
  return resp;
}

Response Response::error(Status status, const std::string& message, std::int64_t request_id) {
  Response resp;
  resp.status = status;
  resp.message = message;
  resp.request_id = request_id;
  resp.payload = nlohmann::json::object();
  return resp;
}

Response Response::fromResult(const OperationResult& result, std::int64_t request_id) {
  if (result.ok) {
    return success(result.message, request_id);
  }
  return error(result.error ? statusFromErrorKind(*result.error) : Status::ERROR,
               result.message, request_id);
}

Response Response::authenticated(const std::string& session_token, const AccountId& account_id,
                                 std::int64_t request_id) {
  nlohmann::json payload;
  payload["session_token"] = session_token;
  payload["account_id"] = account_id;
  return success("Authentication successful", request_id, payload);
}

Response Response::balanceResult(const AccountId& account_id, Amount balance,
                                 std::int64_t request_id) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["balance"] = formatAmount(balance);
  return success("Balance retrieved", request_id, payload);
}

Response Response::transactionsResult(const std::vector<TransactionRecord>& records,
                                      std::int64_t request_id) {
  nlohmann::json payload;
  payload["transactions"] = nlohmann::json::array();
  for (const auto& record : records) {
    payload["transactions"].push_back(recordToWire(record));
  }
  return success("Transactions retrieved", request_id, payload);
}

Response Response::subscribed(std::uint64_t subscription_id, std::int64_t request_id) {
  nlohmann::json payload;
  payload["subscription_id"] = subscription_id;
  return success("Subscribed", request_id, payload);
}

Response Response::balanceUpdate(std::uint64_t subscription_id, const AccountBalance& balance) {
  nlohmann::json payload;
  payload["account_id"] = balance.account_id;
  payload["balance"] = formatAmount(balance.amount);
  return makePush(Status::SUCCESS, "Balance update", subscription_id, std::move(payload));
}

Response Response::transactionUpdate(std::uint64_t subscription_id,
                                     const TransactionRecord& record) {
  nlohmann::json payload;
  payload["transaction"] = recordToWire(record);
  return makePush(Status::SUCCESS, "Transaction update", subscription_id, std::move(payload));
}

Response Response::streamError(std::uint64_t subscription_id, ErrorKind kind,
                               const std::string& message) {
  return makePush(statusFromErrorKind(kind), message, subscription_id, nlohmann::json::object());
}

nlohmann::json recordToWire(const TransactionRecord& record) {
  nlohmann::json j = record;
  j["amount"] = formatAmount(record.amount);
  return j;
}

TransactionRecord recordFromWire(const nlohmann::json& j) {
  nlohmann::json copy = j;
  auto amount = parseAmount(j.at("amount").get<std::string>());
  if (!amount) {
    throw std::invalid_argument("Invalid amount in transaction record");
  }
  copy["amount"] = *amount;
  return copy.get<TransactionRecord>();
}

// Serialization functions
std::string serializeRequest(const Request& request) {
  nlohmann::json j;
  j["type"] = messageTypeToString(request.type);
  j["request_id"] = request.request_id;
  j["session_token"] = request.session_token;
  j["payload"] = request.payload;
  return j.dump();
}

Request deserializeRequest(const std::string& json_str) {
  try {
    nlohmann::json j = nlohmann::json::parse(json_str);
    Request req;
    req.type = messageTypeFromString(j.at("type").get<std::string>());
    req.request_id = j.value("request_id", static_cast<std::int64_t>(0));
    req.session_token = j.value("session_token", std::string());
    req.payload = j.value("payload", nlohmann::json::object());
    return req;
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Malformed request: ") + e.what());
  }
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = statusToString(response.status);
  j["message"] = response.message;
  j["request_id"] = response.request_id;
  j["push"] = response.push;
  j["payload"] = response.payload;
  return j.dump();
}

Response deserializeResponse(const std::string& json_str) {
  try {
    nlohmann::json j = nlohmann::json::parse(json_str);
    Response resp;
    resp.status = statusFromString(j.at("status").get<std::string>());
    resp.message = j.value("message", std::string());
    resp.request_id = j.value("request_id", static_cast<std::int64_t>(0));
    resp.push = j.value("push", false);
    resp.payload = j.value("payload", nlohmann::json::object());
    return resp;
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Malformed response: ") + e.what());
  }
}

// Message framing implementation
std::string MessageFramer::frameMessage(const std::string& message) {
  if (message.size() > kMaxMessageSize) {
    throw std::runtime_error("Message too large to frame");
  }

  std::stringstream ss;
  ss << std::setw(kHeaderSize) << std::setfill('0') << std::hex << message.size();
  ss << message;
  return ss.str();
}

std::optional<std::string> MessageFramer::popMessage(std::string& buffer) {
  if (buffer.size() < kHeaderSize) {
    return std::nullopt;
  }

  std::size_t message_size = 0;
  for (std::size_t i = 0; i < kHeaderSize; ++i) {
    const char c = buffer[i];
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      throw std::runtime_error("Invalid framed message: bad length header");
    }
    message_size = message_size * 16 + static_cast<std::size_t>(digit);
  }

  if (message_size > kMaxMessageSize) {
    throw std::runtime_error("Invalid framed message: too large");
  }
  if (buffer.size() < kHeaderSize + message_size) {
    return std::nullopt;
  }

  std::string message = buffer.substr(kHeaderSize, message_size);
  buffer.erase(0, kHeaderSize + message_size);
  return message;
}

}  // namespace protocol
}  // namespace network
}  // namespace wallet
