#include "wallet_server.hpp"

#include "ledger/transfer_engine.hpp"
#include "observability/logger.hpp"
#include "store/ledger_store.hpp"

namespace wallet {

using network::protocol::MessageType;
using network::protocol::Request;
using network::protocol::Response;
using network::protocol::Status;

namespace {

// Decimal amount text from the payload, or nullopt when absent or malformed
std::optional<Amount> amountField(const nlohmann::json& payload) {
  auto it = payload.find("amount");
  if (it == payload.end() || !it->is_string()) {
    return std::nullopt;
  }
  return parseAmount(it->get<std::string>());
}

Response invalidAmount(std::int64_t request_id) {
  return Response::error(Status::INVALID_AMOUNT, errorKindMessage(ErrorKind::INVALID_AMOUNT),
                         request_id);
}

}  // namespace

WalletServer::WalletServer(WalletService& service, int port,
                           std::chrono::milliseconds send_timeout)
    : service_(service), port_(port), next_subscription_id_(1) {
  tcp_server_ = std::make_unique<network::TCPServer>(
      port_,
      [this](const std::string& request,
             const std::shared_ptr<network::Connection>& connection) {
        return handleRequest(request, connection);
      },
      [this](const std::shared_ptr<network::Connection>& connection) {
        handleClose(connection);
      },
      send_timeout);
}

WalletServer::~WalletServer() {
  stop();
}

bool WalletServer::start() {
  if (!tcp_server_->start()) {
    LOG_ERROR("Failed to start TCP server");
    return false;
  }
  LOG_BUILDER(observability::LogLevel::INFO, "Wallet server started").field("port", port_);
  return true;
}

void WalletServer::stop() {
  if (tcp_server_) {
    tcp_server_->stop();
  }

  // Anything left over was opened without a connection
  std::unordered_map<std::uint64_t, ConnectionState> leftover;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    leftover.swap(connections_);
  }
  leftover.clear();

  std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
  active_sessions_.clear();
}

WalletServer::Stats WalletServer::getStats() const {
  Stats stats;
  stats.is_running = tcp_server_ && tcp_server_->isRunning();
  stats.active_connections = tcp_server_ ? tcp_server_->getConnectionCount() : 0;
  {
    std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
    stats.active_sessions = active_sessions_.size();
  }
  stats.notification_stats = service_.notificationStats();
  return stats;
}

std::string WalletServer::handleRequest(const std::string& request_json,
                                        const std::shared_ptr<network::Connection>& connection) {
  Request request;
  try {
    request = network::protocol::deserializeRequest(request_json);
  } catch (const std::invalid_argument& e) {
    LOG_BUILDER(observability::LogLevel::WARN, "Malformed request").field("error", e.what());
    return network::protocol::serializeResponse(
        Response::error(Status::INVALID_REQUEST, e.what(), 0));
  }

  observability::CorrelationScope correlation(
      (connection ? "c" + std::to_string(connection->id()) + "-" : std::string()) + "r" +
      std::to_string(request.request_id));

  Response response;
  try {
    if (request.type == MessageType::AUTHENTICATE) {
      response = authenticate(request, connection);
    } else if (request.type == MessageType::HEARTBEAT) {
      response = Response::success("Heartbeat acknowledged", request.request_id);
    } else {
      AccountId account_id;
      {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
        auto it = active_sessions_.find(request.session_token);
        if (it != active_sessions_.end()) {
          account_id = it->second;
        }
      }
      if (account_id.empty()) {
        response = Response::error(Status::UNAUTHORIZED, "Invalid session", request.request_id);
      } else {
        response = dispatch(request, account_id, connection);
      }
    }
  } catch (const LedgerError& e) {
    LOG_BUILDER(observability::LogLevel::WARN, "Request failed")
        .field("type", network::protocol::messageTypeToString(request.type))
        .field("kind", errorKindToString(e.kind()))
        .field("error", e.what());
    response = Response::error(network::protocol::statusFromErrorKind(e.kind()),
                               errorKindMessage(e.kind()), request.request_id);
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Error handling request")
        .field("type", network::protocol::messageTypeToString(request.type))
        .field("error", e.what());
    response = Response::error(Status::ERROR, "Request processing failed", request.request_id);
  }

  return network::protocol::serializeResponse(response);
}

Response WalletServer::dispatch(const Request& request, const AccountId& account_id,
                                const std::shared_ptr<network::Connection>& connection) {
  switch (request.type) {
    case MessageType::DEPOSIT: {
      auto amount = amountField(request.payload);
      if (!amount) {
        return invalidAmount(request.request_id);
      }
      return Response::fromResult(service_.Deposit(account_id, *amount), request.request_id);
    }

    case MessageType::TRANSFER: {
      auto recipient = request.payload.find("recipient");
      if (recipient == request.payload.end() || !recipient->is_string()) {
        return Response::error(Status::INVALID_REQUEST, "Missing recipient", request.request_id);
      }
      auto amount = amountField(request.payload);
      if (!amount) {
        return invalidAmount(request.request_id);
      }
      return Response::fromResult(
          service_.Transfer(account_id, recipient->get<std::string>(), *amount),
          request.request_id);
    }

    case MessageType::GET_BALANCE:
      return Response::balanceResult(account_id, service_.GetBalance(account_id),
                                     request.request_id);

    case MessageType::LIST_TRANSACTIONS:
      return Response::transactionsResult(service_.ListTransactions(account_id),
                                          request.request_id);

    case MessageType::SUBSCRIBE_BALANCE:
    case MessageType::SUBSCRIBE_TRANSACTIONS:
      return subscribe(request, account_id, connection);

    case MessageType::UNSUBSCRIBE:
      return unsubscribe(request, connection);

    case MessageType::GET_METRICS: {
      nlohmann::json payload;
      payload["metrics"] = service_.exportMetrics();
      return Response::success("Metrics exported", request.request_id, payload);
    }

    case MessageType::AUTHENTICATE:
    case MessageType::HEARTBEAT:
      break;
  }
  return Response::error(Status::INVALID_REQUEST, "Unsupported request", request.request_id);
}

Response WalletServer::authenticate(const Request& request,
                                    const std::shared_ptr<network::Connection>& connection) {
  auto it = request.payload.find("account_id");
  if (it == request.payload.end() || !it->is_string() ||
      !ledger::TransferEngine::isWellFormedAccountId(it->get<std::string>())) {
    return Response::error(Status::INVALID_REQUEST, "Invalid account id", request.request_id);
  }
  const AccountId account_id = it->get<std::string>();

  service_.EnsureInitialized(account_id);

  const std::string session_token = "session_" + store::generateRecordId();
  {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    active_sessions_[session_token] = account_id;
  }
  if (connection) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[connection->id()].session_tokens.push_back(session_token);
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Session established")
      .field("account_id", account_id);
  return Response::authenticated(session_token, account_id, request.request_id);
}

Response WalletServer::subscribe(const Request& request, const AccountId& account_id,
                                 const std::shared_ptr<network::Connection>& connection) {
  if (!connection) {
    return Response::error(Status::INVALID_REQUEST, "Subscriptions need a connection",
                           request.request_id);
  }

  // Pushes may arrive before the SUBSCRIBED response; the id is fixed up front
  const std::uint64_t subscription_id = next_subscription_id_++;
  std::weak_ptr<network::Connection> weak_connection = connection;

  auto on_error = [weak_connection, subscription_id](ErrorKind kind, const std::string& message) {
    if (auto conn = weak_connection.lock()) {
      conn->send(network::protocol::serializeResponse(
          Response::streamError(subscription_id, kind, message)));
    }
  };

  concurrent::Subscription subscription;
  if (request.type == MessageType::SUBSCRIBE_BALANCE) {
    subscription = service_.SubscribeBalance(
        account_id,
        [weak_connection, subscription_id](const AccountBalance& balance) {
          if (auto conn = weak_connection.lock()) {
            conn->send(network::protocol::serializeResponse(
                Response::balanceUpdate(subscription_id, balance)));
          }
        },
        on_error);
  } else {
    subscription = service_.SubscribeTransactions(
        account_id,
        [weak_connection, subscription_id](const TransactionRecord& record) {
          if (auto conn = weak_connection.lock()) {
            conn->send(network::protocol::serializeResponse(
                Response::transactionUpdate(subscription_id, record)));
          }
        },
        on_error);
  }

  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_[connection->id()].subscriptions.emplace(subscription_id,
                                                         std::move(subscription));
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Subscription opened")
      .field("account_id", account_id)
      .field("type", network::protocol::messageTypeToString(request.type))
      .field("subscription_id", static_cast<std::int64_t>(subscription_id));
  return Response::subscribed(subscription_id, request.request_id);
}

Response WalletServer::unsubscribe(const Request& request,
                                   const std::shared_ptr<network::Connection>& connection) {
  auto it = request.payload.find("subscription_id");
  if (!connection || it == request.payload.end() || !it->is_number_unsigned()) {
    return Response::error(Status::INVALID_REQUEST, "Missing subscription id",
                           request.request_id);
  }
  const std::uint64_t subscription_id = it->get<std::uint64_t>();

  concurrent::Subscription subscription;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto state = connections_.find(connection->id());
    if (state != connections_.end()) {
      auto sub = state->second.subscriptions.find(subscription_id);
      if (sub != state->second.subscriptions.end()) {
        subscription = std::move(sub->second);
        state->second.subscriptions.erase(sub);
      }
    }
  }

  if (!subscription.active()) {
    return Response::error(Status::INVALID_REQUEST, "Unknown subscription", request.request_id);
  }
  // Waits for an in-flight delivery, so not under connections_mutex_
  subscription.cancel();
  return Response::success("Unsubscribed", request.request_id);
}

void WalletServer::handleClose(const std::shared_ptr<network::Connection>& connection) {
  ConnectionState state;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(connection->id());
    if (it == connections_.end()) {
      return;
    }
    state = std::move(it->second);
    connections_.erase(it);
  }

  {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    for (const auto& token : state.session_tokens) {
      active_sessions_.erase(token);
    }
  }

  LOG_BUILDER(observability::LogLevel::DEBUG, "Released connection state")
      .field("peer", connection->peer())
      .field("subscriptions", static_cast<std::int64_t>(state.subscriptions.size()));
  state.subscriptions.clear();
}

}  // namespace wallet
