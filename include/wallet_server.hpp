#ifndef WALLET_WALLET_SERVER_HPP_
#define WALLET_WALLET_SERVER_HPP_

#include "network/protocol.hpp"
#include "network/tcp_server.hpp"
#include "wallet_service.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wallet {

/**
 * Network front end of the wallet.
 * Binds sessions to account ids, dispatches requests to the WalletService
 * and pushes subscription updates back on the subscriber's connection.
 */
class WalletServer {
 public:
  /**
   * `send_timeout` bounds every write to a client, pushes included; a client
   * that stops reading for longer is disconnected. Zero disables the bound.
   */
  WalletServer(WalletService& service, int port,
               std::chrono::milliseconds send_timeout = std::chrono::milliseconds(2000));
  ~WalletServer();

  // Non-copyable
  WalletServer(const WalletServer&) = delete;
  WalletServer& operator=(const WalletServer&) = delete;

  /**
   * Start accepting clients. The service must already be started.
   */
  bool start();

  /**
   * Stop the listener and drop every session and subscription.
   */
  void stop();

  struct Stats {
    bool is_running;
    size_t active_connections;
    size_t active_sessions;
    concurrent::NotificationFanout::Stats notification_stats;
  };
  Stats getStats() const;

  int getPort() const { return port_; }

  /**
   * Handles one serialized request and returns the serialized response.
   * Exposed for tests; `connection` may be null when no pushes are needed.
   */
  std::string handleRequest(const std::string& request_json,
                            const std::shared_ptr<network::Connection>& connection);

 private:
  struct ConnectionState {
    std::vector<std::string> session_tokens;
    std::map<std::uint64_t, concurrent::Subscription> subscriptions;
  };

  network::protocol::Response dispatch(const network::protocol::Request& request,
                                       const AccountId& account_id,
                                       const std::shared_ptr<network::Connection>& connection);

  network::protocol::Response authenticate(const network::protocol::Request& request,
                                           const std::shared_ptr<network::Connection>& connection);

  network::protocol::Response subscribe(const network::protocol::Request& request,
                                        const AccountId& account_id,
                                        const std::shared_ptr<network::Connection>& connection);

  network::protocol::Response unsubscribe(const network::protocol::Request& request,
                                          const std::shared_ptr<network::Connection>& connection);

  void handleClose(const std::shared_ptr<network::Connection>& connection);

  WalletService& service_;
  int port_;
  std::unique_ptr<network::TCPServer> tcp_server_;

  // session token -> account id
  std::unordered_map<std::string, AccountId> active_sessions_;
  mutable std::shared_mutex sessions_mutex_;

  std::unordered_map<std::uint64_t, ConnectionState> connections_;
  std::mutex connections_mutex_;
  std::atomic<std::uint64_t> next_subscription_id_;
};

}  // namespace wallet

#endif  // WALLET_WALLET_SERVER_HPP_
