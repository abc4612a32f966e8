#ifndef WALLET_TCP_CLIENT_HPP_
#define WALLET_TCP_CLIENT_HPP_

#include "network/protocol.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace wallet {
namespace network {

/**
 * TCP Client for connecting to wallet servers.
 * Requests are answered one at a time; messages flagged `push` are handed
 * to the push handler on the receive thread instead.
 */
class TCPClient {
 public:
  using PushHandler = std::function<void(const protocol::Response&)>;

  TCPClient(const std::string& host, int port);
  ~TCPClient();

  // Non-copyable
  TCPClient(const TCPClient&) = delete;
  TCPClient& operator=(const TCPClient&) = delete;

  /**
   * Connect to the server.
   */
  bool connect();

  /**
   * Disconnect from the server.
   */
  void disconnect();

  /**
   * Check if client is connected.
   */
  bool isConnected() const { return connected_.load(); }

  /**
   * Send a request and wait for its response.
   * Throws std::runtime_error if the connection drops or `timeout` passes.
   */
  protocol::Response sendRequest(const protocol::Request& request,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(30));

  /**
   * Set the handler for pushed subscription updates. Call before connect().
   */
  void setPushHandler(PushHandler handler);

  /**
   * Get server host.
   */
  const std::string& getHost() const { return host_; }

  /**
   * Get server port.
   */
  int getPort() const { return port_; }

 private:
  void receiveLoop();
  bool sendMessage(const std::string& message);

  std::string host_;
  int port_;
  int socket_;
  std::atomic<bool> connected_;
  std::unique_ptr<std::thread> receive_thread_;
  mutable std::mutex socket_mutex_;

  // One request in flight at a time
  std::mutex request_mutex_;
  std::mutex response_mutex_;
  std::condition_variable response_cv_;
  std::optional<protocol::Response> pending_response_;

  PushHandler push_handler_;
};

}  // namespace network
}  // namespace wallet

#endif  // WALLET_TCP_CLIENT_HPP_
