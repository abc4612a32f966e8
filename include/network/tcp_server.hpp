#ifndef WALLET_TCP_SERVER_HPP_
#define WALLET_TCP_SERVER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace wallet {
namespace network {

/**
 * One accepted client socket. Writes are serialized so that responses and
 * pushed updates from other threads never interleave on the wire.
 *
 * With a non-zero send timeout, a peer that stops reading is disconnected
 * once a write has made no progress for that long, so a writer never
 * blocks on it indefinitely.
 */
class Connection {
 public:
  Connection(std::uint64_t id, int socket_fd, std::string peer,
             std::chrono::milliseconds send_timeout = std::chrono::milliseconds(0));
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /**
   * Frames and writes one message. Returns false once the peer is gone or
   * the send timeout expired; the connection is closed in both cases.
   */
  bool send(const std::string& message);

  /**
   * Shuts the socket down; a blocked reader wakes up with EOF.
   */
  void shutdown();

  bool isOpen() const { return open_.load(); }
  std::uint64_t id() const { return id_; }
  const std::string& peer() const { return peer_; }
  int socket() const { return socket_fd_; }

 private:
  std::uint64_t id_;
  int socket_fd_;
  std::string peer_;
  std::atomic<bool> open_;
  std::mutex write_mutex_;
};

/**
 * TCP Server for wallet operations.
 * Runs one reader thread per client and hands every complete request to
 * the request handler; the returned string is sent back as the response.
 */
class TCPServer {
 public:
  using RequestHandler =
      std::function<std::string(const std::string&, const std::shared_ptr<Connection>&)>;
  using CloseHandler = std::function<void(const std::shared_ptr<Connection>&)>;

  TCPServer(int port, RequestHandler handler, CloseHandler on_close = nullptr,
            std::chrono::milliseconds send_timeout = std::chrono::milliseconds(0));
  ~TCPServer();

  // Non-copyable
  TCPServer(const TCPServer&) = delete;
  TCPServer& operator=(const TCPServer&) = delete;

  /**
   * Start the server and begin accepting connections.
   */
  bool start();

  /**
   * Stop the server and close all connections.
   */
  void stop();

  /**
   * Check if server is running.
   */
  bool isRunning() const { return running_.load(); }

  /**
   * Get server port.
   */
  int getPort() const { return port_; }

  /**
   * Get number of active connections.
   */
  size_t getConnectionCount() const;

 private:
  struct ClientSlot {
    std::shared_ptr<Connection> connection;
    std::unique_ptr<std::thread> thread;
  };

  void acceptLoop();
  void handleClient(std::shared_ptr<Connection> connection);
  void reapFinishedClients();

  int port_;
  int server_socket_;
  RequestHandler request_handler_;
  CloseHandler close_handler_;
  std::chrono::milliseconds send_timeout_;
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> accept_thread_;
  std::uint64_t next_connection_id_;

  std::unordered_map<std::uint64_t, ClientSlot> clients_;
  std::vector<std::uint64_t> finished_;
  mutable std::mutex connections_mutex_;
};

}  // namespace network
}  // namespace wallet

#endif  // WALLET_TCP_SERVER_HPP_
