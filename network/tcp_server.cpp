#include "network/tcp_server.hpp"

#include "network/protocol.hpp"
#include "observability/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace wallet {
namespace network {

// Connection implementation
Connection::Connection(std::uint64_t id, int socket_fd, std::string peer,
                       std::chrono::milliseconds send_timeout)
    : id_(id), socket_fd_(socket_fd), peer_(std::move(peer)), open_(true) {
  if (send_timeout.count() > 0) {
    struct timeval tv {};
    tv.tv_sec = static_cast<time_t>(send_timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((send_timeout.count() % 1000) * 1000);
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
      LOG_BUILDER(observability::LogLevel::WARN, "Failed to set send timeout")
          .field("peer", peer_);
    }
  }
}

Connection::~Connection() {
  ::close(socket_fd_);
}

bool Connection::send(const std::string& message) {
  const std::string framed = protocol::MessageFramer::frameMessage(message);

  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!open_) {
    return false;
  }

  std::size_t written = 0;
  while (written < framed.size()) {
    ssize_t n = ::send(socket_fd_, framed.data() + written, framed.size() - written,
                       MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      // Peer stopped reading; wake its reader so the connection is released
      LOG_BUILDER(observability::LogLevel::WARN, "Send timed out, dropping client")
          .field("peer", peer_)
          .field("pending_bytes", static_cast<std::int64_t>(framed.size() - written));
      open_ = false;
      ::shutdown(socket_fd_, SHUT_RDWR);
      return false;
    }
    if (n <= 0) {
      open_ = false;
      LOG_BUILDER(observability::LogLevel::WARN, "Error writing to client")
          .field("peer", peer_);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

void Connection::shutdown() {
  open_ = false;
  ::shutdown(socket_fd_, SHUT_RDWR);
}

// TCPServer implementation
TCPServer::TCPServer(int port, RequestHandler handler, CloseHandler on_close,
                     std::chrono::milliseconds send_timeout)
    : port_(port),
      server_socket_(-1),
      request_handler_(std::move(handler)),
      close_handler_(std::move(on_close)),
      send_timeout_(send_timeout),
      running_(false),
      next_connection_id_(1) {
}

TCPServer::~TCPServer() {
  stop();
}

bool TCPServer::start() {
  // Create socket
  server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (server_socket_ < 0) {
    LOG_ERROR("Failed to create socket");
    return false;
  }

  // Set socket options
  int opt = 1;
  if (setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LOG_ERROR("Failed to set socket options");
    ::close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Bind socket
  struct sockaddr_in address {};
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = INADDR_ANY;
  address.sin_port = htons(static_cast<uint16_t>(port_));

  if (bind(server_socket_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Failed to bind socket")
        .field("port", port_);
    ::close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  // Listen for connections
  if (listen(server_socket_, 64) < 0) {
    LOG_ERROR("Failed to listen on socket");
    ::close(server_socket_);
    server_socket_ = -1;
    return false;
  }

  running_ = true;
  accept_thread_ = std::make_unique<std::thread>(&TCPServer::acceptLoop, this);

  LOG_BUILDER(observability::LogLevel::INFO, "TCP server started").field("port", port_);
  return true;
}

void TCPServer::stop() {
  if (!running_) return;

  running_ = false;

  // Close server socket to break accept loop
  if (server_socket_ >= 0) {
    ::shutdown(server_socket_, SHUT_RDWR);
    ::close(server_socket_);
    server_socket_ = -1;
  }

  // Wait for accept thread
  if (accept_thread_ && accept_thread_->joinable()) {
    accept_thread_->join();
  }

  // Wake every reader, then join outside the lock; readers take it on exit
  std::unordered_map<std::uint64_t, ClientSlot> clients;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& pair : clients_) {
      pair.second.connection->shutdown();
    }
    clients.swap(clients_);
    finished_.clear();
  }
  for (auto& pair : clients) {
    if (pair.second.thread && pair.second.thread->joinable()) {
      pair.second.thread->join();
    }
  }

  LOG_INFO("TCP server stopped");
}

void TCPServer::acceptLoop() {
  while (running_) {
    struct sockaddr_in client_address {};
    socklen_t client_addr_len = sizeof(client_address);

    int client_socket = accept(server_socket_,
                               reinterpret_cast<struct sockaddr*>(&client_address),
                               &client_addr_len);

    reapFinishedClients();

    if (client_socket < 0) {
      if (running_) {
        LOG_WARN("Failed to accept connection");
      }
      continue;
    }

    // Get client address for logging
    char client_ip[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);
    std::string client_addr = std::string(client_ip) + ":" +
                              std::to_string(ntohs(client_address.sin_port));

    LOG_BUILDER(observability::LogLevel::INFO, "Accepted connection").field("peer", client_addr);

    // Handle client in separate thread
    std::lock_guard<std::mutex> lock(connections_mutex_);
    if (!running_) {
      ::close(client_socket);
      break;
    }
    auto connection = std::make_shared<Connection>(next_connection_id_++, client_socket,
                                                   client_addr, send_timeout_);
    auto& slot = clients_[connection->id()];
    slot.connection = connection;
    slot.thread = std::make_unique<std::thread>(&TCPServer::handleClient, this, connection);
  }
}

void TCPServer::reapFinishedClients() {
  std::vector<std::unique_ptr<std::thread>> done;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (std::uint64_t id : finished_) {
      auto it = clients_.find(id);
      if (it != clients_.end()) {
        done.push_back(std::move(it->second.thread));
        clients_.erase(it);
      }
    }
    finished_.clear();
  }
  for (auto& thread : done) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
}

void TCPServer::handleClient(std::shared_ptr<Connection> connection) {
  char buffer[4096];
  std::string message_buffer;

  while (running_ && connection->isOpen()) {
    ssize_t bytes_read = read(connection->socket(), buffer, sizeof(buffer));

    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      if (bytes_read < 0 && running_) {
        LOG_BUILDER(observability::LogLevel::WARN, "Error reading from client")
            .field("peer", connection->peer());
      }
      break;
    }

    message_buffer.append(buffer, static_cast<std::size_t>(bytes_read));

    // Process complete messages
    try {
      while (auto request_json = protocol::MessageFramer::popMessage(message_buffer)) {
        std::string response_json;
        try {
          response_json = request_handler_(*request_json, connection);
        } catch (const std::exception& e) {
          LOG_BUILDER(observability::LogLevel::ERROR, "Error processing request")
              .field("peer", connection->peer())
              .field("error", e.what());
          response_json = protocol::serializeResponse(protocol::Response::error(
              protocol::Status::ERROR, "Internal error", 0));
        }

        if (!connection->send(response_json)) {
          break;
        }
      }
    } catch (const std::runtime_error& e) {
      // Corrupt framing: the stream cannot be resynchronized
      LOG_BUILDER(observability::LogLevel::WARN, "Dropping client with corrupt framing")
          .field("peer", connection->peer())
          .field("error", e.what());
      break;
    }
  }

  connection->shutdown();
  if (close_handler_) {
    close_handler_(connection);
  }
  LOG_BUILDER(observability::LogLevel::INFO, "Closed connection").field("peer", connection->peer());

  // Joined by the accept loop or stop()
  std::lock_guard<std::mutex> lock(connections_mutex_);
  finished_.push_back(connection->id());
}

size_t TCPServer::getConnectionCount() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  size_t count = 0;
  for (const auto& pair : clients_) {
    if (pair.second.connection->isOpen()) {
      ++count;
    }
  }
  return count;
}

}  // namespace network
}  // namespace wallet
