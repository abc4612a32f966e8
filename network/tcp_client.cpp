#include "network/tcp_client.hpp"

#include "observability/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace wallet {
namespace network {

TCPClient::TCPClient(const std::string& host, int port)
    : host_(host),
      port_(port),
      socket_(-1),
      connected_(false) {
}

TCPClient::~TCPClient() {
  disconnect();
}

bool TCPClient::connect() {
  if (connected_) return true;

  // Create socket
  socket_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socket_ < 0) {
    LOG_ERROR("Failed to create socket");
    return false;
  }

  // Set up server address
  struct sockaddr_in server_address {};
  server_address.sin_family = AF_INET;
  server_address.sin_port = htons(static_cast<uint16_t>(port_));

  const std::string address = host_ == "localhost" ? "127.0.0.1" : host_;
  if (inet_pton(AF_INET, address.c_str(), &server_address.sin_addr) <= 0) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Invalid address").field("host", host_);
    close(socket_);
    socket_ = -1;
    return false;
  }

  // Connect to server
  if (::connect(socket_, reinterpret_cast<struct sockaddr*>(&server_address),
                sizeof(server_address)) < 0) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Failed to connect")
        .field("host", host_)
        .field("port", port_);
    close(socket_);
    socket_ = -1;
    return false;
  }

  connected_ = true;
  receive_thread_ = std::make_unique<std::thread>(&TCPClient::receiveLoop, this);

  LOG_BUILDER(observability::LogLevel::DEBUG, "Connected to server")
      .field("host", host_)
      .field("port", port_);
  return true;
}

void TCPClient::disconnect() {
  connected_ = false;

  // Shut the socket down to break the receive loop
  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_ >= 0) {
      shutdown(socket_, SHUT_RDWR);
    }
  }

  // Wait for receive thread
  if (receive_thread_ && receive_thread_->joinable()) {
    receive_thread_->join();
  }
  receive_thread_.reset();

  {
    std::lock_guard<std::mutex> lock(socket_mutex_);
    if (socket_ >= 0) {
      close(socket_);
      socket_ = -1;
    }
  }
  response_cv_.notify_all();
}

void TCPClient::setPushHandler(PushHandler handler) {
  push_handler_ = std::move(handler);
}

protocol::Response TCPClient::sendRequest(const protocol::Request& request,
                                          std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> in_flight(request_mutex_);

  if (!connected_) {
    throw std::runtime_error("Not connected to server");
  }

  {
    std::lock_guard<std::mutex> lock(response_mutex_);
    pending_response_.reset();
  }

  if (!sendMessage(protocol::serializeRequest(request))) {
    throw std::runtime_error("Failed to send request");
  }

  // Wait for response
  std::unique_lock<std::mutex> lock(response_mutex_);
  bool answered = response_cv_.wait_for(lock, timeout, [this]() {
    return pending_response_.has_value() || !connected_;
  });
  if (!answered) {
    throw std::runtime_error("Timed out waiting for response");
  }
  if (!pending_response_) {
    throw std::runtime_error("Connection closed before response");
  }

  protocol::Response response = std::move(*pending_response_);
  pending_response_.reset();
  return response;
}

void TCPClient::receiveLoop() {
  char buffer[4096];
  std::string message_buffer;

  while (connected_) {
    ssize_t bytes_read = read(socket_, buffer, sizeof(buffer));

    if (bytes_read < 0 && errno == EINTR) {
      continue;
    }
    if (bytes_read <= 0) {
      if (bytes_read < 0 && connected_) {
        LOG_WARN("Error reading from server");
      }
      break;
    }

    message_buffer.append(buffer, static_cast<std::size_t>(bytes_read));

    // Process complete messages
    try {
      while (auto response_json = protocol::MessageFramer::popMessage(message_buffer)) {
        protocol::Response response = protocol::deserializeResponse(*response_json);

        if (response.push) {
          if (push_handler_) {
            push_handler_(response);
          }
          continue;
        }

        // Notify waiting thread
        {
          std::lock_guard<std::mutex> lock(response_mutex_);
          pending_response_ = std::move(response);
        }
        response_cv_.notify_one();
      }
    } catch (const std::exception& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Unreadable message from server")
          .field("error", e.what());
      break;
    }
  }

  {
    std::lock_guard<std::mutex> lock(response_mutex_);
    connected_ = false;
  }
  response_cv_.notify_all();
}

bool TCPClient::sendMessage(const std::string& message) {
  std::lock_guard<std::mutex> lock(socket_mutex_);

  if (!connected_ || socket_ < 0) return false;

  const std::string framed_message = protocol::MessageFramer::frameMessage(message);

  std::size_t written = 0;
  while (written < framed_message.size()) {
    ssize_t n = ::send(socket_, framed_message.data() + written,
                       framed_message.size() - written, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      LOG_ERROR("Failed to send message");
      connected_ = false;
      return false;
    }
    written += static_cast<std::size_t>(n);
  }

  return true;
}

}  // namespace network
}  // namespace wallet
