#include "ledger/transaction_log.hpp"
#include "network/protocol.hpp"
#include "network/tcp_client.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace wallet::network;

namespace {

std::atomic<bool> watching{true};

void signalHandler(int) {
  watching = false;
}

void printRecord(const wallet::TransactionRecord& record) {
  std::cout << (record.timestamp ? std::to_string(*record.timestamp) : std::string("pending"))
            << "  " << wallet::transactionKindToString(record.kind)
            << "  " << wallet::formatAmount(record.amount)
            << "  " << record.description << std::endl;
}

void printUsage(const char* program) {
  std::cerr << "Usage: " << program << " <host> <port> <account_id> <command> [args]\n"
            << "Commands:\n"
            << "  balance\n"
            << "  deposit <amount>\n"
            << "  transfer <recipient> <amount>\n"
            << "  history\n"
            << "  watch\n"
            << "  metrics" << std::endl;
}

}  // namespace

/**
 * Command-line wallet client acting on one account.
 */
class WalletClient {
 public:
  WalletClient(const std::string& host, int port)
      : client_(host, port), next_request_id_(1) {}

  bool connect() {
    client_.setPushHandler([](const protocol::Response& update) { printUpdate(update); });
    return client_.connect();
  }

  void disconnect() {
    client_.disconnect();
  }

  bool authenticate(const std::string& account_id) {
    auto response = send(protocol::Request::authenticate(nextId(), account_id));
    if (!response || !response->ok()) {
      std::cerr << "Authentication failed"
                << (response ? ": " + response->message : std::string()) << std::endl;
      return false;
    }
    session_token_ = response->payload.at("session_token").get<std::string>();
    return true;
  }

  bool balance() {
    auto response = send(protocol::Request::getBalance(nextId(), session_token_));
    if (!report(response)) return false;
    std::cout << response->payload.at("balance").get<std::string>() << std::endl;
    return true;
  }

  bool deposit(const std::string& amount) {
    auto response = send(protocol::Request::deposit(nextId(), session_token_, amount));
    if (!report(response)) return false;
    std::cout << response->message << std::endl;
    return true;
  }

  bool transfer(const std::string& recipient, const std::string& amount) {
    auto response =
        send(protocol::Request::transfer(nextId(), session_token_, recipient, amount));
    if (!report(response)) return false;
    std::cout << response->message << std::endl;
    return true;
  }

  bool history() {
    auto response = send(protocol::Request::listTransactions(nextId(), session_token_));
    if (!report(response)) return false;

    std::vector<wallet::TransactionRecord> records;
    for (const auto& entry : response->payload.at("transactions")) {
      records.push_back(protocol::recordFromWire(entry));
    }
    wallet::ledger::sortNewestFirst(records);
    for (const auto& record : records) {
      printRecord(record);
    }
    return true;
  }

  bool watch() {
    if (!report(send(protocol::Request::subscribeBalance(nextId(), session_token_))) ||
        !report(send(protocol::Request::subscribeTransactions(nextId(), session_token_)))) {
      return false;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    while (watching && client_.isConnected()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return true;
  }

  bool metrics() {
    auto response = send(protocol::Request::getMetrics(nextId(), session_token_));
    if (!report(response)) return false;
    std::cout << response->payload.at("metrics").get<std::string>();
    return true;
  }

 private:
  std::optional<protocol::Response> send(const protocol::Request& request) {
    try {
      return client_.sendRequest(request);
    } catch (const std::exception& e) {
      std::cerr << protocol::messageTypeToString(request.type) << " failed: " << e.what()
                << std::endl;
      return std::nullopt;
    }
  }

  // Failures go to stderr
  static bool report(const std::optional<protocol::Response>& response) {
    if (!response) return false;
    if (!response->ok()) {
      std::cerr << protocol::statusToString(response->status) << ": " << response->message
                << std::endl;
      return false;
    }
    return true;
  }

  static void printUpdate(const protocol::Response& update) {
    if (!update.ok()) {
      std::cerr << "[stream error] " << protocol::statusToString(update.status) << ": "
                << update.message << std::endl;
      return;
    }
    try {
      if (update.payload.contains("balance")) {
        std::cout << "[balance] " << update.payload.at("balance").get<std::string>()
                  << std::endl;
      } else if (update.payload.contains("transaction")) {
        std::cout << "[history] ";
        printRecord(protocol::recordFromWire(update.payload.at("transaction")));
      }
    } catch (const std::exception& e) {
      std::cerr << "Unreadable update: " << e.what() << std::endl;
    }
  }

  std::int64_t nextId() { return next_request_id_++; }

  TCPClient client_;
  std::string session_token_;
  std::int64_t next_request_id_;
};

int main(int argc, char* argv[]) {
  if (argc < 5) {
    printUsage(argv[0]);
    return 2;
  }

  const std::string host = argv[1];
  int port = 0;
  try {
    port = std::stoi(argv[2]);
  } catch (const std::exception&) {
    std::cerr << "Invalid port: " << argv[2] << std::endl;
    return 2;
  }
  const std::string account_id = argv[3];
  const std::string command = argv[4];

  WalletClient client(host, port);
  if (!client.connect()) {
    std::cerr << "Failed to connect to " << host << ":" << port << std::endl;
    return 1;
  }

  if (!client.authenticate(account_id)) {
    client.disconnect();
    return 1;
  }

  bool ok = false;
  if (command == "balance") {
    ok = client.balance();
  } else if (command == "deposit" && argc >= 6) {
    ok = client.deposit(argv[5]);
  } else if (command == "transfer" && argc >= 7) {
    ok = client.transfer(argv[5], argv[6]);
  } else if (command == "history") {
    ok = client.history();
  } else if (command == "watch") {
    ok = client.watch();
  } else if (command == "metrics") {
    ok = client.metrics();
  } else {
    printUsage(argv[0]);
    client.disconnect();
    return 2;
  }

  client.disconnect();
  return ok ? 0 : 1;
}
