#include "wallet_server.hpp"
#include "network/tcp_client.hpp"
#include "store/memory_ledger_store.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace wallet;
using namespace wallet::network::protocol;

class WalletServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.open();
    service_ = std::make_unique<WalletService>(store_);
    ASSERT_TRUE(service_->start());
    server_ = std::make_unique<WalletServer>(*service_, 0);
  }

  void TearDown() override {
    server_.reset();
    service_.reset();
  }

  Response call(const Request& request) {
    return deserializeResponse(server_->handleRequest(serializeRequest(request), nullptr));
  }

  std::string login(const std::string& account_id) {
    Response resp = call(Request::authenticate(1, account_id));
    EXPECT_TRUE(resp.ok()) << resp.message;
    return resp.payload.value("session_token", std::string());
  }

  store::MemoryLedgerStore store_;
  std::unique_ptr<WalletService> service_;
  std::unique_ptr<WalletServer> server_;
};

TEST_F(WalletServerTest, AuthenticateInitializesAccount) {
  Response resp = call(Request::authenticate(11, "alice"));
  ASSERT_TRUE(resp.ok());
  EXPECT_EQ(resp.request_id, 11);
  EXPECT_EQ(resp.payload["account_id"], "alice");
  EXPECT_EQ(resp.payload["session_token"].get<std::string>().rfind("session_", 0), 0u);
  EXPECT_TRUE(store_.Get(ledger::BalanceRepository::keyFor("alice")).exists());
}

TEST_F(WalletServerTest, AuthenticateRejectsMalformedAccountIds) {
  for (const std::string& bad : {std::string(""), std::string("a b"), std::string(200, 'x')}) {
    Response resp = call(Request::authenticate(1, bad));
    EXPECT_EQ(resp.status, Status::INVALID_REQUEST) << bad;
  }
}

TEST_F(WalletServerTest, UnknownSessionIsUnauthorized) {
  Response resp = call(Request::getBalance(4, "session_forged"));
  EXPECT_EQ(resp.status, Status::UNAUTHORIZED);
  EXPECT_EQ(resp.request_id, 4);
}

TEST_F(WalletServerTest, HeartbeatNeedsNoSession) {
  EXPECT_TRUE(call(Request::heartbeat(2)).ok());
}

TEST_F(WalletServerTest, DepositTransferAndBalanceUseDecimalText) {
  std::string alice = login("alice");
  std::string bob = login("bob");

  ASSERT_TRUE(call(Request::deposit(2, alice, "10.00")).ok());
  Response transfer = call(Request::transfer(3, alice, "bob", "2.50"));
  ASSERT_TRUE(transfer.ok()) << transfer.message;

  Response balance = call(Request::getBalance(4, alice));
  ASSERT_TRUE(balance.ok());
  EXPECT_EQ(balance.payload["balance"], "7.50");
  EXPECT_EQ(call(Request::getBalance(5, bob)).payload["balance"], "2.50");
}

TEST_F(WalletServerTest, DomainErrorsMapToStatuses) {
  std::string alice = login("alice");

  EXPECT_EQ(call(Request::deposit(1, alice, "abc")).status, Status::INVALID_AMOUNT);
  EXPECT_EQ(call(Request::deposit(1, alice, "0")).status, Status::INVALID_AMOUNT);
  EXPECT_EQ(call(Request::transfer(1, alice, "bob", "1.00")).status, Status::INSUFFICIENT_FUNDS);
  EXPECT_EQ(call(Request::transfer(1, alice, "alice", "1.00")).status,
            Status::SELF_TRANSFER_NOT_ALLOWED);
  EXPECT_EQ(call(Request::transfer(1, alice, "", "1.00")).status, Status::INVALID_RECIPIENT);

  Request missing = Request::transfer(1, alice, "bob", "1.00");
  missing.payload.erase("recipient");
  EXPECT_EQ(call(missing).status, Status::INVALID_REQUEST);

  Request numeric = Request::deposit(1, alice, "1.00");
  numeric.payload["amount"] = 100;
  EXPECT_EQ(call(numeric).status, Status::INVALID_AMOUNT);
}

TEST_F(WalletServerTest, ListTransactionsReturnsWireRecords) {
  std::string alice = login("alice");
  ASSERT_TRUE(call(Request::deposit(1, alice, "1.25")).ok());
  ASSERT_TRUE(call(Request::transfer(2, alice, "bob", "0.25")).ok());

  Response resp = call(Request::listTransactions(3, alice));
  ASSERT_TRUE(resp.ok());
  const auto& records = resp.payload["transactions"];
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0]["amount"], "1.25");
  EXPECT_EQ(records[0]["kind"], "DEPOSIT");
  EXPECT_EQ(records[1]["kind"], "TRANSFER_SENT");
  EXPECT_EQ(recordFromWire(records[1]).amount, 25);
}

TEST_F(WalletServerTest, MetricsAreExported) {
  std::string alice = login("alice");
  ASSERT_TRUE(call(Request::deposit(1, alice, "1.00")).ok());

  Response resp = call(Request::getMetrics(2, alice));
  ASSERT_TRUE(resp.ok());
  std::string text = resp.payload["metrics"].get<std::string>();
  EXPECT_NE(text.find("wallet_operations_total"), std::string::npos);
}

TEST_F(WalletServerTest, MalformedRequestsAreRejected) {
  Response resp = deserializeResponse(server_->handleRequest("{oops", nullptr));
  EXPECT_EQ(resp.status, Status::INVALID_REQUEST);

  resp = deserializeResponse(server_->handleRequest("{\"type\":\"WITHDRAW\"}", nullptr));
  EXPECT_EQ(resp.status, Status::INVALID_REQUEST);
}

TEST_F(WalletServerTest, SubscriptionsNeedAConnection) {
  std::string alice = login("alice");
  EXPECT_EQ(call(Request::subscribeBalance(1, alice)).status, Status::INVALID_REQUEST);
  EXPECT_EQ(call(Request::unsubscribe(2, alice, 1)).status, Status::INVALID_REQUEST);
}

TEST(WalletServerNetworkTest, PushesReachSubscribedClient) {
  store::MemoryLedgerStore store;
  store.open();
  WalletService service(store);
  ASSERT_TRUE(service.start());

  const int port = 38000 + static_cast<int>(::testing::UnitTest::GetInstance()->random_seed() % 1000);
  WalletServer server(service, port);
  if (!server.start()) {
    GTEST_SKIP() << "Could not listen on port " << port;
  }

  std::mutex mutex;
  std::vector<Response> pushes;
  network::TCPClient client("localhost", port);
  client.setPushHandler([&](const Response& push) {
    std::lock_guard<std::mutex> lock(mutex);
    pushes.push_back(push);
  });
  ASSERT_TRUE(client.connect());

  Response auth = client.sendRequest(Request::authenticate(1, "carol"));
  ASSERT_TRUE(auth.ok()) << auth.message;
  const std::string token = auth.payload["session_token"].get<std::string>();

  Response sub = client.sendRequest(Request::subscribeBalance(2, token));
  ASSERT_TRUE(sub.ok()) << sub.message;
  const std::uint64_t subscription_id = sub.payload["subscription_id"].get<std::uint64_t>();

  ASSERT_TRUE(client.sendRequest(Request::deposit(3, token, "4.20")).ok());

  auto seen = [&](const std::string& balance) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& push : pushes) {
      if (push.payload.value("balance", std::string()) == balance) return true;
    }
    return false;
  };
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (!seen("4.20") && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_TRUE(seen("0.00"));
  EXPECT_TRUE(seen("4.20"));
  {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& push : pushes) {
      EXPECT_TRUE(push.push);
      EXPECT_EQ(push.payload["subscription_id"].get<std::uint64_t>(), subscription_id);
    }
  }

  EXPECT_TRUE(client.sendRequest(Request::unsubscribe(4, token, subscription_id)).ok());
  EXPECT_EQ(client.sendRequest(Request::unsubscribe(5, token, subscription_id)).status,
            Status::INVALID_REQUEST);

  client.disconnect();
  server.stop();
  EXPECT_EQ(service.notificationStats().active_subscriptions, 0u);
}

TEST(ConnectionTest, SendTimesOutWhenPeerStopsReading) {
  int fds[2];
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

  network::Connection connection(1, fds[0], "pair", std::chrono::milliseconds(50));
  const std::string large(8 * 1024 * 1024, 'x');

  auto started = std::chrono::steady_clock::now();
  EXPECT_FALSE(connection.send(large));
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  EXPECT_FALSE(connection.isOpen());
  EXPECT_FALSE(connection.send("after"));

  ::close(fds[1]);
}

namespace {

// Speaks the wire protocol over a bare socket so the test controls when
// (and whether) replies are read.
class BareClient {
 public:
  explicit BareClient(int port) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
    // Small receive window so the server's writes back up quickly
    int rcvbuf = 4096;
    ::setsockopt(fd_, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));

    struct sockaddr_in address {};
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port));
    ::inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
    connected_ = ::connect(fd_, reinterpret_cast<struct sockaddr*>(&address),
                           sizeof(address)) == 0;
  }

  ~BareClient() { ::close(fd_); }

  bool connected() const { return connected_; }

  Response call(const Request& request) {
    const std::string framed = MessageFramer::frameMessage(serializeRequest(request));
    if (::send(fd_, framed.data(), framed.size(), MSG_NOSIGNAL) !=
        static_cast<ssize_t>(framed.size())) {
      ADD_FAILURE() << "send failed";
      return Response();
    }

    char chunk[4096];
    while (true) {
      while (auto message = MessageFramer::popMessage(buffer_)) {
        Response response = deserializeResponse(*message);
        if (!response.push) {
          return response;
        }
      }
      ssize_t n = ::read(fd_, chunk, sizeof(chunk));
      if (n <= 0) {
        ADD_FAILURE() << "connection closed while waiting for a response";
        return Response();
      }
      buffer_.append(chunk, static_cast<std::size_t>(n));
    }
  }

 private:
  int fd_;
  bool connected_ = false;
  std::string buffer_;
};

}  // namespace

TEST(WalletServerNetworkTest, StalledSubscriberDoesNotBlockOthers) {
  store::MemoryLedgerStore store;
  store.open();
  WalletService service(store);
  ASSERT_TRUE(service.start());

  const int port =
      39000 + static_cast<int>(::testing::UnitTest::GetInstance()->random_seed() % 1000);
  WalletServer server(service, port, std::chrono::milliseconds(100));
  if (!server.start()) {
    GTEST_SKIP() << "Could not listen on port " << port;
  }

  // Subscribes to its own history and then never reads again
  BareClient stalled(port);
  ASSERT_TRUE(stalled.connected());
  Response auth = stalled.call(Request::authenticate(1, "alice"));
  ASSERT_TRUE(auth.ok()) << auth.message;
  const std::string alice_token = auth.payload["session_token"].get<std::string>();
  ASSERT_TRUE(stalled.call(Request::subscribeTransactions(2, alice_token)).ok());

  std::mutex mutex;
  std::vector<std::string> balances;
  network::TCPClient watcher("localhost", port);
  watcher.setPushHandler([&](const Response& push) {
    std::lock_guard<std::mutex> lock(mutex);
    balances.push_back(push.payload.value("balance", std::string()));
  });
  ASSERT_TRUE(watcher.connect());
  Response bob = watcher.sendRequest(Request::authenticate(1, "bob"));
  ASSERT_TRUE(bob.ok()) << bob.message;
  const std::string bob_token = bob.payload["session_token"].get<std::string>();
  ASSERT_TRUE(watcher.sendRequest(Request::subscribeBalance(2, bob_token)).ok());
  ASSERT_EQ(service.notificationStats().active_subscriptions, 2u);

  // Keep pushing records at the stalled client until the server drops it
  for (int i = 0; i < 200000 && service.notificationStats().active_subscriptions > 1; ++i) {
    ASSERT_TRUE(service.Deposit("alice", 1).ok);
    if (i % 1000 == 999) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (service.notificationStats().active_subscriptions > 1 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(service.notificationStats().active_subscriptions, 1u);

  ASSERT_TRUE(service.Deposit("bob", 420).ok);
  auto seen = [&] {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& balance : balances) {
      if (balance == "4.20") return true;
    }
    return false;
  };
  deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!seen() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_TRUE(seen());

  watcher.disconnect();
  server.stop();
}
