#include "config/wallet_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace wallet;
using namespace wallet::config;

class WalletConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto& name : set_vars_) {
      unsetenv(name.c_str());
    }
    for (const auto& path : files_) {
      std::remove(path.c_str());
    }
  }

  void setEnv(const std::string& name, const std::string& value) {
    setenv(name.c_str(), value.c_str(), 1);
    set_vars_.push_back(name);
  }

  std::string writeFile(const std::string& contents) {
    std::string path = ::testing::TempDir() + "wallet_config_" +
                       std::to_string(files_.size()) + ".json";
    std::ofstream out(path);
    out << contents;
    files_.push_back(path);
    return path;
  }

  std::vector<std::string> set_vars_;
  std::vector<std::string> files_;
};

TEST_F(WalletConfigTest, DefaultsAreValid) {
  WalletConfig config;
  EXPECT_EQ(config.storage, StorageBackend::MEMORY);
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.send_timeout_ms, 2000);
  EXPECT_EQ(config.max_attempts, 5);
  EXPECT_FALSE(config.atomic_sender_log);
  EXPECT_NO_THROW(config.validate());
}

TEST_F(WalletConfigTest, FromJsonReadsEverySection) {
  auto j = nlohmann::json::parse(R"({
    "storage": "postgres",
    "server": {"port": 9090, "send_timeout_ms": 250},
    "database": {"host": "db.internal", "port": 6543, "name": "ledger",
                 "user": "svc", "password": "pw", "pool_size": 4,
                 "schema_path": "/etc/wallet/schema.sql"},
    "transactions": {"max_attempts": 8, "initial_backoff_ms": 10, "request_timeout_ms": 2000},
    "atomic_sender_log": true,
    "notifications": {"batch_size": 16},
    "log_level": "debug"
  })");

  WalletConfig config = WalletConfig::fromJson(j);
  EXPECT_EQ(config.storage, StorageBackend::POSTGRES);
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.send_timeout_ms, 250);
  EXPECT_EQ(config.database.host, "db.internal");
  EXPECT_EQ(config.database.port, 6543);
  EXPECT_EQ(config.database.database, "ledger");
  EXPECT_EQ(config.database.username, "svc");
  EXPECT_EQ(config.database.password, "pw");
  EXPECT_EQ(config.database.max_connections, 4);
  EXPECT_EQ(config.schema_path, "/etc/wallet/schema.sql");
  EXPECT_EQ(config.max_attempts, 8);
  EXPECT_EQ(config.initial_backoff_ms, 10);
  EXPECT_EQ(config.request_timeout_ms, 2000);
  EXPECT_TRUE(config.atomic_sender_log);
  EXPECT_EQ(config.notification_batch_size, 16u);
  EXPECT_EQ(config.log_level, observability::LogLevel::DEBUG);
}

TEST_F(WalletConfigTest, FromJsonRejectsBadValues) {
  EXPECT_THROW(WalletConfig::fromJson(nlohmann::json::parse(R"({"storage": "redis"})")),
               std::invalid_argument);
  EXPECT_THROW(WalletConfig::fromJson(nlohmann::json::parse(R"({"server": {"port": "x"}})")),
               std::invalid_argument);
  EXPECT_THROW(WalletConfig::fromJson(nlohmann::json::parse(R"({"log_level": "chatty"})")),
               std::invalid_argument);
}

TEST_F(WalletConfigTest, EnvironmentOverridesFile) {
  std::string path = writeFile(R"({"server": {"port": 9090}, "database": {"host": "a"}})");
  setEnv("WALLET_PORT", "7070");
  setEnv("WALLET_DB_HOST", "b");
  setEnv("WALLET_STORAGE", "postgres");
  setEnv("WALLET_LOG_LEVEL", "warn");
  setEnv("WALLET_SEND_TIMEOUT_MS", "500");

  WalletConfig config = WalletConfig::load(path);
  EXPECT_EQ(config.port, 7070);
  EXPECT_EQ(config.send_timeout_ms, 500);
  EXPECT_EQ(config.database.host, "b");
  EXPECT_EQ(config.storage, StorageBackend::POSTGRES);
  EXPECT_EQ(config.log_level, observability::LogLevel::WARN);
}

TEST_F(WalletConfigTest, InvalidEnvironmentValuesThrow) {
  setEnv("WALLET_PORT", "80x");
  EXPECT_THROW(WalletConfig::load(""), std::invalid_argument);

  setEnv("WALLET_PORT", "70000");
  EXPECT_THROW(WalletConfig::load(""), std::invalid_argument);
}

TEST_F(WalletConfigTest, LoadFailsOnMissingOrBrokenFile) {
  EXPECT_THROW(WalletConfig::load(::testing::TempDir() + "does_not_exist.json"),
               std::invalid_argument);
  EXPECT_THROW(WalletConfig::load(writeFile("{not json")), std::invalid_argument);
}

TEST_F(WalletConfigTest, ValidateChecksRanges) {
  WalletConfig config;
  config.max_attempts = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = WalletConfig();
  config.initial_backoff_ms = -1;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = WalletConfig();
  config.notification_batch_size = 0;
  EXPECT_THROW(config.validate(), std::invalid_argument);

  config = WalletConfig();
  config.send_timeout_ms = -1;
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.send_timeout_ms = 0;
  EXPECT_NO_THROW(config.validate());
}

TEST_F(WalletConfigTest, MapsToServiceAndStoreOptions) {
  WalletConfig config;
  config.max_attempts = 9;
  config.initial_backoff_ms = 7;
  config.request_timeout_ms = 1500;
  config.atomic_sender_log = true;
  config.notification_batch_size = 32;
  config.database.host = "db";
  config.schema_path = "schema.sql";

  WalletService::Options options = config.serviceOptions();
  EXPECT_EQ(options.transactions.max_attempts, 9);
  EXPECT_EQ(options.transactions.initial_backoff, std::chrono::milliseconds(7));
  EXPECT_EQ(options.request_timeout, std::chrono::milliseconds(1500));
  EXPECT_TRUE(options.engine.atomic_sender_log);
  EXPECT_EQ(options.notifications.batch_size, 32u);

  database::PostgresLedgerStore::Config store_config = config.storeConfig();
  EXPECT_EQ(store_config.connection.host, "db");
  EXPECT_EQ(store_config.schema_path, "schema.sql");
}

TEST(EnvHelpersTest, GetEnvOrDefault) {
  unsetenv("WALLET_TEST_UNSET_VARIABLE");
  EXPECT_FALSE(getEnv("WALLET_TEST_UNSET_VARIABLE").has_value());
  EXPECT_EQ(getEnvOrDefault("WALLET_TEST_UNSET_VARIABLE", "fallback"), "fallback");
}
