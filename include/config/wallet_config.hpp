#ifndef WALLET_WALLET_CONFIG_HPP_
#define WALLET_WALLET_CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "database/postgres_ledger_store.hpp"
#include "observability/logger.hpp"
#include "wallet_service.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace wallet {
namespace config {

enum class StorageBackend {
  MEMORY,
  POSTGRES
};

std::string storageBackendToString(StorageBackend backend);
StorageBackend storageBackendFromString(const std::string& name);

/**
 * Server settings: optional JSON file first, then WALLET_* environment
 * variables on top. Invalid values throw std::invalid_argument.
 */
struct WalletConfig {
  StorageBackend storage = StorageBackend::MEMORY;
  int port = 8080;
  int send_timeout_ms = 2000;

  database::PostgresConnection::Config database;
  std::string schema_path;

  int max_attempts = 5;
  int initial_backoff_ms = 2;
  int request_timeout_ms = 0;
  bool atomic_sender_log = false;
  std::size_t notification_batch_size = 64;

  observability::LogLevel log_level = observability::LogLevel::INFO;

  WalletConfig();

  /**
   * Reads `path` (skipped when empty) and applies the environment.
   */
  static WalletConfig load(const std::string& path);

  static WalletConfig fromJson(const nlohmann::json& j);

  void applyEnvironment();
  void validate() const;

  WalletService::Options serviceOptions() const;
  database::PostgresLedgerStore::Config storeConfig() const;
};

// Value of an environment variable, nullopt when unset.
std::optional<std::string> getEnv(const char* name);

std::string getEnvOrDefault(const char* name, const std::string& default_value);

}  // namespace config
}  // namespace wallet

#endif  // WALLET_WALLET_CONFIG_HPP_
