#include "config/wallet_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#ifndef WALLET_SCHEMA_PATH
#define WALLET_SCHEMA_PATH "database/schema.sql"
#endif

namespace wallet {
namespace config {

namespace {

int parseInt(const std::string& name, const std::string& value) {
  try {
    std::size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::invalid_argument(name + " must be an integer, got '" + value + "'");
  }
}

}  // namespace

std::string storageBackendToString(StorageBackend backend) {
  switch (backend) {
    case StorageBackend::MEMORY: return "memory";
    case StorageBackend::POSTGRES: return "postgres";
  }
  return "unknown";
}

StorageBackend storageBackendFromString(const std::string& name) {
  if (name == "memory") return StorageBackend::MEMORY;
  if (name == "postgres") return StorageBackend::POSTGRES;
  throw std::invalid_argument("Unknown storage backend: " + name);
}

std::optional<std::string> getEnv(const char* name) {
  const char* value = std::getenv(name);
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

std::string getEnvOrDefault(const char* name, const std::string& default_value) {
  return getEnv(name).value_or(default_value);
}

WalletConfig::WalletConfig() : schema_path(WALLET_SCHEMA_PATH) {
}

WalletConfig WalletConfig::load(const std::string& path) {
  WalletConfig config;

  if (!path.empty()) {
    std::ifstream file(path);
    if (!file.is_open()) {
      throw std::invalid_argument("Could not open config file: " + path);
    }

    nlohmann::json j;
    try {
      j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::invalid_argument("Config file " + path + " is not valid JSON: " + e.what());
    }
    config = fromJson(j);
  }

  config.applyEnvironment();
  config.validate();
  return config;
}

WalletConfig WalletConfig::fromJson(const nlohmann::json& j) {
  WalletConfig config;

  try {
    if (j.contains("storage")) {
      config.storage = storageBackendFromString(j.at("storage").get<std::string>());
    }
    if (j.contains("server")) {
      config.port = j.at("server").value("port", config.port);
      config.send_timeout_ms = j.at("server").value("send_timeout_ms", config.send_timeout_ms);
    }
    if (j.contains("database")) {
      const auto& db = j.at("database");
      config.database.host = db.value("host", config.database.host);
      config.database.port = db.value("port", config.database.port);
      config.database.database = db.value("name", config.database.database);
      config.database.username = db.value("user", config.database.username);
      config.database.password = db.value("password", config.database.password);
      config.database.connection_timeout =
          db.value("connect_timeout_seconds", config.database.connection_timeout);
      config.database.max_connections = db.value("pool_size", config.database.max_connections);
      config.schema_path = db.value("schema_path", config.schema_path);
    }
    if (j.contains("transactions")) {
      const auto& tx = j.at("transactions");
      config.max_attempts = tx.value("max_attempts", config.max_attempts);
      config.initial_backoff_ms = tx.value("initial_backoff_ms", config.initial_backoff_ms);
      config.request_timeout_ms = tx.value("request_timeout_ms", config.request_timeout_ms);
    }
    config.atomic_sender_log = j.value("atomic_sender_log", config.atomic_sender_log);
    if (j.contains("notifications")) {
      config.notification_batch_size =
          j.at("notifications").value("batch_size", config.notification_batch_size);
    }
    if (j.contains("log_level")) {
      const std::string name = j.at("log_level").get<std::string>();
      auto level = observability::parseLogLevel(name);
      if (!level) {
        throw std::invalid_argument("Unknown log level: " + name);
      }
      config.log_level = *level;
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
  }

  return config;
}

void WalletConfig::applyEnvironment() {
  if (auto value = getEnv("WALLET_STORAGE")) {
    storage = storageBackendFromString(*value);
  }
  if (auto value = getEnv("WALLET_PORT")) {
    port = parseInt("WALLET_PORT", *value);
  }
  if (auto value = getEnv("WALLET_SEND_TIMEOUT_MS")) {
    send_timeout_ms = parseInt("WALLET_SEND_TIMEOUT_MS", *value);
  }

  database.host = getEnvOrDefault("WALLET_DB_HOST", database.host);
  if (auto value = getEnv("WALLET_DB_PORT")) {
    database.port = parseInt("WALLET_DB_PORT", *value);
  }
  database.database = getEnvOrDefault("WALLET_DB_NAME", database.database);
  database.username = getEnvOrDefault("WALLET_DB_USER", database.username);
  database.password = getEnvOrDefault("WALLET_DB_PASSWORD", database.password);

  if (auto value = getEnv("WALLET_LOG_LEVEL")) {
    auto level = observability::parseLogLevel(*value);
    if (!level) {
      throw std::invalid_argument("Unknown log level in WALLET_LOG_LEVEL: " + *value);
    }
    log_level = *level;
  }
}

void WalletConfig::validate() const {
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Server port out of range: " + std::to_string(port));
  }
  if (send_timeout_ms < 0) {
    throw std::invalid_argument("server.send_timeout_ms must not be negative");
  }
  if (database.port <= 0 || database.port > 65535) {
    throw std::invalid_argument("Database port out of range: " + std::to_string(database.port));
  }
  if (database.max_connections <= 0) {
    throw std::invalid_argument("Database pool size must be positive");
  }
  if (max_attempts <= 0) {
    throw std::invalid_argument("transactions.max_attempts must be positive");
  }
  if (initial_backoff_ms < 0 || request_timeout_ms < 0) {
    throw std::invalid_argument("Transaction timings must not be negative");
  }
  if (notification_batch_size == 0) {
    throw std::invalid_argument("notifications.batch_size must be positive");
  }
}

WalletService::Options WalletConfig::serviceOptions() const {
  WalletService::Options options;
  options.transactions.max_attempts = max_attempts;
  options.transactions.initial_backoff = std::chrono::milliseconds(initial_backoff_ms);
  options.engine.atomic_sender_log = atomic_sender_log;
  options.notifications.batch_size = notification_batch_size;
  options.request_timeout = std::chrono::milliseconds(request_timeout_ms);
  return options;
}

database::PostgresLedgerStore::Config WalletConfig::storeConfig() const {
  database::PostgresLedgerStore::Config store_config;
  store_config.connection = database;
  store_config.schema_path = schema_path;
  return store_config;
}

}  // namespace config
}  // namespace wallet
