#include "config/wallet_config.hpp"
#include "database/postgres_ledger_store.hpp"
#include "observability/logger.hpp"
#include "store/memory_ledger_store.hpp"
#include "wallet_server.hpp"
#include "wallet_service.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

int main(int argc, char* argv[]) {
  using namespace wallet;

  // Usage: wallet_server [config.json]
  std::string config_path = argc >= 2 ? argv[1] : "";

  config::WalletConfig settings;
  try {
    settings = config::WalletConfig::load(config_path);
  } catch (const std::exception& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }

  observability::Logger::getInstance().setLogLevel(settings.log_level);

  LOG_BUILDER(observability::LogLevel::INFO, "Starting wallet server")
      .field("port", settings.port)
      .field("storage", config::storageBackendToString(settings.storage))
      .field("atomic_sender_log", settings.atomic_sender_log);

  // Set up signal handling
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  try {
    std::unique_ptr<store::LedgerStore> ledger_store;
    if (settings.storage == config::StorageBackend::POSTGRES) {
      LOG_BUILDER(observability::LogLevel::INFO, "Using PostgreSQL ledger store")
          .field("host", settings.database.host)
          .field("database", settings.database.database);
      ledger_store = std::make_unique<database::PostgresLedgerStore>(settings.storeConfig());
    } else {
      LOG_INFO("Using in-memory ledger store");
      ledger_store = std::make_unique<store::MemoryLedgerStore>();
    }

    if (!ledger_store->open()) {
      LOG_FATAL("Failed to open ledger store");
      return 1;
    }

    WalletService service(*ledger_store, settings.serviceOptions());
    if (!service.start()) {
      LOG_FATAL("Failed to start wallet service");
      ledger_store->close();
      return 1;
    }

    WalletServer server(service, settings.port,
                        std::chrono::milliseconds(settings.send_timeout_ms));
    if (!server.start()) {
      LOG_FATAL("Failed to start wallet server");
      service.stop();
      ledger_store->close();
      return 1;
    }

    // Main server loop
    auto last_report = std::chrono::steady_clock::now();
    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

      auto now = std::chrono::steady_clock::now();
      if (now - last_report >= std::chrono::seconds(60)) {
        last_report = now;
        auto stats = server.getStats();
        LOG_BUILDER(observability::LogLevel::INFO, "Server statistics")
            .field("active_connections", static_cast<std::int64_t>(stats.active_connections))
            .field("active_sessions", static_cast<std::int64_t>(stats.active_sessions))
            .field("events_processed",
                   static_cast<std::int64_t>(stats.notification_stats.events_processed))
            .field("deliveries", static_cast<std::int64_t>(stats.notification_stats.deliveries))
            .field("active_subscriptions",
                   static_cast<std::int64_t>(stats.notification_stats.active_subscriptions));
      }
    }

    LOG_INFO("Shutting down");
    server.stop();
    service.stop();
    ledger_store->close();

  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::FATAL, "Server error").field("error", e.what());
    return 1;
  }

  LOG_INFO("Server shutdown complete");
  return 0;
}
