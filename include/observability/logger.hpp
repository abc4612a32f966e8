#ifndef WALLET_LOGGER_HPP_
#define WALLET_LOGGER_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace wallet {
namespace observability {

enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

/**
 * Parses "DEBUG", "info", ... into a level. Returns nullopt for unknown names.
 */
std::optional<LogLevel> parseLogLevel(const std::string& name);

std::string logLevelToString(LogLevel level);

/**
 * Process-wide structured logger writing one JSON object per line.
 *
 * Every line carries timestamp, level, thread and message, plus the calling
 * component, the correlation id of the request being served on this thread
 * (see CorrelationScope) and any LogBuilder fields.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool enabled(LogLevel level) const { return level >= min_level_.load(); }

  // Default: std::clog
  void setOutputStream(std::ostream& stream);

  /**
   * Writes one line. An empty `correlation_id` falls back to the one bound
   * to the calling thread.
   */
  void write(LogLevel level, const std::string& message,
             const std::string& component = "",
             const std::string& correlation_id = "");

  // Key/value line, emitted when the builder is destroyed
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    LogBuilder(const LogBuilder&) = delete;
    LogBuilder& operator=(const LogBuilder&) = delete;

    LogBuilder& field(const std::string& key, const std::string& value);
    LogBuilder& field(const std::string& key, const char* value);
    LogBuilder& field(const std::string& key, std::int64_t value);
    LogBuilder& field(const std::string& key, int value);
    LogBuilder& field(const std::string& key, double value);
    LogBuilder& field(const std::string& key, bool value);

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::json fields_;
  };

 private:
  Logger();
  ~Logger() = default;

  void emit(LogLevel level, const std::string& message, const std::string& component,
            const std::string& correlation_id, const nlohmann::json& fields);

  static std::string currentTimestamp();
  static std::string currentThreadId();

  std::atomic<LogLevel> min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

/**
 * Binds a correlation id to the current thread for its lifetime; scopes
 * nest and restore the previous id on exit.
 */
class CorrelationScope {
 public:
  explicit CorrelationScope(std::string correlation_id);
  ~CorrelationScope();

  CorrelationScope(const CorrelationScope&) = delete;
  CorrelationScope& operator=(const CorrelationScope&) = delete;

  // Id bound to the calling thread, empty when none
  static const std::string& current();

 private:
  std::string previous_;
};

#define LOG_DEBUG(msg) \
  wallet::observability::Logger::getInstance().write( \
      wallet::observability::LogLevel::DEBUG, msg, __func__)
#define LOG_INFO(msg) \
  wallet::observability::Logger::getInstance().write( \
      wallet::observability::LogLevel::INFO, msg, __func__)
#define LOG_WARN(msg) \
  wallet::observability::Logger::getInstance().write( \
      wallet::observability::LogLevel::WARN, msg, __func__)
#define LOG_ERROR(msg) \
  wallet::observability::Logger::getInstance().write( \
      wallet::observability::LogLevel::ERROR, msg, __func__)
#define LOG_FATAL(msg) \
  wallet::observability::Logger::getInstance().write( \
      wallet::observability::LogLevel::FATAL, msg, __func__)

#define LOG_BUILDER(level, msg) \
  wallet::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace wallet

#endif  // WALLET_LOGGER_HPP_
