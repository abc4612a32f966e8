#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace wallet {
namespace observability {

namespace {

thread_local std::string t_correlation_id;

}  // namespace

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR,
                         LogLevel::FATAL}) {
    if (logLevelToString(level) == upper) {
      return level;
    }
  }
  if (upper == "WARNING") return LogLevel::WARN;
  return std::nullopt;
}

std::string logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
  }
  return "UNKNOWN";
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_stream_(&std::clog) {}

void Logger::setLogLevel(LogLevel level) {
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::write(LogLevel level, const std::string& message, const std::string& component,
                   const std::string& correlation_id) {
  emit(level, message, component, correlation_id, nlohmann::json::object());
}

void Logger::emit(LogLevel level, const std::string& message, const std::string& component,
                  const std::string& correlation_id, const nlohmann::json& fields) {
  if (!enabled(level)) return;

  nlohmann::json entry = {
    {"timestamp", currentTimestamp()},
    {"level", logLevelToString(level)},
    {"thread", currentThreadId()},
    {"message", message}
  };
  if (!component.empty()) {
    entry["component"] = component;
  }

  const std::string& correlation =
      correlation_id.empty() ? CorrelationScope::current() : correlation_id;
  if (!correlation.empty()) {
    entry["correlation_id"] = correlation;
  }

  // Builder fields never replace the fixed keys above
  for (auto it = fields.begin(); it != fields.end(); ++it) {
    if (!entry.contains(it.key())) {
      entry[it.key()] = it.value();
    }
  }

  // Replace invalid UTF-8 instead of throwing from a log call
  const std::string line =
      entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lock(mutex_);
  *output_stream_ << line << '\n';
  output_stream_->flush();
}

std::string Logger::currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto seconds = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream ss;
  ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << micros.count() << "Z";
  return ss.str();
}

std::string Logger::currentThreadId() {
  std::ostringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

// LogBuilder
Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component)
    : level_(level), message_(message), component_(component),
      fields_(nlohmann::json::object()) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().emit(level_, message_, component_, "", fields_);
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const std::string& value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, const char* value) {
  fields_[key] = std::string(value ? value : "");
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, std::int64_t value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, int value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, double value) {
  fields_[key] = value;
  return *this;
}

Logger::LogBuilder& Logger::LogBuilder::field(const std::string& key, bool value) {
  fields_[key] = value;
  return *this;
}

// CorrelationScope
CorrelationScope::CorrelationScope(std::string correlation_id)
    : previous_(std::move(t_correlation_id)) {
  t_correlation_id = std::move(correlation_id);
}

CorrelationScope::~CorrelationScope() {
  t_correlation_id = std::move(previous_);
}

const std::string& CorrelationScope::current() {
  return t_correlation_id;
}

}  // namespace observability
}  // namespace wallet
