#include "store/ledger_store.hpp"

#include "observability/logger.hpp"

#include <random>

namespace wallet {
namespace store {

StoreError::StoreError(Code code, const std::string& message)
    : std::runtime_error(message), code_(code) {
}

std::uint64_t ChangeFeed::subscribe(const std::string& key, ChangeListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t id = next_id_++;
  listeners_.emplace(id, Entry{key, std::move(listener)});
  by_key_.emplace(key, id);
  return id;
}

void ChangeFeed::unsubscribe(std::uint64_t subscription_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = listeners_.find(subscription_id);
  if (it == listeners_.end()) {
    return;
  }

  auto range = by_key_.equal_range(it->second.key);
  for (auto key_it = range.first; key_it != range.second; ++key_it) {
    if (key_it->second == subscription_id) {
      by_key_.erase(key_it);
      break;
    }
  }
  listeners_.erase(it);
}

void ChangeFeed::publish(const ChangeEvent& event) const {
  std::vector<ChangeListener> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto range = by_key_.equal_range(event.key);
    for (auto it = range.first; it != range.second; ++it) {
      targets.push_back(listeners_.at(it->second).listener);
    }
  }

  for (const auto& listener : targets) {
    try {
      listener(event);
    } catch (const std::exception& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Change listener threw")
          .field("key", event.key)
          .field("error", e.what());
    }
  }
}

std::size_t ChangeFeed::listenerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

std::string generateRecordId() {
  static const char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
  thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::size_t> dist(0, sizeof(kAlphabet) - 2);

  std::string id;
  id.reserve(20);
  for (int i = 0; i < 20; ++i) {
    id.push_back(kAlphabet[dist(rng)]);
  }
  return id;
}

Timestamp currentTimeMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace store
}  // namespace wallet
