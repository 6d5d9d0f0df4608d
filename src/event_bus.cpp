#include "event_bus.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <random>

namespace {

// Random (version 4) UUID string
std::string new_event_id() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(rng);
  uint64_t lo = dist(rng);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF,
                     hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

}  // namespace

void to_json(nlohmann::json& j, const Event& e) {
  j = nlohmann::json{{"event_id", e.event_id},
                     {"event_type", e.event_type},
                     {"timestamp", e.timestamp},
                     {"session_id", e.session_id},
                     {"data", e.data}};
  if (e.error_message) j["error_message"] = *e.error_message;
}

Event make_event(const std::string& type, const std::string& session_id, nlohmann::json data) {
  Event e;
  e.event_id = new_event_id();
  e.event_type = type;
  e.timestamp = std::chrono::duration<double>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
  e.session_id = session_id;
  e.data = std::move(data);
  return e;
}

void EventBus::subscribe(const std::string& event_type, Handler handler) {
  std::lock_guard<std::mutex> g(mu_);
  subscribers_[event_type].push_back(std::move(handler));
}

void EventBus::publish(const Event& event) {
  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> g(mu_);
    auto it = subscribers_.find(event.event_type);
    if (it != subscribers_.end()) handlers = it->second;
  }
  spdlog::debug("Publishing {} for session {} to {} handler(s)", event.event_type,
                event.session_id, handlers.size());
  for (const auto& h : handlers) h(event);
}

size_t EventBus::subscriber_count(const std::string& event_type) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = subscribers_.find(event_type);
  return it == subscribers_.end() ? 0 : it->second.size();
}
