#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

constexpr const char* kMetricsCalculatedEvent = "metrics_calculated";
constexpr const char* kProcessingFailedEvent = "processing_failed";

struct Event {
  std::string event_id;
  std::string event_type;
  double timestamp{0};  // seconds since the Unix epoch
  std::string session_id;
  nlohmann::json data = nlohmann::json::object();
  std::optional<std::string> error_message;
};

void to_json(nlohmann::json& j, const Event& e);

// Fills id and timestamp
Event make_event(const std::string& type, const std::string& session_id,
                 nlohmann::json data = nlohmann::json::object());

class EventPublisher {
public:
  virtual ~EventPublisher() = default;
  virtual void publish(const Event& event) = 0;
};

// In-process publish/subscribe. Handlers run on the publishing thread; an
// exception thrown by a handler reaches the publisher.
class EventBus : public EventPublisher {
public:
  using Handler = std::function<void(const Event&)>;

  void subscribe(const std::string& event_type, Handler handler);
  void publish(const Event& event) override;

  size_t subscriber_count(const std::string& event_type) const;

private:
  mutable std::mutex mu_;
  std::map<std::string, std::vector<Handler>> subscribers_;
};
