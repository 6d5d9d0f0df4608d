#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "event_bus.hpp"
#include "landmark_filter.hpp"
#include "pipeline.hpp"
#include "session_store.hpp"
#include "telemetry.hpp"
#include "types.hpp"

class SessionNotFoundError : public std::runtime_error {
public:
  explicit SessionNotFoundError(const std::string& session_id)
      : std::runtime_error("Session not found: " + session_id), session_id_(session_id) {}
  const std::string& session_id() const { return session_id_; }

private:
  std::string session_id_;
};

struct MetricsServiceConfig {
  PipelineConfig pipeline;
  FrameFilterConfig frame_filter;
};

// fetch -> filter -> pipeline -> persist -> complete -> notify, for one session.
// Store and publisher errors propagate to the caller; calculator errors do not.
class MetricsService {
public:
  MetricsService(SessionRepository& sessions, PoseRepository& poses, MetricsRepository& metrics,
                 EventPublisher* publisher, TelemetryRegistry& telemetry,
                 MetricsServiceConfig cfg = MetricsServiceConfig{});

  RunningMetrics compute_metrics(const std::string& session_id);

  std::optional<RunningMetrics> stored_metrics(const std::string& session_id) const;

private:
  void mark_failed(SessionRecord session, const std::string& reason);

  SessionRepository& sessions_;
  PoseRepository& poses_;
  MetricsRepository& metrics_;
  EventPublisher* publisher_;  // optional
  TelemetryRegistry& telemetry_;
  MetricsServiceConfig cfg_;
};
