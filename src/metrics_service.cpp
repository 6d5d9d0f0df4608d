#include "metrics_service.hpp"

#include <spdlog/spdlog.h>

#include "json_codec.hpp"

MetricsService::MetricsService(SessionRepository& sessions, PoseRepository& poses,
                               MetricsRepository& metrics, EventPublisher* publisher,
                               TelemetryRegistry& telemetry, MetricsServiceConfig cfg)
    : sessions_(sessions),
      poses_(poses),
      metrics_(metrics),
      publisher_(publisher),
      telemetry_(telemetry),
      cfg_(std::move(cfg)) {}

RunningMetrics MetricsService::compute_metrics(const std::string& session_id) {
  std::optional<SessionRecord> found = sessions_.get_session(session_id);
  if (!found) throw SessionNotFoundError(session_id);
  SessionRecord session = *found;

  bool completed = false;
  try {
    validate_profile(session.profile);

    session.status = ProcessingStatus::PROCESSING;
    session.error_message.reset();
    sessions_.update_session(session);

    const PoseSequence frames = poses_.get_poses(session_id);
    const PoseSequence usable = select_usable_frames(frames, cfg_.frame_filter);
    spdlog::info("Session {}: {} frames fetched, {} usable", session_id, frames.size(),
                 usable.size());

    MetricsPipeline pipeline(session.profile, cfg_.pipeline);
    const PipelineReport report = pipeline.run_detailed(usable);
    telemetry_.add_run_ms(report.run_ms);
    for (size_t i = 0; i < report.failures.size(); ++i) telemetry_.inc_calculator_failure();

    const size_t record = metrics_.create_metrics(session_id, report.metrics);
    spdlog::debug("Session {}: metrics record {} written", session_id, record);

    session.status = ProcessingStatus::COMPLETED;
    sessions_.update_session(session);
    completed = true;
    telemetry_.inc_session();

    if (publisher_) {
      const nlohmann::json metrics_json = report.metrics;
      nlohmann::json keys = nlohmann::json::array();
      for (const auto& item : metrics_json.items()) keys.push_back(item.key());
      publisher_->publish(
          make_event(kMetricsCalculatedEvent, session_id, {{"metrics_keys", keys}}));
    }

    spdlog::info("Metrics calculated and stored for session {}", session_id);
    return report.metrics;
  } catch (const std::exception& e) {
    if (!completed) {
      telemetry_.inc_session_failure();
      mark_failed(session, e.what());
    } else {
      spdlog::error("Session {}: metrics stored but notification failed: {}", session_id,
                    e.what());
    }
    throw;
  }
}

void MetricsService::mark_failed(SessionRecord session, const std::string& reason) {
  spdlog::error("Metrics calculation failed for session {}: {}", session.id, reason);
  session.status = ProcessingStatus::FAILED;
  session.error_message = reason;
  try {
    sessions_.update_session(session);
    if (publisher_) {
      Event ev = make_event(kProcessingFailedEvent, session.id);
      ev.error_message = reason;
      publisher_->publish(ev);
    }
  } catch (const std::exception& e) {
    // The caller rethrows the failure that got us here
    spdlog::error("Could not record failure of session {}: {}", session.id, e.what());
  }
}

std::optional<RunningMetrics> MetricsService::stored_metrics(const std::string& session_id) const {
  return metrics_.get_metrics(session_id);
}
