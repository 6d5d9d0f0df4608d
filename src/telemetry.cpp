#include "telemetry.hpp"

#include <sstream>

TelemetrySnapshot TelemetryRegistry::snapshot() const {
  TelemetrySnapshot s{};
  s.run_p50_ms = run_ms_.perc(50);
  s.run_p95_ms = run_ms_.perc(95);
  s.run_p99_ms = run_ms_.perc(99);
  s.sessions_total = sessions_total_.load();
  s.session_failures_total = session_failures_total_.load();
  s.calculator_failures_total = calculator_failures_total_.load();
  return s;
}

std::string TelemetryRegistry::prometheus_text(const TelemetrySnapshot& s) const {
  std::ostringstream os;
  os << "gaitkeeper_pipeline_run_ms{quantile=\"0.5\"} " << s.run_p50_ms << "\n";
  os << "gaitkeeper_pipeline_run_ms{quantile=\"0.95\"} " << s.run_p95_ms << "\n";
  os << "gaitkeeper_pipeline_run_ms{quantile=\"0.99\"} " << s.run_p99_ms << "\n";

  os << "gaitkeeper_sessions_total " << s.sessions_total << "\n";
  os << "gaitkeeper_session_failures_total " << s.session_failures_total << "\n";
  os << "gaitkeeper_calculator_failures_total " << s.calculator_failures_total << "\n";
  return os.str();
}
