#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>

using namespace std::chrono;

MetricsPipeline::MetricsPipeline(const RunnerProfile& profile, PipelineConfig cfg)
    : MetricsPipeline(profile, cfg, create_default_calculators(profile, cfg.calculator)) {}

MetricsPipeline::MetricsPipeline(const RunnerProfile& profile, PipelineConfig cfg,
                                 std::vector<std::unique_ptr<MetricCalculator>> calculators)
    : profile_(profile), cfg_(std::move(cfg)), calculators_(std::move(calculators)) {
  validate_profile(profile_);
}

RunningMetrics MetricsPipeline::run(const PoseSequence& frames) const {
  return run_detailed(frames).metrics;
}

PipelineReport MetricsPipeline::run_detailed(const PoseSequence& frames) const {
  const auto t0 = steady_clock::now();
  PipelineReport report;
  report.calibration = estimate_calibration(frames, profile_, cfg_.calibration);
  if (!report.calibration.valid) {
    spdlog::warn("Calibration unavailable for {} frames; physical-unit metrics use fallbacks",
                 frames.size());
  }

  const auto outcomes = cfg_.parallel ? run_parallel(frames, report.calibration)
                                      : run_sequential(frames, report.calibration);

  // Merge in registration order so parallel and sequential runs agree
  for (const auto& o : outcomes) {
    if (!o.ok) {
      spdlog::warn("Calculator '{}' failed: {}", o.calculator, o.error);
      report.failures.push_back({o.calculator, o.error});
      continue;
    }
    spdlog::debug("Calculator '{}' finished in {:.3f} ms", o.calculator, o.duration_ms);
    report.details.merge(o.metrics);
  }

  report.metrics = report.details.to_running_metrics();
  report.run_ms = duration<double, std::milli>(steady_clock::now() - t0).count();

  spdlog::info("Pipeline processed {} frames in {:.2f} ms ({} of {} calculators succeeded)",
               frames.size(), report.run_ms, calculators_.size() - report.failures.size(),
               calculators_.size());
  return report;
}

std::vector<CalculatorOutcome> MetricsPipeline::run_sequential(
    const PoseSequence& frames, const CalibrationContext& calib) const {
  std::vector<CalculatorOutcome> outcomes;
  outcomes.reserve(calculators_.size());
  for (const auto& calc : calculators_) outcomes.push_back(calc->run(frames, calib));
  return outcomes;
}

std::vector<CalculatorOutcome> MetricsPipeline::run_parallel(
    const PoseSequence& frames, const CalibrationContext& calib) const {
  std::vector<CalculatorOutcome> outcomes(calculators_.size());
  std::vector<std::thread> workers;
  workers.reserve(calculators_.size());

  // Each worker writes only its own slot; inputs are shared read-only
  const size_t limit = cfg_.max_threads == 0
                           ? calculators_.size()
                           : std::min(cfg_.max_threads, calculators_.size());
  size_t spawned = 0;
  try {
    for (; spawned < limit; ++spawned) {
      const size_t i = spawned;
      workers.emplace_back([this, i, &frames, &calib, &outcomes] {
        outcomes[i] = calculators_[i]->run(frames, calib);
      });
    }
  } catch (const std::system_error& e) {
    spdlog::warn("Could only start {} of {} calculator threads ({}); running the rest inline",
                 spawned, calculators_.size(), e.what());
  }
  for (size_t i = spawned; i < calculators_.size(); ++i) {
    outcomes[i] = calculators_[i]->run(frames, calib);
  }
  for (auto& w : workers) w.join();
  return outcomes;
}

std::vector<std::string> MetricsPipeline::calculator_names() const {
  std::vector<std::string> names;
  names.reserve(calculators_.size());
  for (const auto& c : calculators_) names.push_back(c->name());
  return names;
}
