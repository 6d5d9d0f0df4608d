#pragma once
#include <memory>
#include <string>
#include <vector>

#include "calculators.hpp"
#include "calibration.hpp"
#include "types.hpp"

struct PipelineConfig {
  CalculatorParams calculator;
  CalibrationConfig calibration;
  bool parallel{false};  // one thread per calculator
  size_t max_threads{0};  // 0 means no cap; calculators past the cap run on the caller's thread
};

struct CalculatorFailure {
  std::string calculator;
  std::string reason;
};

struct PipelineReport {
  RunningMetrics metrics;
  PartialMetrics details;  // merged calculator outputs, side outputs included
  CalibrationContext calibration;
  std::vector<CalculatorFailure> failures;
  double run_ms{0.0};
};

// Runs every metric calculator over one session and merges their results.
// A failing calculator only loses its own fields, which fall back to defaults.
class MetricsPipeline {
public:
  explicit MetricsPipeline(const RunnerProfile& profile, PipelineConfig cfg = PipelineConfig{});
  MetricsPipeline(const RunnerProfile& profile, PipelineConfig cfg,
                  std::vector<std::unique_ptr<MetricCalculator>> calculators);

  RunningMetrics run(const PoseSequence& frames) const;
  PipelineReport run_detailed(const PoseSequence& frames) const;

  std::vector<std::string> calculator_names() const;
  const PipelineConfig& config() const { return cfg_; }

private:
  std::vector<CalculatorOutcome> run_sequential(const PoseSequence& frames,
                                                const CalibrationContext& calib) const;
  std::vector<CalculatorOutcome> run_parallel(const PoseSequence& frames,
                                              const CalibrationContext& calib) const;

  RunnerProfile profile_;
  PipelineConfig cfg_;
  std::vector<std::unique_ptr<MetricCalculator>> calculators_;
};
