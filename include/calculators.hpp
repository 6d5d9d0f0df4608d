#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "calibration.hpp"
#include "gait_events.hpp"
#include "signal_utils.hpp"
#include "types.hpp"

// Minimum session lengths below which a calculator reports its defaults
constexpr size_t kMinFramesBasic = 10;
constexpr size_t kMinFramesGait = 20;

// Empirical stride/step length to body height ratios
constexpr double kStrideHeightRatio = 0.45;
constexpr double kStepHeightRatio = 0.225;

enum class MeasurementMethod { POSE_ANALYSIS, ANATOMICAL_ESTIMATE };

std::string to_string(MeasurementMethod m);

struct CalculatorParams {
  SmoothingParams smoothing;
  PeakParams peaks;
  // A foot is on the ground while within this fraction of its vertical range
  // from its lowest observed position.
  double contact_threshold_ratio{0.2};
};

// What a single calculator contributes. Unset fields are left to other
// calculators or to the pipeline defaults.
struct PartialMetrics {
  std::optional<double> cadence;
  std::optional<double> speed;
  std::optional<double> step_length;
  std::optional<double> stride_length;
  std::optional<double> ground_contact_time;
  std::optional<double> flight_time;
  std::optional<double> vertical_oscillation;
  std::optional<double> forward_lean;
  std::optional<double> left_right_symmetry;
  std::optional<cv::Point3d> center_of_gravity;
  std::optional<std::map<std::string, double>> joint_angles;

  // Side outputs
  std::optional<int> step_count;
  std::optional<int> left_steps;
  std::optional<int> right_steps;
  std::optional<double> distance;
  std::optional<double> average_frame_distance;
  std::optional<int> stride_count;
  std::optional<int> measured_step_count;
  std::optional<MeasurementMethod> measurement_method;
  std::optional<double> contact_flight_ratio;

  // Fields set in other override ours
  void merge(const PartialMetrics& other);

  // Fills every unset RunningMetrics field with its default (0, empty, origin)
  RunningMetrics to_running_metrics() const;
};

struct CalculatorOutcome {
  std::string calculator;
  bool ok{false};
  std::string error;  // set when !ok
  PartialMetrics metrics;
  double duration_ms{0.0};
};

// One metric family computed over a whole session.
class MetricCalculator {
public:
  MetricCalculator(const RunnerProfile& profile, const CalculatorParams& params)
      : profile_(profile), params_(params) {}
  virtual ~MetricCalculator() = default;

  virtual std::string name() const = 0;

  // Runs calculate() and converts any exception into a failed outcome.
  CalculatorOutcome run(const PoseSequence& frames, const CalibrationContext& calib) const;

protected:
  virtual PartialMetrics calculate(const PoseSequence& frames,
                                   const CalibrationContext& calib) const = 0;

  RunnerProfile profile_;
  CalculatorParams params_;
};

class CadenceCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "cadence"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class SpeedCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "speed"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class StrideCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "stride"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;

private:
  PartialMetrics anatomical_estimate() const;
};

class TimingCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "timing"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class VerticalOscillationCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "vertical_oscillation"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class LeanAngleCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "forward_lean"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class SymmetryCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "symmetry"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class CenterOfGravityCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "center_of_gravity"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

class JointAngleCalculator : public MetricCalculator {
public:
  using MetricCalculator::MetricCalculator;
  std::string name() const override { return "joint_angles"; }

protected:
  PartialMetrics calculate(const PoseSequence& frames,
                           const CalibrationContext& calib) const override;
};

// The nine calculators in pipeline order
std::vector<std::unique_ptr<MetricCalculator>> create_default_calculators(
    const RunnerProfile& profile, const CalculatorParams& params);

// Symmetry score for the given per-foot event counts, in [0, 1]
double symmetry_score(size_t left_count, size_t right_count);
