#include <chrono>
#include <exception>

#include "calculators.hpp"

using namespace std::chrono;

std::string to_string(MeasurementMethod m) {
  return m == MeasurementMethod::ANATOMICAL_ESTIMATE ? "anatomical_estimate" : "pose_analysis";
}

namespace {

template <typename T>
void take(std::optional<T>& dst, const std::optional<T>& src) {
  if (src) dst = src;
}

}  // namespace

void PartialMetrics::merge(const PartialMetrics& o) {
  take(cadence, o.cadence);
  take(speed, o.speed);
  take(step_length, o.step_length);
  take(stride_length, o.stride_length);
  take(ground_contact_time, o.ground_contact_time);
  take(flight_time, o.flight_time);
  take(vertical_oscillation, o.vertical_oscillation);
  take(forward_lean, o.forward_lean);
  take(left_right_symmetry, o.left_right_symmetry);
  take(center_of_gravity, o.center_of_gravity);
  take(joint_angles, o.joint_angles);

  take(step_count, o.step_count);
  take(left_steps, o.left_steps);
  take(right_steps, o.right_steps);
  take(distance, o.distance);
  take(average_frame_distance, o.average_frame_distance);
  take(stride_count, o.stride_count);
  take(measured_step_count, o.measured_step_count);
  take(measurement_method, o.measurement_method);
  take(contact_flight_ratio, o.contact_flight_ratio);
}

RunningMetrics PartialMetrics::to_running_metrics() const {
  RunningMetrics m;
  m.cadence = cadence.value_or(0.0);
  m.speed = speed.value_or(0.0);
  m.step_length = step_length.value_or(0.0);
  m.stride_length = stride_length.value_or(0.0);
  m.ground_contact_time = ground_contact_time.value_or(0.0);
  m.flight_time = flight_time.value_or(0.0);
  m.vertical_oscillation = vertical_oscillation.value_or(0.0);
  m.forward_lean = forward_lean.value_or(0.0);
  m.left_right_symmetry = left_right_symmetry.value_or(0.0);
  m.center_of_gravity = center_of_gravity.value_or(cv::Point3d(0, 0, 0));
  m.joint_angles = joint_angles.value_or(std::map<std::string, double>{});
  return m;
}

CalculatorOutcome MetricCalculator::run(const PoseSequence& frames,
                                        const CalibrationContext& calib) const {
  CalculatorOutcome outcome;
  outcome.calculator = name();

  const auto t0 = steady_clock::now();
  try {
    outcome.metrics = calculate(frames, calib);
    outcome.ok = true;
  } catch (const std::exception& e) {
    outcome.error = e.what();
  } catch (...) {
    outcome.error = "non-standard exception";
  }
  outcome.duration_ms = duration<double, std::milli>(steady_clock::now() - t0).count();
  return outcome;
}

std::vector<std::unique_ptr<MetricCalculator>> create_default_calculators(
    const RunnerProfile& profile, const CalculatorParams& params) {
  std::vector<std::unique_ptr<MetricCalculator>> calcs;
  calcs.push_back(std::make_unique<CadenceCalculator>(profile, params));
  calcs.push_back(std::make_unique<SpeedCalculator>(profile, params));
  calcs.push_back(std::make_unique<StrideCalculator>(profile, params));
  calcs.push_back(std::make_unique<TimingCalculator>(profile, params));
  calcs.push_back(std::make_unique<VerticalOscillationCalculator>(profile, params));
  calcs.push_back(std::make_unique<LeanAngleCalculator>(profile, params));
  calcs.push_back(std::make_unique<SymmetryCalculator>(profile, params));
  calcs.push_back(std::make_unique<CenterOfGravityCalculator>(profile, params));
  calcs.push_back(std::make_unique<JointAngleCalculator>(profile, params));
  return calcs;
}
