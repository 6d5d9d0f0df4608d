#include "calculators.hpp"

namespace {

Track hip_center_track(const PoseSequence& frames) {
  return midpoint_track(landmark_track(frames, Landmark::LEFT_HIP),
                        landmark_track(frames, Landmark::RIGHT_HIP));
}

}  // namespace

PartialMetrics SpeedCalculator::calculate(const PoseSequence& frames,
                                          const CalibrationContext& calib) const {
  PartialMetrics out;
  out.speed = 0.0;
  out.distance = 0.0;
  if (frames.size() < kMinFramesBasic || !calib.valid) return out;

  const Track hips = smooth_track(hip_center_track(frames), params_.smoothing);

  std::vector<double> frame_distances;
  frame_distances.reserve(hips.size());
  for (size_t i = 1; i < hips.size(); ++i) {
    frame_distances.push_back(calib.to_meters(distance(hips[i - 1], hips[i])));
  }

  double total_distance = 0.0;
  for (double d : frame_distances) total_distance += d;

  const double total_time = elapsed_seconds(frames);
  out.speed = total_time > 0.0 ? total_distance / total_time : 0.0;
  out.distance = total_distance;
  out.average_frame_distance = mean_of(frame_distances);
  return out;
}

PartialMetrics VerticalOscillationCalculator::calculate(const PoseSequence& frames,
                                                        const CalibrationContext& calib) const {
  PartialMetrics out;
  out.vertical_oscillation = 0.0;
  if (frames.size() < kMinFramesBasic || !calib.valid) return out;

  const std::vector<double> y = smooth(axis_values(hip_center_track(frames), 1), params_.smoothing);
  out.vertical_oscillation = calib.to_meters(stddev_of(y));
  return out;
}
