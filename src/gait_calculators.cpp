// Calculators built on per-foot gait events: cadence, stride/step length,
// contact/flight timing and left/right symmetry.

#include <algorithm>
#include <cstdlib>

#include "calculators.hpp"

namespace {

// Frames where the foot is within threshold_ratio of its range from the ground.
// y grows downward, so the ground is the largest observed y.
std::vector<bool> contact_mask(const std::vector<double>& y, double threshold_ratio) {
  std::vector<bool> mask(y.size(), false);
  if (y.empty()) return mask;

  const auto [lo, hi] = std::minmax_element(y.begin(), y.end());
  const double range = *hi - *lo;
  if (range <= 0.0) return mask;

  const double threshold = threshold_ratio * range;
  for (size_t i = 0; i < y.size(); ++i) mask[i] = (*hi - y[i]) <= threshold;
  return mask;
}

// Durations of maximal runs of `true` in [begin, end). A run ending at frame e
// lasts until the timestamp of frame e + 1.
std::vector<double> run_durations(const std::vector<bool>& mask, const std::vector<double>& ts,
                                  size_t begin, size_t end) {
  std::vector<double> durations;
  size_t i = begin;
  while (i < end) {
    if (!mask[i]) {
      ++i;
      continue;
    }
    const size_t start = i;
    while (i < end && mask[i]) ++i;
    const size_t stop = std::min(i, ts.size() - 1);
    if (ts[stop] > ts[start]) durations.push_back(ts[stop] - ts[start]);
  }
  return durations;
}

std::vector<double> contact_intervals(const std::vector<int>& events,
                                      const std::vector<bool>& mask,
                                      const std::vector<double>& ts) {
  std::vector<double> intervals;
  for (size_t i = 0; i + 1 < events.size(); ++i) {
    auto d = run_durations(mask, ts, static_cast<size_t>(events[i]),
                           static_cast<size_t>(events[i + 1]));
    intervals.insert(intervals.end(), d.begin(), d.end());
  }
  return intervals;
}

}  // namespace

double symmetry_score(size_t left_count, size_t right_count) {
  const size_t total = left_count + right_count;
  if (total == 0) return 0.0;

  const double diff = std::abs(static_cast<double>(left_count) - static_cast<double>(right_count));
  return std::max(0.0, 1.0 - diff / static_cast<double>(total));
}

PartialMetrics CadenceCalculator::calculate(const PoseSequence& frames,
                                            const CalibrationContext& /*calib*/) const {
  PartialMetrics out;
  out.cadence = 0.0;
  out.step_count = 0;
  if (frames.size() < kMinFramesBasic) return out;

  const double total_time = elapsed_seconds(frames);
  if (total_time <= 0.0) return out;

  const GaitEvents events = detect_gait_events(frames, params_.smoothing, params_.peaks);
  const auto steps = static_cast<int>(events.total());

  out.cadence = static_cast<double>(steps) / total_time * 60.0;
  out.step_count = steps;
  out.left_steps = static_cast<int>(events.left.size());
  out.right_steps = static_cast<int>(events.right.size());
  return out;
}

PartialMetrics StrideCalculator::anatomical_estimate() const {
  PartialMetrics out;
  out.stride_length = profile_.height_m() * kStrideHeightRatio;
  out.step_length = profile_.height_m() * kStepHeightRatio;
  out.measurement_method = MeasurementMethod::ANATOMICAL_ESTIMATE;
  return out;
}

PartialMetrics StrideCalculator::calculate(const PoseSequence& frames,
                                           const CalibrationContext& calib) const {
  if (frames.size() < kMinFramesGait) {
    PartialMetrics out;
    out.stride_length = 0.0;
    out.step_length = 0.0;
    return out;
  }

  const Track left = smooth_track(landmark_track(frames, Landmark::LEFT_ANKLE), params_.smoothing);
  const Track right =
      smooth_track(landmark_track(frames, Landmark::RIGHT_ANKLE), params_.smoothing);

  GaitEvents events;
  events.left = detect_foot_contacts(axis_values(left, 1), params_.peaks);
  events.right = detect_foot_contacts(axis_values(right, 1), params_.peaks);

  if (events.left.size() < 2 || events.right.size() < 2 || !calib.valid) {
    return anatomical_estimate();
  }

  std::vector<double> strides;
  auto add_strides = [&strides](const std::vector<int>& contacts, const Track& track) {
    for (size_t i = 0; i + 1 < contacts.size(); ++i) {
      strides.push_back(distance(track[contacts[i]], track[contacts[i + 1]]));
    }
  };
  add_strides(events.left, left);
  add_strides(events.right, right);

  std::vector<double> steps;
  const auto contacts = events.chronological();
  for (size_t i = 0; i + 1 < contacts.size(); ++i) {
    const FootContact& a = contacts[i];
    const FootContact& b = contacts[i + 1];
    if (a.foot == b.foot) continue;
    const cv::Point3d& pa = (a.foot == Foot::LEFT ? left : right)[a.frame];
    const cv::Point3d& pb = (b.foot == Foot::LEFT ? left : right)[b.frame];
    steps.push_back(distance(pa, pb));
  }

  PartialMetrics out;
  out.stride_length = strides.empty() ? 0.0 : calib.to_meters(mean_of(strides));
  out.step_length = steps.empty() ? 0.0 : calib.to_meters(mean_of(steps));
  out.stride_count = static_cast<int>(strides.size());
  out.measured_step_count = static_cast<int>(steps.size());
  out.measurement_method = MeasurementMethod::POSE_ANALYSIS;
  return out;
}

PartialMetrics TimingCalculator::calculate(const PoseSequence& frames,
                                           const CalibrationContext& /*calib*/) const {
  PartialMetrics out;
  out.ground_contact_time = 0.0;
  out.flight_time = 0.0;
  out.contact_flight_ratio = 0.0;
  if (frames.size() < kMinFramesGait) return out;

  const std::vector<double> ts = timestamps(frames);
  const GaitEvents events = detect_gait_events(frames, params_.smoothing, params_.peaks);
  if (events.total() == 0) return out;

  const auto left_contact = contact_mask(events.left_y, params_.contact_threshold_ratio);
  const auto right_contact = contact_mask(events.right_y, params_.contact_threshold_ratio);

  std::vector<double> contacts = contact_intervals(events.left, left_contact, ts);
  const auto right_intervals = contact_intervals(events.right, right_contact, ts);
  contacts.insert(contacts.end(), right_intervals.begin(), right_intervals.end());

  // Flight: neither foot on the ground, between the first and last gait event
  const auto all = events.chronological();
  const auto span_begin = static_cast<size_t>(all.front().frame);
  const auto span_end = static_cast<size_t>(all.back().frame);
  std::vector<bool> airborne(ts.size(), false);
  for (size_t i = 0; i < ts.size(); ++i) airborne[i] = !left_contact[i] && !right_contact[i];
  const std::vector<double> flights = run_durations(airborne, ts, span_begin, span_end);

  const double gct = mean_of(contacts);
  const double flight = mean_of(flights);
  out.ground_contact_time = gct;
  out.flight_time = flight;
  out.contact_flight_ratio = flight > 0.0 ? gct / flight : 0.0;
  return out;
}

PartialMetrics SymmetryCalculator::calculate(const PoseSequence& frames,
                                             const CalibrationContext& /*calib*/) const {
  PartialMetrics out;
  out.left_right_symmetry = 0.0;
  if (frames.size() < kMinFramesGait) return out;

  const GaitEvents events = detect_gait_events(frames, params_.smoothing, params_.peaks);
  if (events.total() == 0) return out;

  out.left_right_symmetry = symmetry_score(events.left.size(), events.right.size());
  out.left_steps = static_cast<int>(events.left.size());
  out.right_steps = static_cast<int>(events.right.size());
  return out;
}
