#include "gait_events.hpp"

#include <algorithm>
#include <numeric>

namespace {

std::vector<int> local_maxima(const std::vector<double>& x) {
  std::vector<int> peaks;
  const int n = static_cast<int>(x.size());
  const int i_max = n - 1;

  int i = 1;
  while (i < i_max) {
    if (x[i - 1] < x[i]) {
      int ahead = i + 1;
      while (ahead < i_max && x[ahead] == x[i]) ++ahead;

      if (x[ahead] < x[i]) {
        const int left_edge = i;
        const int right_edge = ahead - 1;
        peaks.push_back((left_edge + right_edge) / 2);
        i = ahead;
      }
    }
    ++i;
  }
  return peaks;
}

// Drops peaks closer than min_distance to a higher one
std::vector<int> select_by_distance(const std::vector<double>& x, const std::vector<int>& peaks,
                                    int min_distance) {
  if (min_distance <= 1 || peaks.size() < 2) return peaks;

  std::vector<size_t> order(peaks.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return x[peaks[a]] < x[peaks[b]]; });

  std::vector<bool> keep(peaks.size(), true);
  for (auto it = order.rbegin(); it != order.rend(); ++it) {
    const size_t j = *it;
    if (!keep[j]) continue;

    for (size_t k = j; k-- > 0 && peaks[j] - peaks[k] < min_distance;) keep[k] = false;
    for (size_t k = j + 1; k < peaks.size() && peaks[k] - peaks[j] < min_distance; ++k) {
      keep[k] = false;
    }
  }

  std::vector<int> kept;
  for (size_t i = 0; i < peaks.size(); ++i) {
    if (keep[i]) kept.push_back(peaks[i]);
  }
  return kept;
}

}  // namespace

std::vector<double> peak_prominences(const std::vector<double>& x, const std::vector<int>& peaks) {
  std::vector<double> prominences;
  prominences.reserve(peaks.size());
  const int n = static_cast<int>(x.size());

  for (int peak : peaks) {
    const double height = x[peak];

    double left_min = height;
    for (int i = peak; i >= 0 && x[i] <= height; --i) left_min = std::min(left_min, x[i]);

    double right_min = height;
    for (int i = peak; i < n && x[i] <= height; ++i) right_min = std::min(right_min, x[i]);

    prominences.push_back(height - std::max(left_min, right_min));
  }
  return prominences;
}

std::vector<int> find_peaks(const std::vector<double>& x, const PeakParams& p) {
  if (x.size() < 3) return {};

  std::vector<int> peaks = select_by_distance(x, local_maxima(x), p.min_distance);
  if (p.min_prominence <= 0.0) return peaks;

  const auto prominences = peak_prominences(x, peaks);
  std::vector<int> kept;
  for (size_t i = 0; i < peaks.size(); ++i) {
    if (prominences[i] >= p.min_prominence) kept.push_back(peaks[i]);
  }
  return kept;
}

std::vector<FootContact> GaitEvents::chronological() const {
  std::vector<FootContact> all;
  all.reserve(total());
  for (int f : left) all.push_back({f, Foot::LEFT});
  for (int f : right) all.push_back({f, Foot::RIGHT});
  std::sort(all.begin(), all.end(), [](const FootContact& a, const FootContact& b) {
    if (a.frame != b.frame) return a.frame < b.frame;
    return a.foot == Foot::LEFT && b.foot == Foot::RIGHT;
  });
  return all;
}

std::vector<int> detect_foot_contacts(const std::vector<double>& smoothed_y, const PeakParams& p) {
  // Events sit at the minima of y, i.e. the maxima of -y
  std::vector<double> inverted(smoothed_y.size());
  std::transform(smoothed_y.begin(), smoothed_y.end(), inverted.begin(),
                 [](double v) { return -v; });
  return find_peaks(inverted, p);
}

GaitEvents detect_gait_events(const PoseSequence& frames, const SmoothingParams& smoothing,
                              const PeakParams& peaks) {
  GaitEvents events;
  events.left_y = smooth(axis_values(landmark_track(frames, Landmark::LEFT_ANKLE), 1), smoothing);
  events.right_y = smooth(axis_values(landmark_track(frames, Landmark::RIGHT_ANKLE), 1), smoothing);
  events.left = detect_foot_contacts(events.left_y, peaks);
  events.right = detect_foot_contacts(events.right_y, peaks);
  return events;
}
