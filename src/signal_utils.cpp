#include "signal_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

std::vector<double> savgol_coefficients(int window, int order) {
  const int half = window / 2;

  // Least-squares fit of a polynomial of the given order over the window;
  // the first row of the pseudo-inverse evaluates the fit at the centre.
  cv::Mat A(window, order + 1, CV_64F);
  for (int i = 0; i < window; ++i) {
    const double t = static_cast<double>(i - half);
    double p = 1.0;
    for (int k = 0; k <= order; ++k) {
      A.at<double>(i, k) = p;
      p *= t;
    }
  }

  cv::Mat pinv;
  cv::invert(A, pinv, cv::DECOMP_SVD);

  std::vector<double> coeffs(static_cast<size_t>(window));
  for (int i = 0; i < window; ++i) coeffs[static_cast<size_t>(i)] = pinv.at<double>(0, i);
  return coeffs;
}

std::vector<double> smooth(const std::vector<double>& series, int window, int order) {
  if (window <= 0 || series.size() < static_cast<size_t>(window)) return series;

  if (window % 2 == 0) window += 1;
  if (order < 0 || order >= window) return series;

  const std::vector<double> coeffs = savgol_coefficients(window, order);
  const int n = static_cast<int>(series.size());
  const int half = window / 2;

  std::vector<double> out(series.size(), 0.0);
  for (int i = 0; i < n; ++i) {
    double acc = 0.0;
    for (int k = 0; k < window; ++k) {
      const int src = std::clamp(i + k - half, 0, n - 1);
      acc += coeffs[static_cast<size_t>(k)] * series[static_cast<size_t>(src)];
    }
    out[static_cast<size_t>(i)] = acc;
  }
  return out;
}

std::vector<double> smooth(const std::vector<double>& series, const SmoothingParams& p) {
  return smooth(series, p.window, p.order);
}

Track landmark_track(const PoseSequence& frames, Landmark landmark) {
  Track track;
  track.reserve(frames.size());
  for (const auto& f : frames) {
    if (f.has(landmark)) {
      track.push_back(f.at(landmark).point());
    } else {
      track.emplace_back(0.0, 0.0, 0.0);
    }
  }
  return track;
}

Track midpoint_track(const Track& a, const Track& b) {
  const size_t n = std::min(a.size(), b.size());
  Track mid(n);
  for (size_t i = 0; i < n; ++i) mid[i] = (a[i] + b[i]) * 0.5;
  return mid;
}

std::vector<double> axis_values(const Track& track, int axis) {
  std::vector<double> v;
  v.reserve(track.size());
  for (const auto& p : track) {
    v.push_back(axis == 0 ? p.x : (axis == 1 ? p.y : p.z));
  }
  return v;
}

Track smooth_track(const Track& track, const SmoothingParams& p) {
  const auto xs = smooth(axis_values(track, 0), p);
  const auto ys = smooth(axis_values(track, 1), p);
  const auto zs = smooth(axis_values(track, 2), p);

  Track out(track.size());
  for (size_t i = 0; i < track.size(); ++i) out[i] = cv::Point3d(xs[i], ys[i], zs[i]);
  return out;
}

std::vector<double> timestamps(const PoseSequence& frames) {
  std::vector<double> ts;
  ts.reserve(frames.size());
  for (const auto& f : frames) ts.push_back(f.timestamp);
  return ts;
}

double elapsed_seconds(const PoseSequence& frames) {
  if (frames.size() < 2) return 0.0;
  return frames.back().timestamp - frames.front().timestamp;
}

double distance(const cv::Point3d& p1, const cv::Point3d& p2) { return cv::norm(p1 - p2); }

double angle_at_vertex(const cv::Point3d& p1, const cv::Point3d& p2, const cv::Point3d& p3) {
  const cv::Point3d v1 = p1 - p2;
  const cv::Point3d v2 = p3 - p2;
  const double n1 = cv::norm(v1);
  const double n2 = cv::norm(v2);
  if (n1 == 0.0 || n2 == 0.0) return std::numeric_limits<double>::quiet_NaN();

  const double cos_angle = std::clamp(v1.dot(v2) / (n1 * n2), -1.0, 1.0);
  return std::acos(cos_angle) * 180.0 / CV_PI;
}

double mean_of(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  cv::Scalar mean = cv::mean(v);
  return mean[0];
}

double stddev_of(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  cv::Scalar mean, stddev;
  cv::meanStdDev(v, mean, stddev);
  return stddev[0];
}

double value_range(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  const auto [lo, hi] = std::minmax_element(v.begin(), v.end());
  return *hi - *lo;
}
