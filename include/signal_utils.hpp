#pragma once
#include <opencv2/core.hpp>
#include <vector>

#include "types.hpp"

// One landmark's (x, y, z) position per frame
using Track = std::vector<cv::Point3d>;

struct SmoothingParams {
  int window{5};
  int order{3};
};

// Savitzky-Golay smoothing with nearest-sample edge padding.
// Series shorter than the window, or an order that does not fit the window,
// are returned unchanged. An even window is widened by one sample.
std::vector<double> smooth(const std::vector<double>& series, int window = 5, int order = 3);
std::vector<double> smooth(const std::vector<double>& series, const SmoothingParams& p);

// Savitzky-Golay weights for the centre sample of an odd window
std::vector<double> savgol_coefficients(int window, int order);

// Landmark position for every frame; frames without the landmark yield (0,0,0).
Track landmark_track(const PoseSequence& frames, Landmark landmark);

// Per-frame midpoint of two tracks of equal length
Track midpoint_track(const Track& a, const Track& b);

// Smooths x, y and z independently
Track smooth_track(const Track& track, const SmoothingParams& p);

std::vector<double> axis_values(const Track& track, int axis);

std::vector<double> timestamps(const PoseSequence& frames);

// Last timestamp minus first, 0 for fewer than two frames
double elapsed_seconds(const PoseSequence& frames);

double distance(const cv::Point3d& p1, const cv::Point3d& p2);

// Angle in degrees at p2 formed by p1-p2-p3. The cosine is clamped to [-1, 1].
// Returns NaN when either arm has zero length.
double angle_at_vertex(const cv::Point3d& p1, const cv::Point3d& p2, const cv::Point3d& p3);

double mean_of(const std::vector<double>& v);

// Population standard deviation
double stddev_of(const std::vector<double>& v);

// max - min, 0 for an empty series
double value_range(const std::vector<double>& v);
