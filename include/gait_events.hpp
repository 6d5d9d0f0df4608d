#pragma once
#include <vector>

#include "signal_utils.hpp"
#include "types.hpp"

struct PeakParams {
  double min_prominence{0.01};  // normalized units
  int min_distance{5};          // frames between accepted peaks
};

// Local maxima of x, filtered by spacing then prominence.
// Plateaus resolve to their middle sample; the first and last samples are never peaks.
std::vector<int> find_peaks(const std::vector<double>& x, const PeakParams& p);

// Prominence of each peak: height above the higher of the two surrounding bases
std::vector<double> peak_prominences(const std::vector<double>& x, const std::vector<int>& peaks);

enum class Foot { LEFT, RIGHT };

struct FootContact {
  int frame{0};
  Foot foot{Foot::LEFT};
};

struct GaitEvents {
  std::vector<int> left;   // frame indices of left-foot contacts
  std::vector<int> right;  // frame indices of right-foot contacts
  std::vector<double> left_y;   // smoothed ankle heights the events were found on
  std::vector<double> right_y;

  size_t total() const { return left.size() + right.size(); }

  // Both feet merged into one chronological list
  std::vector<FootContact> chronological() const;
};

// Ground contacts for one foot: extrema of the smoothed vertical trajectory
std::vector<int> detect_foot_contacts(const std::vector<double>& smoothed_y, const PeakParams& p);

// Smooths both ankle tracks' y and detects each foot's contacts
GaitEvents detect_gait_events(const PoseSequence& frames, const SmoothingParams& smoothing,
                              const PeakParams& peaks);
