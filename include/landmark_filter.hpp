#pragma once
#include <vector>

#include "types.hpp"

struct FrameFilterConfig {
  bool enabled{true};
  double min_confidence{0.5};  // mean visibility over the key running landmarks
};

// Landmarks the running metrics depend on: hips, knees, ankles, shoulders
const std::vector<Landmark>& key_running_landmarks();

// Mean visibility of the key landmarks; a missing landmark counts as zero.
double pose_confidence(const std::vector<PoseLandmark>& landmarks);

bool is_valid_pose(const std::vector<PoseLandmark>& landmarks, double min_confidence);

// Keeps the frames whose pose passes is_valid_pose, preserving order.
PoseSequence select_usable_frames(const PoseSequence& frames, const FrameFilterConfig& cfg);
