#include "landmark_filter.hpp"

#include <spdlog/spdlog.h>

const std::vector<Landmark>& key_running_landmarks() {
  static const std::vector<Landmark> keys{
      Landmark::LEFT_HIP,      Landmark::RIGHT_HIP,     Landmark::LEFT_KNEE,
      Landmark::RIGHT_KNEE,    Landmark::LEFT_ANKLE,    Landmark::RIGHT_ANKLE,
      Landmark::LEFT_SHOULDER, Landmark::RIGHT_SHOULDER};
  return keys;
}

double pose_confidence(const std::vector<PoseLandmark>& landmarks) {
  if (landmarks.empty()) return 0.0;

  const auto& keys = key_running_landmarks();
  double total = 0.0;
  for (Landmark l : keys) {
    const size_t idx = landmark_index(l);
    if (idx < landmarks.size()) total += landmarks[idx].visibility;
  }
  return total / static_cast<double>(keys.size());
}

bool is_valid_pose(const std::vector<PoseLandmark>& landmarks, double min_confidence) {
  if (landmarks.empty()) return false;
  return pose_confidence(landmarks) >= min_confidence;
}

PoseSequence select_usable_frames(const PoseSequence& frames, const FrameFilterConfig& cfg) {
  if (!cfg.enabled) return frames;

  PoseSequence usable;
  usable.reserve(frames.size());
  for (const auto& f : frames) {
    if (is_valid_pose(f.landmarks, cfg.min_confidence)) usable.push_back(f);
  }
  if (usable.size() != frames.size()) {
    spdlog::debug("Frame filter kept {}/{} frames (min confidence {:.2f})", usable.size(),
                  frames.size(), cfg.min_confidence);
  }
  return usable;
}
