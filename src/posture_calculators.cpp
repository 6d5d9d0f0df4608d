#include <cmath>

#include "calculators.hpp"

namespace {

struct JointSpec {
  const char* name;
  Landmark proximal;
  Landmark vertex;
  Landmark distal;
};

const JointSpec kJoints[] = {
    {"left_knee", Landmark::LEFT_HIP, Landmark::LEFT_KNEE, Landmark::LEFT_ANKLE},
    {"right_knee", Landmark::RIGHT_HIP, Landmark::RIGHT_KNEE, Landmark::RIGHT_ANKLE},
    {"left_elbow", Landmark::LEFT_SHOULDER, Landmark::LEFT_ELBOW, Landmark::LEFT_WRIST},
    {"right_elbow", Landmark::RIGHT_SHOULDER, Landmark::RIGHT_ELBOW, Landmark::RIGHT_WRIST},
};

const Landmark kCenterOfGravityLandmarks[] = {Landmark::LEFT_HIP,      Landmark::RIGHT_HIP,
                                              Landmark::LEFT_SHOULDER, Landmark::RIGHT_SHOULDER,
                                              Landmark::LEFT_KNEE,     Landmark::RIGHT_KNEE};

// Image "up": y decreases upward
const cv::Point3d kUp(0.0, -1.0, 0.0);

}  // namespace

PartialMetrics LeanAngleCalculator::calculate(const PoseSequence& frames,
                                              const CalibrationContext& /*calib*/) const {
  PartialMetrics out;
  out.forward_lean = 0.0;
  if (frames.size() < kMinFramesBasic) return out;

  std::vector<double> angles;
  for (const auto& f : frames) {
    if (!f.has(Landmark::LEFT_SHOULDER) || !f.has(Landmark::RIGHT_SHOULDER) ||
        !f.has(Landmark::LEFT_HIP) || !f.has(Landmark::RIGHT_HIP)) {
      continue;
    }
    const cv::Point3d shoulders =
        (f.at(Landmark::LEFT_SHOULDER).point() + f.at(Landmark::RIGHT_SHOULDER).point()) * 0.5;
    const cv::Point3d hips =
        (f.at(Landmark::LEFT_HIP).point() + f.at(Landmark::RIGHT_HIP).point()) * 0.5;

    // Angle at the hip center between the trunk and the vertical
    const double angle = angle_at_vertex(shoulders, hips, hips + kUp);
    if (std::isfinite(angle)) angles.push_back(angle);
  }

  out.forward_lean = mean_of(angles);
  return out;
}

PartialMetrics CenterOfGravityCalculator::calculate(const PoseSequence& frames,
                                                    const CalibrationContext& /*calib*/) const {
  PartialMetrics out;
  out.center_of_gravity = cv::Point3d(0, 0, 0);
  if (frames.empty()) return out;

  cv::Point3d sum(0, 0, 0);
  size_t counted = 0;
  for (const auto& f : frames) {
    cv::Point3d frame_sum(0, 0, 0);
    int n = 0;
    for (Landmark l : kCenterOfGravityLandmarks) {
      if (!f.has(l)) continue;
      frame_sum += f.at(l).point();
      ++n;
    }
    if (n == 0) continue;
    sum += frame_sum * (1.0 / n);
    ++counted;
  }

  if (counted > 0) out.center_of_gravity = sum * (1.0 / static_cast<double>(counted));
  return out;
}

PartialMetrics JointAngleCalculator::calculate(const PoseSequence& frames,
                                               const CalibrationContext& /*calib*/) const {
  PartialMetrics out;
  out.joint_angles = std::map<std::string, double>{};
  if (frames.empty()) return out;

  std::map<std::string, std::vector<double>> series;
  for (const auto& joint : kJoints) series[joint.name];

  for (const auto& f : frames) {
    for (const auto& joint : kJoints) {
      if (!f.has(joint.proximal) || !f.has(joint.vertex) || !f.has(joint.distal)) continue;
      const double angle = angle_at_vertex(f.at(joint.proximal).point(), f.at(joint.vertex).point(),
                                           f.at(joint.distal).point());
      if (std::isfinite(angle)) series[joint.name].push_back(angle);
    }
  }

  auto& averages = *out.joint_angles;
  for (const auto& [name, angles] : series) averages[name] = mean_of(angles);
  return out;
}
