#include "calibration.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

#include "signal_utils.hpp"

std::string to_string(CalibrationReference r) {
  switch (r) {
    case CalibrationReference::ANKLES:
      return "ankles";
    case CalibrationReference::HIPS_AND_ANKLES:
      return "hips_and_ankles";
    case CalibrationReference::HIPS:
    default:
      return "hips";
  }
}

CalibrationReference calibration_reference_from_string(const std::string& s) {
  if (s == "hips") return CalibrationReference::HIPS;
  if (s == "ankles") return CalibrationReference::ANKLES;
  if (s == "hips_and_ankles") return CalibrationReference::HIPS_AND_ANKLES;
  throw std::invalid_argument("Unknown calibration reference: " + s);
}

std::vector<Landmark> reference_landmarks(CalibrationReference r) {
  switch (r) {
    case CalibrationReference::ANKLES:
      return {Landmark::LEFT_ANKLE, Landmark::RIGHT_ANKLE};
    case CalibrationReference::HIPS_AND_ANKLES:
      return {Landmark::LEFT_HIP, Landmark::RIGHT_HIP, Landmark::LEFT_ANKLE,
              Landmark::RIGHT_ANKLE};
    case CalibrationReference::HIPS:
    default:
      return {Landmark::LEFT_HIP, Landmark::RIGHT_HIP};
  }
}

CalibrationContext estimate_calibration(const PoseSequence& frames, const RunnerProfile& profile,
                                        const CalibrationConfig& cfg) {
  CalibrationContext ctx;
  if (frames.empty()) return ctx;

  std::vector<double> ranges;
  for (Landmark l : reference_landmarks(cfg.reference)) {
    ranges.push_back(value_range(axis_values(landmark_track(frames, l), 1)));
  }
  ctx.mean_range = mean_of(ranges);

  if (ctx.mean_range <= 0.0) {
    spdlog::debug("Calibration: reference landmarks ({}) show no vertical range",
                  to_string(cfg.reference));
    return ctx;
  }

  const double ratio = profile.height_m() / ctx.mean_range;
  if (!std::isfinite(ratio) || ratio <= 0.0) {
    spdlog::debug("Calibration: rejected ratio {} (height {} cm)", ratio, profile.height_cm);
    return ctx;
  }

  ctx.ratio = ratio;
  ctx.valid = true;
  return ctx;
}
