#pragma once
#include <string>
#include <vector>

#include "types.hpp"

// Which landmarks' vertical extent is taken as the scale reference
enum class CalibrationReference { HIPS, ANKLES, HIPS_AND_ANKLES };

std::string to_string(CalibrationReference r);
CalibrationReference calibration_reference_from_string(const std::string& s);

struct CalibrationConfig {
  CalibrationReference reference{CalibrationReference::HIPS};
};

// Normalized-units-to-meters scale for one session. Computed once and shared
// read-only by every calculator that reports physical units.
struct CalibrationContext {
  double ratio{0.0};         // meters per normalized unit
  double mean_range{0.0};    // mean vertical range of the reference landmarks
  bool valid{false};

  double to_meters(double normalized) const { return normalized * ratio; }
};

std::vector<Landmark> reference_landmarks(CalibrationReference r);

// ratio = height_m / mean(vertical range of each reference landmark).
// A zero range or non-finite ratio gives an invalid context with ratio 0.
CalibrationContext estimate_calibration(const PoseSequence& frames, const RunnerProfile& profile,
                                        const CalibrationConfig& cfg = CalibrationConfig{});
