#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Landmark indices produced by the upstream pose detector (MediaPipe BlazePose numbering)
enum class Landmark : int {
  NOSE = 0,
  LEFT_EYE_INNER = 1,
  LEFT_EYE = 2,
  LEFT_EYE_OUTER = 3,
  RIGHT_EYE_INNER = 4,
  RIGHT_EYE = 5,
  RIGHT_EYE_OUTER = 6,
  LEFT_EAR = 7,
  RIGHT_EAR = 8,
  MOUTH_LEFT = 9,
  MOUTH_RIGHT = 10,
  LEFT_SHOULDER = 11,
  RIGHT_SHOULDER = 12,
  LEFT_ELBOW = 13,
  RIGHT_ELBOW = 14,
  LEFT_WRIST = 15,
  RIGHT_WRIST = 16,
  LEFT_PINKY = 17,
  RIGHT_PINKY = 18,
  LEFT_INDEX = 19,
  RIGHT_INDEX = 20,
  LEFT_THUMB = 21,
  RIGHT_THUMB = 22,
  LEFT_HIP = 23,
  RIGHT_HIP = 24,
  LEFT_KNEE = 25,
  RIGHT_KNEE = 26,
  LEFT_ANKLE = 27,
  RIGHT_ANKLE = 28,
  LEFT_HEEL = 29,
  RIGHT_HEEL = 30,
  LEFT_FOOT_INDEX = 31,
  RIGHT_FOOT_INDEX = 32
};

constexpr size_t kLandmarkCount = 33;

inline size_t landmark_index(Landmark l) { return static_cast<size_t>(l); }

struct PoseLandmark {
  double x{0}, y{0}, z{0};  // normalized scene coordinates, y grows downward
  double visibility{0};     // 0.0 to 1.0

  cv::Point3d point() const { return {x, y, z}; }
};

struct FramePose {
  int64_t frame_number{0};
  double timestamp{0};  // seconds
  std::vector<PoseLandmark> landmarks;
  double confidence{0};

  bool has(Landmark l) const { return landmark_index(l) < landmarks.size(); }
  const PoseLandmark& at(Landmark l) const { return landmarks.at(landmark_index(l)); }
};

using PoseSequence = std::vector<FramePose>;

enum class Gender { MALE, FEMALE, OTHER };

// Accepted profile ranges
constexpr int kMinHeightCm = 50;
constexpr int kMaxHeightCm = 230;
constexpr int kMinAge = 10;
constexpr int kMaxAge = 125;

struct RunnerProfile {
  Gender gender{Gender::OTHER};
  int height_cm{170};
  int age{30};
  std::optional<std::string> email;

  double height_m() const { return static_cast<double>(height_cm) / 100.0; }
};

// Immutable once stored. Each computation for a session adds a new record.
struct RunningMetrics {
  double cadence{0};                // steps per minute
  double speed{0};                  // m/s
  double step_length{0};            // m
  double stride_length{0};          // m
  double ground_contact_time{0};    // s
  double flight_time{0};            // s
  double vertical_oscillation{0};   // m
  double forward_lean{0};           // degrees from vertical
  double left_right_symmetry{0};    // 0..1
  cv::Point3d center_of_gravity{0, 0, 0};
  std::map<std::string, double> joint_angles;  // joint name -> mean degrees
};

enum class ProcessingStatus { PENDING, PROCESSING, COMPLETED, FAILED };

struct SessionRecord {
  std::string id;
  RunnerProfile profile;
  ProcessingStatus status{ProcessingStatus::PENDING};
  std::optional<std::string> error_message;
};

std::string to_string(Gender g);
std::string to_string(ProcessingStatus s);
Gender gender_from_string(const std::string& s);
ProcessingStatus status_from_string(const std::string& s);

// Throws std::invalid_argument when height or age is outside the accepted range
void validate_profile(const RunnerProfile& p);
