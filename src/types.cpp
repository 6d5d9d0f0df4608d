#include "types.hpp"

#include <stdexcept>

std::string to_string(Gender g) {
  switch (g) {
    case Gender::MALE:
      return "male";
    case Gender::FEMALE:
      return "female";
    case Gender::OTHER:
    default:
      return "other";
  }
}

std::string to_string(ProcessingStatus s) {
  switch (s) {
    case ProcessingStatus::PENDING:
      return "pending";
    case ProcessingStatus::PROCESSING:
      return "processing";
    case ProcessingStatus::COMPLETED:
      return "completed";
    case ProcessingStatus::FAILED:
    default:
      return "failed";
  }
}

Gender gender_from_string(const std::string& s) {
  if (s == "male") return Gender::MALE;
  if (s == "female") return Gender::FEMALE;
  if (s == "other") return Gender::OTHER;
  throw std::invalid_argument("Unknown gender: " + s);
}

ProcessingStatus status_from_string(const std::string& s) {
  if (s == "pending") return ProcessingStatus::PENDING;
  if (s == "processing") return ProcessingStatus::PROCESSING;
  if (s == "completed") return ProcessingStatus::COMPLETED;
  if (s == "failed") return ProcessingStatus::FAILED;
  throw std::invalid_argument("Unknown processing status: " + s);
}

void validate_profile(const RunnerProfile& p) {
  if (p.height_cm < kMinHeightCm || p.height_cm > kMaxHeightCm) {
    throw std::invalid_argument("height_cm must be within " + std::to_string(kMinHeightCm) + "-" +
                                std::to_string(kMaxHeightCm) + ", got " +
                                std::to_string(p.height_cm));
  }
  if (p.age < kMinAge || p.age > kMaxAge) {
    throw std::invalid_argument("age must be within " + std::to_string(kMinAge) + "-" +
                                std::to_string(kMaxAge) + ", got " + std::to_string(p.age));
  }
}
