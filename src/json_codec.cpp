#include "json_codec.hpp"

using nlohmann::json;

void to_json(json& j, Gender g) { j = to_string(g); }
void from_json(const json& j, Gender& g) { g = gender_from_string(j.get<std::string>()); }

void to_json(json& j, ProcessingStatus s) { j = to_string(s); }
void from_json(const json& j, ProcessingStatus& s) {
  s = status_from_string(j.get<std::string>());
}

void to_json(json& j, const PoseLandmark& lm) {
  j = json{{"x", lm.x}, {"y", lm.y}, {"z", lm.z}, {"visibility", lm.visibility}};
}

void from_json(const json& j, PoseLandmark& lm) {
  j.at("x").get_to(lm.x);
  j.at("y").get_to(lm.y);
  j.at("z").get_to(lm.z);
  lm.visibility = j.value("visibility", 0.0);
}

void to_json(json& j, const FramePose& f) {
  j = json{{"frame_number", f.frame_number},
           {"timestamp", f.timestamp},
           {"landmarks", f.landmarks},
           {"confidence", f.confidence}};
}

void from_json(const json& j, FramePose& f) {
  j.at("frame_number").get_to(f.frame_number);
  j.at("timestamp").get_to(f.timestamp);
  j.at("landmarks").get_to(f.landmarks);
  f.confidence = j.value("confidence", 0.0);
}

void to_json(json& j, const RunnerProfile& p) {
  j = json{{"gender", p.gender}, {"height_cm", p.height_cm}, {"age", p.age}};
  if (p.email) j["email"] = *p.email;
}

void from_json(const json& j, RunnerProfile& p) {
  j.at("gender").get_to(p.gender);
  j.at("height_cm").get_to(p.height_cm);
  j.at("age").get_to(p.age);
  if (j.contains("email") && !j["email"].is_null()) {
    p.email = j["email"].get<std::string>();
  } else {
    p.email.reset();
  }
  validate_profile(p);
}

void to_json(json& j, const SessionRecord& s) {
  j = json{{"id", s.id}, {"runner_profile", s.profile}, {"status", s.status}};
  if (s.error_message) j["error_message"] = *s.error_message;
}

void from_json(const json& j, SessionRecord& s) {
  j.at("id").get_to(s.id);
  j.at("runner_profile").get_to(s.profile);
  s.status = j.contains("status") ? j["status"].get<ProcessingStatus>()
                                  : ProcessingStatus::PENDING;
  if (j.contains("error_message") && !j["error_message"].is_null()) {
    s.error_message = j["error_message"].get<std::string>();
  } else {
    s.error_message.reset();
  }
}

void to_json(json& j, const RunningMetrics& m) {
  j = json{{"cadence", m.cadence},
           {"speed", m.speed},
           {"step_length", m.step_length},
           {"stride_length", m.stride_length},
           {"ground_contact_time", m.ground_contact_time},
           {"flight_time", m.flight_time},
           {"vertical_oscillation", m.vertical_oscillation},
           {"forward_lean", m.forward_lean},
           {"left_right_symmetry", m.left_right_symmetry},
           {"center_of_gravity",
            {{"x", m.center_of_gravity.x},
             {"y", m.center_of_gravity.y},
             {"z", m.center_of_gravity.z}}},
           {"joint_angles", m.joint_angles}};
}

void from_json(const json& j, RunningMetrics& m) {
  j.at("cadence").get_to(m.cadence);
  j.at("speed").get_to(m.speed);
  j.at("step_length").get_to(m.step_length);
  j.at("stride_length").get_to(m.stride_length);
  j.at("ground_contact_time").get_to(m.ground_contact_time);
  j.at("flight_time").get_to(m.flight_time);
  j.at("vertical_oscillation").get_to(m.vertical_oscillation);
  j.at("forward_lean").get_to(m.forward_lean);
  j.at("left_right_symmetry").get_to(m.left_right_symmetry);
  const auto& cog = j.at("center_of_gravity");
  m.center_of_gravity = cv::Point3d(cog.at("x").get<double>(), cog.at("y").get<double>(),
                                    cog.at("z").get<double>());
  m.joint_angles = j.at("joint_angles").get<std::map<std::string, double>>();
}
