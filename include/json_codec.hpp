#pragma once
#include <nlohmann/json.hpp>

#include "types.hpp"

// nlohmann/json bindings for the domain types (found through ADL)

void to_json(nlohmann::json& j, Gender g);
void from_json(const nlohmann::json& j, Gender& g);

void to_json(nlohmann::json& j, ProcessingStatus s);
void from_json(const nlohmann::json& j, ProcessingStatus& s);

void to_json(nlohmann::json& j, const PoseLandmark& lm);
void from_json(const nlohmann::json& j, PoseLandmark& lm);

void to_json(nlohmann::json& j, const FramePose& f);
void from_json(const nlohmann::json& j, FramePose& f);

void to_json(nlohmann::json& j, const RunnerProfile& p);
void from_json(const nlohmann::json& j, RunnerProfile& p);

void to_json(nlohmann::json& j, const SessionRecord& s);
void from_json(const nlohmann::json& j, SessionRecord& s);

// center_of_gravity is written as {"x":..,"y":..,"z":..}, joint_angles as a flat object
void to_json(nlohmann::json& j, const RunningMetrics& m);
void from_json(const nlohmann::json& j, RunningMetrics& m);
