#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["pipeline"]) {
    auto n = y["pipeline"];
    auto& calc = c.service.pipeline.calculator;
    if (n["smoothing_window"]) calc.smoothing.window = n["smoothing_window"].as<int>();
    if (n["smoothing_order"]) calc.smoothing.order = n["smoothing_order"].as<int>();
    if (n["min_peak_prominence"])
      calc.peaks.min_prominence = n["min_peak_prominence"].as<double>();
    if (n["min_peak_distance"]) calc.peaks.min_distance = n["min_peak_distance"].as<int>();
    if (n["contact_threshold_ratio"])
      calc.contact_threshold_ratio = n["contact_threshold_ratio"].as<double>();
    if (n["parallel"]) c.service.pipeline.parallel = n["parallel"].as<bool>();
    if (n["max_threads"]) c.service.pipeline.max_threads = n["max_threads"].as<size_t>();
  }
  if (y["calibration"] && y["calibration"]["reference"]) {
    c.service.pipeline.calibration.reference =
        calibration_reference_from_string(y["calibration"]["reference"].as<std::string>());
  }
  if (y["frame_filter"]) {
    auto n = y["frame_filter"];
    if (n["enabled"]) c.service.frame_filter.enabled = n["enabled"].as<bool>();
    if (n["min_confidence"])
      c.service.frame_filter.min_confidence = n["min_confidence"].as<double>();
  }
  if (y["store"] && y["store"]["data_dir"])
    c.store.data_dir = y["store"]["data_dir"].as<std::string>();
  if (y["server"]) {
    if (y["server"]["host"]) c.server.host = y["server"]["host"].as<std::string>();
    if (y["server"]["port"]) c.server.port = y["server"]["port"].as<int>();
  }
  if (y["logging"] && y["logging"]["level"])
    c.logging.level = y["logging"]["level"].as<std::string>();

  return c;
}

void apply_logging(const LoggingConfig& cfg) {
  auto level = spdlog::level::from_str(cfg.level);
  if (level == spdlog::level::off && cfg.level != "off") {
    spdlog::warn("Unknown log level '{}', using info", cfg.level);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}
