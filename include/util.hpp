#pragma once
#include <string>

#include "metrics_service.hpp"
#include "session_store.hpp"

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8002};
};

struct LoggingConfig {
  std::string level{"info"};
};

struct AppConfig {
  MetricsServiceConfig service;
  StoreConfig store;
  ServerConfig server;
  LoggingConfig logging;
};

AppConfig load_config(const std::string& path);

// Applies logging.level to the default spdlog logger; unknown names fall back to info
void apply_logging(const LoggingConfig& cfg);
