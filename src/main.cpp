#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "event_bus.hpp"
#include "json_codec.hpp"
#include "metrics_service.hpp"
#include "session_store.hpp"
#include "telemetry.hpp"
#include "util.hpp"

namespace {

void reply_json(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(2), "application/json");
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"GaitKeeper: running gait metrics from pose landmark sessions"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string session_id;
  cli_app.add_option("-s,--session", session_id,
                     "Compute metrics for one session, print them and exit");

  std::string show_id;
  cli_app.add_option("--show", show_id, "Print the stored metrics of a session and exit");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "GaitKeeper v1.0.0" << std::endl;
    std::cout << "Cadence, speed, stride, contact time, oscillation, lean, symmetry, joint angles"
              << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config '{}': {}", cfg_path, e.what());
    return 1;
  }
  apply_logging(app.logging);
  spdlog::info("GaitKeeper starting (config: {}, store: {})", cfg_path, app.store.data_dir);

  try {
    JsonSessionStore store(app.store.data_dir);
    TelemetryRegistry telemetry;
    EventBus bus;
    bus.subscribe(kMetricsCalculatedEvent, [](const Event& e) {
      spdlog::info("Event {}: metrics ready for session {}", e.event_type, e.session_id);
    });
    bus.subscribe(kProcessingFailedEvent, [](const Event& e) {
      spdlog::warn("Event {}: session {} failed ({})", e.event_type, e.session_id,
                   e.error_message.value_or("unknown"));
    });

    MetricsService service(store, store, store, &bus, telemetry, app.service);

    if (!show_id.empty()) {
      auto stored = service.stored_metrics(show_id);
      if (!stored) {
        spdlog::error("No metrics stored for session {}", show_id);
        return 1;
      }
      std::cout << nlohmann::json(*stored).dump(2) << std::endl;
      return 0;
    }

    if (!session_id.empty()) {
      RunningMetrics m = service.compute_metrics(session_id);
      std::cout << nlohmann::json(m).dump(2) << std::endl;
      return 0;
    }

    httplib::Server svr;

    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
      reply_json(res, 200, {{"status", "healthy"}, {"service", "gaitkeeper"}});
    });

    svr.Post(R"(/calculate/([A-Za-z0-9_.-]+))",
             [&](const httplib::Request& req, httplib::Response& res) {
               const std::string id = req.matches[1];
               try {
                 RunningMetrics m = service.compute_metrics(id);
                 reply_json(res, 200, {{"session_id", id}, {"metrics", m}});
               } catch (const SessionNotFoundError& e) {
                 reply_json(res, 404, {{"detail", e.what()}});
               } catch (const std::invalid_argument& e) {
                 reply_json(res, 422, {{"detail", e.what()}});
               } catch (const std::exception& e) {
                 reply_json(res, 500, {{"detail", e.what()}});
               }
             });

    svr.Get(R"(/metrics/([A-Za-z0-9_.-]+))",
            [&](const httplib::Request& req, httplib::Response& res) {
              const std::string id = req.matches[1];
              try {
                auto m = service.stored_metrics(id);
                if (!m) {
                  reply_json(res, 404, {{"detail", "Metrics not found"}});
                  return;
                }
                reply_json(res, 200, {{"session_id", id}, {"metrics", *m}});
              } catch (const std::exception& e) {
                reply_json(res, 500, {{"detail", e.what()}});
              }
            });

    svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
      res.set_content(telemetry.prometheus_text(telemetry.snapshot()),
                      "text/plain; version=0.0.4");
    });

    spdlog::info("HTTP server listening on {}:{}", app.server.host, app.server.port);
    if (!svr.listen(app.server.host, app.server.port)) {
      spdlog::error("Could not bind {}:{}", app.server.host, app.server.port);
      return 1;
    }
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  spdlog::info("Shutdown complete.");
  return 0;
}
