#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class SessionRepository {
public:
  virtual ~SessionRepository() = default;
  virtual std::optional<SessionRecord> get_session(const std::string& id) const = 0;
  virtual void update_session(const SessionRecord& session) = 0;
};

class PoseRepository {
public:
  virtual ~PoseRepository() = default;
  // Frames ordered by frame_number
  virtual PoseSequence get_poses(const std::string& session_id) const = 0;
};

class MetricsRepository {
public:
  virtual ~MetricsRepository() = default;
  // Appends a new immutable record and returns its 1-based number
  virtual size_t create_metrics(const std::string& session_id, const RunningMetrics& metrics) = 0;
  // Latest record, if any
  virtual std::optional<RunningMetrics> get_metrics(const std::string& session_id) const = 0;
  // Every record in creation order
  virtual std::vector<RunningMetrics> metrics_history(const std::string& session_id) const = 0;
};

struct StoreConfig {
  std::string data_dir{"data/sessions"};
};

// Directory-per-session JSON store:
//   <root>/<id>/session.json   SessionRecord
//   <root>/<id>/poses.json     array of FramePose
//   <root>/<id>/metrics/<n>.json   one RunningMetrics per computation, never rewritten
class JsonSessionStore : public SessionRepository,
                         public PoseRepository,
                         public MetricsRepository {
public:
  explicit JsonSessionStore(std::filesystem::path root);

  // Creates the session directory with its record and frames
  void create_session(const SessionRecord& session, const PoseSequence& frames);

  std::optional<SessionRecord> get_session(const std::string& id) const override;
  void update_session(const SessionRecord& session) override;

  PoseSequence get_poses(const std::string& session_id) const override;

  size_t create_metrics(const std::string& session_id, const RunningMetrics& metrics) override;
  std::optional<RunningMetrics> get_metrics(const std::string& session_id) const override;
  std::vector<RunningMetrics> metrics_history(const std::string& session_id) const override;

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path session_dir(const std::string& id) const;
  std::vector<size_t> metrics_records(const std::filesystem::path& dir) const;
  RunningMetrics read_metrics(const std::filesystem::path& path) const;

  std::filesystem::path root_;
  mutable std::mutex mu_;
};
