#include "session_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

#include "json_codec.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kSessionFile = "session.json";
constexpr const char* kPosesFile = "poses.json";
constexpr const char* kMetricsDir = "metrics";

json read_json(const fs::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw StoreError("Cannot open " + path.string());
  try {
    return json::parse(in);
  } catch (const json::parse_error& e) {
    throw StoreError("Malformed JSON in " + path.string() + ": " + e.what());
  }
}

// Write to a sibling temp file and rename so readers never see a partial file
void write_json(const fs::path& path, const json& j) {
  const fs::path tmp = path.string() + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) throw StoreError("Cannot write " + tmp.string());
    out << j.dump(2);
    if (!out) throw StoreError("Failed writing " + tmp.string());
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) throw StoreError("Cannot replace " + path.string() + ": " + ec.message());
}

}  // namespace

JsonSessionStore::JsonSessionStore(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) throw StoreError("Cannot create store directory " + root_.string() + ": " + ec.message());
}

fs::path JsonSessionStore::session_dir(const std::string& id) const {
  const bool bad = id.empty() || id == "." || id == ".." ||
                   id.find_first_of("/\\") != std::string::npos;
  if (bad) throw StoreError("Invalid session id '" + id + "'");
  return root_ / id;
}

void JsonSessionStore::create_session(const SessionRecord& session, const PoseSequence& frames) {
  validate_profile(session.profile);
  std::lock_guard<std::mutex> g(mu_);
  const fs::path dir = session_dir(session.id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) throw StoreError("Cannot create " + dir.string() + ": " + ec.message());

  write_json(dir / kSessionFile, json(session));
  write_json(dir / kPosesFile, json(frames));
  spdlog::debug("Stored session {} with {} frames", session.id, frames.size());
}

std::optional<SessionRecord> JsonSessionStore::get_session(const std::string& id) const {
  std::lock_guard<std::mutex> g(mu_);
  const fs::path path = session_dir(id) / kSessionFile;
  if (!fs::exists(path)) return std::nullopt;
  try {
    return read_json(path).get<SessionRecord>();
  } catch (const json::exception& e) {
    throw StoreError("Invalid session record " + path.string() + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw StoreError("Invalid session record " + path.string() + ": " + e.what());
  }
}

void JsonSessionStore::update_session(const SessionRecord& session) {
  std::lock_guard<std::mutex> g(mu_);
  const fs::path path = session_dir(session.id) / kSessionFile;
  if (!fs::exists(path)) throw StoreError("Session not found: " + session.id);
  write_json(path, json(session));
}

PoseSequence JsonSessionStore::get_poses(const std::string& session_id) const {
  std::lock_guard<std::mutex> g(mu_);
  const fs::path path = session_dir(session_id) / kPosesFile;
  if (!fs::exists(path)) return {};

  PoseSequence frames;
  try {
    frames = read_json(path).get<PoseSequence>();
  } catch (const json::exception& e) {
    throw StoreError("Invalid pose data " + path.string() + ": " + e.what());
  }
  std::stable_sort(frames.begin(), frames.end(), [](const FramePose& a, const FramePose& b) {
    return a.frame_number < b.frame_number;
  });
  return frames;
}

// Record numbers present under <dir>/metrics, ascending
std::vector<size_t> JsonSessionStore::metrics_records(const fs::path& dir) const {
  std::vector<size_t> records;
  const fs::path metrics_dir = dir / kMetricsDir;
  if (!fs::is_directory(metrics_dir)) return records;
  for (const auto& entry : fs::directory_iterator(metrics_dir)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
    const std::string stem = entry.path().stem().string();
    if (stem.empty() || stem.find_first_not_of("0123456789") != std::string::npos) continue;
    records.push_back(static_cast<size_t>(std::stoull(stem)));
  }
  std::sort(records.begin(), records.end());
  return records;
}

RunningMetrics JsonSessionStore::read_metrics(const fs::path& path) const {
  try {
    return read_json(path).get<RunningMetrics>();
  } catch (const json::exception& e) {
    throw StoreError("Invalid metrics record " + path.string() + ": " + e.what());
  }
}

size_t JsonSessionStore::create_metrics(const std::string& session_id,
                                        const RunningMetrics& metrics) {
  std::lock_guard<std::mutex> g(mu_);
  const fs::path dir = session_dir(session_id);
  if (!fs::exists(dir / kSessionFile)) throw StoreError("Session not found: " + session_id);

  const std::vector<size_t> records = metrics_records(dir);
  const size_t next = records.empty() ? 1 : records.back() + 1;

  std::error_code ec;
  fs::create_directories(dir / kMetricsDir, ec);
  if (ec) throw StoreError("Cannot create " + (dir / kMetricsDir).string() + ": " + ec.message());

  const fs::path path = dir / kMetricsDir / (std::to_string(next) + ".json");
  if (fs::exists(path)) throw StoreError("Metrics record already exists: " + path.string());
  write_json(path, json(metrics));
  spdlog::debug("Stored metrics record {} for session {}", next, session_id);
  return next;
}

std::optional<RunningMetrics> JsonSessionStore::get_metrics(const std::string& session_id) const {
  std::lock_guard<std::mutex> g(mu_);
  const fs::path dir = session_dir(session_id);
  const std::vector<size_t> records = metrics_records(dir);
  if (records.empty()) return std::nullopt;
  return read_metrics(dir / kMetricsDir / (std::to_string(records.back()) + ".json"));
}

std::vector<RunningMetrics> JsonSessionStore::metrics_history(const std::string& session_id) const {
  std::lock_guard<std::mutex> g(mu_);
  const fs::path dir = session_dir(session_id);
  std::vector<RunningMetrics> history;
  for (size_t n : metrics_records(dir)) {
    history.push_back(read_metrics(dir / kMetricsDir / (std::to_string(n) + ".json")));
  }
  return history;
}
