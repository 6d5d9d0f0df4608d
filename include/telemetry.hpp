#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct TelemetrySnapshot {
  double run_p50_ms{0}, run_p95_ms{0}, run_p99_ms{0};
  uint64_t sessions_total{0};
  uint64_t session_failures_total{0};
  uint64_t calculator_failures_total{0};
};

// Service-level counters; safe to update from any thread.
class TelemetryRegistry {
public:
  void add_run_ms(double ms) { run_ms_.add(ms); }

  void inc_session() { sessions_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_session_failure() { session_failures_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_calculator_failure() {
    calculator_failures_total_.fetch_add(1, std::memory_order_relaxed);
  }

  uint64_t sessions_total() const { return sessions_total_.load(std::memory_order_relaxed); }
  uint64_t session_failures_total() const {
    return session_failures_total_.load(std::memory_order_relaxed);
  }
  uint64_t calculator_failures_total() const {
    return calculator_failures_total_.load(std::memory_order_relaxed);
  }

  TelemetrySnapshot snapshot() const;
  std::string prometheus_text(const TelemetrySnapshot& s) const;

private:
  RollingHist run_ms_;
  std::atomic<uint64_t> sessions_total_{0};
  std::atomic<uint64_t> session_failures_total_{0};
  std::atomic<uint64_t> calculator_failures_total_{0};
};
