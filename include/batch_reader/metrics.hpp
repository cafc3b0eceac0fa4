#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace br {

struct StageTiming {
  std::string name;
  std::uint64_t calls = 0;
  double total_ms = 0.0;
};

struct OpStats {
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;
  std::map<std::string, std::uint64_t> counters;
};

// Per-operation counters shared by every reader configured with it.
// Safe to use from concurrent operations.
class MetricsRegistry {
public:
  void reset();
  void add_rows(std::uint64_t n);
  void add_bytes(std::uint64_t b);
  void increment(std::string_view counter, std::uint64_t by = 1);
  void record_stage(std::string_view name, double ms);

  std::uint64_t counter(std::string_view name) const;
  OpStats snapshot() const;

private:
  struct StageAccum { std::uint64_t calls = 0; double ms = 0.0; };

  mutable std::mutex mu_;
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::map<std::string, std::uint64_t, std::less<>> counters_;
  std::map<std::string, StageAccum, std::less<>> stages_;
};

// Times a scope into `reg` (no-op when reg is null).
class ScopedStage {
public:
  ScopedStage(MetricsRegistry* reg, std::string_view name)
      : reg_(reg), name_(name), t0_(std::chrono::steady_clock::now()) {}
  ~ScopedStage() {
    if (!reg_) return;
    const auto dt = std::chrono::steady_clock::now() - t0_;
    reg_->record_stage(name_, std::chrono::duration<double, std::milli>(dt).count());
  }

  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;

private:
  MetricsRegistry* reg_;
  std::string_view name_;
  std::chrono::steady_clock::time_point t0_;
};

}
