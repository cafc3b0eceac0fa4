#include "batch_reader/metrics.hpp"

namespace br {

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  rows_ = bytes_ = 0;
  counters_.clear();
  stages_.clear();
}

void MetricsRegistry::add_rows(std::uint64_t n) {
  std::lock_guard<std::mutex> lk(mu_);
  rows_ += n;
}

void MetricsRegistry::add_bytes(std::uint64_t b) {
  std::lock_guard<std::mutex> lk(mu_);
  bytes_ += b;
}

void MetricsRegistry::increment(std::string_view counter, std::uint64_t by) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(counter);
  if (it == counters_.end()) counters_.emplace(std::string(counter), by);
  else it->second += by;
}

void MetricsRegistry::record_stage(std::string_view name, double ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = stages_.find(name);
  if (it == stages_.end()) it = stages_.emplace(std::string(name), StageAccum{}).first;
  ++it->second.calls;
  it->second.ms += ms;
}

std::uint64_t MetricsRegistry::counter(std::string_view name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

OpStats MetricsRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  OpStats r;
  r.rows = rows_;
  r.bytes = bytes_;

  double total_ms = 0.0;
  r.stages.reserve(stages_.size());
  for (auto& kv : stages_) {
    r.stages.push_back(StageTiming{kv.first, kv.second.calls, kv.second.ms});
    total_ms += kv.second.ms;
  }
  r.throughput_mb_s = (total_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (total_ms / 1000.0) : 0.0;
  r.counters.insert(counters_.begin(), counters_.end());
  return r;
}

}
