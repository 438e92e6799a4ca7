#include "bcp_exorcist/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace bx {

void MetricsRegistry::reset() {
  chunks_ = bytes_in_ = bytes_out_ = 0;
  rewrites_ = BatchCounts{};
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.chunks = chunks_;
  r.bytes_in = bytes_in_;
  r.bytes_out = bytes_out_;
  r.rewrites = rewrites_;
  r.wall_time_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_in_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.expansion = bytes_in_ ? static_cast<double>(bytes_out_) / static_cast<double>(bytes_in_) : 0.0;

  // Stages in first-started order; unfinished ones are left out.
  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    if (it != stage_accum_ms_.end()) r.stages.push_back(StageTiming{name, it->second});
  }
  return r;
}

}
