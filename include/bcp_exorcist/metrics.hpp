#pragma once
#include "bcp_exorcist/batch_transcoder.hpp"
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bx {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t chunks = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  BatchCounts rewrites;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0; // input MiB per second
  double expansion = 0.0;       // bytes_out / bytes_in

  std::vector<StageTiming> stages;
};

class MetricsRegistry {
public:
  void reset();
  void add_chunk(std::uint64_t bytes_in) noexcept { ++chunks_; bytes_in_ += bytes_in; }
  void add_bytes_out(std::uint64_t b) noexcept { bytes_out_ += b; }
  void add_rewrites(const BatchCounts& c) noexcept { rewrites_ += c; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  std::uint64_t chunks() const noexcept { return chunks_; }
  std::uint64_t bytes_in() const noexcept { return bytes_in_; }
  std::uint64_t bytes_out() const noexcept { return bytes_out_; }
  const BatchCounts& rewrites() const noexcept { return rewrites_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t chunks_{0};
  std::uint64_t bytes_in_{0};
  std::uint64_t bytes_out_{0};
  BatchCounts rewrites_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
