#pragma once
#include "bcp_exorcist/metrics.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace bx {

struct ExorcismReport {
  // Input / outcome
  std::string filename;
  std::string backup;
  bool ok = false;
  std::string status;   // ok | config_error | io_error | transform_failed
  std::string error;
  std::uint64_t file_size = 0;
  std::string output_sha256;

  // Configuration used
  int sep = 0;
  int eol = 0;
  bool carry_escape = false;
  std::uint64_t chunk_size = 0;

  // Counters and timing
  RunStats stats;
};

class RunJsonWriter {
public:
  // Serialize report to a compact JSON string.
  static std::string to_json(const ExorcismReport& r);
};

// Writes <report_dir>/<slug>.json, creating directories as needed.
bool write_report_file(const std::string& report_dir,
                       const std::string& slug,
                       const std::string& json,
                       std::string* err_out = nullptr);

}
