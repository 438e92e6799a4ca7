#include "bcp_exorcist/run_json.hpp"
#include "bcp_exorcist/path_utils.hpp"
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <simdjson.h>

namespace fs = std::filesystem;

int main() {
  bx::ExorcismReport r;
  r.filename = "exports/\"q1\"\\sales.csv";
  r.backup = r.filename + ".bak";
  r.ok = false;
  r.status = "transform_failed";
  r.error = "exorcism failed: write failed: No space left on device\n";
  r.file_size = 1234;
  r.sep = 0x1E;
  r.eol = 0x1D;
  r.chunk_size = 4096;
  r.stats.chunks = 2;
  r.stats.bytes_in = 1234;
  r.stats.bytes_out = 1300;
  r.stats.rewrites.separators = 9;
  r.stats.throughput_mb_s = std::numeric_limits<double>::infinity();
  r.stats.stages = {{"open", 1}, {"transform", 7}, {"restore", 0}};

  const std::string json = bx::RunJsonWriter::to_json(r);

  try {
    simdjson::ondemand::parser p;
    simdjson::padded_string padded(json);
    auto doc = p.iterate(padded);

    bool ok = true;
    std::string_view fname = doc["filename"].get_string().value();
    if (fname != r.filename) { std::cerr << "[FAIL] filename round trip: " << fname << "\n"; ok = false; }
    if (bool(doc["ok"].get_bool().value())) { std::cerr << "[FAIL] ok flag\n"; ok = false; }
    std::string_view status = doc["status"].get_string().value();
    if (status != "transform_failed") { std::cerr << "[FAIL] status\n"; ok = false; }
    std::string_view error = doc["error"].get_string().value();
    if (error != r.error) { std::cerr << "[FAIL] error text\n"; ok = false; }
    if (doc["sep"].get_uint64().value() != 0x1E) { std::cerr << "[FAIL] sep\n"; ok = false; }
    if (doc["bytes_out"].get_uint64().value() != 1300) { std::cerr << "[FAIL] bytes_out\n"; ok = false; }
    if (doc["separators"].get_uint64().value() != 9) { std::cerr << "[FAIL] separators\n"; ok = false; }
    if (double(doc["throughput_mb_s"].get_double().value()) != 0.0) {
      std::cerr << "[FAIL] non-finite throughput should serialize as 0\n"; ok = false;
    }
    std::size_t stages = 0;
    for (auto st : doc["stage_times"].get_array()) {
      std::string_view name = st["stage"].get_string().value();
      if (stages == 1 && name != "transform") { std::cerr << "[FAIL] stage order\n"; ok = false; }
      ++stages;
    }
    if (stages != 3) { std::cerr << "[FAIL] stage count " << stages << "\n"; ok = false; }
    if (!ok) return 1;
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] report is not valid JSON: " << e.what() << "\n" << json << "\n";
    return 1;
  }

  // --- report file lands under <dir>/<slug>.json
  const fs::path dir = fs::temp_directory_path() / "bx_test_run_json" / "nested";
  fs::remove_all(dir.parent_path());
  const std::string slug = bx::make_slug("exports/sales.csv", "keypath", 64);
  std::string err;
  if (slug != "exports-sales.csv") { std::cerr << "[FAIL] keypath slug " << slug << "\n"; return 1; }
  if (bx::make_slug("/x/y/sales.csv", "basename", 5) != "sales") { std::cerr << "[FAIL] basename slug\n"; return 1; }
  if (bx::make_slug("sales.csv", "hashprefix", 8).size() != 8) { std::cerr << "[FAIL] hash slug\n"; return 1; }
  if (!bx::write_report_file(dir.string(), slug, json, &err) || !fs::exists(dir / "exports-sales.csv.json")) {
    std::cerr << "[FAIL] write_report_file: " << err << "\n"; return 1;
  }
  fs::remove_all(dir.parent_path());

  std::cout << "[PASS] run json report\n";
  return 0;
}
