#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static void put(const fs::path& p, const std::string& s) {
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << s;
}

static int run(const std::string& bin, const std::string& args, const fs::path& log) {
  std::string cmd = "\"" + bin + "\" " + args + " >\"" + log.string() + "\" 2>&1";
  int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

int main() {
  std::string bin = env_or("BX_EXORCIST_BIN", "./bcp-exorcist");
  if (!fs::exists(bin)) { std::cerr << "[ERR] binary not found: " << bin << "\n"; return 2; }

  const fs::path dir = fs::temp_directory_path() / "bx_it_cli";
  fs::remove_all(dir);
  fs::create_directories(dir);
  const fs::path log = dir / "cli.log";
  const fs::path reports = dir / "reports";

  // --- custom single-byte delimiters + report
  const fs::path f = dir / "pipes.csv";
  put(f, "a|b;c|d");
  int rc = run(bin, "--delim='|' --newline=';' --chunk-size=2 --quiet"
                    " --report-dir=\"" + reports.string() + "\" --slug-mode=basename \"" + f.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] exit " << rc << ": " << slurp(log) << "\n"; return 1; }
  if (slurp(f) != "\"a\",\"b\"\n\"c\",\"d\"") { std::cerr << "[FAIL] pipes.csv: " << slurp(f) << "\n"; return 1; }
  if (!slurp(log).empty()) { std::cerr << "[FAIL] --quiet still printed: " << slurp(log) << "\n"; return 1; }

  const fs::path report = reports / "pipes.csv.json";
  if (!fs::exists(report)) { std::cerr << "[FAIL] no report at " << report << "\n"; return 1; }
  try {
    simdjson::ondemand::parser p;
    auto json = simdjson::padded_string::load(report.string());
    auto doc = p.iterate(json);
    bool ok = bool(doc["ok"].get_bool().value());
    std::uint64_t sep = doc["sep"].get_uint64().value();
    std::uint64_t chunks = doc["chunks"].get_uint64().value();
    std::string_view sha = doc["output_sha256"].get_string().value();
    if (!ok || sep != '|' || chunks != 4 || sha.size() != 64) {
      std::cerr << "[FAIL] report fields ok=" << ok << " sep=" << sep << " chunks=" << chunks << "\n";
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] report parse: " << e.what() << "\n"; return 1;
  }

  // --- multi-byte delimiter: config error, file untouched
  const fs::path g = dir / "untouched.csv";
  put(g, "x\x1Ey");
  rc = run(bin, "--delim=ab \"" + g.string() + "\"", log);
  if (rc != 2) { std::cerr << "[FAIL] expected exit 2 for multi-byte delim, got " << rc << "\n"; return 1; }
  if (slurp(g) != "x\x1Ey" || fs::exists(g.string() + ".bak")) { std::cerr << "[FAIL] file touched on config error\n"; return 1; }
  if (slurp(log).find("single byte") == std::string::npos) { std::cerr << "[FAIL] config error text: " << slurp(log) << "\n"; return 1; }

  // --- manifest + missing file: the good job still runs, exit code 3
  const fs::path m = dir / "jobs.jsonl";
  put(m, "{\"path\":\"" + g.string() + "\",\"chunk_size\":\"1K\"}\n"
         "{\"path\":\"" + (dir / "nope.csv").string() + "\"}\n");
  rc = run(bin, "--manifest=\"" + m.string() + "\"", log);
  if (rc != 3) { std::cerr << "[FAIL] expected exit 3, got " << rc << ": " << slurp(log) << "\n"; return 1; }
  if (slurp(g) != "\"x\",\"y\"") { std::cerr << "[FAIL] manifest job not applied: " << slurp(g) << "\n"; return 1; }
  const std::string out = slurp(log);
  if (out.find("[exorcize] ok: ") == std::string::npos || out.find("[exorcize] io_error: ") == std::string::npos) {
    std::cerr << "[FAIL] log lines: " << out << "\n"; return 1;
  }

  // --- usage
  if (run(bin, "--help", log) != 0 || slurp(log).find("Usage: bcp-exorcist") == std::string::npos) {
    std::cerr << "[FAIL] --help\n"; return 1;
  }
  if (run(bin, "", log) != 2) { std::cerr << "[FAIL] no files should exit 2\n"; return 1; }

  fs::remove_all(dir);
  std::cout << "[PASS] cli end-to-end\n";
  return 0;
}
