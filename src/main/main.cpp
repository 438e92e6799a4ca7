#include "bcp_exorcist/exorcist.hpp"
#include "bcp_exorcist/manifest.hpp"
#include "bcp_exorcist/options.hpp"
#include "bcp_exorcist/path_utils.hpp"
#include "bcp_exorcist/run_json.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

struct Cli {
  std::optional<std::string> delim;    // raw bytes after escape decoding
  std::optional<std::string> newline;
  std::optional<std::size_t> chunk_size;
  bool compact = false;                // 1 MiB chunks instead of 4 MiB
  bool carry_escape = false;
  bool quiet = false;
  std::string manifest;
  std::string report_dir;              // empty: no reports
  std::string slug_mode = "basename";  // hashprefix|basename|keypath
  int slug_len = 64;
  std::vector<std::string> files;
};

constexpr int kExitOk = 0;
constexpr int kExitConfig = 2;
constexpr int kExitFailed = 3;

void usage(std::ostream& os) {
  os <<
    "Usage: bcp-exorcist [--delim=B] [--newline=B] [--chunk-size=SIZE] [--compact]\n"
    "                    [--carry-escape] [--manifest=FILE] [--report-dir=DIR]\n"
    "                    [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                    [--quiet] FILE...\n"
    "\n"
    "Rewrites files that use single-byte separators (default \\x1E between fields,\n"
    "\\x1D between records) into quoted CSV, in place. The original is kept as\n"
    "FILE.bak; on failure the partial output is kept as FILE.broken and the\n"
    "original is restored.\n"
    "\n"
    "  B     one byte: literal, \\xHH, 0xHH, \\t, \\n, \\r, \\0 or \\\\\n"
    "  SIZE  bytes with optional K/M/G (KiB/MiB/GiB) suffix, default 4MiB\n";
}

// Returns nullopt after printing the reason; exit code in *rc.
std::optional<Cli> parse_cli(int argc, char** argv, int* rc) {
  Cli c;
  auto bad = [&](const std::string& msg) {
    std::cerr << "[cli] " << msg << "\n";
    *rc = kExitConfig;
    return std::optional<Cli>{};
  };

  bool only_files = false;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (only_files || a.empty() || a[0] != '-') { c.files.push_back(a); continue; }
    if (a == "--") { only_files = true; continue; }

    auto val = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (val("--delim=", &v) || val("--newline=", &v)) {
      auto raw = bx::decode_byte_arg(v);
      if (!raw) return bad("bad byte escape in '" + a + "'");
      (a.rfind("--delim=", 0) == 0 ? c.delim : c.newline) = *raw;
      continue;
    }
    if (val("--chunk-size=", &v)) {
      c.chunk_size = bx::parse_size(v);
      if (!c.chunk_size) return bad("bad chunk size '" + v + "'");
      continue;
    }
    if (val("--manifest=", &c.manifest)) continue;
    if (val("--report-dir=", &c.report_dir)) continue;
    if (val("--slug-mode=", &c.slug_mode)) {
      if (c.slug_mode != "hashprefix" && c.slug_mode != "basename" && c.slug_mode != "keypath")
        return bad("bad slug mode '" + c.slug_mode + "'");
      continue;
    }
    if (val("--slug-len=", &v)) {
      try { c.slug_len = std::stoi(v); } catch (const std::exception&) { c.slug_len = 0; }
      if (c.slug_len <= 0) return bad("bad slug length '" + v + "'");
      continue;
    }
    if (a == "--compact")      { c.compact = true; continue; }
    if (a == "--carry-escape") { c.carry_escape = true; continue; }
    if (a == "--quiet" || a == "-q") { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); *rc = kExitOk; return std::nullopt; }
    return bad("unknown option '" + a + "'");
  }
  return c;
}

std::string slug_for(const std::string& path, const std::string& mode, int len) {
  // hashprefix hashes the absolute path so reruns from other dirs agree
  std::string key = path;
  if (mode == "hashprefix") {
    std::error_code ec;
    auto abs = std::filesystem::weakly_canonical(std::filesystem::path(path), ec);
    if (!ec) key = abs.string();
  }
  return bx::make_slug(key, mode, len);
}

bool run_one(const bx::ExorcizeRequest& job, const Cli& cli) {
  bx::ExorcismReport rep;
  std::string err;
  bx::ExorcizeStatus st = bx::exorcize_file(job, &rep, &err);

  if (st == bx::ExorcizeStatus::Ok) {
    if (!cli.quiet) {
      std::cout << "[exorcize] ok: " << job.path
                << " in=" << rep.stats.bytes_in
                << " out=" << rep.stats.bytes_out
                << " chunks=" << rep.stats.chunks << "\n";
    }
  } else {
    std::cerr << "[exorcize] " << bx::status_name(st) << ": " << job.path << ": " << err << "\n";
  }

  if (!cli.report_dir.empty()) {
    const std::string slug = slug_for(job.path, cli.slug_mode, cli.slug_len);
    std::string rerr;
    if (!bx::write_report_file(cli.report_dir, slug, bx::RunJsonWriter::to_json(rep), &rerr))
      std::cerr << "[report] " << rerr << "\n";
  }
  return st == bx::ExorcizeStatus::Ok;
}

}

int main(int argc, char** argv) {
  int rc = kExitOk;
  auto cli = parse_cli(argc, argv, &rc);
  if (!cli) return rc;

  // --- validate everything before touching any file
  bx::ExorcizeRequest defaults;
  std::string err;
  std::optional<std::string_view> delim, newline;
  if (cli->delim) delim = *cli->delim;
  if (cli->newline) newline = *cli->newline;
  if (!bx::make_options(delim, newline, &defaults.opts, &err)) {
    std::cerr << "[cli] " << err << "\n";
    return kExitConfig;
  }
  defaults.opts.carry_escape = cli->carry_escape;
  defaults.chunk_size = cli->chunk_size ? *cli->chunk_size
                      : (cli->compact ? bx::kCompactChunkBytes : bx::kDefaultChunkBytes);

  std::vector<bx::ExorcizeRequest> jobs;
  if (!cli->manifest.empty()) {
    if (!bx::load_manifest(cli->manifest, defaults, &jobs, &err)) {
      std::cerr << "[manifest] " << err << "\n";
      return kExitConfig;
    }
  }
  for (const auto& f : cli->files) {
    bx::ExorcizeRequest job = defaults;
    job.path = f;
    jobs.push_back(std::move(job));
  }
  if (jobs.empty()) {
    std::cerr << "[cli] no input files\n";
    usage(std::cerr);
    return kExitConfig;
  }

  // --- run; one failure does not stop the rest
  bool all_ok = true;
  for (const auto& job : jobs) all_ok &= run_one(job, *cli);
  return all_ok ? kExitOk : kExitFailed;
}
