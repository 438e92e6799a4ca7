#include "bcp_exorcist/exorcist.hpp"
#include "bcp_exorcist/chunk_reader.hpp"
#include "bcp_exorcist/chunk_writer.hpp"
#include "bcp_exorcist/metrics.hpp"
#include "bcp_exorcist/path_utils.hpp"
#include "bcp_exorcist/stream_driver.hpp"
#include <chrono>
#include <exception>

namespace bx {

const char* status_name(ExorcizeStatus s) noexcept {
  switch (s) {
    case ExorcizeStatus::Ok:              return "ok";
    case ExorcizeStatus::ConfigError:     return "config_error";
    case ExorcizeStatus::IoError:         return "io_error";
    case ExorcizeStatus::TransformFailed: return "transform_failed";
  }
  return "unknown";
}

ExorcizeStatus exorcize_file(const ExorcizeRequest& req,
                             ExorcismReport* report,
                             std::string* err_out,
                             const TransformFn& transform) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  MetricsRegistry metrics;
  ExorcismReport local;
  ExorcismReport& rep = report ? *report : local;
  rep = ExorcismReport{};
  rep.filename = req.path;
  rep.backup = backup_path(req.path);
  rep.sep = static_cast<unsigned char>(req.opts.sep);
  rep.eol = static_cast<unsigned char>(req.opts.eol);
  rep.carry_escape = req.opts.carry_escape;
  rep.chunk_size = req.chunk_size;

  auto finish = [&](ExorcizeStatus st, const std::string& msg) {
    const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
    rep.ok = (st == ExorcizeStatus::Ok);
    rep.status = status_name(st);
    rep.error = msg;
    rep.stats = metrics.snapshot(wall_ms);
    if (err_out && !msg.empty()) *err_out = msg;
    return st;
  };

  if (req.path.empty()) return finish(ExorcizeStatus::ConfigError, "empty file path");
  if (req.chunk_size == 0) return finish(ExorcizeStatus::ConfigError, "chunk size must be positive");

  const std::string& path = req.path;
  const std::string& bak = rep.backup;
  std::string err;

  // --- open: move the original aside, read from the backup
  metrics.start_stage("open");
  if (!rename_path(path, bak, &err)) {
    metrics.end_stage("open");
    return finish(ExorcizeStatus::IoError, err);
  }

  ChunkReader in(bak);
  if (!in.is_open()) {
    std::string msg = "open " + in.error();
    if (!rename_path(bak, path, &err)) msg += "; restore failed: " + err;
    metrics.end_stage("open");
    return finish(ExorcizeStatus::IoError, msg);
  }
  rep.file_size = in.size();

  ChunkWriter out(path);
  if (!out.is_open()) {
    std::string msg = "create " + out.error();
    in.close();
    if (!rename_path(bak, path, &err)) msg += "; restore failed: " + err;
    metrics.end_stage("open");
    return finish(ExorcizeStatus::IoError, msg);
  }
  metrics.end_stage("open");

  // --- transform
  metrics.start_stage("transform");
  std::string terr;
  bool ok = false;
  try {
    ok = transform
        ? transform(in, out, in.size(), req.chunk_size, req.opts, &metrics, &terr)
        : exorcize_stream(in, out, in.size(), req.chunk_size, req.opts, &metrics, &terr);
  } catch (const std::exception& e) {
    terr = e.what(); // the restore below still has to run
  }
  if (ok && !out.close()) { ok = false; terr = "close failed: " + out.error(); }
  metrics.end_stage("transform");

  if (ok) {
    rep.output_sha256 = out.sha256_hex();
    return finish(ExorcizeStatus::Ok, {});
  }

  // --- restore: keep the partial output for inspection, put the original back
  metrics.start_stage("restore");
  (void)out.close(); // already failing; the transform error is what gets reported
  in.close();
  std::string msg = "exorcism failed: " + (terr.empty() ? std::string("unknown error") : terr);
  if (!rename_path(path, broken_path(path), &err) || !rename_path(bak, path, &err))
    msg += "; restore failed: " + err;
  metrics.end_stage("restore");
  return finish(ExorcizeStatus::TransformFailed, msg);
}

}
