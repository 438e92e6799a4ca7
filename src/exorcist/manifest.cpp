#include "bcp_exorcist/manifest.hpp"

#include <simdjson.h>
#include <cctype>
#include <cstdint>
#include <exception>
#include <fstream>
#include <string>
#include <string_view>

namespace bx {

// A single JSON char is the byte itself; longer strings may spell it
// ("0x1E", "\\x1E").
static bool json_byte(std::string_view s, char def, char* out, std::string* err) {
  std::optional<std::string> raw;
  if (s.size() <= 1) raw = std::string(s);
  else raw = decode_byte_arg(s);
  if (!raw) { if (err) *err = "bad byte escape '" + std::string(s) + "'"; return false; }
  auto b = unwrap_byte(std::string_view(*raw), def, err);
  if (!b) return false;
  *out = *b;
  return true;
}

bool parse_manifest_line(std::string_view line,
                         const ExorcizeRequest& defaults,
                         ExorcizeRequest* job,
                         std::string* err_out) {
  thread_local simdjson::ondemand::parser parser;
  thread_local std::string scratch;

  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.capacity());

  ExorcizeRequest r = defaults;
  r.path.clear();
  std::string err;

  try {
    auto doc = parser.iterate(view);
    simdjson::ondemand::object obj = doc.get_object();

    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value();
      simdjson::ondemand::value v = field.value();

      if (key == "path") {
        r.path = std::string(std::string_view(v.get_string().value()));
      } else if (key == "delim") {
        if (!json_byte(v.get_string().value(), kDefaultSeparator, &r.opts.sep, &err)) break;
      } else if (key == "newline") {
        if (!json_byte(v.get_string().value(), kDefaultTerminator, &r.opts.eol, &err)) break;
      } else if (key == "chunk_size") {
        if (v.type().value() == simdjson::ondemand::json_type::string) {
          std::string_view s = v.get_string().value();
          auto n = parse_size(s);
          if (!n) { err = "bad chunk_size '" + std::string(s) + "'"; break; }
          r.chunk_size = *n;
        } else {
          std::uint64_t n = v.get_uint64().value();
          auto checked = parse_size(std::to_string(n));
          if (!checked) { err = "bad chunk_size " + std::to_string(n); break; }
          r.chunk_size = *checked;
        }
      } else if (key == "carry_escape") {
        r.opts.carry_escape = bool(v.get_bool().value());
      } else {
        err = "unknown key '" + std::string(key) + "'";
        break;
      }
    }
  } catch (const std::exception& e) {
    err = e.what();
  }

  if (err.empty() && r.path.empty()) err = "missing \"path\"";
  if (!err.empty()) { if (err_out) *err_out = err; return false; }

  *job = std::move(r);
  return true;
}

bool load_manifest(const std::string& path,
                   const ExorcizeRequest& defaults,
                   std::vector<ExorcizeRequest>* jobs,
                   std::string* err_out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { if (err_out) *err_out = "cannot open manifest " + path; return false; }

  std::vector<ExorcizeRequest> out;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string_view sv(line);
    if (!sv.empty() && sv.back() == '\r') sv.remove_suffix(1);
    std::size_t i = 0;
    while (i < sv.size() && std::isspace((unsigned char)sv[i])) ++i;
    if (i == sv.size() || sv[i] == '#') continue;

    ExorcizeRequest job;
    std::string err;
    if (!parse_manifest_line(sv, defaults, &job, &err)) {
      if (err_out) *err_out = path + ":" + std::to_string(line_no) + ": " + err;
      return false;
    }
    out.push_back(std::move(job));
  }
  if (in.bad()) { if (err_out) *err_out = "read error on manifest " + path; return false; }

  *jobs = std::move(out);
  return true;
}

}
