#include "bcp_exorcist/run_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite
#include <cstdio>

namespace bx {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned char>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const ExorcismReport& r) {
  const RunStats& s = r.stats;
  std::ostringstream o;
  o << "{";
  o << "\"filename\":";      esc(o, r.filename);      o << ",";
  o << "\"backup\":";        esc(o, r.backup);        o << ",";
  o << "\"ok\":" << (r.ok ? "true" : "false") << ",";
  o << "\"status\":";        esc(o, r.status);        o << ",";
  o << "\"error\":";         esc(o, r.error);         o << ",";
  o << "\"file_size\":" << r.file_size << ",";
  o << "\"output_sha256\":"; esc(o, r.output_sha256); o << ",";

  o << "\"sep\":" << r.sep << ",";
  o << "\"eol\":" << r.eol << ",";
  o << "\"carry_escape\":" << (r.carry_escape ? "true" : "false") << ",";
  o << "\"chunk_size\":" << r.chunk_size << ",";

  o << "\"chunks\":" << s.chunks << ",";
  o << "\"bytes_in\":" << s.bytes_in << ",";
  o << "\"bytes_out\":" << s.bytes_out << ",";
  o << "\"separators\":" << s.rewrites.separators << ",";
  o << "\"terminators\":" << s.rewrites.terminators << ",";
  o << "\"quotes\":" << s.rewrites.quotes << ",";
  o << "\"escapes\":" << s.rewrites.escapes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"expansion\":" << safe_num(s.expansion) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
