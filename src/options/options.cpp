#include "bcp_exorcist/options.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <system_error>
#include <fast_float/fast_float.h>

namespace bx {

static int hex_val(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::string describe_byte(char c) {
  const unsigned char u = static_cast<unsigned char>(c);
  if (u >= 0x20 && u < 0x7f && c != '\\') return std::string(1, c);
  char tmp[8];
  std::snprintf(tmp, sizeof(tmp), "\\x%02X", u);
  return tmp;
}

std::optional<char> unwrap_byte(std::optional<std::string_view> in, char def,
                                std::string* err) {
  if (!in || in->empty()) return def;
  if (in->size() == 1) return (*in)[0];

  if (err) {
    std::string shown;
    for (char c : *in) shown += describe_byte(c);
    *err = "input '" + shown + "' should be a single byte; len: " + std::to_string(in->size());
  }
  return std::nullopt;
}

bool make_options(std::optional<std::string_view> delim,
                  std::optional<std::string_view> newline,
                  ExorcismOptions* out, std::string* err) {
  auto sep = unwrap_byte(delim, kDefaultSeparator, err);
  if (!sep) return false;
  auto eol = unwrap_byte(newline, kDefaultTerminator, err);
  if (!eol) return false;
  out->sep = *sep;
  out->eol = *eol;
  return true;
}

std::optional<std::string> decode_byte_arg(std::string_view s) {
  // 0xHH form (whole token)
  if (s.size() == 4 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    int hi = hex_val(s[2]), lo = hex_val(s[3]);
    if (hi < 0 || lo < 0) return std::nullopt;
    return std::string(1, static_cast<char>((hi << 4) | lo));
  }

  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\') { out.push_back(s[i]); continue; }
    if (i + 1 >= s.size()) return std::nullopt; // dangling backslash
    char e = s[++i];
    switch (e) {
      case 't':  out.push_back('\t'); break;
      case 'n':  out.push_back('\n'); break;
      case 'r':  out.push_back('\r'); break;
      case '0':  out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      case 'x': case 'X': {
        if (i + 2 >= s.size()) return std::nullopt;
        int hi = hex_val(s[i + 1]), lo = hex_val(s[i + 2]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        break;
      }
      default: return std::nullopt;
    }
  }
  return out;
}

std::optional<std::size_t> parse_size(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back()))  s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || !std::isfinite(v) || v <= 0.0) return std::nullopt;

  std::string_view unit(ptr, static_cast<size_t>(s.data() + s.size() - ptr));
  while (!unit.empty() && std::isspace((unsigned char)unit.front())) unit.remove_prefix(1);

  double mul = 1.0;
  if (unit.empty() || ieq(unit, "b"))                                   mul = 1.0;
  else if (ieq(unit, "k") || ieq(unit, "kb") || ieq(unit, "kib"))       mul = 1024.0;
  else if (ieq(unit, "m") || ieq(unit, "mb") || ieq(unit, "mib"))       mul = 1024.0 * 1024.0;
  else if (ieq(unit, "g") || ieq(unit, "gb") || ieq(unit, "gib"))       mul = 1024.0 * 1024.0 * 1024.0;
  else return std::nullopt;

  const double bytes = std::floor(v * mul);
  const double limit = static_cast<double>(std::numeric_limits<std::size_t>::max() / kOutputExpansion);
  if (bytes < 1.0 || bytes >= limit) return std::nullopt;
  return static_cast<std::size_t>(bytes);
}

}
