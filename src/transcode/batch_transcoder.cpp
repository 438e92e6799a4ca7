#include "bcp_exorcist/batch_transcoder.hpp"
#include <cstddef>

namespace bx {

static inline void append(std::vector<char>& out, const char* b, const char* e) {
  out.insert(out.end(), b, e);
}

template <std::size_t N>
static inline void append_lit(std::vector<char>& out, const char (&lit)[N]) {
  out.insert(out.end(), lit, lit + (N - 1));
}

BatchCounts transcode_batch(std::string_view haystack, std::vector<char>& out,
                            char sep, char eol, int prev_byte) {
  BatchCounts n;
  const char* s = haystack.data();
  const char* e = s + haystack.size();
  const char* span = s; // start of the pending verbatim run

  auto escaped = [&](const char* p) {
    if (p > s) return p[-1] == '\\';
    return prev_byte == static_cast<unsigned char>('\\');
  };

  // Single forward pass over all three needles keeps rewrites in file order.
  for (const char* p = s; p < e; ++p) {
    const char c = *p;
    if (c != sep && c != eol && c != '"') continue;

    append(out, span, p);
    if (c == sep) {
      if (escaped(p)) { out.push_back('\\'); ++n.escapes; }
      append_lit(out, "\",\"");
      ++n.separators;
    } else if (c == eol) {
      if (escaped(p)) { out.push_back('\\'); ++n.escapes; }
      append_lit(out, "\"\n\"");
      ++n.terminators;
    } else {
      append_lit(out, "\\\"");
      ++n.quotes;
    }
    span = p + 1;
  }

  if (span < e) append(out, span, e);
  return n;
}

}
