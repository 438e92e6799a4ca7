#pragma once
#include <cstdint>
#include <string_view>
#include <vector>

namespace bx {

// No byte precedes the chunk (look-back stays inside the chunk).
constexpr int kNoPrevByte = -1;

struct BatchCounts {
  std::uint64_t separators  = 0;
  std::uint64_t terminators = 0;
  std::uint64_t quotes      = 0;
  std::uint64_t escapes     = 0; // '\' passed through before sep/eol

  BatchCounts& operator+=(const BatchCounts& o) noexcept {
    separators += o.separators; terminators += o.terminators;
    quotes += o.quotes; escapes += o.escapes;
    return *this;
  }
};

// Rewrites one chunk of broken CSV, appending to `out` (never cleared here).
//   sep -> "," between quoted fields   eol -> "\n" between quoted rows
//   '"' -> \"
// A '\' right before sep/eol is passed through as an extra '\'. The byte
// before position 0 is `prev_byte`, or nothing when it is kNoPrevByte.
// If one byte serves several roles: sep wins over eol, eol over quote.
BatchCounts transcode_batch(std::string_view haystack, std::vector<char>& out,
                            char sep, char eol, int prev_byte = kNoPrevByte);

}
