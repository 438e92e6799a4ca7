#include "bcp_exorcist/stream_driver.hpp"
#include "bcp_exorcist/metrics.hpp"
#include <exception>
#include <string_view>
#include <vector>

namespace bx {

static bool fail(std::string* err_out, const char* step, const std::string& why) {
  if (err_out) *err_out = std::string(step) + " failed: " + (why.empty() ? "unknown error" : why);
  return false;
}

void close_pending(std::vector<char>& out, int flushed_tail, InputTail tail) {
  const std::size_t len = out.size();
  if (len == 0) return;
  if (len == 1 && flushed_tail == kNoPrevByte) return;

  const char last = out[len - 1];
  const int  prev = (len > 1) ? static_cast<unsigned char>(out[len - 2]) : flushed_tail;

  switch (last) {
    case '"':
      if (prev == '\n') out.pop_back();
      else if ((prev == '\\' && tail == InputTail::Quote) ||
               (prev == ',' && tail == InputTail::Separator)) out.push_back('"');
      break;
    case '\n':
      break;
    default:
      out.push_back('"');
      break;
  }
}

bool exorcize_stream(ByteSource& in, ByteSink& out,
                     std::uint64_t total_size, std::size_t chunk_size,
                     const ExorcismOptions& opts,
                     MetricsRegistry* metrics,
                     std::string* err_out) {
  if (chunk_size == 0) return fail(err_out, "configure", "chunk size must be positive");

  if (total_size == 0) {
    if (!out.flush()) return fail(err_out, "flush", out.error());
    return true;
  }

  std::vector<char> buf;
  std::vector<char> pending;
  try {
    buf.resize(chunk_size);
    pending.reserve(chunk_size * kOutputExpansion);
  } catch (const std::exception& e) {
    return fail(err_out, "allocate",
                std::to_string(chunk_size) + "-byte chunk buffers: " + e.what());
  }
  pending.push_back('"'); // stream starts inside an open field

  int carry = kNoPrevByte;        // last input byte of the previous chunk
  int flushed_tail = kNoPrevByte; // last output byte handed to the sink

  while (true) {
    std::size_t got = 0;
    if (!in.read_chunk(buf.data(), buf.size(), &got)) return fail(err_out, "read", in.error());
    if (got == 0) break;

    // write before transcoding so the final buffer stays editable
    if (!pending.empty()) {
      if (!out.write(std::string_view(pending.data(), pending.size())))
        return fail(err_out, "write", out.error());
      flushed_tail = static_cast<unsigned char>(pending.back());
      if (metrics) metrics->add_bytes_out(pending.size());
    }
    pending.clear();

    BatchCounts c = transcode_batch(std::string_view(buf.data(), got), pending,
                                    opts.sep, opts.eol,
                                    opts.carry_escape ? carry : kNoPrevByte);
    carry = static_cast<unsigned char>(buf[got - 1]);
    if (metrics) { metrics->add_chunk(got); metrics->add_rewrites(c); }
  }

  InputTail tail = InputTail::Content;
  if (carry == static_cast<unsigned char>(opts.sep))      tail = InputTail::Separator;
  else if (carry == static_cast<unsigned char>(opts.eol)) tail = InputTail::Content;
  else if (carry == '"')                                  tail = InputTail::Quote;
  close_pending(pending, flushed_tail, tail);

  if (!pending.empty()) {
    if (!out.write(std::string_view(pending.data(), pending.size())))
      return fail(err_out, "write", out.error());
    if (metrics) metrics->add_bytes_out(pending.size());
  }
  if (!out.flush()) return fail(err_out, "flush", out.error());
  return true;
}

}
