#pragma once
#include "bcp_exorcist/batch_transcoder.hpp"
#include "bcp_exorcist/byte_stream.hpp"
#include "bcp_exorcist/options.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bx {

class MetricsRegistry;

// Role of the last input byte, which the closed bytes alone cannot tell:
// a trailing \" is either an escaped literal quote still needing its
// closing quote, or a backslash field that is already closed.
enum class InputTail { Content, Separator, Quote };

// Resolves the dangling quote left open at end of stream:
//   ...\n"  -> ...\n     (stream ended on a record boundary)
//   ...\n   -> unchanged
//   ...\"   -> ...\""    only when `tail` is Quote (escaped literal quote)
//   ...,"   -> ...,""    only when `tail` is Separator (empty last field)
//   ...x"   -> unchanged (already closed)
//   ...x    -> ...x"
// The tail-driven rows extend the plain two-byte rule, which leaves both
// cases unclosed (see DESIGN.md).
// `flushed_tail` is the last byte already written out, used as the
// predecessor when `out` holds a single byte. Idempotent for any `tail`.
void close_pending(std::vector<char>& out, int flushed_tail = kNoPrevByte,
                   InputTail tail = InputTail::Content);

// Streams `in` to `out` chunk by chunk, rewriting broken CSV into quoted
// CSV. Output for a chunk is written only after the next chunk has been
// read, so the last buffer can still be closed before it is written.
// `total_size` == 0 writes nothing. Returns false on any read/write/flush
// failure (or chunk_size == 0) with a message in *err_out.
bool exorcize_stream(ByteSource& in, ByteSink& out,
                     std::uint64_t total_size, std::size_t chunk_size,
                     const ExorcismOptions& opts,
                     MetricsRegistry* metrics = nullptr,
                     std::string* err_out = nullptr);

}
