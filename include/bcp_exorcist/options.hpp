#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace bx {

constexpr char        kDefaultSeparator  = '\x1E';
constexpr char        kDefaultTerminator = '\x1D';
constexpr std::size_t kDefaultChunkBytes = 4 * 1024 * 1024; // 4 MiB
constexpr std::size_t kCompactChunkBytes = 1 * 1024 * 1024; // 1 MiB
constexpr std::size_t kOutputExpansion   = 3;               // out buffer = 3x chunk

struct ExorcismOptions {
  char sep = kDefaultSeparator;   // field boundary in the broken input
  char eol = kDefaultTerminator;  // record boundary in the broken input
  bool carry_escape = false;      // look back across chunk boundaries for '\'
};

struct ExorcizeRequest {
  std::string path;
  ExorcismOptions opts;
  std::size_t chunk_size = kDefaultChunkBytes;
};

// Absent or empty -> `def`; one byte -> that byte; anything longer is a
// configuration error (nullopt + message in *err).
std::optional<char> unwrap_byte(std::optional<std::string_view> in, char def,
                                std::string* err = nullptr);

bool make_options(std::optional<std::string_view> delim,
                  std::optional<std::string_view> newline,
                  ExorcismOptions* out, std::string* err = nullptr);

// "\x1E", "0x1E", "\t", "\n", "\r", "\0", "\\" or literal text -> raw bytes.
std::optional<std::string> decode_byte_arg(std::string_view s);

// "4194304", "4MiB", "1.5M", "512K" ... (binary units). nullopt when not a
// positive size or when the output expansion would overflow size_t.
std::optional<std::size_t> parse_size(std::string_view s);

// Printable form of a configured byte, e.g. "\x1E".
std::string describe_byte(char c);

}
