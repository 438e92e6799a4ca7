#pragma once
#include "bcp_exorcist/byte_stream.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace bx {

// Writes to a file through a large stdio buffer. Optionally keeps a running
// SHA-256 of everything written.
class ChunkWriter : public ByteSink {
public:
  struct Config {
    std::size_t buffer_bytes = 1024 * 1024; // stdio buffer, 1 MiB
    bool        digest       = true;        // SHA-256 of written bytes
  };

  explicit ChunkWriter(std::string path);      // uses default Config{}
  ChunkWriter(std::string path, Config cfg);   // explicit Config
  ~ChunkWriter() override;

  ChunkWriter(const ChunkWriter&) = delete;
  ChunkWriter& operator=(const ChunkWriter&) = delete;

  bool is_open() const noexcept;

  bool write(std::string_view bytes) override;
  bool flush() override;
  int  last_error() const noexcept override;
  std::string error() const override;

  std::uint64_t bytes_written() const noexcept;

  // Lowercase hex digest of bytes written so far; empty when digest is off.
  std::string sha256_hex() const;

  // Flushes and closes; false if the final flush/close failed.
  bool close();

private:
  struct Impl; Impl* p_;
};

}
