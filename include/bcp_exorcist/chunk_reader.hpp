#pragma once
#include "bcp_exorcist/byte_stream.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace bx {

// Pulls raw chunks from a file with stdio. Open failures are deferred:
// is_open() is false and last_error() carries errno.
class ChunkReader : public ByteSource {
public:
  explicit ChunkReader(std::string path);
  ~ChunkReader() override;

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  bool is_open() const noexcept;
  const std::string& path() const noexcept;

  // Size on disk at open time (0 if unknown).
  std::uint64_t size() const noexcept;

  bool read_chunk(char* dst, std::size_t cap, std::size_t* got) override;
  int  last_error() const noexcept override;
  std::string error() const override;
  std::uint64_t bytes_read() const noexcept;

  void close();

private:
  struct Impl; Impl* p_;
};

}
