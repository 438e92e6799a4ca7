#include "bcp_exorcist/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

namespace bx {

struct ChunkReader::Impl {
  std::string path;
  FILE* f{nullptr};
  int last_errno{0};
  std::uint64_t size{0};
  std::uint64_t bytes{0};

  void open() {
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return; }

    struct stat st{};
    if (::fstat(::fileno(f), &st) != 0) { last_errno = errno; std::fclose(f); f = nullptr; return; }
    size = static_cast<std::uint64_t>(st.st_size);
  }

  bool read_chunk(char* dst, std::size_t cap, std::size_t* got) {
    *got = 0;
    if (!f) { if (!last_errno) last_errno = EBADF; return false; }

    std::size_t n = std::fread(dst, 1, cap, f);
    if (n == 0 && std::ferror(f)) { last_errno = errno ? errno : EIO; return false; }
    bytes += n;
    *got = n;
    return true;
  }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }
};

ChunkReader::ChunkReader(std::string path)
  : p_(new Impl{std::move(path)}) { p_->open(); }

ChunkReader::~ChunkReader() { p_->close(); delete p_; }

bool ChunkReader::is_open() const noexcept { return p_->f != nullptr; }
const std::string& ChunkReader::path() const noexcept { return p_->path; }
std::uint64_t ChunkReader::size() const noexcept { return p_->size; }

bool ChunkReader::read_chunk(char* dst, std::size_t cap, std::size_t* got) {
  return p_->read_chunk(dst, cap, got);
}

int ChunkReader::last_error() const noexcept { return p_->last_errno; }

std::string ChunkReader::error() const {
  if (!p_->last_errno) return {};
  return p_->path + ": " + std::strerror(p_->last_errno);
}

std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
void ChunkReader::close() { p_->close(); }

}
