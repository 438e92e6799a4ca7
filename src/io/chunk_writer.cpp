#include "bcp_exorcist/chunk_writer.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/sha.h>

namespace bx {

struct ChunkWriter::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  std::vector<char> vbuf;
  int last_errno{0};
  std::uint64_t bytes{0};
  SHA256_CTX sha{};

  void open() {
    f = std::fopen(path.c_str(), "wb");
    if (!f) { last_errno = errno; return; }
    if (cfg.buffer_bytes > 0) {
      vbuf.resize(cfg.buffer_bytes);
      std::setvbuf(f, vbuf.data(), _IOFBF, vbuf.size());
    }
    if (cfg.digest) SHA256_Init(&sha);
  }

  bool write(std::string_view b) {
    if (!f) { if (!last_errno) last_errno = EBADF; return false; }
    if (b.empty()) return true;
    std::size_t n = std::fwrite(b.data(), 1, b.size(), f);
    if (n != b.size()) { last_errno = errno ? errno : EIO; return false; }
    if (cfg.digest) SHA256_Update(&sha, b.data(), b.size());
    bytes += n;
    return true;
  }

  bool flush() {
    if (!f) { if (!last_errno) last_errno = EBADF; return false; }
    if (std::fflush(f) != 0) { last_errno = errno ? errno : EIO; return false; }
    return true;
  }

  bool close() {
    if (!f) return last_errno == 0;
    bool ok = std::fflush(f) == 0;
    if (!ok) last_errno = errno ? errno : EIO;
    if (std::fclose(f) != 0 && ok) { last_errno = errno ? errno : EIO; ok = false; }
    f = nullptr;
    return ok;
  }
};

ChunkWriter::ChunkWriter(std::string path)
  : ChunkWriter(std::move(path), Config{}) {}

ChunkWriter::ChunkWriter(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) { p_->open(); }

ChunkWriter::~ChunkWriter() { (void)p_->close(); delete p_; }

bool ChunkWriter::is_open() const noexcept { return p_->f != nullptr; }
bool ChunkWriter::write(std::string_view bytes) { return p_->write(bytes); }
bool ChunkWriter::flush() { return p_->flush(); }
bool ChunkWriter::close() { return p_->close(); }
int  ChunkWriter::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkWriter::bytes_written() const noexcept { return p_->bytes; }

std::string ChunkWriter::error() const {
  if (!p_->last_errno) return {};
  return p_->path + ": " + std::strerror(p_->last_errno);
}

std::string ChunkWriter::sha256_hex() const {
  if (!p_->cfg.digest) return {};
  SHA256_CTX ctx = p_->sha; // finalize a copy; writing may continue
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256_Final(md, &ctx);
  std::ostringstream o;
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
  return o.str();
}

}
