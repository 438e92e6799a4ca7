#include "bcp_exorcist/byte_stream.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

namespace bx {

bool MemorySource::read_chunk(char* dst, std::size_t cap, std::size_t* got) {
  *got = 0;
  if (failed_ || (fail_after_ >= 0 && reads_ >= fail_after_)) { failed_ = true; return false; }
  ++reads_;
  const std::size_t n = std::min(cap, data_.size() - pos_);
  if (n) std::memcpy(dst, data_.data() + pos_, n);
  pos_ += n;
  *got = n;
  return true;
}

std::string MemorySource::error() const {
  return failed_ ? std::strerror(EIO) : std::string();
}

bool MemorySink::write(std::string_view bytes) {
  if (has_limit_ && data_.size() + bytes.size() > limit_) {
    data_.append(bytes.substr(0, limit_ - data_.size()));
    errno_ = ENOSPC;
    return false;
  }
  data_.append(bytes);
  return true;
}

bool MemorySink::flush() {
  if (fail_flush_) { errno_ = EIO; return false; }
  ++flushes_;
  return true;
}

std::string MemorySink::error() const {
  return errno_ ? std::strerror(errno_) : std::string();
}

}
