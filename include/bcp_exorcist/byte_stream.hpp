#pragma once
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace bx {

// Anything the stream driver can pull raw bytes from.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Reads up to `cap` bytes. Returns false on error; *got == 0 on success
  // means end of stream.
  virtual bool read_chunk(char* dst, std::size_t cap, std::size_t* got) = 0;

  virtual int last_error() const noexcept = 0;
  virtual std::string error() const = 0;
};

// Anything the stream driver can push bytes into.
class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual bool write(std::string_view bytes) = 0;
  virtual bool flush() = 0;

  virtual int last_error() const noexcept = 0;
  virtual std::string error() const = 0;
};

class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::string data) : data_(std::move(data)) {}

  bool read_chunk(char* dst, std::size_t cap, std::size_t* got) override;
  int last_error() const noexcept override { return failed_ ? EIO : 0; }
  std::string error() const override;

  // Make the read after `n` successful reads fail (EIO).
  void fail_after_reads(int n) { fail_after_ = n; }

private:
  std::string data_;
  std::size_t pos_{0};
  int reads_{0};
  int fail_after_{-1};
  bool failed_{false};
};

class MemorySink : public ByteSink {
public:
  bool write(std::string_view bytes) override;
  bool flush() override;
  int last_error() const noexcept override { return errno_; }
  std::string error() const override;

  const std::string& data() const noexcept { return data_; }
  int flushes() const noexcept { return flushes_; }

  // Reject writes once `n` bytes have been accepted (ENOSPC).
  void fail_after_bytes(std::size_t n) { limit_ = n; has_limit_ = true; }
  void fail_on_flush(bool on = true) { fail_flush_ = on; }

private:
  std::string data_;
  int flushes_{0};
  int errno_{0};
  std::size_t limit_{0};
  bool has_limit_{false};
  bool fail_flush_{false};
};

}
