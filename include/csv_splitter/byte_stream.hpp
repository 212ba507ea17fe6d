#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

namespace cs {

// Sequential, closeable byte source. Readers pull one byte at a time so the
// stream position always matches what the caller has consumed.
class ByteStream {
public:
  static constexpr int kEof = -1;

  virtual ~ByteStream() = default;

  // Next byte as unsigned char value, or kEof. Throws IoError on failure.
  virtual int get() = 0;

  // Bytes handed out by get() so far.
  virtual std::uint64_t position() const noexcept = 0;

  // Releases the underlying handle. Safe to call more than once.
  virtual void close() noexcept = 0;
};

// stdio-backed file stream, optionally limited to [offset, offset+length).
class FileByteStream : public ByteStream {
public:
  static constexpr std::uint64_t kToEnd = std::numeric_limits<std::uint64_t>::max();

  explicit FileByteStream(std::string path, std::uint64_t offset = 0,
                          std::uint64_t length = kToEnd);
  ~FileByteStream() override;

  FileByteStream(const FileByteStream&) = delete;
  FileByteStream& operator=(const FileByteStream&) = delete;

  int get() override;
  std::uint64_t position() const noexcept override { return pos_; }
  void close() noexcept override;

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  std::uint64_t remaining_;
  std::uint64_t pos_{0};
};

// In-memory stream over an owned buffer (tests, small inputs).
class MemoryByteStream : public ByteStream {
public:
  explicit MemoryByteStream(std::string data) : data_(std::move(data)) {}

  int get() override;
  std::uint64_t position() const noexcept override { return pos_; }
  void close() noexcept override { closed_ = true; }

  bool closed() const noexcept { return closed_; }

private:
  std::string data_;
  std::size_t pos_{0};
  bool closed_{false};
};

}
