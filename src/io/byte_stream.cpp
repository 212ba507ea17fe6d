#include "csv_splitter/byte_stream.hpp"
#include "csv_splitter/errors.hpp"

#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <utility>

namespace cs {

static std::string errno_text(const std::string& what, const std::string& path, int e) {
  return what + " " + path + ": " + std::strerror(e);
}

FileByteStream::FileByteStream(std::string path, std::uint64_t offset, std::uint64_t length)
  : path_(std::move(path)), remaining_(length) {
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) throw IoError(errno_text("cannot open", path_, errno));
  if (offset > 0 && ::fseeko(f_, static_cast<off_t>(offset), SEEK_SET) != 0) {
    const int e = errno;
    close();
    throw IoError(errno_text("cannot seek", path_, e));
  }
}

FileByteStream::~FileByteStream() { close(); }

int FileByteStream::get() {
  if (!f_) throw IoError("read on closed stream: " + path_);
  if (remaining_ == 0) return kEof;
  const int c = std::getc(f_);
  if (c == EOF) {
    if (std::ferror(f_)) throw IoError(errno_text("read failed on", path_, errno));
    remaining_ = 0;
    return kEof;
  }
  if (remaining_ != kToEnd) --remaining_;
  ++pos_;
  return c;
}

void FileByteStream::close() noexcept {
  if (f_) { std::fclose(f_); f_ = nullptr; }
}

int MemoryByteStream::get() {
  if (closed_) throw IoError("read on closed memory stream");
  if (pos_ >= data_.size()) return kEof;
  return static_cast<unsigned char>(data_[pos_++]);
}

}
