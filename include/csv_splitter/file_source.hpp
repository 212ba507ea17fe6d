#pragma once
#include "csv_splitter/byte_stream.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cs {

struct FileEntry {
  std::string path;
  std::uint64_t size = 0;
  bool regular = true;  // false for directories, dangling links, devices...
};

// Turns job inputs into the ordered list of files to plan.
class FileEnumerator {
public:
  virtual ~FileEnumerator() = default;
  virtual std::vector<FileEntry> list(const std::vector<std::string>& inputs) const = 0;
};

// Local filesystem listing.
//  - a regular file yields itself
//  - a directory yields its immediate children sorted by name, skipping
//    hidden names ('.' or '_' prefix); sub-directories come back with
//    regular=false so planning rejects them
//  - a missing path throws InputError
class LocalFileEnumerator : public FileEnumerator {
public:
  std::vector<FileEntry> list(const std::vector<std::string>& inputs) const override;

  // Stat a single path without expanding directories.
  static FileEntry stat(const std::string& path);
};

// Opens a byte stream for a file, or for a byte range of it.
class StreamProvider {
public:
  static constexpr std::uint64_t kToEnd = FileByteStream::kToEnd;

  virtual ~StreamProvider() = default;
  virtual std::unique_ptr<ByteStream> open(const std::string& path,
                                           std::uint64_t offset = 0,
                                           std::uint64_t length = kToEnd) = 0;
};

class LocalStreamProvider : public StreamProvider {
public:
  std::unique_ptr<ByteStream> open(const std::string& path,
                                   std::uint64_t offset = 0,
                                   std::uint64_t length = kToEnd) override;
};

// Process-wide local provider used by the plain-function entry points.
StreamProvider& local_streams();

// True for names the directory listing skips.
bool is_hidden_name(const std::string& filename);

}
