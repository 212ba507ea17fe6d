#include "csv_splitter/file_source.hpp"
#include "csv_splitter/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace cs {

namespace fs = std::filesystem;

bool is_hidden_name(const std::string& filename) {
  return !filename.empty() && (filename[0] == '.' || filename[0] == '_');
}

FileEntry LocalFileEnumerator::stat(const std::string& path) {
  FileEntry e;
  e.path = path;
  std::error_code ec;
  e.regular = fs::is_regular_file(path, ec);
  if (e.regular) {
    e.size = fs::file_size(path, ec);
    if (ec) throw IoError("cannot stat " + path + ": " + ec.message());
  }
  return e;
}

std::vector<FileEntry> LocalFileEnumerator::list(const std::vector<std::string>& inputs) const {
  std::vector<FileEntry> out;
  for (const auto& in : inputs) {
    std::error_code ec;
    // symlink_status: a link to nothing still "exists" and is rejected later
    if (!fs::exists(fs::symlink_status(in, ec))) {
      throw InputError("Input path does not exist: " + in);
    }
    if (!fs::is_directory(in, ec)) {
      out.push_back(stat(in));
      continue;
    }

    std::vector<std::string> children;
    for (auto& d : fs::directory_iterator(in, ec)) {
      const std::string name = d.path().filename().string();
      if (is_hidden_name(name)) continue;
      children.push_back(d.path().string());
    }
    if (ec) throw IoError("cannot list " + in + ": " + ec.message());
    std::sort(children.begin(), children.end());
    for (const auto& c : children) out.push_back(stat(c));
  }
  return out;
}

std::unique_ptr<ByteStream> LocalStreamProvider::open(const std::string& path,
                                                      std::uint64_t offset,
                                                      std::uint64_t length) {
  return std::make_unique<FileByteStream>(path, offset, length);
}

StreamProvider& local_streams() {
  static LocalStreamProvider provider;
  return provider;
}

}
