#pragma once
#include <cstdint>
#include <string>

namespace cs {

// One unit of downstream work: bytes [offset, offset+length) of `path`.
// Offsets are file-relative; no record count is carried.
struct SplitDescriptor {
  std::string path;
  std::uint64_t offset = 0;
  std::uint64_t length = 0;

  std::uint64_t end() const noexcept { return offset + length; }

  bool operator==(const SplitDescriptor& o) const noexcept {
    return offset == o.offset && length == o.length && path == o.path;
  }
  bool operator!=(const SplitDescriptor& o) const noexcept { return !(*this == o); }
};

}
