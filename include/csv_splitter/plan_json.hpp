#pragma once
#include "csv_splitter/split_descriptor.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cs {

class PlanJsonWriter {
public:
  // {"splits":[{"path":"...","offset":N,"length":N},...]}
  static std::string to_json(const std::vector<SplitDescriptor>& splits);

  // One "path\toffset\tlength\n" line per split.
  static std::string to_tsv(const std::vector<SplitDescriptor>& splits);
};

// Parses a document produced by PlanJsonWriter::to_json. Unknown members are
// ignored. Throws InputError("malformed plan: ...") on any JSON/schema error.
std::vector<SplitDescriptor> parse_plan_json(std::string_view json);

// Reads and parses a plan file. Throws IoError if it cannot be read.
std::vector<SplitDescriptor> load_plan_json(const std::string& path);

}
