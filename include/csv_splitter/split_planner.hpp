#pragma once
#include "csv_splitter/csv_format.hpp"
#include "csv_splitter/file_source.hpp"
#include "csv_splitter/split_descriptor.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cs {

struct PlannerConfig {
  CsvFormat format;
  std::int64_t lines_per_split = 1;
  int threads = 1;  // files planned concurrently by plan_files()

  // Throws ConfigurationError on an invalid format, lines_per_split <= 0 or threads <= 0.
  void validate() const;
};

// Result of planning one file. Only `splits` is handed to consumers.
struct FilePlan {
  std::string path;
  std::vector<SplitDescriptor> splits;
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  bool unterminated_quote = false;
};

// Accumulator threaded through the per-line fold.
struct SplitFold {
  std::uint64_t begin = 0;
  std::uint64_t length = 0;
  std::int64_t lines = 0;
};

// Adds one logical line of `line_bytes` to `acc`; appends a descriptor to
// `out` when the group reaches `lines_per_split` and returns the reset fold.
SplitFold fold_line(SplitFold acc, std::uint64_t line_bytes, std::int64_t lines_per_split,
                    const std::string& path, std::vector<SplitDescriptor>& out);

// Emits the trailing partial group, if any.
void flush_fold(const SplitFold& acc, const std::string& path,
                std::vector<SplitDescriptor>& out);

class SplitPlanner {
public:
  // Validates cfg before anything else; `streams` must outlive the planner.
  explicit SplitPlanner(PlannerConfig cfg);
  SplitPlanner(PlannerConfig cfg, StreamProvider& streams);

  FilePlan plan_file(const FileEntry& file) const;

  // One plan per file, in input order. Runs up to cfg.threads files at once;
  // the first failure (in file order) is rethrown after all workers finish.
  std::vector<FilePlan> plan_files(const std::vector<FileEntry>& files) const;

  // All descriptors of plan_files(), grouped by file.
  std::vector<SplitDescriptor> get_splits(const std::vector<FileEntry>& files) const;

  const PlannerConfig& config() const noexcept { return cfg_; }

private:
  PlannerConfig cfg_;
  StreamProvider& streams_;
};

// Plain-function entry point over the local filesystem.
std::vector<SplitDescriptor> plan_splits(const FileEntry& file, const PlannerConfig& cfg);

}
