#pragma once
#include "csv_splitter/file_source.hpp"
#include "csv_splitter/split_descriptor.hpp"
#include "csv_splitter/split_planner.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cs {

struct VerifyReport {
  std::uint64_t files = 0;
  std::uint64_t splits = 0;
  std::uint64_t lines = 0;
  std::vector<std::string> problems;

  bool ok() const noexcept { return problems.empty(); }
};

// Checks a plan the way a consumer sees it: per file, the descriptors must
// tile [0, size) in order, and re-reading each range on its own must give
// exactly lines_per_split logical lines (1..lines_per_split for the last).
// Configuration and I/O failures still throw; plan defects are reported.
VerifyReport verify_plan(const std::vector<FileEntry>& files,
                         const std::vector<SplitDescriptor>& splits,
                         const PlannerConfig& cfg,
                         StreamProvider& streams);

}
