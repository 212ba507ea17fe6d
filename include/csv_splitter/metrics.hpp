#pragma once
#include "csv_splitter/split_planner.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cs {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t files = 0;
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t splits = 0;
  std::uint64_t unterminated_quote_files = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;
};

// Run counters for the CLI summary. Not thread-safe: fold per-file plans in
// after plan_files() returns.
class MetricsRegistry {
public:
  void add_plan(const FilePlan& p) noexcept;

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t files_{0};
  std::uint64_t lines_{0};
  std::uint64_t bytes_{0};
  std::uint64_t splits_{0};
  std::uint64_t open_quote_files_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// "files=2 splits=5 lines=9 bytes=120 ..." single-line summary.
std::string format_stats(const RunStats& s);

}
