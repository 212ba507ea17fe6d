#include "csv_splitter/metrics.hpp"

#include <algorithm>
#include <sstream>

namespace cs {

void MetricsRegistry::add_plan(const FilePlan& p) noexcept {
  ++files_;
  lines_ += p.lines;
  bytes_ += p.bytes;
  splits_ += p.splits.size();
  if (p.unterminated_quote) ++open_quote_files_;
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.files = files_;
  r.lines = lines_;
  r.bytes = bytes_;
  r.splits = splits_;
  r.unterminated_quote_files = open_quote_files_;
  r.wall_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0 : it->second});
  }
  return r;
}

std::string format_stats(const RunStats& s) {
  std::ostringstream o;
  o << "files=" << s.files
    << " splits=" << s.splits
    << " lines=" << s.lines
    << " bytes=" << s.bytes
    << " wall_ms=" << s.wall_ms
    << " mb_s=" << s.throughput_mb_s;
  if (s.unterminated_quote_files) o << " unterminated_quote_files=" << s.unterminated_quote_files;
  for (auto& st : s.stages) o << " " << st.name << "_ms=" << st.duration_ms;
  return o.str();
}

}
