#include "csv_splitter/split_planner.hpp"
#include "csv_splitter/errors.hpp"
#include "csv_splitter/quote_line_reader.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <thread>

namespace cs {

void PlannerConfig::validate() const {
  format.validate();
  if (lines_per_split <= 0) throw ConfigurationError("lines per split must be positive");
  if (threads <= 0) throw ConfigurationError("planner threads must be positive");
}

SplitFold fold_line(SplitFold acc, std::uint64_t line_bytes, std::int64_t lines_per_split,
                    const std::string& path, std::vector<SplitDescriptor>& out) {
  acc.length += line_bytes;
  ++acc.lines;
  if (acc.lines == lines_per_split) {
    out.push_back(SplitDescriptor{path, acc.begin, acc.length});
    return SplitFold{acc.begin + acc.length, 0, 0};
  }
  return acc;
}

void flush_fold(const SplitFold& acc, const std::string& path,
                std::vector<SplitDescriptor>& out) {
  if (acc.lines != 0) out.push_back(SplitDescriptor{path, acc.begin, acc.length});
}

SplitPlanner::SplitPlanner(PlannerConfig cfg) : SplitPlanner(cfg, local_streams()) {}

SplitPlanner::SplitPlanner(PlannerConfig cfg, StreamProvider& streams)
  : cfg_(cfg), streams_(streams) {
  cfg_.validate();
}

FilePlan SplitPlanner::plan_file(const FileEntry& file) const {
  if (!file.regular) throw InputError("Not a file: " + file.path);

  FilePlan plan;
  plan.path = file.path;

  QuoteLineReader reader(streams_.open(file.path), cfg_.format);
  std::string row;
  SplitFold acc;
  while (std::size_t n = reader.read_line(row)) {
    acc = fold_line(acc, n, cfg_.lines_per_split, file.path, plan.splits);
    ++plan.lines;
  }
  flush_fold(acc, file.path, plan.splits);

  plan.bytes = reader.position();
  plan.unterminated_quote = reader.unterminated_quote();
  return plan;
}

std::vector<FilePlan> SplitPlanner::plan_files(const std::vector<FileEntry>& files) const {
  // A non-regular input fails the whole run before any file is read.
  for (const auto& f : files) {
    if (!f.regular) throw InputError("Not a file: " + f.path);
  }

  std::vector<FilePlan> plans(files.size());
  std::vector<std::exception_ptr> errors(files.size());

  const std::size_t workers =
      std::min<std::size_t>(static_cast<std::size_t>(cfg_.threads), files.size());

  if (workers <= 1) {
    for (std::size_t i = 0; i < files.size(); ++i) plans[i] = plan_file(files[i]);
    return plans;
  }

  // Each slot is written by exactly one worker; no other shared state.
  std::atomic<std::size_t> next{0};
  auto work = [&]() {
    for (std::size_t i = next++; i < files.size(); i = next++) {
      try {
        plans[i] = plan_file(files[i]);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  try {
    for (std::size_t w = 0; w < workers; ++w) pool.emplace_back(work);
  } catch (...) {
    for (auto& t : pool) t.join();
    throw;
  }
  for (auto& t : pool) t.join();

  for (auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  return plans;
}

std::vector<SplitDescriptor> SplitPlanner::get_splits(const std::vector<FileEntry>& files) const {
  std::vector<SplitDescriptor> out;
  for (auto& p : plan_files(files)) {
    out.insert(out.end(), std::make_move_iterator(p.splits.begin()),
               std::make_move_iterator(p.splits.end()));
  }
  return out;
}

std::vector<SplitDescriptor> plan_splits(const FileEntry& file, const PlannerConfig& cfg) {
  // Re-stat: a caller-built entry may claim a directory is a regular file.
  SplitPlanner planner(cfg);
  return planner.plan_file(LocalFileEnumerator::stat(file.path)).splits;
}

}
