#include "csv_splitter/plan_verifier.hpp"
#include "csv_splitter/quote_line_reader.hpp"

#include <limits>
#include <map>
#include <sstream>

namespace cs {

static std::string where(const SplitDescriptor& d) {
  std::ostringstream o;
  o << d.path << " [" << d.offset << ", ";
  if (d.length > std::numeric_limits<std::uint64_t>::max() - d.offset) o << d.offset << "+" << d.length;
  else o << d.end();
  o << ")";
  return o.str();
}

// Counts the logical lines a consumer would find inside exactly one range.
static std::uint64_t count_range_lines(const SplitDescriptor& d, const CsvFormat& fmt,
                                       StreamProvider& streams, std::uint64_t* consumed) {
  QuoteLineReader reader(streams.open(d.path, d.offset, d.length), fmt);
  std::uint64_t n = 0;
  reader.for_each_line([&](std::string_view, std::size_t) { ++n; return true; });
  *consumed = reader.position();
  return n;
}

VerifyReport verify_plan(const std::vector<FileEntry>& files,
                         const std::vector<SplitDescriptor>& splits,
                         const PlannerConfig& cfg,
                         StreamProvider& streams) {
  cfg.validate();
  VerifyReport rep;

  std::map<std::string, std::vector<const SplitDescriptor*>> by_file;
  for (const auto& f : files) by_file[f.path];
  // Descriptors of one file must be contiguous in the plan.
  std::map<std::string, bool> closed;
  const std::string* prev = nullptr;
  for (const auto& d : splits) {
    if (!prev || *prev != d.path) {
      if (prev) closed[*prev] = true;
      if (closed[d.path]) rep.problems.push_back("plan not grouped by file at " + where(d));
      prev = &d.path;
    }
    auto it = by_file.find(d.path);
    if (it == by_file.end()) {
      rep.problems.push_back("split for unknown file: " + where(d));
      continue;
    }
    it->second.push_back(&d);
  }

  const auto k = static_cast<std::uint64_t>(cfg.lines_per_split);
  for (const auto& f : files) {
    ++rep.files;
    const auto& mine = by_file[f.path];
    std::uint64_t expect_offset = 0;
    for (std::size_t i = 0; i < mine.size(); ++i) {
      const SplitDescriptor& d = *mine[i];
      ++rep.splits;
      if (d.offset != expect_offset) {
        std::ostringstream o;
        o << (d.offset > expect_offset ? "gap" : "overlap") << " before " << where(d)
          << ", expected offset " << expect_offset;
        rep.problems.push_back(o.str());
      }
      if (d.offset > f.size || d.length > f.size - d.offset) {
        rep.problems.push_back("split past end of file: " + where(d));
        expect_offset = d.offset;
        continue;
      }
      expect_offset = d.end();

      std::uint64_t consumed = 0;
      const std::uint64_t n = count_range_lines(d, cfg.format, streams, &consumed);
      rep.lines += n;
      const bool last = (i + 1 == mine.size());
      if (consumed != d.length) {
        rep.problems.push_back("short read in " + where(d));
      } else if (last ? (n == 0 || n > k) : (n != k)) {
        std::ostringstream o;
        o << where(d) << " holds " << n << " logical lines, expected "
          << (last ? "1.." : "") << k;
        rep.problems.push_back(o.str());
      }
    }
    if (expect_offset != f.size) {
      std::ostringstream o;
      o << f.path << ": splits cover " << expect_offset << " of " << f.size << " bytes";
      rep.problems.push_back(o.str());
    }
  }
  return rep;
}

}
