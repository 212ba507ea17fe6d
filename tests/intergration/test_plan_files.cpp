#include "csv_splitter/byte_stream.hpp"
#include "csv_splitter/file_source.hpp"
#include "csv_splitter/plan_verifier.hpp"
#include "csv_splitter/split_planner.hpp"
#include "../test_support.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using cs_test::expect;
using cs_test::throws;

namespace {

void write_file(const fs::path& p, const std::string& s) {
  std::ofstream out(p, std::ios::binary);
  out.write(s.data(), static_cast<std::streamsize>(s.size()));
}

std::string read_range(const std::string& path, std::uint64_t off, std::uint64_t len) {
  cs::FileByteStream in(path, off, len);
  std::string s;
  for (int c = in.get(); c != cs::ByteStream::kEof; c = in.get()) s.push_back(static_cast<char>(c));
  return s;
}

// Logical line counts for the checked-in fixtures.
void test_fixtures(const fs::path& dir) {
  const std::map<std::string, std::uint64_t> expected_lines = {
    {"quoted_multiline.csv", 5},
    {"no_trailing_newline.csv", 4},
    {"crlf.csv", 3},
    {"unterminated_quote.csv", 2},
    {"empty.csv", 0},
  };

  cs::LocalFileEnumerator lister;
  auto files = lister.list({dir.string()});
  expect(files.size() == expected_lines.size(), "fixtures: every csv listed");

  for (std::int64_t k : {1, 2, 4}) {
    cs::PlannerConfig cfg;
    cfg.lines_per_split = k;
    cfg.threads = 2;
    cs::SplitPlanner planner(cfg);
    auto plans = planner.plan_files(files);

    std::vector<cs::SplitDescriptor> all;
    for (const auto& p : plans) {
      const std::string name = fs::path(p.path).filename().string();
      auto it = expected_lines.find(name);
      if (it == expected_lines.end()) continue;
      expect(p.lines == it->second, "fixtures: " + name + " line count");
      expect(p.unterminated_quote == (name == "unterminated_quote.csv"),
             "fixtures: " + name + " unterminated flag");
      std::cout << "  " << name << " k=" << k << " lines=" << p.lines
                << " splits=" << p.splits.size() << " bytes=" << p.bytes << "\n";
      all.insert(all.end(), p.splits.begin(), p.splits.end());
    }

    auto rep = cs::verify_plan(files, all, cfg, cs::local_streams());
    for (const auto& pr : rep.problems) std::cerr << "       " << pr << "\n";
    expect(rep.ok(), "fixtures: planner output verifies (k=" + std::to_string(k) + ")");
  }
}

void test_quoted_split_ranges(const fs::path& dir) {
  const std::string path = (dir / "quoted_multiline.csv").string();
  auto splits = cs::plan_splits(cs::LocalFileEnumerator::stat(path), cs::PlannerConfig{});
  expect(splits.size() == 5, "ranges: one split per logical line");
  if (splits.size() != 5) return;
  expect(read_range(path, splits[1].offset, splits[1].length) ==
         "1,alpha,\"first line\nsecond line\"\n", "ranges: record with embedded newline kept whole");
  expect(read_range(path, splits[4].offset, splits[4].length) == "4,delta,\"x\n\ny\"\n",
         "ranges: blank line inside quotes kept whole");
}

void test_directory_listing() {
  const fs::path root = fs::temp_directory_path() / "cs_it_listing";
  fs::remove_all(root);
  fs::create_directories(root);
  write_file(root / "b.csv", "3\n4\n5\n");
  write_file(root / "a.csv", "1\n\"2\n2\"\n");
  write_file(root / "_SUCCESS", "");
  write_file(root / ".a.csv.crc", "xx");

  cs::LocalFileEnumerator lister;
  auto files = lister.list({root.string()});
  expect(files.size() == 2, "listing: hidden and marker files skipped");
  if (files.size() == 2) {
    expect(fs::path(files[0].path).filename() == "a.csv" && files[0].size == 8, "listing: sorted, sized");
    expect(files[1].regular, "listing: regular flag set");
  }

  cs::PlannerConfig cfg;
  cfg.lines_per_split = 2;
  cs::SplitPlanner planner(cfg);
  auto splits = planner.get_splits(files);
  expect(splits.size() == 3, "listing: 1 split for a.csv, 2 for b.csv");
  if (splits.size() == 3) {
    expect(splits[0].length == 8 && splits[1].offset == 0 && splits[1].length == 4 &&
           splits[2].offset == 4 && splits[2].length == 2, "listing: per-file offsets");
  }

  // tampered plan: drop the middle split
  auto broken = splits;
  if (broken.size() == 3) broken.erase(broken.begin() + 1);
  auto rep = cs::verify_plan(files, broken, cfg, cs::local_streams());
  expect(!rep.ok(), "verify: gap detected");

  // merged splits hold too many lines
  auto merged = splits;
  if (merged.size() == 3) { merged[1].length += merged[2].length; merged.pop_back(); }
  expect(!cs::verify_plan(files, merged, cfg, cs::local_streams()).ok(), "verify: oversized split detected");

  // a range whose end wraps around is out of bounds, not an exception
  auto wrapped = splits;
  if (wrapped.size() == 3) { wrapped[2].offset = std::numeric_limits<std::uint64_t>::max(); wrapped[2].length = 1; }
  bool wrapped_ok = true;
  bool past_end = false;
  expect(!throws<std::exception>([&]{
           auto r = cs::verify_plan(files, wrapped, cfg, cs::local_streams());
           wrapped_ok = r.ok();
           for (const auto& pr : r.problems) past_end = past_end || pr.find("past end of file") != std::string::npos;
         }), "verify: wrapping range does not throw");
  expect(!wrapped_ok && past_end, "verify: wrapping range reported past end of file");

  // every split is valid on its own, but b.csv is split around a.csv
  auto interleaved = splits;
  if (interleaved.size() == 3) std::swap(interleaved[0], interleaved[1]);
  auto irep = cs::verify_plan(files, interleaved, cfg, cs::local_streams());
  bool not_grouped = false;
  for (const auto& pr : irep.problems) not_grouped = not_grouped || pr.find("not grouped") != std::string::npos;
  expect(!irep.ok() && not_grouped, "verify: interleaved files detected");

  fs::create_directories(root / "nested");
  auto with_dir = lister.list({root.string()});
  expect(with_dir.size() == 3, "listing: sub-directory listed");
  expect(throws<cs::InputError>([&]{ (void)planner.plan_files(with_dir); }),
         "listing: sub-directory fails the run");

  // a caller-built entry defaults to regular; the directory is still refused
  expect(throws<cs::InputError>([&]{ (void)cs::plan_splits(cs::FileEntry{(root / "nested").string()}, cfg); }),
         "plan_splits: directory entry is an input error");
  expect(throws<cs::InputError>([&]{ (void)cs::plan_splits(cs::FileEntry{root.string(), 0, true}, cfg); }),
         "plan_splits: entry claiming regular is re-checked");

  expect(throws<cs::InputError>([&]{ (void)lister.list({(root / "missing").string()}); }),
         "listing: missing input path");
  expect(throws<cs::IoError>([&]{ cs::FileByteStream s((root / "missing").string()); }),
         "stream: open failure is IoError");
  fs::remove_all(root);
}

}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  try {
    test_fixtures(dir);
    test_quoted_split_ranges(dir);
    test_directory_listing();
  } catch (const std::exception& e) {
    std::cerr << "[FAIL] unexpected exception: " << e.what() << "\n";
    return 1;
  }
  return cs_test::finish("plan_files");
}
