#pragma once
#include "csv_splitter/split_planner.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Job-level key/value settings.
//   csv.delimiter          default "\""
//   csv.separator          default ","
//   split.lines_per_split  default 1
//   split.threads          default 1
class Configuration {
public:
  static constexpr const char* kDelimiter     = "csv.delimiter";
  static constexpr const char* kSeparator     = "csv.separator";
  static constexpr const char* kLinesPerSplit = "split.lines_per_split";
  static constexpr const char* kThreads       = "split.threads";

  static constexpr const char* kDefaultDelimiter = "\"";
  static constexpr const char* kDefaultSeparator = ",";
  static constexpr std::int64_t kDefaultLinesPerSplit = 1;

  void set(std::string key, std::string value);
  void set_int(std::string key, std::int64_t value);
  void unset(std::string_view key);

  std::optional<std::string> get(std::string_view key) const;
  std::string get(std::string_view key, std::string_view defv) const;

  // Throws ConfigurationError when the value is present but not an integer.
  std::int64_t get_int(std::string_view key, std::int64_t defv) const;

  // Properties file: "key=value" per line, '#' comments, blank lines ignored.
  // Keys are trimmed, values are kept verbatim (a " " separator is legal).
  bool load_file(const std::string& path, std::string* err_out = nullptr);

  // "key=value" from the command line.
  bool merge_arg(std::string_view kv, std::string* err_out = nullptr);

  std::size_t size() const noexcept { return kv_.size(); }

private:
  std::map<std::string, std::string, std::less<>> kv_;
};

void set_lines_per_split(Configuration& conf, std::int64_t lines);
std::int64_t get_lines_per_split(const Configuration& conf);

// Record-reader construction check: resolves defaults and validates
// delimiter/separator, lines per split and threads. Throws ConfigurationError.
PlannerConfig planner_config_from(const Configuration& conf);

}
