#include "csv_splitter/config.hpp"
#include "csv_splitter/errors.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <utility>

namespace cs {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

void Configuration::set(std::string key, std::string value) {
  kv_[std::move(key)] = std::move(value);
}

void Configuration::set_int(std::string key, std::int64_t value) {
  set(std::move(key), std::to_string(value));
}

void Configuration::unset(std::string_view key) {
  auto it = kv_.find(key);
  if (it != kv_.end()) kv_.erase(it);
}

std::optional<std::string> Configuration::get(std::string_view key) const {
  auto it = kv_.find(key);
  if (it == kv_.end()) return std::nullopt;
  return it->second;
}

std::string Configuration::get(std::string_view key, std::string_view defv) const {
  auto v = get(key);
  return v ? *v : std::string(defv);
}

std::int64_t Configuration::get_int(std::string_view key, std::int64_t defv) const {
  auto v = get(key);
  if (!v) return defv;
  std::string_view s = trim(*v);
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size()) {
    throw ConfigurationError("not an integer for " + std::string(key) + ": '" + *v + "'");
  }
  return out;
}

bool Configuration::merge_arg(std::string_view kv, std::string* err_out) {
  auto eq = kv.find('=');
  std::string_view key = (eq == std::string_view::npos) ? std::string_view{} : trim(kv.substr(0, eq));
  if (key.empty()) {
    if (err_out) *err_out = "expected key=value, got '" + std::string(kv) + "'";
    return false;
  }
  set(std::string(key), std::string(kv.substr(eq + 1)));
  return true;
}

bool Configuration::load_file(const std::string& path, std::string* err_out) {
  std::ifstream in(path);
  if (!in) {
    if (err_out) *err_out = "cannot open config file: " + path;
    return false;
  }
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    std::string_view t = trim(line);
    if (t.empty() || t.front() == '#') continue;
    std::string err;
    if (!merge_arg(line, &err)) {
      if (err_out) *err_out = path + ":" + std::to_string(line_no) + ": " + err;
      return false;
    }
  }
  return true;
}

void set_lines_per_split(Configuration& conf, std::int64_t lines) {
  conf.set_int(Configuration::kLinesPerSplit, lines);
}

std::int64_t get_lines_per_split(const Configuration& conf) {
  return conf.get_int(Configuration::kLinesPerSplit, Configuration::kDefaultLinesPerSplit);
}

PlannerConfig planner_config_from(const Configuration& conf) {
  PlannerConfig cfg;
  cfg.format = CsvFormat::from_strings(
      conf.get(Configuration::kDelimiter, Configuration::kDefaultDelimiter),
      conf.get(Configuration::kSeparator, Configuration::kDefaultSeparator));
  cfg.lines_per_split = get_lines_per_split(conf);
  const std::int64_t threads = conf.get_int(Configuration::kThreads, 1);
  if (threads <= 0 || threads > 1024) {
    throw ConfigurationError("planner threads must be between 1 and 1024");
  }
  cfg.threads = static_cast<int>(threads);
  cfg.validate();
  return cfg;
}

}
