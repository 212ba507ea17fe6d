#include "csv_splitter/config.hpp"
#include "csv_splitter/errors.hpp"
#include "csv_splitter/file_source.hpp"
#include "csv_splitter/metrics.hpp"
#include "csv_splitter/plan_json.hpp"
#include "csv_splitter/plan_verifier.hpp"
#include "csv_splitter/split_planner.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

enum ExitCode { kOk = 0, kVerifyFailed = 1, kConfigError = 2, kInputError = 3 };

struct Cli {
  std::string conf_file;
  std::vector<std::string> defines;  // -Dkey=value, in order
  std::optional<std::string> lines_per_split;
  std::optional<std::string> delimiter;
  std::optional<std::string> separator;
  std::optional<std::string> threads;
  std::string format = "json";  // json|tsv
  std::string out;              // empty -> stdout
  std::string check_plan;       // verify this plan instead of planning
  bool verify = false;
  bool quiet = false;
  std::vector<std::string> inputs;
};

void usage(std::ostream& os) {
  os <<
    "Usage: csv-splitter [--lines-per-split=N] [--delimiter=C] [--separator=C]\n"
    "                    [--threads=N] [--conf=FILE] [-Dkey=value]...\n"
    "                    [--format=json|tsv] [--out=FILE] [--verify] [--check=PLAN.json]\n"
    "                    [--quiet] <path>...\n";
}

// Returns false on a usage error.
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_opt = [&](const char* pfx, std::optional<std::string>* out){
      std::string v;
      if (!eat(pfx, &v)) return false;
      *out = v;
      return true;
    };
    if (eat_opt("--lines-per-split=", &c.lines_per_split)) continue;
    if (eat_opt("--delimiter=", &c.delimiter)) continue;
    if (eat_opt("--separator=", &c.separator)) continue;
    if (eat_opt("--threads=", &c.threads)) continue;
    if (eat("--conf=", &c.conf_file)) continue;
    if (eat("--format=", &c.format)) continue;
    if (eat("--out=", &c.out)) continue;
    if (eat("--check=", &c.check_plan)) continue;
    if (a.rfind("-D", 0) == 0 && a.size() > 2) { c.defines.push_back(a.substr(2)); continue; }
    if (a == "--verify") { c.verify = true; continue; }
    if (a == "--quiet")  { c.quiet  = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "[plan] unknown option: " << a << "\n";
      return false;
    }
    c.inputs.push_back(a);
  }
  if (c.format != "json" && c.format != "tsv") {
    std::cerr << "[plan] --format must be json or tsv\n";
    return false;
  }
  if (c.inputs.empty()) {
    std::cerr << "[plan] no input paths\n";
    return false;
  }
  return true;
}

// defaults < --conf file < -D overrides < named flags
bool build_configuration(const Cli& c, cs::Configuration& conf) {
  std::string err;
  if (!c.conf_file.empty() && !conf.load_file(c.conf_file, &err)) {
    std::cerr << "[plan] " << err << "\n";
    return false;
  }
  for (const auto& d : c.defines) {
    if (!conf.merge_arg(d, &err)) { std::cerr << "[plan] bad -D: " << err << "\n"; return false; }
  }
  if (c.lines_per_split) conf.set(cs::Configuration::kLinesPerSplit, *c.lines_per_split);
  if (c.delimiter)       conf.set(cs::Configuration::kDelimiter, *c.delimiter);
  if (c.separator)       conf.set(cs::Configuration::kSeparator, *c.separator);
  if (c.threads)         conf.set(cs::Configuration::kThreads, *c.threads);
  return true;
}

bool write_output(const std::string& path, const std::string& body) {
  if (path.empty()) {
    std::cout << body;
    if (body.empty() || body.back() != '\n') std::cout << "\n";
    return true;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) { std::cerr << "[plan] cannot write " << path << "\n"; return false; }
  out.write(body.data(), static_cast<std::streamsize>(body.size()));
  return static_cast<bool>(out);
}

int report_verify(const cs::VerifyReport& rep) {
  for (const auto& p : rep.problems) std::cerr << "[verify] " << p << "\n";
  std::cerr << "[verify] " << (rep.ok() ? "ok" : "FAILED")
            << ": files=" << rep.files << " splits=" << rep.splits
            << " lines=" << rep.lines << " problems=" << rep.problems.size() << "\n";
  return rep.ok() ? kOk : kVerifyFailed;
}

int run(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  cs::Configuration conf;
  if (!build_configuration(cli, conf)) return kConfigError;

  // Eager check: nothing is listed or opened with a bad configuration.
  cs::PlannerConfig cfg = cs::planner_config_from(conf);

  cs::MetricsRegistry metrics;
  cs::LocalFileEnumerator lister;
  metrics.start_stage("enumerate");
  std::vector<cs::FileEntry> files = lister.list(cli.inputs);
  metrics.end_stage("enumerate");

  if (!cli.check_plan.empty()) {
    metrics.start_stage("verify");
    auto plan = cs::load_plan_json(cli.check_plan);
    int rc = report_verify(cs::verify_plan(files, plan, cfg, cs::local_streams()));
    metrics.end_stage("verify");
    return rc;
  }

  cs::SplitPlanner planner(cfg);
  metrics.start_stage("plan");
  std::vector<cs::FilePlan> plans = planner.plan_files(files);
  metrics.end_stage("plan");

  std::vector<cs::SplitDescriptor> splits;
  for (auto& p : plans) {
    metrics.add_plan(p);
    if (p.unterminated_quote) {
      std::cerr << "[plan] warn: unterminated quoted field at end of " << p.path << "\n";
    }
    splits.insert(splits.end(), p.splits.begin(), p.splits.end());
  }

  const std::string body = (cli.format == "tsv") ? cs::PlanJsonWriter::to_tsv(splits)
                                                 : cs::PlanJsonWriter::to_json(splits);
  if (!write_output(cli.out, body)) return kInputError;

  int rc = kOk;
  if (cli.verify) {
    metrics.start_stage("verify");
    rc = report_verify(cs::verify_plan(files, splits, cfg, cs::local_streams()));
    metrics.end_stage("verify");
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  if (!cli.quiet) std::cerr << "[plan] " << cs::format_stats(metrics.snapshot(wall_ms)) << "\n";
  return rc;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return kConfigError; }

  try {
    return run(cli);
  } catch (const cs::ConfigurationError& e) {
    std::cerr << "[plan] configuration error: " << e.what() << "\n";
    return kConfigError;
  } catch (const cs::InputError& e) {
    std::cerr << "[plan] input error: " << e.what() << "\n";
    return kInputError;
  } catch (const cs::IoError& e) {
    std::cerr << "[plan] I/O error: " << e.what() << "\n";
    return kInputError;
  }
}
