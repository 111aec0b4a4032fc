#include "split_reader/avro_split_reader.hpp"
#include "split_reader/conf_loader.hpp"
#include "split_reader/error.hpp"
#include "split_reader/file_split.hpp"
#include "split_reader/job_conf.hpp"
#include "split_reader/partition_table.hpp"
#include "split_reader/path_utils.hpp"
#include "split_reader/schema_cache.hpp"
#include "split_reader/split_report.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

enum class Mode { FromJob, Distributed, Interactive };

struct Cli {
  std::string job_file;
  std::vector<std::string> overrides;   // key=value
  Mode mode = Mode::FromJob;
  std::int64_t start = 0;
  std::int64_t length = -1;             // -1: to end of file
  int splits = 0;                       // >0: cut each file into N splits
  bool print = false;
  std::string report_root;              // empty: no run.json
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  std::vector<std::string> files;
  bool ok = true;
};

void usage(std::ostream& os) {
  os <<
    "Usage: split-reader [--job=FILE] [--set=key=value]... [--distributed|--interactive]\n"
    "                    [--start=N] [--length=N] [--splits=N] [--print]\n"
    "                    [--report-root=DIR] [--slug-mode=hashprefix|basename|keypath]\n"
    "                    [--slug-len=N] <file>...\n";
}

template <typename T>
bool parse_int(std::string_view s, T* out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_int = [&](const char* pfx, auto* out){
      if (a.rfind(pfx, 0) != 0) return false;
      if (!parse_int(std::string_view(a).substr(std::string(pfx).size()), out)) {
        std::cerr << "[cli] bad number in " << a << "\n";
        c.ok = false;
      }
      return true;
    };
    std::string kv;
    if (eat("--job=", &c.job_file)) continue;
    if (eat("--set=", &kv)) { c.overrides.push_back(kv); continue; }
    if (a == "--distributed") { c.mode = Mode::Distributed; continue; }
    if (a == "--interactive") { c.mode = Mode::Interactive; continue; }
    if (eat_int("--start=", &c.start)) continue;
    if (eat_int("--length=", &c.length)) continue;
    if (eat_int("--splits=", &c.splits)) continue;
    if (a == "--print") { c.print = true; continue; }
    if (eat("--report-root=", &c.report_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_int("--slug-len=", &c.slug_len)) continue;
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[cli] unknown option " << a << "\n"; c.ok = false; continue; }
    c.files.push_back(a);
  }
  if (c.start < 0 || c.length < -1 || c.splits < 0 || c.slug_len < 1) {
    std::cerr << "[cli] --start, --length and --splits must be >= 0, --slug-len >= 1\n";
    c.ok = false;
  }
  if (c.files.empty()) c.ok = false;
  return c;
}

// Reads every split of one file; returns 0 on success, 3 if a split failed.
int read_one_file(const std::string& filepath, const sr::JobConf& conf,
                  const sr::PartitionTable& parts, const Cli& cli,
                  sr::SchemaCache& cache) {
  namespace ch = std::chrono;
  std::ostream& info = cli.print ? std::cerr : std::cout;

  std::error_code fec;
  const auto file_size = static_cast<std::int64_t>(std::filesystem::file_size(filepath, fec));
  if (fec) {
    std::cerr << "[split] cannot stat " << filepath << ": " << fec.message() << "\n";
    return 3;
  }

  std::vector<sr::FileSplit> splits;
  if (cli.splits > 0) {
    splits = sr::make_splits(filepath, file_size, cli.splits);
  } else {
    const std::int64_t len = cli.length >= 0 ? cli.length : std::max<std::int64_t>(0, file_size - cli.start);
    splits.push_back(sr::FileSplit{filepath, cli.start, len});
  }

  sr::SplitReportPayload p{};
  p.filename = filepath;
  p.file_size = static_cast<std::uint64_t>(file_size);

  bool failed = false;
  const auto t0 = ch::steady_clock::now();

  for (const auto& split : splits) {
    sr::SplitReportEntry e{};
    e.split_start = split.start;
    e.split_length = split.length;
    const auto s0 = ch::steady_clock::now();
    try {
      sr::AvroSplitReader reader(conf, parts, split, sr::Reporter::null(), &cache);
      if (p.schema_source.empty()) {
        p.schema_source = sr::to_string(reader.resolved_schema().source);
        p.partition = reader.resolved_schema().partition;
      }
      e.sync_start = reader.start();
      e.stop = reader.stop();

      auto key = reader.create_key();
      auto value = reader.create_value();
      while (reader.next(key, value)) {
        ++e.rows;
        if (cli.print) std::cout << value.to_json() << "\n";
      }
      e.end_pos = reader.get_pos();
      e.progress = reader.get_progress();
      reader.close();
    } catch (const sr::SplitReadError& err) {
      std::cerr << "[split] " << split.to_string() << " failed: " << err.what() << "\n";
      e.error = err.what();
      failed = true;
    }
    e.wall_time_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - s0).count();
    p.rows += e.rows;

    info << "[split] " << split.to_string()
         << " rows=" << e.rows
         << " sync_start=" << e.sync_start
         << " end=" << e.end_pos
         << " progress=" << std::fixed << std::setprecision(2) << e.progress
         << std::defaultfloat << "\n";
    p.splits.push_back(std::move(e));
  }

  p.wall_time_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const double sec = p.wall_time_ms / 1000.0;
  p.rows_per_sec = sec > 0.0 ? (p.rows / sec) : 0.0;

  info << "[file] " << filepath << " rows=" << p.rows << " splits=" << splits.size() << "\n";

  if (!cli.report_root.empty()) {
    const std::string key = (cli.slug_mode == "hashprefix") ? sr::qualify_path(filepath) : filepath;
    const std::string slug = sr::make_slug(key, cli.slug_mode, cli.slug_len);
    std::string err;
    if (!sr::write_report_dir(cli.report_root, slug, sr::SplitReportWriter::to_json(p), &err)) {
      std::cerr << "[report] write_report_dir failed: " << err << "\n";
      return 3;
    }
    info << "[report] " << cli.report_root << "/" << slug << "/run.json\n";
  }
  return failed ? 3 : 0;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (!cli.ok) { usage(std::cerr); return 2; }

  sr::JobConf conf;
  sr::PartitionTable parts;
  if (!cli.job_file.empty()) {
    std::string err;
    if (!sr::load_job_file(cli.job_file, &conf, &parts, &err)) {
      std::cerr << "[conf] " << err << "\n";
      return 2;
    }
  }
  for (const auto& kv : cli.overrides) {
    if (!conf.apply_override(kv)) {
      std::cerr << "[conf] bad override '" << kv << "', expected key=value\n";
      return 2;
    }
  }
  if (cli.mode == Mode::Distributed && !conf.inside_distributed_job()) {
    conf.set(std::string(sr::keys::kPlan), "split-reader-cli");
  } else if (cli.mode == Mode::Interactive) {
    conf.erase(sr::keys::kPlan);
  }

  // One cache for the whole run; every split of every file shares it.
  sr::SchemaCache cache;

  int rc = 0;
  for (const auto& f : cli.files) {
    int one = read_one_file(f, conf, parts, cli, cache);
    if (one != 0) rc = one;
  }
  return rc;
}
