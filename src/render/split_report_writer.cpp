#include "split_reader/split_report.hpp"
#include "split_reader/path_utils.hpp"
#include <cmath> // std::isfinite
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sr {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:   o << c;      break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string SplitReportWriter::to_json(const SplitReportPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"filename\":";      esc(o, p.filename);      o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"schema_source\":"; esc(o, p.schema_source); o << ",";
  o << "\"partition\":";     esc(o, p.partition);     o << ",";
  o << "\"rows\":" << p.rows << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";

  o << "\"splits\":[";
  for (size_t i=0;i<p.splits.size();++i){
    if (i) o << ",";
    const auto& s = p.splits[i];
    o << "{"
      << "\"split_start\":"  << s.split_start  << ","
      << "\"split_length\":" << s.split_length << ","
      << "\"sync_start\":"   << s.sync_start   << ","
      << "\"stop\":"         << s.stop         << ","
      << "\"end_pos\":"      << s.end_pos      << ","
      << "\"rows\":"         << s.rows         << ","
      << "\"progress\":"     << safe_num(s.progress) << ","
      << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ","
      << "\"error\":";
    esc(o, s.error);
    o << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      std::string* err_out) {
  const std::filesystem::path out = std::filesystem::path(report_root) / slug / "run.json";
  if (!ensure_parent_dirs(out)) {
    if (err_out) *err_out = "failed to create " + out.parent_path().string();
    return false;
  }
  std::ofstream rj(out, std::ios::binary);
  if (!rj) {
    if (err_out) *err_out = "failed to write " + out.string();
    return false;
  }
  rj.write(run_json_str.data(),
           static_cast<std::streamsize>(run_json_str.size()));
  if (!rj) {
    if (err_out) *err_out = "short write to " + out.string();
    return false;
  }
  return true;
}

}
