#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sr {

struct SplitReportEntry {
  std::int64_t  split_start  = 0;
  std::int64_t  split_length = 0;
  std::int64_t  sync_start   = 0;   // first sync point at or after split_start
  std::int64_t  stop         = 0;
  std::int64_t  end_pos      = 0;   // reader position after the last record
  std::uint64_t rows         = 0;
  double        progress     = 0.0;
  double        wall_time_ms = 0.0;
  std::string   error;              // empty on success
};

struct SplitReportPayload {
  // Input metadata
  std::string   filename;
  std::uint64_t file_size = 0;

  // Schema decision
  std::string schema_source;
  std::string partition;

  // Totals
  std::uint64_t rows = 0;
  double wall_time_ms = 0.0;
  double rows_per_sec = 0.0;

  std::vector<SplitReportEntry> splits;
};

class SplitReportWriter {
public:
  // Serialize payload to a compact JSON string.
  static std::string to_json(const SplitReportPayload& p);
};

// Writes <report_root>/<slug>/run.json.
bool write_report_dir(const std::string& report_root,
                      const std::string& slug,
                      const std::string& run_json_str,
                      std::string* err_out = nullptr);

}
