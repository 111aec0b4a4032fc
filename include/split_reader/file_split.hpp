#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sr {

// Byte range [start, start + length) of one file, assigned to one task.
struct FileSplit {
  std::string   path;
  std::int64_t  start  = 0;
  std::int64_t  length = 0;

  std::int64_t stop() const noexcept { return start + length; }
  std::string to_string() const;
};

// Cut [0, file_size) into `count` contiguous splits of near-equal length.
std::vector<FileSplit> make_splits(const std::string& path, std::int64_t file_size, int count);

}
