#include "split_reader/file_split.hpp"

namespace sr {

std::string FileSplit::to_string() const {
  return path + ":" + std::to_string(start) + "+" + std::to_string(length);
}

std::vector<FileSplit> make_splits(const std::string& path, std::int64_t file_size, int count) {
  std::vector<FileSplit> out;
  if (count < 1) count = 1;
  if (file_size < 0) file_size = 0;
  out.reserve(static_cast<size_t>(count));
  const std::int64_t base = file_size / count;
  const std::int64_t extra = file_size % count;
  std::int64_t off = 0;
  for (int i = 0; i < count; ++i) {
    const std::int64_t len = base + (i < extra ? 1 : 0);
    out.push_back(FileSplit{path, off, len});
    off += len;
  }
  return out;
}

}
