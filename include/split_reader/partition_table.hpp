#pragma once
#include "split_reader/job_conf.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sr {

struct PartitionDesc {
  std::string path_prefix;   // qualified partition directory
  Properties  properties;    // per-partition overrides (schema literal/url, ...)
};

// Partition path prefix -> properties, in insertion order. Lookups walk the
// list front to back and the first matching prefix wins; tables are expected
// to hold non-overlapping prefixes.
class PartitionTable {
public:
  using const_iterator = std::vector<PartitionDesc>::const_iterator;

  void add(std::string path_prefix, Properties props);

  // First entry whose prefix is a string prefix of `qualified_path`.
  const PartitionDesc* find_for(std::string_view qualified_path) const noexcept;

  std::size_t size() const noexcept { return parts_.size(); }
  bool empty() const noexcept { return parts_.empty(); }
  const_iterator begin() const noexcept { return parts_.begin(); }
  const_iterator end() const noexcept { return parts_.end(); }

private:
  std::vector<PartitionDesc> parts_;
};

}
