#include "split_reader/partition_table.hpp"
#include "split_reader/path_utils.hpp"
#include <utility>

namespace sr {

void PartitionTable::add(std::string path_prefix, Properties props) {
  parts_.push_back(PartitionDesc{std::move(path_prefix), std::move(props)});
}

const PartitionDesc* PartitionTable::find_for(std::string_view qualified_path) const noexcept {
  for (const auto& p : parts_) {
    if (path_in_partition(qualified_path, p.path_prefix)) return &p;
  }
  return nullptr;
}

}
