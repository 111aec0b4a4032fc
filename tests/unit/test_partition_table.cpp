#include "split_reader/partition_table.hpp"
#include "split_reader/path_utils.hpp"
#include <filesystem>
#include <iostream>
#include <string>

static int fails = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

int main(){
  sr::PartitionTable t;
  t.add("/data/t/p=1", sr::Properties{{"avro.schema.literal", "A"}});
  t.add("/data/t/p=2", sr::Properties{});
  t.add("/data/t",     sr::Properties{{"avro.schema.literal", "T"}});

  const sr::PartitionDesc* hit = t.find_for("/data/t/p=1/part-00000");
  expect(hit && hit->path_prefix == "/data/t/p=1", "p=1 file matches p=1 partition");

  hit = t.find_for("/data/t/p=2/part-00000");
  expect(hit && hit->path_prefix == "/data/t/p=2", "p=2 file matches p=2 partition");

  // "/data/t" also prefixes the p=1 path; insertion order decides.
  hit = t.find_for("/data/t/p=3/part-00000");
  expect(hit && hit->path_prefix == "/data/t", "unlisted partition falls to table prefix");

  expect(t.find_for("/other/p=1/part-00000") == nullptr, "foreign path has no partition");
  expect(t.size() == 3, "three partitions");

  // Prefixes are plain strings.
  expect(sr::path_in_partition("/data/t/p=10/x", "/data/t/p=1"), "string prefix semantics");
  expect(!sr::path_in_partition("/data", "/data/t"), "shorter path is not inside");

  // Qualification
  expect(sr::qualify_path("hdfs://nn:8020/a/b") == "hdfs://nn:8020/a/b", "hdfs uri untouched");
  expect(sr::qualify_path("file:/a/b") == "file:/a/b", "file uri untouched");
  expect(sr::qualify_path("/data/t/./p=1/../p=1/part") == "/data/t/p=1/part", "absolute path normalized");
  const std::string rel = sr::qualify_path("rel/part-0");
  expect(std::filesystem::path(rel).is_absolute(), "relative path made absolute");
  expect(rel.size() > 10 && rel.substr(rel.size() - 10) == "rel/part-0", "relative path keeps its tail");

  expect(sr::local_path_from_url("file:///tmp/a.avsc") == "/tmp/a.avsc", "file:/// url to path");
  expect(sr::local_path_from_url("file:/tmp/a.avsc") == "/tmp/a.avsc", "file: url to path");
  expect(sr::local_path_from_url("/tmp/a.avsc") == "/tmp/a.avsc", "plain path unchanged");

  if (fails) return 1;
  std::cout << "[PASS] partition table and path qualification\n";
  return 0;
}
