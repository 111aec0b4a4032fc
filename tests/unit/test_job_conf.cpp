#include "split_reader/conf_loader.hpp"
#include "split_reader/job_conf.hpp"
#include "split_reader/partition_table.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int fails = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static void properties_basics() {
  sr::Properties p;
  p.set("b", "1");
  p.set("a", "2");
  p.set("b", "3");   // replace keeps position
  expect(p.size() == 2, "replace does not add");
  expect(p.begin()->first == "b" && p.begin()->second == "3", "insertion order kept on replace");
  expect(p.get_or("missing", "dflt") == "dflt", "get_or default");
  expect(!p.get("missing").has_value(), "missing key is nullopt");
  expect(p.erase("b") && !p.contains("b") && p.size() == 1, "erase");
  expect(!p.erase("b"), "erase twice");
}

static void distributed_flag() {
  sr::JobConf c;
  expect(!c.inside_distributed_job(), "empty conf is interactive");
  c.set(std::string(sr::keys::kPlan), "");
  expect(!c.inside_distributed_job(), "empty plan is interactive");
  expect(c.apply_override("split_reader.plan=plan-7"), "override applied");
  expect(c.inside_distributed_job(), "plan makes the job distributed");
  expect(c.apply_override("x=a=b") && c.get_or("x", "") == "a=b", "value may contain '='");
  expect(!c.apply_override("novalue"), "override without '=' rejected");
  expect(!c.apply_override("=v"), "override without key rejected");
}

static void load_fixture() {
  const fs::path f = "tests/data/job_partitioned.json";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; std::exit(2); }

  sr::JobConf conf;
  sr::PartitionTable parts;
  std::string err;
  expect(sr::load_job_file(f.string(), &conf, &parts, &err), "fixture loads: " + err);
  expect(conf.inside_distributed_job(), "fixture is distributed");
  expect(parts.size() == 3, "three partitions in fixture");

  auto it = parts.begin();
  expect(it->path_prefix == "/warehouse/events/dt=2011-06-01", "file order kept (0)");
  auto lit = it->properties.get(sr::keys::kSchemaLiteral);
  expect(lit && lit->find("\"Event\"") != std::string::npos, "inline schema object kept as raw json");
  ++it;
  expect(it->path_prefix == "/warehouse/events/dt=2011-06-02", "file order kept (1)");
  expect(it->properties.get_or(sr::keys::kSchemaUrl, "") == "file:///nonexistent/event.avsc", "url property");
  ++it;
  expect(!it->properties.contains(sr::keys::kSchemaLiteral) &&
         !it->properties.contains(sr::keys::kSchemaUrl), "third partition has no schema");
}

static void malformed_inputs() {
  std::string err;
  expect(!sr::load_job_json("[1,2]", nullptr, nullptr, &err), "array root rejected");
  expect(!sr::load_job_json(R"({"properties":{"k":1}})", nullptr, nullptr, &err), "number value rejected");
  expect(err.find("'k'") != std::string::npos, "error names the key");
  expect(!sr::load_job_json(R"({"partitions":[{"properties":{}}]})", nullptr, nullptr, &err), "partition without path");
  expect(err.find("partitions[0]") != std::string::npos, "error names the partition");
  expect(!sr::load_job_json(R"({"partitions":{}})", nullptr, nullptr, &err), "partitions must be array");
  expect(!sr::load_job_json(R"({"properties":)", nullptr, nullptr, &err), "truncated document rejected");
  expect(!sr::load_job_file("tests/data/does-not-exist.json", nullptr, nullptr, &err), "missing file");

  sr::JobConf conf;
  expect(sr::load_job_json("{}", &conf, nullptr, &err), "empty object accepted");
  expect(conf.empty(), "empty object gives empty conf");
}

int main(){
  properties_basics();
  distributed_flag();
  load_fixture();
  malformed_inputs();
  if (fails) return 1;
  std::cout << "[PASS] job configuration\n";
  return 0;
}
