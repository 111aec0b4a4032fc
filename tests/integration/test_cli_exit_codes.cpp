#include <avro/Compiler.hh>
#include <avro/DataFile.hh>
#include <avro/Generic.hh>
#include <simdjson.h>
#include <sys/wait.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int fails = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string g_bin;
static fs::path g_log;

static int run(const std::string& args) {
  const std::string cmd = "\"" + g_bin + "\" " + args + " >\"" + g_log.string() + "\" 2>&1";
  const int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

static void write_events(const fs::path& path, int n) {
  const avro::ValidSchema schema = avro::compileJsonSchemaFromString(R"({
    "type": "record", "name": "Event",
    "fields": [ { "name": "id", "type": "long" } ]
  })");
  avro::DataFileWriter<avro::GenericDatum> writer(path.string().c_str(), schema, 256);
  avro::GenericDatum d(schema);
  for (int i = 0; i < n; ++i) {
    d.value<avro::GenericRecord>().field("id").value<int64_t>() = i;
    writer.write(d);
  }
  writer.close();
}

int main() {
  g_bin = env_or("SR_BIN", "split-reader");
  if (!fs::exists(g_bin)) { std::cerr << "[ERR] binary not found: " << g_bin << "\n"; return 2; }

  const fs::path dir = fs::temp_directory_path() / "split_reader_cli_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  g_log = dir / "cli.log";

  const fs::path events = dir / "events.avro";
  write_events(events, 200);
  const fs::path junk = dir / "junk.avro";
  { std::ofstream(junk) << "not a container"; }
  const std::string ev = "\"" + events.string() + "\"";

  // Success, with a report.
  const fs::path reports = dir / "reports";
  expect(run("--splits=3 --report-root=\"" + reports.string() + "\" --slug-mode=basename --slug-len=64 " + ev) == 0,
         "clean run exits 0");
  const fs::path runjson = reports / "events.avro" / "run.json";
  if (fs::exists(runjson)) {
    simdjson::ondemand::parser p;
    auto json = simdjson::padded_string::load(runjson.string());
    auto doc = p.iterate(json);
    const uint64_t rows = doc["rows"].get_uint64().value_or(0);
    expect(rows == 200, "run.json counts every record once (" + std::to_string(rows) + ")");
  } else {
    expect(false, "run.json written under the basename slug");
  }
  expect(run("--start=0 --length=0 " + ev) == 0, "empty split is not an error");

  // Usage and configuration errors.
  expect(run("--no-such-option " + ev) == 2, "unknown option exits 2");
  expect(run("") == 2, "no input files exits 2");
  expect(run("--slug-len=-1 --report-root=\"" + reports.string() + "\" " + ev) == 2, "slug length below 1 exits 2");
  expect(run("--start=-5 " + ev) == 2, "negative start exits 2");
  expect(run("--splits=abc " + ev) == 2, "non-numeric splits exits 2");
  expect(run("--set=novalue " + ev) == 2, "override without '=' exits 2");
  expect(run("--job=\"" + (dir / "missing.json").string() + "\" " + ev) == 2, "missing job file exits 2");

  // Failed splits.
  expect(run("\"" + (dir / "missing.avro").string() + "\"") == 3, "missing input exits 3");
  expect(run("\"" + junk.string() + "\"") == 3, "malformed container exits 3");
  expect(run("--start=9223372036854775800 --length=100 " + ev) == 3, "overflowing range exits 3");
  expect(run("--interactive --set=avro.split.schema=\"{\\\"type\\\":\" " + ev) == 3,
         "unparsable job schema fails the split");

  if (fails) {
    std::cerr << "[INFO] last command output in " << g_log << "\n";
    return 1;
  }
  fs::remove_all(dir);
  std::cout << "[PASS] cli exit codes\n";
  return 0;
}
