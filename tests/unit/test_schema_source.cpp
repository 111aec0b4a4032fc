#include "split_reader/job_conf.hpp"
#include "split_reader/schema_cache.hpp"
#include "split_reader/schema_source.hpp"

#include <avro/Compiler.hh>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int fails = 0;
static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static const char* kSchemaA =
  R"({"type":"record","name":"A","fields":[{"name":"id","type":"long"}]})";
static const char* kSchemaB =
  R"({"type":"record","name":"B","fields":[{"name":"name","type":"string"}]})";

static std::string name_of(const avro::ValidSchema& s) {
  return s.root()->name().simpleName();
}

int main(){
  const fs::path dir = fs::temp_directory_path() / "split_reader_schema_source";
  fs::create_directories(dir);
  const fs::path b_file = dir / "b.avsc";
  { std::ofstream(b_file) << kSchemaB; }
  const fs::path bad_file = dir / "bad.avsc";
  { std::ofstream(bad_file) << "{\"type\":\"record\""; }

  sr::Error err;

  // parse
  auto a = sr::parse_schema(kSchemaA, &err);
  expect(a.has_value() && name_of(*a) == "A", "literal A parses");
  expect(!sr::parse_schema("{not json", &err).has_value(), "garbage does not parse");
  expect(err.kind == sr::ErrorKind::Config, "parse failure is a config error");

  // literal wins over url
  {
    sr::Properties p{{"avro.schema.url", "file://" + b_file.string()},
                     {"avro.schema.literal", kSchemaA}};
    sr::SchemaOrigin origin = sr::SchemaOrigin::Url;
    auto s = sr::determine_schema(p, nullptr, &err, &origin);
    expect(s && name_of(*s) == "A", "literal preferred when both present");
    expect(origin == sr::SchemaOrigin::Literal, "origin reports literal");
  }

  // url forms
  for (const std::string url : {"file://" + b_file.string(), "file:" + b_file.string(), b_file.string()}) {
    sr::Properties p{{"avro.schema.url", url}};
    sr::SchemaOrigin origin = sr::SchemaOrigin::Literal;
    auto s = sr::determine_schema(p, nullptr, &err, &origin);
    expect(s && name_of(*s) == "B", "schema read from " + url);
    expect(origin == sr::SchemaOrigin::Url, "origin reports url for " + url);
  }

  // "none" literal defers to the url
  {
    sr::Properties p{{"avro.schema.literal", "none"}, {"avro.schema.url", b_file.string()}};
    auto s = sr::determine_schema(p, nullptr, &err);
    expect(s && name_of(*s) == "B", "literal 'none' falls through to url");
  }

  // failures
  {
    sr::Properties p{{"avro.schema.literal", "none"}};
    err = {};
    expect(!sr::determine_schema(p, nullptr, &err), "'none' alone is not a schema");
    expect(err.kind == sr::ErrorKind::Config && err.message.find("can't determine") != std::string::npos,
           "missing schema message");
  }
  {
    sr::Properties p{{"avro.schema.url", (dir / "missing.avsc").string()}};
    err = {};
    expect(!sr::determine_schema(p, nullptr, &err), "missing url file fails");
    expect(err.kind == sr::ErrorKind::Config, "missing url is a config error");
  }
  {
    sr::Properties p{{"avro.schema.url", bad_file.string()}};
    err = {};
    expect(!sr::determine_schema(p, nullptr, &err), "malformed schema at url fails");
    expect(err.message.find(bad_file.string()) != std::string::npos, "message names the url");
  }
  {
    std::string text;
    err = {};
    expect(!sr::fetch_schema_text("ftp://host/a.avsc", &text, &err), "ftp scheme unsupported");
  }

  // cache
  {
    sr::SchemaCache cache;
    sr::Properties p{{"avro.schema.url", b_file.string()}};
    auto first = sr::determine_schema(p, &cache, &err);
    expect(first.has_value() && cache.size() == 1, "url schema cached");
    fs::remove(b_file);
    auto second = sr::determine_schema(p, &cache, &err);
    expect(second && second->root() == first->root(), "cached schema served without reading the url");
    cache.clear();
    expect(cache.size() == 0, "cache cleared");
    expect(!sr::determine_schema(p, &cache, &err), "after clear the url is read again");
  }

  fs::remove_all(dir);
  if (fails) return 1;
  std::cout << "[PASS] schema sources\n";
  return 0;
}
