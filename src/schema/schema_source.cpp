#include "split_reader/schema_source.hpp"
#include "split_reader/job_conf.hpp"
#include "split_reader/path_utils.hpp"
#include "split_reader/schema_cache.hpp"

#include <avro/Compiler.hh>
#include <avro/Exception.hh>
#include <httplib.h>

#include <fstream>
#include <sstream>

namespace sr {

static bool is_http_url(std::string_view url) {
  return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

static bool usable(const std::optional<std::string>& v) {
  return v.has_value() && !v->empty() && *v != keys::kSchemaNone;
}

std::optional<avro::ValidSchema> parse_schema(std::string_view text, Error* err) {
  try {
    return avro::compileJsonSchemaFromString(std::string(text));
  } catch (const avro::Exception& e) {
    fail(err, ErrorKind::Config, std::string("unable to parse schema: ") + e.what());
    return std::nullopt;
  }
}

static bool fetch_http(std::string_view url, std::string* out, Error* err) {
  const auto scheme_end = url.find("://");
  const auto slash = url.find('/', scheme_end + 3);
  std::string base(url.substr(0, slash));
  std::string path = (slash == std::string_view::npos) ? "/" : std::string(url.substr(slash));

  httplib::Client cli(base);
  if (!cli.is_valid()) {
    return fail(err, ErrorKind::Config, "unsupported schema url " + std::string(url));
  }
  cli.set_connection_timeout(10);
  cli.set_read_timeout(30);
  cli.set_follow_location(true);

  auto res = cli.Get(path);
  if (!res) {
    return fail(err, ErrorKind::Config, "unable to fetch schema from " + std::string(url) +
                                        ": " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    return fail(err, ErrorKind::Config, "unable to fetch schema from " + std::string(url) +
                                        ": HTTP " + std::to_string(res->status));
  }
  *out = std::move(res->body);
  return true;
}

static bool fetch_local(std::string_view url, std::string* out, Error* err) {
  const std::string path = local_path_from_url(url);
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(err, ErrorKind::Config, "unable to read schema from " + std::string(url));
  }
  std::ostringstream ss; ss << in.rdbuf();
  if (in.bad()) {
    return fail(err, ErrorKind::Config, "error while reading schema from " + std::string(url));
  }
  *out = ss.str();
  return true;
}

bool fetch_schema_text(std::string_view url, std::string* out, Error* err) {
  if (is_http_url(url)) return fetch_http(url, out, err);
  if (has_uri_scheme(url) && url.rfind("file:", 0) != 0) {
    return fail(err, ErrorKind::Config, "unsupported schema url scheme: " + std::string(url));
  }
  return fetch_local(url, out, err);
}

std::optional<avro::ValidSchema> determine_schema(const Properties& props,
                                                  SchemaCache* cache,
                                                  Error* err,
                                                  SchemaOrigin* origin) {
  const auto literal = props.get(keys::kSchemaLiteral);
  if (usable(literal)) {
    if (origin) *origin = SchemaOrigin::Literal;
    const std::string key = SchemaCache::literal_key(*literal);
    if (cache) {
      if (auto hit = cache->get(key)) return hit;
    }
    auto schema = parse_schema(*literal, err);
    if (schema && cache) cache->put(key, *schema);
    return schema;
  }

  const auto url = props.get(keys::kSchemaUrl);
  if (usable(url)) {
    if (origin) *origin = SchemaOrigin::Url;
    const std::string key = SchemaCache::url_key(*url);
    if (cache) {
      if (auto hit = cache->get(key)) return hit;
    }
    std::string text;
    if (!fetch_schema_text(*url, &text, err)) return std::nullopt;
    auto schema = parse_schema(text, err);
    if (!schema) {
      if (err) err->message = "schema at " + *url + ": " + err->message;
      return std::nullopt;
    }
    if (cache) cache->put(key, *schema);
    return schema;
  }

  fail(err, ErrorKind::Config,
       "neither " + std::string(keys::kSchemaLiteral) + " nor " + std::string(keys::kSchemaUrl) +
       " specified, can't determine table schema");
  return std::nullopt;
}

}
