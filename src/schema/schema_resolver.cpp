#include "split_reader/schema_resolver.hpp"
#include "split_reader/job_conf.hpp"
#include "split_reader/partition_table.hpp"
#include "split_reader/path_utils.hpp"
#include "split_reader/schema_cache.hpp"
#include "split_reader/schema_source.hpp"

#include <iostream>

namespace sr {

const char* to_string(ResolvedSchema::Source s) noexcept {
  switch (s) {
    case ResolvedSchema::Source::None:             return "none";
    case ResolvedSchema::Source::PartitionLiteral: return "partition-literal";
    case ResolvedSchema::Source::PartitionUrl:     return "partition-url";
    case ResolvedSchema::Source::JobSchema:        return "job-schema";
  }
  return "unknown";
}

SchemaResolver::SchemaResolver(const JobConf& conf, const PartitionTable& parts, SchemaCache* cache)
  : conf_(conf), parts_(parts), cache_(cache) {}

bool SchemaResolver::try_resolve(std::string_view path, bool distributed,
                                 ResolvedSchema* out, Error* err) const {
  ResolvedSchema r;

  if (distributed) {
    const std::string qualified = qualify_path(path);
    if (const PartitionDesc* part = parts_.find_for(qualified)) {
      std::cerr << "[schema] matching partition " << part->path_prefix
                << " with input split " << qualified << "\n";
      r.partition = part->path_prefix;

      const auto& props = part->properties;
      if (props.contains(keys::kSchemaLiteral) || props.contains(keys::kSchemaUrl)) {
        SchemaOrigin origin = SchemaOrigin::Literal;
        auto schema = determine_schema(props, cache_, err, &origin);
        if (!schema) {
          if (err) err->message = "partition " + part->path_prefix + ": " + err->message;
          return false;
        }
        r.schema = std::move(schema);
        r.source = (origin == SchemaOrigin::Literal) ? ResolvedSchema::Source::PartitionLiteral
                                                     : ResolvedSchema::Source::PartitionUrl;
      }
      // No override on the matched partition: it will not be on any other.
      *out = std::move(r);
      return true;
    }
    std::cerr << "[schema] unable to match split " << qualified << " with a partition\n";
  }

  if (auto text = conf_.get(keys::kJobSchema)) {
    std::cerr << "[schema] found the avro schema in the job: " << *text << "\n";
    std::optional<avro::ValidSchema> schema;
    const std::string key = SchemaCache::literal_key(*text);
    if (cache_) schema = cache_->get(key);
    if (!schema) {
      schema = parse_schema(*text, err);
      if (!schema) {
        if (err) err->message = std::string(keys::kJobSchema) + ": " + err->message;
        return false;
      }
      if (cache_) cache_->put(key, *schema);
    }
    r.schema = std::move(schema);
    r.source = ResolvedSchema::Source::JobSchema;
  }

  *out = std::move(r);
  return true;
}

ResolvedSchema SchemaResolver::resolve(std::string_view path, bool distributed) const {
  ResolvedSchema r;
  Error err;
  if (!try_resolve(path, distributed, &r, &err)) throw SplitReadError(err);
  return r;
}

}
