#pragma once
#include "split_reader/error.hpp"
#include <avro/ValidSchema.hh>
#include <optional>
#include <string>
#include <string_view>

namespace sr {

class JobConf;
class PartitionTable;
class SchemaCache;

struct ResolvedSchema {
  enum class Source { None, PartitionLiteral, PartitionUrl, JobSchema };

  Source source = Source::None;
  std::string partition;                    // matched prefix, empty if none matched
  std::optional<avro::ValidSchema> schema;  // empty: use the schema embedded in the file

  bool has_schema() const noexcept { return schema.has_value(); }
};

const char* to_string(ResolvedSchema::Source s) noexcept;

// Decides which reader schema applies to a file. Holds borrowed references;
// construct it for the duration of a resolution and drop it afterwards.
//
// Order, first success wins:
//  1. distributed jobs: first partition (insertion order) whose prefix starts
//     the qualified path. A matching partition without schema properties
//     means "no schema" and ends the search.
//  2. the process-scoped job schema (keys::kJobSchema).
//  3. no schema.
class SchemaResolver {
public:
  SchemaResolver(const JobConf& conf, const PartitionTable& parts, SchemaCache* cache = nullptr);

  // Non-throwing form. Returns false only for malformed schema sources.
  bool try_resolve(std::string_view path, bool distributed,
                   ResolvedSchema* out, Error* err) const;

  // Throws SplitReadError (kind Config) for malformed schema sources.
  ResolvedSchema resolve(std::string_view path, bool distributed) const;

private:
  const JobConf& conf_;
  const PartitionTable& parts_;
  SchemaCache* cache_;
};

}
