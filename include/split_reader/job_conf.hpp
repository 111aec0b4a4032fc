#pragma once
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sr {

// Configuration keys read by the library.
namespace keys {
inline constexpr std::string_view kSchemaLiteral = "avro.schema.literal";
inline constexpr std::string_view kSchemaUrl     = "avro.schema.url";
// Schema placed in the job by an interactive (single-process) caller.
inline constexpr std::string_view kJobSchema     = "avro.split.schema";
// Set by the host only when the reader runs inside a distributed job.
inline constexpr std::string_view kPlan          = "split_reader.plan";
// Literal/URL value meaning "not provided".
inline constexpr std::string_view kSchemaNone    = "none";
}

// String key/value set that keeps insertion order. Setting an existing key
// replaces the value in place.
class Properties {
public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  Properties() = default;
  Properties(std::initializer_list<Entry> init);

  void set(std::string key, std::string value);
  bool erase(std::string_view key);
  bool contains(std::string_view key) const noexcept;
  std::optional<std::string> get(std::string_view key) const;
  std::string get_or(std::string_view key, std::string_view def) const;

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

private:
  const Entry* find(std::string_view key) const noexcept;
  std::vector<Entry> entries_;
};

// Per-job configuration handed to every reader of the job.
class JobConf : public Properties {
public:
  using Properties::Properties;

  // True when a non-empty plan is present, i.e. the reader is one task of a
  // distributed job rather than an interactive single-process read.
  bool inside_distributed_job() const;

  // Apply a "key=value" override; false if there is no '='.
  bool apply_override(std::string_view kv);
};

}
