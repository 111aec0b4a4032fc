#pragma once
#include <avro/ValidSchema.hh>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sr {

// Parsed schemas keyed by their source ("literal:<text>", "url:<url>").
// One instance per process, owned by whoever runs the readers and cleared
// between jobs. Safe to share between readers on different threads.
class SchemaCache {
public:
  static std::string literal_key(std::string_view text);
  static std::string url_key(std::string_view url);

  void put(std::string key, avro::ValidSchema schema);
  std::optional<avro::ValidSchema> get(std::string_view key) const;
  void clear();
  std::size_t size() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, avro::ValidSchema> map_;
};

}
