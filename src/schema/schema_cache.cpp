#include "split_reader/schema_cache.hpp"

namespace sr {

std::string SchemaCache::literal_key(std::string_view text) {
  return "literal:" + std::string(text);
}

std::string SchemaCache::url_key(std::string_view url) {
  return "url:" + std::string(url);
}

void SchemaCache::put(std::string key, avro::ValidSchema schema) {
  std::lock_guard<std::mutex> lk(mu_);
  map_[std::move(key)] = std::move(schema);
}

std::optional<avro::ValidSchema> SchemaCache::get(std::string_view key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = map_.find(std::string(key));
  if (it == map_.end()) return std::nullopt;
  return it->second;
}

void SchemaCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  map_.clear();
}

std::size_t SchemaCache::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return map_.size();
}

}
