#pragma once
#include <avro/GenericDatum.hh>
#include <avro/ValidSchema.hh>
#include <string>
#include <string_view>

namespace sr {

// Key type of the reader: the container format has no keys, so every key is
// the same placeholder.
struct NullKey {
  bool operator==(const NullKey&) const noexcept { return true; }
  bool operator!=(const NullKey&) const noexcept { return false; }
};

// Caller-owned record container. Allocated once, refilled in place by the
// reader on every successful next(); the reader keeps no reference to it.
class AvroRecordWritable {
public:
  AvroRecordWritable() = default;

  avro::GenericDatum& datum() noexcept { return datum_; }
  const avro::GenericDatum& datum() const noexcept { return datum_; }

  // Schema the current datum was decoded with (reader schema of the split).
  const avro::ValidSchema& schema() const noexcept { return schema_; }
  void bind(const avro::ValidSchema& schema);

  bool populated() const noexcept { return populated_; }

  // Field of a record datum by name; nullptr if not a record or no such field.
  const avro::GenericDatum* field(std::string_view name) const;

  // Avro JSON encoding of the current datum; "null" before the first fill.
  std::string to_json() const;

private:
  avro::GenericDatum datum_;
  avro::ValidSchema  schema_;
  bool populated_{false};
};

}
