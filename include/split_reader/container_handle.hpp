#pragma once
#include "split_reader/error.hpp"
#include <avro/GenericDatum.hh>
#include <avro/ValidSchema.hh>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sr {

// Cursor over a sync-markered container file. Offsets are absolute byte
// positions in the file. Codec failures surface as exceptions from the
// codec library; callers translate them.
class ContainerHandle {
public:
  virtual ~ContainerHandle() = default;

  // Position at the first sync point at or after `offset`.
  virtual void seek_to_sync_after(std::int64_t offset) = 0;

  virtual bool has_next() = 0;

  // Decode the next record into `out`, reusing its storage.
  virtual void next(avro::GenericDatum& out) = 0;

  // Current byte offset of the underlying stream.
  virtual std::int64_t tell() = 0;

  // True once the sync marker in front of the next record is at or after
  // `offset`, or when there is no next record.
  virtual bool past_sync(std::int64_t offset) = 0;

  // Schema records are decoded into.
  virtual const avro::ValidSchema& reader_schema() const = 0;

  virtual void close() = 0;
};

// Open an Avro object container file. With a reader schema the codec
// resolves each record against the file's writer schema; without one the
// writer schema is used as is. Returns nullptr and fills *err on failure.
std::unique_ptr<ContainerHandle> open_avro_container(const std::string& path,
                                                     const std::optional<avro::ValidSchema>& reader_schema,
                                                     Error* err);

}
