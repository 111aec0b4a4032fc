#pragma once
#include "split_reader/bounded_split_reader.hpp"
#include "split_reader/file_split.hpp"
#include "split_reader/record_reader.hpp"
#include "split_reader/record_writable.hpp"
#include "split_reader/schema_resolver.hpp"

#include <cstdint>
#include <memory>

namespace sr {

class JobConf;
class PartitionTable;
class SchemaCache;

// Reads the records of one split of an Avro container file for the host
// framework. The reader schema is resolved once, at construction, from the
// job configuration and partition table; without one the file's own schema
// is used. Every failure leaves as SplitReadError. The reporter gets one
// heartbeat per record and a status line on close.
class AvroSplitReader : public RecordReader<NullKey, AvroRecordWritable> {
public:
  AvroSplitReader(const JobConf& conf, const PartitionTable& parts,
                  const FileSplit& split, Reporter& reporter,
                  SchemaCache* cache = nullptr);
  ~AvroSplitReader() override;

  NullKey create_key() override { return NullKey{}; }
  AvroRecordWritable create_value() override { return AvroRecordWritable{}; }
  bool next(NullKey& key, AvroRecordWritable& value) override;
  std::int64_t get_pos() override;
  float get_progress() override;
  void close() override;

  const ResolvedSchema& resolved_schema() const noexcept { return resolved_; }
  std::int64_t start() const noexcept { return reader_->start(); }
  std::int64_t stop() const noexcept { return reader_->stop(); }
  std::uint64_t records_read() const noexcept { return records_; }

private:
  FileSplit split_;
  Reporter& reporter_;
  ResolvedSchema resolved_;
  std::unique_ptr<BoundedSplitReader> reader_;
  std::uint64_t records_{0};
};

}
