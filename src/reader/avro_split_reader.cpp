#include "split_reader/avro_split_reader.hpp"
#include "split_reader/container_handle.hpp"
#include "split_reader/job_conf.hpp"
#include "split_reader/partition_table.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace sr {

static SplitReadError with_split(const FileSplit& split, const SplitReadError& e) {
  return SplitReadError(e.kind(), split.to_string() + ": " + e.what(), e.cause());
}

AvroSplitReader::AvroSplitReader(const JobConf& conf, const PartitionTable& parts,
                                 const FileSplit& split, Reporter& reporter,
                                 SchemaCache* cache)
  : split_(split), reporter_(reporter) {
  try {
    resolved_ = SchemaResolver(conf, parts, cache).resolve(split_.path, conf.inside_distributed_job());

    Error err;
    auto handle = open_avro_container(split_.path, resolved_.schema, &err);
    if (!handle) throw SplitReadError(err);

    reader_ = std::make_unique<BoundedSplitReader>(std::move(handle), split_.start, split_.length);
  } catch (const SplitReadError& e) {
    throw with_split(split_, e);
  }

  std::cerr << "[split] " << split_.to_string()
            << " schema=" << to_string(resolved_.source)
            << " sync_start=" << reader_->start()
            << " stop=" << reader_->stop() << "\n";
}

AvroSplitReader::~AvroSplitReader() = default;

bool AvroSplitReader::next(NullKey&, AvroRecordWritable& value) {
  bool got = false;
  try {
    got = reader_->advance(value.datum());
  } catch (const SplitReadError& e) {
    throw with_split(split_, e);
  }
  if (!got) return false;
  value.bind(reader_->handle().reader_schema());
  ++records_;
  reporter_.progress();
  return true;
}

std::int64_t AvroSplitReader::get_pos() { return reader_->position(); }

float AvroSplitReader::get_progress() { return reader_->progress(); }

void AvroSplitReader::close() {
  const auto state = reader_->state();
  if (state == BoundedSplitReader::State::Closed) return;
  reader_->close();
  const std::string status = split_.to_string() + " closed (" + to_string(state) + ") after " +
                             std::to_string(records_) + " records at " +
                             std::to_string(reader_->position());
  reporter_.set_status(status);
  std::cerr << "[split] " << status << "\n";
}

}
