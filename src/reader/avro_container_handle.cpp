#include "split_reader/container_handle.hpp"

#include <avro/DataFile.hh>
#include <avro/Exception.hh>
#include <avro/Generic.hh>
#include <avro/Stream.hh>

#include <exception>
#include <limits>

namespace sr {

namespace {

// DataFileReaderBase::pastSync(position) computes position + SyncSize, so
// this is the largest position that does not overflow.
constexpr std::int64_t kMaxSafePosition =
    std::numeric_limits<std::int64_t>::max() - avro::SyncSize;

class AvroContainerHandle final : public ContainerHandle {
public:
  AvroContainerHandle(std::unique_ptr<avro::DataFileReader<avro::GenericDatum>> reader,
                      avro::SeekableInputStream* stream)
    : reader_(std::move(reader)), stream_(stream),
      reader_schema_(reader_->readerSchema()) {}

  ~AvroContainerHandle() override { close(); }

  void seek_to_sync_after(std::int64_t offset) override {
    reader_->sync(offset);
  }

  bool has_next() override {
    return !reader_->pastSync(kMaxSafePosition);
  }

  void next(avro::GenericDatum& out) override {
    if (!bound(out)) out = avro::GenericDatum(reader_schema_);
    if (!reader_->read(out)) {
      throw avro::Exception("unexpected end of container while reading a record");
    }
  }

  std::int64_t tell() override {
    if (stream_) last_pos_ = static_cast<std::int64_t>(stream_->byteCount());
    return last_pos_;
  }

  bool past_sync(std::int64_t offset) override {
    if (offset > kMaxSafePosition) offset = kMaxSafePosition;
    return reader_->pastSync(offset);
  }

  const avro::ValidSchema& reader_schema() const override { return reader_schema_; }

  void close() override {
    if (!reader_) return;
    (void)tell();
    stream_ = nullptr;
    reader_->close();
    reader_.reset();
  }

private:
  // Reuse the caller's record only if it was built from our reader schema;
  // anything else (fresh null datum, another file's record) is rebound.
  bool bound(const avro::GenericDatum& d) const {
    if (d.type() != avro::AVRO_RECORD) return false;
    return d.value<avro::GenericRecord>().schema() == reader_schema_.root();
  }

  std::unique_ptr<avro::DataFileReader<avro::GenericDatum>> reader_;
  avro::SeekableInputStream* stream_;   // owned by reader_
  avro::ValidSchema reader_schema_;
  std::int64_t last_pos_{0};
};

}

std::unique_ptr<ContainerHandle> open_avro_container(const std::string& path,
                                                     const std::optional<avro::ValidSchema>& reader_schema,
                                                     Error* err) {
  try {
    std::unique_ptr<avro::SeekableInputStream> in = avro::fileSeekableInputStream(path.c_str());
    avro::SeekableInputStream* raw = in.get();
    std::unique_ptr<avro::DataFileReader<avro::GenericDatum>> reader;
    if (reader_schema) {
      reader = std::make_unique<avro::DataFileReader<avro::GenericDatum>>(std::move(in), *reader_schema);
    } else {
      reader = std::make_unique<avro::DataFileReader<avro::GenericDatum>>(std::move(in));
    }
    return std::make_unique<AvroContainerHandle>(std::move(reader), raw);
  } catch (const avro::Exception& e) {
    fail(err, ErrorKind::Io, "cannot open " + path + ": " + e.what());
    return nullptr;
  } catch (const std::exception& e) {
    fail(err, ErrorKind::Io, "cannot open " + path + ": " + e.what());
    return nullptr;
  }
}

}
