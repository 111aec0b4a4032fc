#include "split_reader/record_writable.hpp"

#include <avro/Encoder.hh>
#include <avro/Generic.hh>
#include <avro/Specific.hh>
#include <avro/Stream.hh>

#include <memory>
#include <sstream>

namespace sr {

void AvroRecordWritable::bind(const avro::ValidSchema& schema) {
  if (!populated_ || schema_.root() != schema.root()) schema_ = schema;
  populated_ = true;
}

const avro::GenericDatum* AvroRecordWritable::field(std::string_view name) const {
  if (datum_.type() != avro::AVRO_RECORD) return nullptr;
  const auto& rec = datum_.value<avro::GenericRecord>();
  const std::string key(name);
  if (!rec.hasField(key)) return nullptr;
  return &rec.field(key);
}

std::string AvroRecordWritable::to_json() const {
  if (!populated_) return "null";
  std::ostringstream os;
  {
    std::unique_ptr<avro::OutputStream> out = avro::ostreamOutputStream(os);
    avro::EncoderPtr enc = avro::jsonEncoder(schema_);
    enc->init(*out);
    avro::encode(*enc, datum_);
    enc->flush();
  }
  return os.str();
}

}
