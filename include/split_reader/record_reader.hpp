#pragma once
#include <cstdint>
#include <string_view>

namespace sr {

// Heartbeat/status channel of the host framework. Readers accept one so the
// host can wire it through; the default methods do nothing.
class Reporter {
public:
  virtual ~Reporter() = default;
  virtual void progress() {}
  virtual void set_status(std::string_view) {}

  static Reporter& null();
};

// Keyed pull iterator the host drives: create the key/value containers once,
// call next() until it returns false, then close().
template <typename K, typename V>
class RecordReader {
public:
  virtual ~RecordReader() = default;

  virtual K create_key() = 0;
  virtual V create_value() = 0;

  // Fill `value` and return true, or return false at the end of the split
  // leaving `value` untouched.
  virtual bool next(K& key, V& value) = 0;

  virtual std::int64_t get_pos() = 0;

  // Fraction of the split consumed, in [0, 1].
  virtual float get_progress() = 0;

  virtual void close() = 0;
};

}
