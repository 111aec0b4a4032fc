#include "split_reader/bounded_split_reader.hpp"

#include <avro/Exception.hh>
#include <algorithm>
#include <exception>
#include <limits>
#include <string>

namespace sr {

const char* to_string(BoundedSplitReader::State s) noexcept {
  switch (s) {
    case BoundedSplitReader::State::Positioning: return "positioning";
    case BoundedSplitReader::State::Iterating:   return "iterating";
    case BoundedSplitReader::State::Exhausted:   return "exhausted";
    case BoundedSplitReader::State::Closed:      return "closed";
  }
  return "unknown";
}

BoundedSplitReader::BoundedSplitReader(std::unique_ptr<ContainerHandle> handle,
                                       std::int64_t split_start, std::int64_t split_length)
  : handle_(std::move(handle)) {
  if (!handle_) throw SplitReadError(ErrorKind::Io, "split reader needs an open container");
  if (split_start < 0 || split_length < 0 ||
      split_start > std::numeric_limits<std::int64_t>::max() - split_length) {
    throw SplitReadError(ErrorKind::Io, "invalid split range start=" + std::to_string(split_start) +
                                        " length=" + std::to_string(split_length));
  }
  stop_ = split_start + split_length;
  const std::string where = "cannot position at sync point after offset " + std::to_string(split_start);
  try {
    handle_->seek_to_sync_after(split_start);
    start_ = handle_->tell();
  } catch (const avro::Exception& e) {
    throw SplitReadError(ErrorKind::Io, where + ": " + e.what(), e.what());
  } catch (const std::exception& e) {
    throw SplitReadError(ErrorKind::Io, where + ": " + e.what(), e.what());
  }
  last_pos_ = start_;
  state_ = State::Iterating;
}

BoundedSplitReader::~BoundedSplitReader() = default;

bool BoundedSplitReader::advance(avro::GenericDatum& out) {
  if (state_ != State::Iterating) return false;
  try {
    // The stop test uses the marker of the next block, not the byte offset:
    // a record may start before stop and end after it.
    if (!handle_->has_next() || handle_->past_sync(stop_)) {
      state_ = State::Exhausted;
      return false;
    }
    handle_->next(out);
  } catch (const avro::Exception& e) {
    throw SplitReadError(ErrorKind::Io,
                         "decode failed near offset " + std::to_string(last_pos_) + ": " + e.what(),
                         e.what());
  } catch (const std::exception& e) {
    // Corrupt lengths surface from the decoder as bad_alloc / length_error.
    throw SplitReadError(ErrorKind::Io,
                         "decode failed near offset " + std::to_string(last_pos_) + ": " + e.what(),
                         e.what());
  }
  last_pos_ = std::max(last_pos_, handle_->tell());
  return true;
}

std::int64_t BoundedSplitReader::position() {
  if (handle_) last_pos_ = std::max(last_pos_, handle_->tell());
  return last_pos_;
}

float BoundedSplitReader::progress() {
  if (stop_ <= start_) return 0.0f;
  const float p = static_cast<float>(position() - start_) / static_cast<float>(stop_ - start_);
  return std::min(1.0f, std::max(0.0f, p));
}

void BoundedSplitReader::close() {
  if (!handle_) return;
  last_pos_ = std::max(last_pos_, handle_->tell());
  handle_->close();
  handle_.reset();
  state_ = State::Closed;
}

}
