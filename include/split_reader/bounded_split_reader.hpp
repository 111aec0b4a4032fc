#pragma once
#include "split_reader/container_handle.hpp"
#include <cstdint>
#include <memory>

namespace sr {

// Forward-only iteration over one split of a sync-markered container.
//
// The reader starts at the first sync point at or after the split start;
// bytes before it belong to the previous split. A record is produced only if
// the sync marker in front of it lies before `stop`, so the last record may
// end past `stop` and the next split picks up at the following marker.
class BoundedSplitReader {
public:
  enum class State { Positioning, Iterating, Exhausted, Closed };

  // Seeks the handle; throws SplitReadError (Io) if positioning fails.
  BoundedSplitReader(std::unique_ptr<ContainerHandle> handle,
                     std::int64_t split_start, std::int64_t split_length);
  ~BoundedSplitReader();

  BoundedSplitReader(const BoundedSplitReader&) = delete;
  BoundedSplitReader& operator=(const BoundedSplitReader&) = delete;

  // Decode the next record into `out`. Returns false, without touching `out`,
  // once the handle is drained or its next sync marker is at or past stop.
  bool advance(avro::GenericDatum& out);

  // Byte offset of the handle; the last seen offset after close().
  std::int64_t position();

  // (position - start) / (stop - start), clamped to [0, 1]; 0 for an empty range.
  float progress();

  // Releases the handle. Further calls are no-ops.
  void close();

  std::int64_t start() const noexcept { return start_; }
  std::int64_t stop() const noexcept { return stop_; }
  State state() const noexcept { return state_; }

  // Underlying handle; only valid before close().
  const ContainerHandle& handle() const { return *handle_; }

private:
  std::unique_ptr<ContainerHandle> handle_;
  std::int64_t start_{0};
  std::int64_t stop_{0};
  std::int64_t last_pos_{0};
  State state_{State::Positioning};
};

const char* to_string(BoundedSplitReader::State s) noexcept;

}
