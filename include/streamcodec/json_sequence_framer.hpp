#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "streamcodec/frame_buffer.hpp"

namespace streamcodec {

/**
 * Splits an RFC 7464 JSON text sequence into records.
 *
 * The first byte must be RS; otherwise poll() reports
 * MissingInitialRecordSeparator and the framer finishes without emitting
 * anything. Each record runs up to the next RS. Empty records are skipped.
 * Record payloads keep their trailing LF.
 */
class JsonSequenceFramer {
public:
  static constexpr std::string_view kFormatName = "json-seq";

  enum class State { Initial, ParsingRecord, Finished };

  explicit JsonSequenceFramer(std::size_t max_frame_size = 0) : max_frame_size_(max_frame_size) {}

  FrameAction poll();
  FrameAction ingest(std::optional<std::string_view> chunk);

  State state() const { return state_; }

private:
  State state_ = State::Initial;
  FrameBuffer buffer_;
  std::size_t max_frame_size_;
};

}  // namespace streamcodec
