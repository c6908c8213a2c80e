#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "streamcodec/frame_buffer.hpp"

namespace streamcodec {

/**
 * Splits a byte stream on LF. A non-empty unterminated remainder is emitted
 * once when the source ends.
 */
class LineFramer {
public:
  static constexpr std::string_view kFormatName = "lines";

  enum class State { WaitingForDelimiter, Finished };

  explicit LineFramer(std::size_t max_frame_size = 0) : max_frame_size_(max_frame_size) {}

  FrameAction poll();
  FrameAction ingest(std::optional<std::string_view> chunk);

  State state() const { return state_; }

private:
  State state_ = State::WaitingForDelimiter;
  FrameBuffer buffer_;
  std::size_t max_frame_size_;
};

}  // namespace streamcodec
