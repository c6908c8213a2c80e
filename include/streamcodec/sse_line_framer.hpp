#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "streamcodec/frame_buffer.hpp"

namespace streamcodec {

/**
 * Splits a byte stream into event-stream lines.
 *
 * LF, CR and CRLF each terminate exactly one line. After a CR the framer moves
 * to ConsumedCR and drops the next byte if it is LF, even when that byte only
 * arrives in a later chunk.
 *
 * https://html.spec.whatwg.org/multipage/server-sent-events.html#parsing-an-event-stream
 */
class ServerSentEventLineFramer {
public:
  static constexpr std::string_view kFormatName = "sse-lines";

  enum class State { WaitingForDelimiter, ConsumedCR, Finished };

  explicit ServerSentEventLineFramer(std::size_t max_frame_size = 0) : max_frame_size_(max_frame_size) {}

  FrameAction poll();
  FrameAction ingest(std::optional<std::string_view> chunk);

  State state() const { return state_; }

private:
  State state_ = State::WaitingForDelimiter;
  FrameBuffer buffer_;
  std::size_t max_frame_size_;
};

}  // namespace streamcodec
