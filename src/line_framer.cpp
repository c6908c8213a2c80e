#include "streamcodec/line_framer.hpp"

#include "streamcodec/ascii.hpp"

namespace streamcodec {

FrameAction LineFramer::poll() {
  switch (state_) {
    case State::WaitingForDelimiter: {
      const auto index = buffer_.find(ascii::kLf);
      if (index == FrameBuffer::npos) {
        if (buffer_.exceeds(max_frame_size_)) {
          state_ = State::Finished;
          return FrameAction::emit_error({FramingErrorKind::FrameTooLarge, buffer_.size(), max_frame_size_});
        }
        return FrameAction::needs_more();
      }
      return FrameAction::emit_frame(buffer_.take_frame(index));
    }
    case State::Finished:
      return FrameAction::return_nil();
  }
  return FrameAction::return_nil();
}

FrameAction LineFramer::ingest(std::optional<std::string_view> chunk) {
  if (state_ == State::Finished) {
    return FrameAction::return_nil();
  }
  if (chunk) {
    buffer_.append(*chunk);
    return FrameAction::noop();
  }
  state_ = State::Finished;
  if (buffer_.empty()) {
    return FrameAction::return_nil();
  }
  return FrameAction::emit_frame(buffer_.take_all());
}

}  // namespace streamcodec
