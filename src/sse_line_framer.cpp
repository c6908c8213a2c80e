#include "streamcodec/sse_line_framer.hpp"

#include "streamcodec/ascii.hpp"

namespace streamcodec {
namespace {

constexpr char kLineTerminators[] = {ascii::kLf, ascii::kCr};

}  // namespace

FrameAction ServerSentEventLineFramer::poll() {
  switch (state_) {
    case State::WaitingForDelimiter: {
      const auto index = buffer_.find_first_of(std::string_view(kLineTerminators, sizeof(kLineTerminators)));
      if (index == FrameBuffer::npos) {
        if (buffer_.exceeds(max_frame_size_)) {
          state_ = State::Finished;
          return FrameAction::emit_error({FramingErrorKind::FrameTooLarge, buffer_.size(), max_frame_size_});
        }
        return FrameAction::needs_more();
      }
      const bool carriage_return = buffer_.view()[index] == ascii::kCr;
      const std::string_view line = buffer_.take_frame(index);
      if (carriage_return) {
        state_ = State::ConsumedCR;
      }
      return FrameAction::emit_frame(line);
    }
    case State::ConsumedCR:
      if (buffer_.empty()) {
        return FrameAction::needs_more();
      }
      if (buffer_.front() == ascii::kLf) {
        buffer_.drop_front(1);
      }
      state_ = State::WaitingForDelimiter;
      return FrameAction::noop();
    case State::Finished:
      return FrameAction::return_nil();
  }
  return FrameAction::return_nil();
}

FrameAction ServerSentEventLineFramer::ingest(std::optional<std::string_view> chunk) {
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
