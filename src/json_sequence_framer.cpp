#include "streamcodec/json_sequence_framer.hpp"

#include "streamcodec/ascii.hpp"

namespace streamcodec {

FrameAction JsonSequenceFramer::poll() {
  switch (state_) {
    case State::Initial:
      if (buffer_.empty()) {
        return FrameAction::needs_more();
      }
      if (buffer_.front() != ascii::kRs) {
        state_ = State::Finished;
        return FrameAction::emit_error({FramingErrorKind::MissingInitialRecordSeparator, buffer_.size(), 0});
      }
      buffer_.drop_front(1);
      state_ = State::ParsingRecord;
      return FrameAction::noop();
    case State::ParsingRecord: {
      const auto index = buffer_.find(ascii::kRs);
      if (index == FrameBuffer::npos) {
        if (buffer_.exceeds(max_frame_size_)) {
          state_ = State::Finished;
          return FrameAction::emit_error({FramingErrorKind::FrameTooLarge, buffer_.size(), max_frame_size_});
        }
        return FrameAction::needs_more();
      }
      const std::string_view record = buffer_.take_frame(index);
      if (record.empty()) {
        return FrameAction::noop();
      }
      return FrameAction::emit_frame(record);
    }
    case State::Finished:
      return FrameAction::return_nil();
  }
  return FrameAction::return_nil();
}

FrameAction JsonSequenceFramer::ingest(std::optional<std::string_view> chunk) {
  if (state_ == State::Finished) {
    return FrameAction::return_nil();
  }
  if (chunk) {
    buffer_.append(*chunk);
    return FrameAction::noop();
  }
  state_ = State::Finished;
  if (buffer_.empty()) {
    // Also covers a stream that ends right after a lone RS.
    return FrameAction::return_nil();
  }
  return FrameAction::emit_frame(buffer_.take_all());
}

}  // namespace streamcodec
