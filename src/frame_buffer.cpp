#include "streamcodec/frame_buffer.hpp"

#include <algorithm>

namespace streamcodec {

void throw_framing_error(const FramingFailure& failure) {
  switch (failure.kind) {
    case FramingErrorKind::MissingInitialRecordSeparator:
      throw MissingInitialRecordSeparatorError();
    case FramingErrorKind::FrameTooLarge:
      throw FrameTooLargeError(failure.buffered_size, failure.limit);
  }
  throw FramingError(failure.kind, "Unknown framing error");
}

void FrameBuffer::append(std::string_view chunk) {
  if (head_ > 0) {
    bytes_.erase(0, head_);
    head_ = 0;
  }
  bytes_.append(chunk.data(), chunk.size());
}

std::size_t FrameBuffer::find(char delimiter) const {
  const auto index = bytes_.find(delimiter, head_);
  return index == std::string::npos ? npos : index - head_;
}

std::size_t FrameBuffer::find_first_of(std::string_view delimiters) const {
  const auto index = bytes_.find_first_of(delimiters.data(), head_, delimiters.size());
  return index == std::string::npos ? npos : index - head_;
}

std::string_view FrameBuffer::take_frame(std::size_t index) {
  const std::string_view frame = std::string_view(bytes_).substr(head_, index);
  head_ = std::min(bytes_.size(), head_ + index + 1);
  return frame;
}

std::string_view FrameBuffer::take_all() {
  const std::string_view rest = view();
  head_ = bytes_.size();
  return rest;
}

void FrameBuffer::drop_front(std::size_t count) {
  head_ = std::min(bytes_.size(), head_ + count);
}

}  // namespace streamcodec
