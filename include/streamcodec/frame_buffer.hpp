#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "streamcodec/error.hpp"

namespace streamcodec {

struct FramingFailure {
  FramingErrorKind kind = FramingErrorKind::MissingInitialRecordSeparator;
  std::size_t buffered_size = 0;
  std::size_t limit = 0;
};

/**
 * Result of a framer transition.
 *
 * poll() may return any type. ingest() only returns ReturnNil, EmitFrame or Noop.
 */
struct FrameAction {
  enum class Type { ReturnNil, EmitFrame, EmitError, NeedsMore, Noop };

  Type type = Type::Noop;
  std::string_view frame;
  std::optional<FramingFailure> failure;

  static FrameAction return_nil() { return FrameAction{Type::ReturnNil, {}, std::nullopt}; }
  static FrameAction emit_frame(std::string_view frame) { return FrameAction{Type::EmitFrame, frame, std::nullopt}; }
  static FrameAction emit_error(FramingFailure failure) { return FrameAction{Type::EmitError, {}, failure}; }
  static FrameAction needs_more() { return FrameAction{Type::NeedsMore, {}, std::nullopt}; }
  static FrameAction noop() { return FrameAction{Type::Noop, {}, std::nullopt}; }
};

[[noreturn]] void throw_framing_error(const FramingFailure& failure);

/**
 * Growable byte buffer shared by all framers.
 *
 * Consumed bytes are only released on the next append, so a frame view returned
 * by take_frame() or take_all() stays valid until then. The logical contents
 * never include bytes of a frame that was already taken.
 */
class FrameBuffer {
public:
  static constexpr std::size_t npos = std::string_view::npos;

  void append(std::string_view chunk);

  bool empty() const { return head_ == bytes_.size(); }
  std::size_t size() const { return bytes_.size() - head_; }
  std::string_view view() const { return std::string_view(bytes_).substr(head_); }
  char front() const { return bytes_[head_]; }

  // Offsets are relative to the start of the unconsumed bytes.
  std::size_t find(char delimiter) const;
  std::size_t find_first_of(std::string_view delimiters) const;

  // Returns the bytes before `index` and consumes them together with the delimiter at `index`.
  std::string_view take_frame(std::size_t index);
  std::string_view take_all();
  void drop_front(std::size_t count);

  // True when a frame limit is set and the unconsumed bytes exceed it.
  bool exceeds(std::size_t limit) const { return limit != 0 && size() > limit; }

private:
  std::string bytes_;
  std::size_t head_ = 0;
};

}  // namespace streamcodec
