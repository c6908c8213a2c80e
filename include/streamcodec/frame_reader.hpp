#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "streamcodec/json_sequence_framer.hpp"
#include "streamcodec/line_framer.hpp"
#include "streamcodec/options.hpp"
#include "streamcodec/source.hpp"
#include "streamcodec/sse_line_framer.hpp"

namespace streamcodec {

/**
 * Pulls byte chunks from a source through a framer and returns one frame per
 * call to next().
 *
 * The returned view points into the framer's buffer and is only valid until
 * the following call to next(). Structural errors are thrown as FramingError;
 * after an error or the end of the source, next() returns std::nullopt.
 */
template <typename Framer>
class FrameReader {
public:
  explicit FrameReader(ByteSource& source, StreamOptions options = {})
      : source_(source), options_(std::move(options)), framer_(options_.max_frame_size) {}

  FrameReader(const FrameReader&) = delete;
  FrameReader& operator=(const FrameReader&) = delete;

  std::optional<std::string_view> next() {
    while (true) {
      FrameAction action = framer_.poll();
      switch (action.type) {
        case FrameAction::Type::ReturnNil:
          finish();
          return std::nullopt;
        case FrameAction::Type::EmitFrame:
          ++frame_count_;
          return action.frame;
        case FrameAction::Type::EmitError:
          fail(*action.failure);
        case FrameAction::Type::Noop:
          continue;
        case FrameAction::Type::NeedsMore:
          break;
      }

      std::optional<std::string> chunk = source_.next();
      FrameAction ingested = chunk ? framer_.ingest(std::string_view(*chunk)) : framer_.ingest(std::nullopt);
      switch (ingested.type) {
        case FrameAction::Type::ReturnNil:
          finish();
          return std::nullopt;
        case FrameAction::Type::EmitFrame:
          ++frame_count_;
          return ingested.frame;
        default:
          continue;
      }
    }
  }

  std::size_t frame_count() const { return frame_count_; }
  const Framer& framer() const { return framer_; }

private:
  void finish() {
    if (finished_) {
      return;
    }
    finished_ = true;
    log(options_, LogLevel::Debug, "frame stream finished",
        {{"format", std::string(Framer::kFormatName)}, {"frames", frame_count_}});
  }

  [[noreturn]] void fail(const FramingFailure& failure) {
    finished_ = true;
    nlohmann::json details = {{"format", std::string(Framer::kFormatName)}, {"frames", frame_count_}};
    if (failure.kind == FramingErrorKind::FrameTooLarge) {
      details["buffered_size"] = failure.buffered_size;
      details["limit"] = failure.limit;
    }
    log(options_, LogLevel::Error, "frame stream failed", details);
    throw_framing_error(failure);
  }

  ByteSource& source_;
  StreamOptions options_;
  Framer framer_;
  std::size_t frame_count_ = 0;
  bool finished_ = false;
};

using LineFrameReader = FrameReader<LineFramer>;
using ServerSentEventLineReader = FrameReader<ServerSentEventLineFramer>;
using JsonSequenceFrameReader = FrameReader<JsonSequenceFramer>;

/**
 * Plain Lines decoding: each LF-terminated line as an owned string.
 */
class LineReader final : public Source<std::string> {
public:
  explicit LineReader(ByteSource& source, StreamOptions options = {})
      : frames_(source, std::move(options)) {}

  std::optional<std::string> next() override {
    auto frame = frames_.next();
    if (!frame) {
      return std::nullopt;
    }
    return std::string(*frame);
  }

private:
  LineFrameReader frames_;
};

}  // namespace streamcodec
