#include "streamcodec/streaming.hpp"

#include <utility>

#include "streamcodec/frame_reader.hpp"
#include "streamcodec/serializers.hpp"
#include "streamcodec/source.hpp"

namespace streamcodec {
namespace {

template <typename Serializer>
std::string encode_all(const std::vector<typename Serializer::Item>& items) {
  VectorSource<typename Serializer::Item> source(items);
  SerializingByteSource<Serializer> encoder(source);
  return collect_bytes(encoder);
}

}  // namespace

std::vector<ServerSentEvent> parse_sse_stream(std::string_view payload, const StreamOptions& options) {
  VectorSource<std::string> source(std::vector<std::string>{std::string(payload)});
  ServerSentEventReader reader(source, options);
  return collect(reader);
}

std::vector<std::string> parse_lines(std::string_view payload, const StreamOptions& options) {
  VectorSource<std::string> source(std::vector<std::string>{std::string(payload)});
  LineReader reader(source, options);
  return collect(reader);
}

std::vector<std::string> parse_json_sequence(std::string_view payload, const StreamOptions& options) {
  VectorSource<std::string> source(std::vector<std::string>{std::string(payload)});
  JsonSequenceFrameReader reader(source, options);
  std::vector<std::string> records;
  while (auto record = reader.next()) {
    records.emplace_back(*record);
  }
  return records;
}

std::string encode_sse_stream(const std::vector<ServerSentEvent>& events) {
  return encode_all<ServerSentEventSerializer>(events);
}

std::string encode_lines(const std::vector<std::string>& payloads) {
  return encode_all<LineSerializer>(payloads);
}

std::string encode_json_sequence(const std::vector<std::string>& payloads) {
  return encode_all<JsonSequenceSerializer>(payloads);
}

ServerSentEventStream::ServerSentEventStream(EventHandler handler,
                                             TerminationPredicate predicate,
                                             StreamOptions options)
    : options_(std::move(options)),
      framer_(options_.max_frame_size),
      assembler_(std::move(predicate)),
      handler_(std::move(handler)) {}

void ServerSentEventStream::feed(const char* data, std::size_t size) {
  if (stopped_ || finished_) return;
  framer_.ingest(std::string_view(data, size));
  drain_lines();
}

void ServerSentEventStream::finalize() {
  if (stopped_ || finished_) return;
  FrameAction last = framer_.ingest(std::nullopt);
  if (last.type == FrameAction::Type::EmitFrame) {
    assembler_.ingest(last.frame);
    drain_events();
  }
  if (!stopped_ && !finished_) {
    assembler_.ingest(std::nullopt);
    drain_events();
  }
  finished_ = true;
  log(options_, LogLevel::Debug, "server-sent event stream finished",
      {{"events", events_.size()}, {"stopped", stopped_}});
}

void ServerSentEventStream::stop() {
  stopped_ = true;
}

void ServerSentEventStream::drain_lines() {
  while (!stopped_ && !finished_) {
    FrameAction action = framer_.poll();
    switch (action.type) {
      case FrameAction::Type::EmitFrame:
        assembler_.ingest(action.frame);
        drain_events();
        break;
      case FrameAction::Type::EmitError:
        finished_ = true;
        log(options_, LogLevel::Error, "server-sent event stream failed",
            {{"events", events_.size()}, {"buffered_size", action.failure->buffered_size}});
        throw_framing_error(*action.failure);
      case FrameAction::Type::Noop:
        break;
      case FrameAction::Type::NeedsMore:
      case FrameAction::Type::ReturnNil:
        return;
    }
  }
}

void ServerSentEventStream::drain_events() {
  while (!stopped_) {
    auto action = assembler_.poll();
    switch (action.type) {
      case ServerSentEventAssembler::Action::Type::EmitEvent:
        dispatch(std::move(*action.event));
        break;
      case ServerSentEventAssembler::Action::Type::Noop:
        break;
      case ServerSentEventAssembler::Action::Type::ReturnNil:
        finished_ = true;
        return;
      case ServerSentEventAssembler::Action::Type::NeedsMore:
        return;
    }
  }
}

void ServerSentEventStream::dispatch(ServerSentEvent&& event) {
  events_.push_back(std::move(event));
  if (handler_) {
    const bool should_continue = handler_(events_.back());
    if (!should_continue) {
      stopped_ = true;
    }
  }
}

}  // namespace streamcodec
