#pragma once

#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "streamcodec/frame_reader.hpp"
#include "streamcodec/json_codec.hpp"
#include "streamcodec/options.hpp"
#include "streamcodec/serializers.hpp"
#include "streamcodec/server_sent_event.hpp"
#include "streamcodec/source.hpp"
#include "streamcodec/sse_assembler.hpp"

namespace streamcodec {

/**
 * Decodes every frame of a framed byte stream as a JSON value of type T.
 *
 * Framing errors and nlohmann::json exceptions propagate from next(); the
 * reader returns std::nullopt afterwards.
 */
template <typename T, typename Framer>
class JsonFrameReader final : public Source<T> {
public:
  explicit JsonFrameReader(ByteSource& source, StreamOptions options = {})
      : codec_(options.json), frames_(source, std::move(options)) {}

  std::optional<T> next() override {
    if (failed_) {
      return std::nullopt;
    }
    auto frame = frames_.next();
    if (!frame) {
      return std::nullopt;
    }
    try {
      return codec_.decode<T>(*frame);
    } catch (const nlohmann::json::exception&) {
      failed_ = true;
      throw;
    }
  }

private:
  JsonCodec codec_;
  FrameReader<Framer> frames_;
  bool failed_ = false;
};

template <typename T>
using JsonLinesReader = JsonFrameReader<T, LineFramer>;

template <typename T>
using JsonSequenceReader = JsonFrameReader<T, JsonSequenceFramer>;

/**
 * Server-sent events whose data field holds JSON. Events without data keep
 * data empty. The termination predicate sees the raw data before decoding,
 * which is where sentinels such as "[DONE]" are recognized.
 */
template <typename T>
class ServerSentEventJsonReader final : public Source<ServerSentEventWithJsonData<T>> {
public:
  explicit ServerSentEventJsonReader(ByteSource& source,
                                     StreamOptions options = {},
                                     TerminationPredicate predicate = nullptr)
      : codec_(options.json), events_(source, std::move(options), std::move(predicate)) {}

  std::optional<ServerSentEventWithJsonData<T>> next() override {
    if (failed_) {
      return std::nullopt;
    }
    auto event = events_.next();
    if (!event) {
      return std::nullopt;
    }
    ServerSentEventWithJsonData<T> typed;
    typed.event = std::move(event->event);
    typed.id = std::move(event->id);
    typed.retry = event->retry;
    if (event->data) {
      try {
        typed.data = codec_.decode<T>(*event->data);
      } catch (const nlohmann::json::exception&) {
        failed_ = true;
        throw;
      }
    }
    return typed;
  }

private:
  JsonCodec codec_;
  ServerSentEventReader events_;
  bool failed_ = false;
};

/**
 * Encodes each upstream value to a compact JSON payload.
 */
template <typename T>
class JsonPayloadSource final : public Source<std::string> {
public:
  JsonPayloadSource(Source<T>& upstream, JsonCodec codec)
      : upstream_(upstream), codec_(std::move(codec)) {}

  std::optional<std::string> next() override {
    auto value = upstream_.next();
    if (!value) {
      return std::nullopt;
    }
    return codec_.encode(*value);
  }

private:
  Source<T>& upstream_;
  JsonCodec codec_;
};

template <typename T, typename Serializer>
class JsonPayloadWriter final : public ByteSource {
public:
  explicit JsonPayloadWriter(Source<T>& upstream, StreamOptions options = {})
      : payloads_(upstream, JsonCodec(options.json)), encoder_(payloads_, std::move(options)) {}

  std::optional<std::string> next() override { return encoder_.next(); }

private:
  JsonPayloadSource<T> payloads_;
  SerializingByteSource<Serializer> encoder_;
};

template <typename T>
using JsonLinesWriter = JsonPayloadWriter<T, LineSerializer>;

template <typename T>
using JsonSequenceWriter = JsonPayloadWriter<T, JsonSequenceSerializer>;

template <typename T>
class ServerSentEventJsonWriter final : public ByteSource {
public:
  explicit ServerSentEventJsonWriter(Source<ServerSentEventWithJsonData<T>>& upstream, StreamOptions options = {})
      : events_(upstream, JsonCodec(options.json)), encoder_(events_, std::move(options)) {}

  std::optional<std::string> next() override { return encoder_.next(); }

private:
  class EncodedEvents final : public Source<ServerSentEvent> {
  public:
    EncodedEvents(Source<ServerSentEventWithJsonData<T>>& upstream, JsonCodec codec)
        : upstream_(upstream), codec_(std::move(codec)) {}

    std::optional<ServerSentEvent> next() override {
      auto typed = upstream_.next();
      if (!typed) {
        return std::nullopt;
      }
      ServerSentEvent event;
      event.id = std::move(typed->id);
      event.event = std::move(typed->event);
      event.retry = typed->retry;
      if (typed->data) {
        event.data = codec_.encode(*typed->data);
      }
      return event;
    }

  private:
    Source<ServerSentEventWithJsonData<T>>& upstream_;
    JsonCodec codec_;
  };

  EncodedEvents events_;
  ServerSentEventEncoder encoder_;
};

}  // namespace streamcodec
