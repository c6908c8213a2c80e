#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "streamcodec/options.hpp"
#include "streamcodec/server_sent_event.hpp"
#include "streamcodec/source.hpp"

namespace streamcodec {

struct SerializerAction {
  enum class Type { ReturnNil, NeedsMore, EmitBytes };

  Type type = Type::NeedsMore;
  std::string bytes;
};

/**
 * Writes each payload followed by LF.
 */
class LineSerializer {
public:
  using Item = std::string;
  static constexpr std::string_view kFormatName = "lines";

  enum class State { Running, Finished };

  SerializerAction poll() const;
  SerializerAction ingest(const std::optional<std::string>& payload);

  State state() const { return state_; }

private:
  State state_ = State::Running;
};

/**
 * Writes each payload as an RFC 7464 record: RS, payload, LF.
 */
class JsonSequenceSerializer {
public:
  using Item = std::string;
  static constexpr std::string_view kFormatName = "json-seq";

  enum class State { Running, Finished };

  SerializerAction poll() const;
  SerializerAction ingest(const std::optional<std::string>& payload);

  State state() const { return state_; }

private:
  State state_ = State::Running;
};

/**
 * Writes events in text/event-stream format.
 *
 * Fields are written in the order id, event, retry, then one data line per
 * line of the payload (CRLF and CR count as line breaks), then a blank line.
 */
class ServerSentEventSerializer {
public:
  using Item = ServerSentEvent;
  static constexpr std::string_view kFormatName = "sse";

  enum class State { Running, Finished };

  SerializerAction poll() const;
  SerializerAction ingest(const std::optional<ServerSentEvent>& event);

  State state() const { return state_; }

private:
  State state_ = State::Running;
};

std::string serialize_server_sent_event(const ServerSentEvent& event);

/**
 * Drives a serializer against a source of items. The result is itself a byte
 * source that yields one chunk per item.
 */
template <typename Serializer>
class SerializingByteSource final : public ByteSource {
public:
  using Item = typename Serializer::Item;

  explicit SerializingByteSource(Source<Item>& upstream, StreamOptions options = {})
      : upstream_(upstream), options_(std::move(options)) {}

  std::optional<std::string> next() override {
    while (true) {
      const SerializerAction action = serializer_.poll();
      if (action.type == SerializerAction::Type::ReturnNil) {
        return std::nullopt;
      }
      SerializerAction ingested = serializer_.ingest(upstream_.next());
      switch (ingested.type) {
        case SerializerAction::Type::EmitBytes:
          ++item_count_;
          return std::move(ingested.bytes);
        case SerializerAction::Type::ReturnNil:
          log(options_, LogLevel::Debug, "serialized stream finished",
              {{"format", std::string(Serializer::kFormatName)}, {"items", item_count_}});
          return std::nullopt;
        case SerializerAction::Type::NeedsMore:
          continue;
      }
    }
  }

  std::size_t item_count() const { return item_count_; }

private:
  Source<Item>& upstream_;
  StreamOptions options_;
  Serializer serializer_;
  std::size_t item_count_ = 0;
};

using LineEncoder = SerializingByteSource<LineSerializer>;
using JsonSequenceEncoder = SerializingByteSource<JsonSequenceSerializer>;
using ServerSentEventEncoder = SerializingByteSource<ServerSentEventSerializer>;

}  // namespace streamcodec
