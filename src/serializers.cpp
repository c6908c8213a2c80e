#include "streamcodec/serializers.hpp"

#include <string_view>

#include "streamcodec/ascii.hpp"

namespace streamcodec {
namespace {

SerializerAction running_or_finished(bool finished) {
  return SerializerAction{finished ? SerializerAction::Type::ReturnNil : SerializerAction::Type::NeedsMore, {}};
}

void append_field(std::string& buffer, std::string_view name, std::string_view value) {
  buffer.append(name.data(), name.size());
  buffer.push_back(ascii::kColon);
  buffer.push_back(ascii::kSpace);
  buffer.append(value.data(), value.size());
  buffer.push_back(ascii::kLf);
}

}  // namespace

SerializerAction LineSerializer::poll() const {
  return running_or_finished(state_ == State::Finished);
}

SerializerAction LineSerializer::ingest(const std::optional<std::string>& payload) {
  if (state_ == State::Finished || !payload) {
    state_ = State::Finished;
    return SerializerAction{SerializerAction::Type::ReturnNil, {}};
  }
  std::string bytes;
  bytes.reserve(payload->size() + 1);
  bytes += *payload;
  bytes.push_back(ascii::kLf);
  return SerializerAction{SerializerAction::Type::EmitBytes, std::move(bytes)};
}

SerializerAction JsonSequenceSerializer::poll() const {
  return running_or_finished(state_ == State::Finished);
}

SerializerAction JsonSequenceSerializer::ingest(const std::optional<std::string>& payload) {
  if (state_ == State::Finished || !payload) {
    state_ = State::Finished;
    return SerializerAction{SerializerAction::Type::ReturnNil, {}};
  }
  std::string bytes;
  bytes.reserve(payload->size() + 2);
  bytes.push_back(ascii::kRs);
  bytes += *payload;
  bytes.push_back(ascii::kLf);
  return SerializerAction{SerializerAction::Type::EmitBytes, std::move(bytes)};
}

SerializerAction ServerSentEventSerializer::poll() const {
  return running_or_finished(state_ == State::Finished);
}

SerializerAction ServerSentEventSerializer::ingest(const std::optional<ServerSentEvent>& event) {
  if (state_ == State::Finished || !event) {
    state_ = State::Finished;
    return SerializerAction{SerializerAction::Type::ReturnNil, {}};
  }
  return SerializerAction{SerializerAction::Type::EmitBytes, serialize_server_sent_event(*event)};
}

std::string serialize_server_sent_event(const ServerSentEvent& event) {
  std::string buffer;
  if (event.id) append_field(buffer, "id", *event.id);
  if (event.event) append_field(buffer, "event", *event.event);
  if (event.retry) append_field(buffer, "retry", std::to_string(*event.retry));
  if (event.data) {
    const std::string_view data(*event.data);
    std::size_t start = 0;
    while (true) {
      const auto end = data.find_first_of("\r\n", start);
      if (end == std::string_view::npos) {
        append_field(buffer, "data", data.substr(start));
        break;
      }
      append_field(buffer, "data", data.substr(start, end - start));
      start = end + 1;
      if (data[end] == ascii::kCr && start < data.size() && data[start] == ascii::kLf) {
        ++start;
      }
    }
  }
  buffer.push_back(ascii::kLf);
  return buffer;
}

}  // namespace streamcodec
