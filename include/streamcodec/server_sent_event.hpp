#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace streamcodec {

/**
 * An event of a text/event-stream body.
 *
 * https://html.spec.whatwg.org/multipage/server-sent-events.html#event-stream-interpretation
 */
struct ServerSentEvent {
  // Last event ID, used by clients to resume an interrupted stream.
  std::optional<std::string> id;
  // Event type.
  std::optional<std::string> event;
  // Payload; multiple data lines are joined with LF.
  std::optional<std::string> data;
  // Reconnection delay in milliseconds.
  std::optional<std::int64_t> retry;
};

inline bool operator==(const ServerSentEvent& lhs, const ServerSentEvent& rhs) {
  return lhs.id == rhs.id && lhs.event == rhs.event && lhs.data == rhs.data && lhs.retry == rhs.retry;
}

inline bool operator!=(const ServerSentEvent& lhs, const ServerSentEvent& rhs) {
  return !(lhs == rhs);
}

/**
 * A server-sent event whose data field carries one JSON value.
 */
template <typename T>
struct ServerSentEventWithJsonData {
  std::optional<std::string> event;
  std::optional<T> data;
  std::optional<std::string> id;
  std::optional<std::int64_t> retry;
};

template <typename T>
bool operator==(const ServerSentEventWithJsonData<T>& lhs, const ServerSentEventWithJsonData<T>& rhs) {
  return lhs.event == rhs.event && lhs.data == rhs.data && lhs.id == rhs.id && lhs.retry == rhs.retry;
}

template <typename T>
bool operator!=(const ServerSentEventWithJsonData<T>& lhs, const ServerSentEventWithJsonData<T>& rhs) {
  return !(lhs == rhs);
}

// Absent fields are omitted.
void to_json(nlohmann::json& json, const ServerSentEvent& event);

}  // namespace streamcodec
