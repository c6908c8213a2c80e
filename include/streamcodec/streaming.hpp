#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "streamcodec/options.hpp"
#include "streamcodec/server_sent_event.hpp"
#include "streamcodec/sse_assembler.hpp"
#include "streamcodec/sse_line_framer.hpp"

namespace streamcodec {

std::vector<ServerSentEvent> parse_sse_stream(std::string_view payload, const StreamOptions& options = {});
std::vector<std::string> parse_lines(std::string_view payload, const StreamOptions& options = {});
std::vector<std::string> parse_json_sequence(std::string_view payload, const StreamOptions& options = {});

std::string encode_sse_stream(const std::vector<ServerSentEvent>& events);
std::string encode_lines(const std::vector<std::string>& payloads);
std::string encode_json_sequence(const std::vector<std::string>& payloads);

/**
 * Push-driven server-sent event decoding for transports that deliver body
 * chunks through a callback.
 *
 * Runs the same line framer and assembler as ServerSentEventReader. Every
 * dispatched event is recorded; the handler can stop the stream by returning
 * false. Bytes fed after the stream stopped or finished are ignored.
 */
class ServerSentEventStream {
public:
  using EventHandler = std::function<bool(const ServerSentEvent&)>;

  explicit ServerSentEventStream(EventHandler handler = nullptr,
                                 TerminationPredicate predicate = nullptr,
                                 StreamOptions options = {});

  void feed(const char* data, std::size_t size);
  void feed(std::string_view chunk) { feed(chunk.data(), chunk.size()); }
  void finalize();
  void stop();

  [[nodiscard]] bool stopped() const { return stopped_; }
  [[nodiscard]] bool finished() const { return finished_; }
  [[nodiscard]] const std::vector<ServerSentEvent>& events() const { return events_; }

private:
  void drain_lines();
  void drain_events();
  void dispatch(ServerSentEvent&& event);

  StreamOptions options_;
  ServerSentEventLineFramer framer_;
  ServerSentEventAssembler assembler_;
  EventHandler handler_;
  std::vector<ServerSentEvent> events_;
  bool stopped_ = false;
  bool finished_ = false;
};

}  // namespace streamcodec
