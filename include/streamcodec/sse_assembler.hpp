#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "streamcodec/frame_reader.hpp"
#include "streamcodec/options.hpp"
#include "streamcodec/server_sent_event.hpp"
#include "streamcodec/source.hpp"

namespace streamcodec {

/**
 * Inspects the finalized data of an event. Returning false marks the event as
 * an end-of-stream sentinel: it is dropped and the stream ends.
 */
using TerminationPredicate = std::function<bool(std::string_view data)>;

/**
 * Accumulates event-stream lines into events.
 *
 * A blank line dispatches the accumulated event. Comments, unknown fields,
 * lines without a colon and unparsable retry values are skipped silently. An
 * event that is still open when the lines end is discarded.
 */
class ServerSentEventAssembler {
public:
  enum class State { AccumulatingEvent, Finished };

  struct Action {
    enum class Type { ReturnNil, EmitEvent, NeedsMore, Noop };

    Type type = Type::Noop;
    std::optional<ServerSentEvent> event;
  };

  explicit ServerSentEventAssembler(TerminationPredicate predicate = nullptr)
      : predicate_(std::move(predicate)) {}

  Action poll();
  Action ingest(std::optional<std::string_view> line);

  State state() const { return state_; }
  bool terminated_by_predicate() const { return terminated_by_predicate_; }

private:
  void apply_field(std::string_view field, std::string_view value);

  State state_ = State::AccumulatingEvent;
  ServerSentEvent event_;
  std::deque<std::string> lines_;
  TerminationPredicate predicate_;
  bool terminated_by_predicate_ = false;
};

class ServerSentEventReader final : public Source<ServerSentEvent> {
public:
  explicit ServerSentEventReader(ByteSource& source,
                                 StreamOptions options = {},
                                 TerminationPredicate predicate = nullptr);

  std::optional<ServerSentEvent> next() override;

  std::size_t event_count() const { return event_count_; }

private:
  void finish();

  StreamOptions options_;
  ServerSentEventLineReader lines_;
  ServerSentEventAssembler assembler_;
  std::size_t event_count_ = 0;
  bool finished_ = false;
};

}  // namespace streamcodec
