#include "streamcodec/sse_assembler.hpp"

#include <charconv>
#include <cstdint>
#include <utility>

#include "streamcodec/ascii.hpp"

namespace streamcodec {
namespace {

std::optional<std::int64_t> parse_retry(std::string_view value) {
  if (!value.empty() && value.front() == '+') {
    value.remove_prefix(1);
    if (!value.empty() && value.front() == '-') {
      return std::nullopt;
    }
  }
  if (value.empty()) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

ServerSentEventAssembler::Action ServerSentEventAssembler::poll() {
  if (state_ == State::Finished) {
    return Action{Action::Type::ReturnNil, std::nullopt};
  }
  if (lines_.empty()) {
    return Action{Action::Type::NeedsMore, std::nullopt};
  }

  const std::string line = std::move(lines_.front());
  lines_.pop_front();

  if (line.empty()) {
    ServerSentEvent event = std::move(event_);
    event_ = ServerSentEvent{};
    if (event.data && !event.data->empty() && event.data->back() == ascii::kLf) {
      event.data->pop_back();
    }
    if (predicate_ && event.data && !predicate_(*event.data)) {
      state_ = State::Finished;
      terminated_by_predicate_ = true;
      lines_.clear();
      return Action{Action::Type::ReturnNil, std::nullopt};
    }
    return Action{Action::Type::EmitEvent, std::move(event)};
  }

  if (line.front() == ascii::kColon) {
    return Action{Action::Type::Noop, std::nullopt};
  }

  const auto colon = line.find(ascii::kColon);
  if (colon == std::string::npos) {
    return Action{Action::Type::Noop, std::nullopt};
  }

  const std::string_view text(line);
  std::string_view value = text.substr(colon + 1);
  if (!value.empty() && value.front() == ascii::kSpace) {
    value.remove_prefix(1);
  }
  apply_field(text.substr(0, colon), value);
  return Action{Action::Type::Noop, std::nullopt};
}

ServerSentEventAssembler::Action ServerSentEventAssembler::ingest(std::optional<std::string_view> line) {
  if (state_ == State::Finished) {
    return Action{Action::Type::ReturnNil, std::nullopt};
  }
  if (line) {
    lines_.emplace_back(*line);
    return Action{Action::Type::Noop, std::nullopt};
  }
  // A partially accumulated event is dropped at end of stream.
  state_ = State::Finished;
  event_ = ServerSentEvent{};
  lines_.clear();
  return Action{Action::Type::ReturnNil, std::nullopt};
}

void ServerSentEventAssembler::apply_field(std::string_view field, std::string_view value) {
  if (field == "event") {
    event_.event = std::string(value);
  } else if (field == "data") {
    std::string& data = event_.data ? *event_.data : event_.data.emplace();
    data.append(value.data(), value.size());
    data.push_back(ascii::kLf);
  } else if (field == "id") {
    event_.id = std::string(value);
  } else if (field == "retry") {
    if (auto retry = parse_retry(value)) {
      event_.retry = *retry;
    }
  }
}

ServerSentEventReader::ServerSentEventReader(ByteSource& source,
                                             StreamOptions options,
                                             TerminationPredicate predicate)
    : options_(std::move(options)),
      lines_(source, options_),
      assembler_(std::move(predicate)) {}

std::optional<ServerSentEvent> ServerSentEventReader::next() {
  if (finished_) {
    return std::nullopt;
  }
  while (true) {
    auto action = assembler_.poll();
    switch (action.type) {
      case ServerSentEventAssembler::Action::Type::EmitEvent:
        ++event_count_;
        return std::move(action.event);
      case ServerSentEventAssembler::Action::Type::ReturnNil:
        finish();
        return std::nullopt;
      case ServerSentEventAssembler::Action::Type::Noop:
        continue;
      case ServerSentEventAssembler::Action::Type::NeedsMore:
        break;
    }

    const auto ingested = assembler_.ingest(lines_.next());
    if (ingested.type == ServerSentEventAssembler::Action::Type::ReturnNil) {
      finish();
      return std::nullopt;
    }
  }
}

void ServerSentEventReader::finish() {
  finished_ = true;
  if (assembler_.terminated_by_predicate()) {
    log(options_, LogLevel::Debug, "server-sent event stream ended by termination predicate",
        {{"events", event_count_}});
    return;
  }
  log(options_, LogLevel::Debug, "server-sent event stream finished", {{"events", event_count_}});
}

}  // namespace streamcodec
