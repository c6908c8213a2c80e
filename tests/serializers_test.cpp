#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "streamcodec/frame_reader.hpp"
#include "streamcodec/serializers.hpp"
#include "streamcodec/source.hpp"
#include "streamcodec/sse_assembler.hpp"
#include "streamcodec/streaming.hpp"

#include "support/chunking.hpp"

using streamcodec::SerializerAction;
using streamcodec::ServerSentEvent;

namespace {

ServerSentEvent data_event(const std::string& data) {
  ServerSentEvent event;
  event.data = data;
  return event;
}

std::string encode_events(const std::vector<ServerSentEvent>& events) {
  streamcodec::VectorSource<ServerSentEvent> source(events);
  streamcodec::ServerSentEventEncoder encoder(source);
  return streamcodec::collect_bytes(encoder);
}

}  // namespace

TEST(LineSerializerTest, AppendsLineFeed) {
  streamcodec::VectorSource<std::string> payloads(std::vector<std::string>{"hello", "", "world"});
  streamcodec::LineEncoder encoder(payloads);
  EXPECT_EQ(encoder.next(), std::optional<std::string>("hello\n"));
  EXPECT_EQ(encoder.next(), std::optional<std::string>("\n"));
  EXPECT_EQ(encoder.next(), std::optional<std::string>("world\n"));
  EXPECT_FALSE(encoder.next().has_value());
  EXPECT_FALSE(encoder.next().has_value());
  EXPECT_EQ(encoder.item_count(), 3u);
}

TEST(LineSerializerTest, StateMachineFinishesOnce) {
  streamcodec::LineSerializer serializer;
  EXPECT_EQ(serializer.poll().type, SerializerAction::Type::NeedsMore);
  auto action = serializer.ingest(std::string("x"));
  ASSERT_EQ(action.type, SerializerAction::Type::EmitBytes);
  EXPECT_EQ(action.bytes, "x\n");
  EXPECT_EQ(serializer.ingest(std::nullopt).type, SerializerAction::Type::ReturnNil);
  EXPECT_EQ(serializer.state(), streamcodec::LineSerializer::State::Finished);
  EXPECT_EQ(serializer.poll().type, SerializerAction::Type::ReturnNil);
  EXPECT_EQ(serializer.ingest(std::string("late")).type, SerializerAction::Type::ReturnNil);
}

TEST(JsonSequenceSerializerTest, FramesEachRecord) {
  EXPECT_EQ(streamcodec::encode_json_sequence({"{\"name\":\"Rover\"}", "{\"name\":\"Pancake\"}"}),
            "\x1e{\"name\":\"Rover\"}\n\x1e{\"name\":\"Pancake\"}\n");

  streamcodec::JsonSequenceSerializer serializer;
  EXPECT_EQ(serializer.ingest(std::string("1")).bytes, std::string("\x1e" "1\n"));
  EXPECT_EQ(serializer.ingest(std::nullopt).type, SerializerAction::Type::ReturnNil);
  EXPECT_EQ(serializer.poll().type, SerializerAction::Type::ReturnNil);
}

TEST(ServerSentEventSerializerTest, SplitsDataIntoLines) {
  EXPECT_EQ(encode_events({data_event("hello\nworld")}), "data: hello\ndata: world\n\n");
  EXPECT_EQ(encode_events({data_event("hello\nworld"), data_event("hello2\nworld2")}),
            "data: hello\ndata: world\n\ndata: hello2\ndata: world2\n\n");
}

TEST(ServerSentEventSerializerTest, NormalizesCarriageReturns) {
  EXPECT_EQ(encode_events({data_event("a\r\nb\rc\n\r\nd")}),
            "data: a\ndata: b\ndata: c\ndata: \ndata: d\n\n");
  EXPECT_EQ(encode_events({data_event("end\n")}), "data: end\ndata: \n\n");
  EXPECT_EQ(encode_events({data_event("")}), "data: \n\n");
}

TEST(ServerSentEventSerializerTest, WritesFieldsInOrder) {
  ServerSentEvent retry_only;
  retry_only.retry = 5000;

  ServerSentEvent custom = data_event("This is a custom event message.");
  custom.event = "customEvent";

  ServerSentEvent with_id = data_event("This is a message with an ID.");
  with_id.id = "123";

  ServerSentEvent all_fields = data_event("x");
  all_fields.retry = 1;
  all_fields.event = "e";
  all_fields.id = "i";

  const std::string expected =
      "retry: 5000\n"
      "\n"
      "data: This is the first message.\n"
      "\n"
      "data: This is the second\n"
      "data: message.\n"
      "\n"
      "event: customEvent\n"
      "data: This is a custom event message.\n"
      "\n"
      "id: 123\n"
      "data: This is a message with an ID.\n"
      "\n"
      "id: i\n"
      "event: e\n"
      "retry: 1\n"
      "data: x\n"
      "\n";
  EXPECT_EQ(encode_events({retry_only,
                           data_event("This is the first message."),
                           data_event("This is the second\nmessage."),
                           custom,
                           with_id,
                           all_fields}),
            expected);
}

TEST(ServerSentEventSerializerTest, EmptyEventIsABlankLine) {
  EXPECT_EQ(streamcodec::serialize_server_sent_event(ServerSentEvent{}), "\n");
}

TEST(RoundTripTest, Lines) {
  const std::vector<std::string> payloads = {"alpha", "", "gamma delta", "{\"k\":[1,2]}"};
  auto bytes = streamcodec::encode_lines(payloads);
  for (std::size_t size : {std::size_t{1}, std::size_t{5}, bytes.size()}) {
    auto source = streamcodec::testing::chunked_source(bytes, size);
    streamcodec::LineReader reader(source);
    EXPECT_EQ(streamcodec::collect(reader), payloads);
  }
}

TEST(RoundTripTest, JsonSequence) {
  const std::vector<std::string> payloads = {"{\"a\":1}", "[true,false]", "\"text\""};
  const auto records = streamcodec::parse_json_sequence(streamcodec::encode_json_sequence(payloads));
  ASSERT_EQ(records.size(), payloads.size());
  for (std::size_t i = 0; i < payloads.size(); ++i) {
    EXPECT_EQ(records[i], payloads[i] + "\n");
  }
}

TEST(RoundTripTest, ServerSentEvents) {
  ServerSentEvent full;
  full.id = "42";
  full.event = "update";
  full.data = "multi\nline\n\npayload";
  full.retry = 250;

  ServerSentEvent empty_data;
  empty_data.data = "";

  ServerSentEvent no_data;
  no_data.event = "heartbeat";

  const std::vector<ServerSentEvent> events = {full, empty_data, no_data, ServerSentEvent{}, data_event("x")};
  const std::string bytes = encode_events(events);
  for (std::size_t size : {std::size_t{1}, std::size_t{3}, bytes.size()}) {
    auto source = streamcodec::testing::chunked_source(bytes, size);
    streamcodec::ServerSentEventReader reader(source);
    EXPECT_EQ(streamcodec::collect(reader), events) << "chunk size " << size;
  }
}
