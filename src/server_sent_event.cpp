#include "streamcodec/server_sent_event.hpp"

namespace streamcodec {

void to_json(nlohmann::json& json, const ServerSentEvent& event) {
  json = nlohmann::json::object();
  if (event.id) json["id"] = *event.id;
  if (event.event) json["event"] = *event.event;
  if (event.data) json["data"] = *event.data;
  if (event.retry) json["retry"] = *event.retry;
}

}  // namespace streamcodec
