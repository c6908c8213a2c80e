#include "streamcodec/json_codec.hpp"

namespace streamcodec {

nlohmann::json JsonCodec::parse(std::string_view bytes) const {
  return nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, true, options_.ignore_comments);
}

std::string JsonCodec::dump(const nlohmann::json& value) const {
  return value.dump(-1, ' ', options_.ensure_ascii, options_.error_handler);
}

}  // namespace streamcodec
