#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace streamcodec {

struct JsonCodecOptions {
  bool ensure_ascii = false;
  nlohmann::json::error_handler_t error_handler = nlohmann::json::error_handler_t::strict;
  bool ignore_comments = false;
};

/**
 * Converts single payloads between bytes and JSON values.
 *
 * Encoded output is always compact, single-line JSON with object keys in sorted
 * order and unescaped forward slashes, so it fits inside any of the framings.
 * Parse and type errors are nlohmann::json exceptions and propagate unchanged.
 */
class JsonCodec {
public:
  JsonCodec() = default;
  explicit JsonCodec(JsonCodecOptions options) : options_(options) {}

  const JsonCodecOptions& options() const { return options_; }

  nlohmann::json parse(std::string_view bytes) const;
  std::string dump(const nlohmann::json& value) const;

  template <typename T>
  T decode(std::string_view bytes) const {
    return parse(bytes).get<T>();
  }

  template <typename T>
  std::string encode(const T& value) const {
    return dump(nlohmann::json(value));
  }

private:
  JsonCodecOptions options_;
};

}  // namespace streamcodec
