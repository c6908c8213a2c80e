#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include "streamcodec/json_codec.hpp"
#include "streamcodec/logging.hpp"

namespace streamcodec {

struct StreamOptions {
  // Zero means unlimited.
  std::size_t max_frame_size = 0;
  JsonCodecOptions json;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

/**
 * Fills values left at their defaults from STREAMCODEC_LOG and
 * STREAMCODEC_MAX_FRAME_SIZE. Explicit values always win.
 */
StreamOptions resolve_stream_options(StreamOptions options);

void log(const StreamOptions& options,
         LogLevel level,
         const std::string& message,
         const nlohmann::json& details = nlohmann::json::object());

}  // namespace streamcodec
