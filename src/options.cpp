#include "streamcodec/options.hpp"

#include <utility>

#include "streamcodec/utils/env.hpp"

namespace streamcodec {

StreamOptions resolve_stream_options(StreamOptions options) {
  if (options.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("STREAMCODEC_LOG")) {
      if (!env_log->empty()) {
        options.log_level = parse_log_level(*env_log, options.log_level);
      }
    }
  }

  if (options.max_frame_size == 0) {
    if (auto env_max = utils::read_env_size("STREAMCODEC_MAX_FRAME_SIZE")) {
      options.max_frame_size = *env_max;
    }
  }

  return options;
}

void log(const StreamOptions& options, LogLevel level, const std::string& message, const nlohmann::json& details) {
  if (!options.logger) {
    return;
  }
  if (level == LogLevel::Off || static_cast<int>(level) > static_cast<int>(options.log_level)) {
    return;
  }
  options.logger(level, message, details);
}

}  // namespace streamcodec
