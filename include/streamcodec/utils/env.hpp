#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace streamcodec::utils {

/**
 * Reads an environment variable and trims leading/trailing whitespace.
 * Returns std::nullopt when the variable is not set.
 */
std::optional<std::string> read_env(const std::string& name);

std::string read_env_or(const std::string& name, const std::string& fallback);

/**
 * Reads a non-negative decimal integer from the environment.
 * Unset or blank variables yield std::nullopt; anything else that is not a
 * plain decimal number throws ConfigurationError naming the variable.
 */
std::optional<std::size_t> read_env_size(const std::string& name);

}  // namespace streamcodec::utils
