#include "streamcodec/utils/env.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

#include "streamcodec/error.hpp"

namespace streamcodec::utils {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  return trim(raw);
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  if (auto value = read_env(name)) {
    return *value;
  }
  return fallback;
}

std::optional<std::size_t> read_env_size(const std::string& name) {
  auto value = read_env(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  std::size_t parsed = 0;
  const char* first = value->data();
  const char* last = first + value->size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    throw ConfigurationError(name + " must be a non-negative integer, got '" + *value + "'");
  }
  return parsed;
}

}  // namespace streamcodec::utils
