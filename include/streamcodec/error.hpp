#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace streamcodec {

class StreamCodecError : public std::runtime_error {
public:
  explicit StreamCodecError(const std::string& message)
      : std::runtime_error(message) {}
};

enum class FramingErrorKind { MissingInitialRecordSeparator, FrameTooLarge };

/**
 * Structural error raised while splitting a byte stream into frames.
 * Fatal for the whole sequence: the reader that threw it produces nothing afterwards.
 */
class FramingError : public StreamCodecError {
public:
  FramingError(FramingErrorKind kind, const std::string& message)
      : StreamCodecError(message), kind_(kind) {}

  FramingErrorKind kind() const { return kind_; }

private:
  FramingErrorKind kind_;
};

class MissingInitialRecordSeparatorError : public FramingError {
public:
  MissingInitialRecordSeparatorError()
      : FramingError(FramingErrorKind::MissingInitialRecordSeparator,
                     "Missing an initial <RS> character, the bytes might not be a JSON Sequence.") {}
};

class FrameTooLargeError : public FramingError {
public:
  FrameTooLargeError(std::size_t buffered_size, std::size_t limit)
      : FramingError(FramingErrorKind::FrameTooLarge,
                     "Frame exceeds maximum size: " + std::to_string(buffered_size) +
                         " bytes buffered, limit is " + std::to_string(limit)),
        buffered_size_(buffered_size),
        limit_(limit) {}

  std::size_t buffered_size() const { return buffered_size_; }
  std::size_t limit() const { return limit_; }

private:
  std::size_t buffered_size_;
  std::size_t limit_;
};

class ConfigurationError : public StreamCodecError {
public:
  explicit ConfigurationError(const std::string& message)
      : StreamCodecError(message) {}
};

}  // namespace streamcodec
