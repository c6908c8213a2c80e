#pragma once

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace streamcodec {

/**
 * Single-pass pull source. next() returns std::nullopt once the source is
 * exhausted and keeps returning it afterwards.
 */
template <typename T>
class Source {
public:
  virtual ~Source() = default;
  virtual std::optional<T> next() = 0;
};

// Chunks may have any size, including zero.
using ByteSource = Source<std::string>;

template <typename T>
class VectorSource final : public Source<T> {
public:
  explicit VectorSource(std::vector<T> items) : items_(std::move(items)) {}

  std::optional<T> next() override {
    if (index_ >= items_.size()) {
      return std::nullopt;
    }
    return std::move(items_[index_++]);
  }

private:
  std::vector<T> items_;
  std::size_t index_ = 0;
};

template <typename T>
class FunctionSource final : public Source<T> {
public:
  using Producer = std::function<std::optional<T>()>;

  explicit FunctionSource(Producer producer) : producer_(std::move(producer)) {}

  std::optional<T> next() override {
    if (exhausted_ || !producer_) {
      return std::nullopt;
    }
    auto value = producer_();
    if (!value) {
      exhausted_ = true;
    }
    return value;
  }

private:
  Producer producer_;
  bool exhausted_ = false;
};

class IstreamByteSource final : public ByteSource {
public:
  explicit IstreamByteSource(std::istream& stream, std::size_t chunk_size = 4096);

  std::optional<std::string> next() override;

private:
  std::istream& stream_;
  std::size_t chunk_size_;
  bool exhausted_ = false;
};

/**
 * Splits bytes into consecutive chunks of at most chunk_size bytes.
 * A chunk_size of zero is treated as one.
 */
std::vector<std::string> split_into_chunks(std::string_view bytes, std::size_t chunk_size);

template <typename T>
std::vector<T> collect(Source<T>& source) {
  std::vector<T> items;
  while (auto item = source.next()) {
    items.push_back(std::move(*item));
  }
  return items;
}

std::string collect_bytes(ByteSource& source);

}  // namespace streamcodec
