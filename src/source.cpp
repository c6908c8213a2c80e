#include "streamcodec/source.hpp"

#include <algorithm>

namespace streamcodec {

IstreamByteSource::IstreamByteSource(std::istream& stream, std::size_t chunk_size)
    : stream_(stream), chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

std::optional<std::string> IstreamByteSource::next() {
  if (exhausted_) {
    return std::nullopt;
  }
  std::string chunk(chunk_size_, '\0');
  stream_.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  const auto count = static_cast<std::size_t>(stream_.gcount());
  if (count == 0) {
    exhausted_ = true;
    return std::nullopt;
  }
  chunk.resize(count);
  return chunk;
}

std::vector<std::string> split_into_chunks(std::string_view bytes, std::size_t chunk_size) {
  const std::size_t step = std::max<std::size_t>(chunk_size, 1);
  std::vector<std::string> chunks;
  chunks.reserve(bytes.size() / step + 1);
  for (std::size_t offset = 0; offset < bytes.size(); offset += step) {
    chunks.emplace_back(bytes.substr(offset, step));
  }
  return chunks;
}

std::string collect_bytes(ByteSource& source) {
  std::string bytes;
  while (auto chunk = source.next()) {
    bytes += *chunk;
  }
  return bytes;
}

}  // namespace streamcodec
