#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "streamcodec/frame_reader.hpp"
#include "streamcodec/options.hpp"
#include "streamcodec/source.hpp"

namespace streamcodec::testing {

inline VectorSource<std::string> chunked_source(std::string_view bytes, std::size_t chunk_size) {
  return VectorSource<std::string>(split_into_chunks(bytes, chunk_size));
}

inline VectorSource<std::string> one_byte_per_chunk(std::string_view bytes) {
  return chunked_source(bytes, 1);
}

// Interleaves an empty chunk before every byte.
inline VectorSource<std::string> with_empty_chunks(std::string_view bytes) {
  std::vector<std::string> chunks;
  for (char byte : bytes) {
    chunks.emplace_back();
    chunks.emplace_back(1, byte);
  }
  chunks.emplace_back();
  return VectorSource<std::string>(std::move(chunks));
}

template <typename Framer>
std::vector<std::string> read_frames(ByteSource& source, StreamOptions options = {}) {
  FrameReader<Framer> reader(source, std::move(options));
  std::vector<std::string> frames;
  while (auto frame = reader.next()) {
    frames.emplace_back(*frame);
  }
  return frames;
}

template <typename Framer>
std::vector<std::string> decode_frames(std::string_view bytes, std::size_t chunk_size, StreamOptions options = {}) {
  auto source = chunked_source(bytes, chunk_size);
  return read_frames<Framer>(source, std::move(options));
}

}  // namespace streamcodec::testing
