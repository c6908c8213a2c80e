#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "streamcodec/source.hpp"

TEST(SourceTest, VectorSourceStaysExhausted) {
  streamcodec::VectorSource<int> source(std::vector<int>{1, 2});
  EXPECT_EQ(source.next(), 1);
  EXPECT_EQ(source.next(), 2);
  EXPECT_FALSE(source.next().has_value());
  EXPECT_FALSE(source.next().has_value());
}

TEST(SourceTest, FunctionSourceStopsAtFirstNullopt) {
  int calls = 0;
  streamcodec::FunctionSource<int> source([&calls]() -> std::optional<int> {
    ++calls;
    if (calls == 3) {
      return std::nullopt;
    }
    return calls;
  });
  EXPECT_EQ(streamcodec::collect(source), (std::vector<int>{1, 2}));
  EXPECT_FALSE(source.next().has_value());
  EXPECT_EQ(calls, 3);
}

TEST(SourceTest, IstreamSourceReadsFixedChunks) {
  std::istringstream input("abcdefg");
  streamcodec::IstreamByteSource source(input, 3);
  EXPECT_EQ(streamcodec::collect(source), (std::vector<std::string>{"abc", "def", "g"}));
  EXPECT_FALSE(source.next().has_value());
}

TEST(SourceTest, IstreamSourceOnEmptyStream) {
  std::istringstream input;
  streamcodec::IstreamByteSource source(input);
  EXPECT_FALSE(source.next().has_value());
}

TEST(SourceTest, SplitIntoChunks) {
  EXPECT_EQ(streamcodec::split_into_chunks("abcde", 2), (std::vector<std::string>{"ab", "cd", "e"}));
  EXPECT_EQ(streamcodec::split_into_chunks("abc", 0), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(streamcodec::split_into_chunks("", 4).empty());
}

TEST(SourceTest, CollectBytesConcatenates) {
  streamcodec::VectorSource<std::string> source(std::vector<std::string>{"ab", "", "cd"});
  EXPECT_EQ(streamcodec::collect_bytes(source), "abcd");
}
