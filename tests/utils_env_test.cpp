#include <gtest/gtest.h>

#include "streamcodec/error.hpp"
#include "streamcodec/utils/env.hpp"

#include "support/env_guard.hpp"

using streamcodec::utils::read_env;
using streamcodec::utils::read_env_or;
using streamcodec::utils::read_env_size;

TEST(UtilsEnvTest, ReturnsNulloptWhenUnset) {
  streamcodec::testing::ScopedEnvironment env;
  env.unset("STREAMCODEC_TEST_ENV_UNSET");
  EXPECT_FALSE(read_env("STREAMCODEC_TEST_ENV_UNSET").has_value());
}

TEST(UtilsEnvTest, TrimsWhitespaceFromValues) {
  streamcodec::testing::ScopedEnvironment env;
  env.set("STREAMCODEC_TEST_ENV_TRIM", "  value  ");
  auto value = read_env("STREAMCODEC_TEST_ENV_TRIM");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "value");
}

TEST(UtilsEnvTest, ReadEnvOrFallsBackWhenAbsent) {
  streamcodec::testing::ScopedEnvironment env;
  env.unset("STREAMCODEC_TEST_ENV_OR");
  EXPECT_EQ(read_env_or("STREAMCODEC_TEST_ENV_OR", "fallback"), "fallback");
  env.set("STREAMCODEC_TEST_ENV_OR", "set");
  EXPECT_EQ(read_env_or("STREAMCODEC_TEST_ENV_OR", "fallback"), "set");
}

TEST(UtilsEnvTest, ReadsSizes) {
  streamcodec::testing::ScopedEnvironment env;
  env.unset("STREAMCODEC_TEST_ENV_SIZE");
  EXPECT_FALSE(read_env_size("STREAMCODEC_TEST_ENV_SIZE").has_value());

  env.set("STREAMCODEC_TEST_ENV_SIZE", "   ");
  EXPECT_FALSE(read_env_size("STREAMCODEC_TEST_ENV_SIZE").has_value());

  env.set("STREAMCODEC_TEST_ENV_SIZE", " 4096 ");
  EXPECT_EQ(read_env_size("STREAMCODEC_TEST_ENV_SIZE"), std::optional<std::size_t>(4096));
}

TEST(UtilsEnvTest, RejectsMalformedSizes) {
  streamcodec::testing::ScopedEnvironment env;
  for (const char* value : {"-1", "12kb", "1.5", "abc"}) {
    env.set("STREAMCODEC_TEST_ENV_SIZE", value);
    EXPECT_THROW(read_env_size("STREAMCODEC_TEST_ENV_SIZE"), streamcodec::ConfigurationError) << value;
  }
}
