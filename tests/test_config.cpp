/**
 * @file test_config.cpp
 * @brief Tests for LinkConfig validation and the `key = value` loader.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

#include "serlink/config/config_loader.hpp"

using serlink::config::ConfigError;
using serlink::config::LinkConfig;
using serlink::config::Loader;

TEST(LinkConfig, Defaults_AreValid) {
  const auto cfg = Loader::defaults();
  EXPECT_TRUE(cfg.validate().has_value());
  EXPECT_EQ(cfg.word_bits, 32u);
  EXPECT_EQ(cfg.bytes_per_word, 4u);
  EXPECT_EQ(cfg.tx_buffer_depth, 8u);
  EXPECT_EQ(cfg.rx_buffer_depth, 8u);
  EXPECT_TRUE(cfg.reset_on_link_down);
  EXPECT_EQ(cfg.timeout_cycles(), 1'000'000'000u);
}

TEST(LinkConfig, Validate_ReportsFirstViolation) {
  LinkConfig c;
  c.word_bits = 16;
  ASSERT_FALSE(c.validate());
  EXPECT_EQ(c.validate().error(), ConfigError::WordWidthInvalid);

  c = LinkConfig{};
  c.word_bits = 72;
  EXPECT_EQ(c.validate().error(), ConfigError::WordWidthInvalid);

  c = LinkConfig{};
  c.bytes_per_word = 0;
  EXPECT_EQ(c.validate().error(), ConfigError::BytesPerWordInvalid);

  c = LinkConfig{};
  c.rx_buffer_depth = 0;
  EXPECT_EQ(c.validate().error(), ConfigError::BufferDepthZero);

  c = LinkConfig{};
  c.timeout_s = 0;
  EXPECT_EQ(c.validate().error(), ConfigError::TimeoutZero);
}

TEST(LinkConfig, TimeoutCycles_Saturates) {
  LinkConfig c;
  c.clk_freq_hz = std::numeric_limits<std::uint64_t>::max() / 2;
  c.timeout_s   = 4;
  EXPECT_EQ(c.timeout_cycles(), std::numeric_limits<std::uint64_t>::max());
}

// ---------- Loader ----------

/**
 * @test LoadFromString_OverridesAndComments
 * @brief Keys override defaults; comments, blank lines and padding are ignored.
 */
TEST(ConfigLoader, LoadFromString_OverridesAndComments) {
  const auto cfg = Loader::load_from_string(
      "# link under test\n"
      "word_bits = 64\n"
      "\n"
      "  tx_buffer_depth=16   # deeper tx\n"
      "clk_freq_hz = 1000\r\n"
      "timeout_s = 2\n"
      "reset_on_link_down = no\n");
  ASSERT_TRUE(cfg);
  EXPECT_EQ(cfg->word_bits, 64u);
  EXPECT_EQ(cfg->tx_buffer_depth, 16u);
  EXPECT_EQ(cfg->rx_buffer_depth, 8u); // default kept
  EXPECT_EQ(cfg->timeout_cycles(), 2000u);
  EXPECT_FALSE(cfg->reset_on_link_down);
}

TEST(ConfigLoader, LoadFromString_Errors) {
  auto unknown = Loader::load_from_string("word_bitz = 32\n");
  ASSERT_FALSE(unknown);
  EXPECT_EQ(unknown.error(), ConfigError::ParseError);

  auto no_eq = Loader::load_from_string("word_bits 32\n");
  ASSERT_FALSE(no_eq);
  EXPECT_EQ(no_eq.error(), ConfigError::ParseError);

  auto bad_num = Loader::load_from_string("rx_buffer_depth = 8x\n");
  ASSERT_FALSE(bad_num);
  EXPECT_EQ(bad_num.error(), ConfigError::ParseError);

  auto bad_bool = Loader::load_from_string("reset_on_link_down = maybe\n");
  ASSERT_FALSE(bad_bool);
  EXPECT_EQ(bad_bool.error(), ConfigError::ParseError);

  auto invalid = Loader::load_from_string("bytes_per_word = 0\n");
  ASSERT_FALSE(invalid);
  EXPECT_EQ(invalid.error(), ConfigError::BytesPerWordInvalid);
}

TEST(ConfigLoader, LoadFromFile_Missing) {
  auto r = Loader::load_from_file("/nonexistent/serlink.conf");
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ConfigError::FileNotFound);
}

TEST(ConfigError, ToString_Stable) {
  EXPECT_EQ(serlink::config::to_string(ConfigError::DuplicatePort), "duplicate_port");
  EXPECT_EQ(serlink::config::to_string(ConfigError::LaneMissing), "lane_missing");
}
