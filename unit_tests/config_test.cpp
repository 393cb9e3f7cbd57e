/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "common/config.hpp"
#include "common/errors.hpp"
#include "logging/logger.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

using namespace snet;

TEST(NetworkConfigTest, DefaultStagesMatchReferenceTable) {
  std::vector<StageConfig> stages = default_stages();
  ASSERT_EQ(stages.size(), 3u);
  const size_t filters[] = {384, 768, 1536};
  const size_t repeats[] = {4, 8, 4};
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(stages[i].filters, filters[i]);
    EXPECT_EQ(stages[i].repeat, repeats[i]);
    EXPECT_EQ(stages[i].groups, 8u);
    EXPECT_EQ(stages[i].kernel_size, (Size2{3, 3}));
    EXPECT_EQ(stages[i].stage, static_cast<int>(i) + 2);
  }

  NetworkConfig config = default_network_config();
  EXPECT_EQ(config.input_shape, (std::vector<size_t>{224, 224, 3}));
  EXPECT_EQ(config.num_classes, 1000u);
  EXPECT_EQ(config.stem_filters, 24u);
  EXPECT_DOUBLE_EQ(config.bottleneck_ratio, 0.25);
  EXPECT_EQ(config.layout, Layout::NHWC);
}

TEST(NetworkConfigTest, PresetTables) {
  EXPECT_EQ(preset_stages(3)[0].filters, 240u);
  EXPECT_EQ(preset_stages(1)[2].filters, 576u);
  EXPECT_EQ(preset_stages(4)[1].groups, 4u);
  EXPECT_THROW(preset_stages(5), ConfigurationError);
  EXPECT_THROW(preset_stages(0), ConfigurationError);
}

TEST(NetworkConfigTest, ParsesFullDocument) {
  nlohmann::json j = nlohmann::json::parse(R"({
    "input_shape": [96, 128, 1],
    "num_classes": 7,
    "layout": "channels_first",
    "stem_filters": 16,
    "bottleneck_ratio": 0.5,
    "seed": 99,
    "stages": [
      {"filters": 64, "kernel_size": [3, 5], "groups": 2, "repeat": 2},
      {"filters": 128, "kernel_size": 3, "groups": 2, "repeat": 3, "stage": 3}
    ]
  })");
  NetworkConfig config = NetworkConfig::from_json(j);

  EXPECT_EQ(config.input_shape, (std::vector<size_t>{96, 128, 1}));
  EXPECT_EQ(config.num_classes, 7u);
  EXPECT_EQ(config.layout, Layout::NCHW);
  EXPECT_EQ(config.stem_filters, 16u);
  EXPECT_DOUBLE_EQ(config.bottleneck_ratio, 0.5);
  EXPECT_EQ(config.seed, 99u);
  ASSERT_EQ(config.stages.size(), 2u);
  EXPECT_EQ(config.stages[0].kernel_size, (Size2{3, 5}));
  EXPECT_EQ(config.stages[0].stage, 2);
  EXPECT_EQ(config.stages[1].kernel_size, (Size2{3, 3}));
  EXPECT_EQ(config.stages[1].repeat, 3u);
  EXPECT_EQ(config.stages[1].stage, 3);

  NetworkConfig again = NetworkConfig::from_json(config.to_json());
  EXPECT_EQ(again.to_json(), config.to_json());
}

TEST(NetworkConfigTest, MissingKeysTakeDefaults) {
  NetworkConfig config = NetworkConfig::from_json(nlohmann::json::object());
  EXPECT_EQ(config.num_classes, 1000u);
  ASSERT_EQ(config.stages.size(), 3u);
  EXPECT_EQ(config.stages[2].filters, 1536u);

  NetworkConfig grouped = NetworkConfig::from_json({{"groups", 2}});
  EXPECT_EQ(grouped.stages[0].filters, 200u);
  EXPECT_EQ(grouped.stages[0].groups, 2u);
}

TEST(NetworkConfigTest, RejectsMalformedValues) {
  using nlohmann::json;
  EXPECT_THROW(NetworkConfig::from_json(json::array()), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"num_classes", -3}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"num_classes", "ten"}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"input_shape", {224, 224}}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"input_shape", {224, 0, 3}}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"layout", "channels_middle"}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"groups", 6}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"bottleneck_ratio", "quarter"}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"stages", json::object()}}), ConfigurationError);
  json no_filters = {{"repeat", 2}};
  EXPECT_THROW(NetworkConfig::from_json({{"stages", json::array({no_filters})}}),
               ConfigurationError);
  json bad_kernel = {{"filters", 64}, {"kernel_size", json::array({3})}};
  EXPECT_THROW(NetworkConfig::from_json({{"stages", json::array({bad_kernel})}}),
               ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"bottleneck_ratio", 1e30}}), ConfigurationError);
  EXPECT_THROW(NetworkConfig::from_json({{"bottleneck_ratio", 0.0}}), ConfigurationError);
  json huge_stage = {{"filters", 64}, {"stage", 4294967298LL}};
  EXPECT_THROW(NetworkConfig::from_json({{"stages", json::array({huge_stage})}}),
               ConfigurationError);
  json negative_stage = {{"filters", 64}, {"stage", -4294967298LL}};
  EXPECT_THROW(NetworkConfig::from_json({{"stages", json::array({negative_stage})}}),
               ConfigurationError);
}

TEST(NetworkConfigTest, LargeSeedSurvivesRoundTrip) {
  NetworkConfig config = default_network_config();
  config.seed = (1ULL << 63) + 5;
  NetworkConfig parsed = NetworkConfig::from_json(config.to_json());
  EXPECT_EQ(parsed.seed, config.seed);

  config.seed = ~0ULL;
  EXPECT_EQ(NetworkConfig::from_json(config.to_json()).seed, ~0ULL);
}

TEST(NetworkConfigTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "snet_config_test.json";
  {
    std::ofstream file(path);
    file << R"({"num_classes": 10, "input_shape": [32, 32, 3], "groups": 3})";
  }
  NetworkConfig config = load_from_json(path);
  EXPECT_EQ(config.num_classes, 10u);
  EXPECT_EQ(config.stages[1].filters, 480u);

  {
    std::ofstream file(path);
    file << "{ not json";
  }
  EXPECT_THROW(load_from_json(path), ConfigurationError);
  EXPECT_THROW(load_from_json(path + ".missing"), ConfigurationError);
}

TEST(LayoutTest, ParsesNames) {
  EXPECT_EQ(layout_from_string("nhwc"), Layout::NHWC);
  EXPECT_EQ(layout_from_string("channels_last"), Layout::NHWC);
  EXPECT_EQ(layout_from_string("NCHW"), Layout::NCHW);
  EXPECT_EQ(layout_from_string("channels_first"), Layout::NCHW);
  EXPECT_THROW(layout_from_string("hwc"), ConfigurationError);
  EXPECT_EQ(make_image_shape(Layout::NCHW, 2, 5, 6, 7), (std::vector<size_t>{2, 7, 5, 6}));
  EXPECT_EQ(make_image_shape(Layout::NHWC, 2, 5, 6, 7), (std::vector<size_t>{2, 5, 6, 7}));
}

TEST(LoggerTest, ParsesLevels) {
  EXPECT_EQ(log_level_from_string("debug"), spdlog::level::debug);
  EXPECT_EQ(log_level_from_string("warn"), spdlog::level::warn);
  EXPECT_THROW(log_level_from_string("chatty"), ConfigurationError);
}

TEST(LoggerTest, SetLevelFiltersMessages) {
  GlobalLogger::set_level(LogLevel::warn);
  EXPECT_FALSE(GlobalLogger::should_log(LogLevel::debug));
  EXPECT_TRUE(GlobalLogger::should_log(LogLevel::err));
  GlobalLogger::set_level(LogLevel::debug);
  EXPECT_TRUE(GlobalLogger::should_log(LogLevel::debug));
  GlobalLogger::set_level(LogLevel::info);
}
