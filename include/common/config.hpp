/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "nn/op_types.hpp"
#include "tensor/layout.hpp"

namespace snet {

/**
 * @brief Parameters of a single shuffle unit.
 *
 * `stage` is the network stage number (2, 3 or 4); stage 2 uses a plain bottleneck
 * convolution instead of a grouped one.
 */
struct UnitConfig {
  size_t filters = 0;
  Size2 kernel_size{3, 3};
  size_t stride = 1;
  size_t groups = 1;
  int stage = 2;
  double bottleneck_ratio = 0.25;
};

struct StageConfig {
  size_t filters = 0;
  Size2 kernel_size{3, 3};
  size_t groups = 1;
  size_t repeat = 1;
  int stage = 2;
};

// stage2 = {384, 3x3, 8, 4}, stage3 = {768, 3x3, 8, 8}, stage4 = {1536, 3x3, 8, 4}
std::vector<StageConfig> default_stages();

/**
 * @brief Everything needed to build one network.
 *
 * `input_shape` is always {height, width, channels}; `layout` decides how the
 * graph orders those axes.
 */
struct NetworkConfig {
  std::vector<size_t> input_shape{224, 224, 3};
  size_t num_classes = 1000;
  std::vector<StageConfig> stages = default_stages();
  Layout layout = Layout::NHWC;
  size_t stem_filters = 24;
  double bottleneck_ratio = 0.25;
  unsigned long long seed = 0;

  /**
   * @brief Serializes to the JSON format accepted by from_json().
   * @return JSON object; `stages` is always written explicitly.
   */
  nlohmann::json to_json() const;

  /**
   * @brief Parses a configuration; missing keys take their defaults.
   *
   * When `stages` is absent, `groups` (default 8) selects a preset table.
   * Malformed or negative values raise ConfigurationError.
   */
  static NetworkConfig from_json(const nlohmann::json &j);
};

// Published 1x widths for 1, 2, 3, 4 or 8 groups.
std::vector<StageConfig> preset_stages(size_t groups);

// 224x224x3 input, 1000 classes, default stage table.
NetworkConfig default_network_config();

NetworkConfig load_from_json(const std::string &path);

}  // namespace snet
