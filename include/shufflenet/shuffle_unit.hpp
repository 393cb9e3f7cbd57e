/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>

#include "common/config.hpp"
#include "nn/backend.hpp"

namespace snet {

enum class BottleneckMode {
  Plain,    // ordinary convolution, groups = 1
  Grouped,  // 1x1 grouped convolution
};

enum class MergeMode {
  Add,                 // stride 1: expand to `filters`, add the unit input
  ConcatWithShortcut,  // stride 2: expand to `filters - in`, concat avg-pooled input
};

/**
 * @brief Resolved structure of one shuffle unit.
 *
 * Produced by plan_unit() before anything is added to a graph, so that every channel
 * count the unit will use has already been checked.
 */
struct UnitPlan {
  BottleneckMode bottleneck;
  MergeMode merge;
  size_t in_channels;
  size_t bottleneck_channels;
  size_t expand_channels;  // output width of the final grouped convolution
  size_t out_channels;
};

/**
 * @brief Validates a unit configuration against its input width.
 * @throws ConfigurationError naming the offending values.
 */
UnitPlan plan_unit(const UnitConfig &config, size_t in_channels);

/**
 * @brief Bottleneck residual unit.
 *
 * bottleneck conv -> BN -> ReLU -> channel shuffle -> depthwise conv -> BN ->
 * grouped expansion -> BN, merged with the unit input by add (stride 1) or by
 * concatenation with a 3x3/2 average-pooled shortcut (stride 2).
 */
TensorHandle shuffle_unit(Backend &backend, const TensorHandle &x, const UnitConfig &config);

std::string to_string(BottleneckMode mode);
std::string to_string(MergeMode mode);

}  // namespace snet
