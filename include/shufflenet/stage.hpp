/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <vector>

#include "common/config.hpp"
#include "nn/backend.hpp"
#include "shufflenet/shuffle_unit.hpp"

namespace snet {

// Unit configurations of a stage: the first with stride 2, the rest with stride 1.
std::vector<UnitConfig> stage_units(const StageConfig &config, double bottleneck_ratio = 0.25);

/**
 * @brief Plans every unit of a stage starting from `in_channels`.
 * @throws ConfigurationError if `repeat` is zero or any unit is invalid.
 */
std::vector<UnitPlan> plan_stage(const StageConfig &config, size_t in_channels,
                                 double bottleneck_ratio = 0.25);

/**
 * @brief Builds `config.repeat` shuffle units.
 *
 * The whole stage is planned before the first unit is emitted, so a configuration
 * error leaves the graph untouched.
 */
TensorHandle stage(Backend &backend, const TensorHandle &x, const StageConfig &config,
                   double bottleneck_ratio = 0.25);

}  // namespace snet
