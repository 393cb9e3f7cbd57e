/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "shufflenet/stage.hpp"

#include "common/errors.hpp"
#include "logging/logger.hpp"

namespace snet {

std::vector<UnitConfig> stage_units(const StageConfig &config, double bottleneck_ratio) {
  if (config.repeat == 0) {
    throw ConfigurationError("stage " + std::to_string(config.stage) +
                             ": repeat must be at least 1");
  }
  std::vector<UnitConfig> units;
  units.reserve(config.repeat);
  for (size_t i = 0; i < config.repeat; ++i) {
    UnitConfig unit;
    unit.filters = config.filters;
    unit.kernel_size = config.kernel_size;
    unit.stride = i == 0 ? 2 : 1;
    unit.groups = config.groups;
    unit.stage = config.stage;
    unit.bottleneck_ratio = bottleneck_ratio;
    units.push_back(unit);
  }
  return units;
}

std::vector<UnitPlan> plan_stage(const StageConfig &config, size_t in_channels,
                                 double bottleneck_ratio) {
  std::vector<UnitPlan> plans;
  size_t channels = in_channels;
  for (const auto &unit : stage_units(config, bottleneck_ratio)) {
    plans.push_back(plan_unit(unit, channels));
    channels = plans.back().out_channels;
  }
  return plans;
}

TensorHandle stage(Backend &backend, const TensorHandle &x, const StageConfig &config,
                   double bottleneck_ratio) {
  const std::vector<UnitPlan> plans = plan_stage(config, x.channels(), bottleneck_ratio);
  const std::vector<UnitConfig> units = stage_units(config, bottleneck_ratio);

  for (size_t i = 0; GlobalLogger::should_log(LogLevel::debug) && i < plans.size(); ++i) {
    GlobalLogger::debug("stage {} unit {}: {} -> {} channels ({} bottleneck of {}, {} merge)",
                        config.stage, i, plans[i].in_channels, plans[i].out_channels,
                        to_string(plans[i].bottleneck), plans[i].bottleneck_channels,
                        to_string(plans[i].merge));
  }

  TensorHandle y = x;
  for (const auto &unit : units) {
    y = shuffle_unit(backend, y, unit);
  }
  return y;
}

}  // namespace snet
