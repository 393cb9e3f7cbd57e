/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "shufflenet/shuffle_unit.hpp"

#include <cmath>

#include "common/errors.hpp"
#include "shufflenet/channel_shuffle.hpp"
#include "shufflenet/group_conv.hpp"

namespace snet {

namespace {

std::string describe(const UnitConfig &config, size_t in_channels) {
  return "unit(stage=" + std::to_string(config.stage) +
         ", filters=" + std::to_string(config.filters) + ", stride=" +
         std::to_string(config.stride) + ", groups=" + std::to_string(config.groups) +
         ", in_channels=" + std::to_string(in_channels) + ")";
}

} // namespace

UnitPlan plan_unit(const UnitConfig &config, size_t in_channels) {
  const std::string where = describe(config, in_channels);
  if (config.filters == 0 || config.groups == 0 || in_channels == 0) {
    throw ConfigurationError(where + ": filters, groups and input channels must be positive");
  }
  if (config.kernel_size.h == 0 || config.kernel_size.w == 0) {
    throw ConfigurationError(where + ": kernel size must be positive");
  }
  if (config.stride != 1 && config.stride != 2) {
    throw ConfigurationError(where + ": stride must be 1 or 2");
  }
  if (!(config.bottleneck_ratio > 0.0 && config.bottleneck_ratio <= 1.0)) {
    throw ConfigurationError(where + ": bottleneck ratio must be in (0, 1], got " +
                             std::to_string(config.bottleneck_ratio));
  }

  UnitPlan plan;
  plan.in_channels = in_channels;
  plan.out_channels = config.filters;
  plan.bottleneck = config.stage == 2 ? BottleneckMode::Plain : BottleneckMode::Grouped;
  plan.merge = config.stride == 1 ? MergeMode::Add : MergeMode::ConcatWithShortcut;

  const double bottleneck = std::floor(static_cast<double>(config.filters) * config.bottleneck_ratio);
  if (bottleneck < 1.0) {
    throw ConfigurationError(where + ": bottleneck channels floor(filters * " +
                             std::to_string(config.bottleneck_ratio) + ") must be at least 1");
  }
  plan.bottleneck_channels = static_cast<size_t>(bottleneck);

  try {
    if (plan.bottleneck == BottleneckMode::Grouped) {
      check_grouping(in_channels, plan.bottleneck_channels, config.groups);
    } else if (plan.bottleneck_channels % config.groups != 0) {
      throw ConfigurationError("bottleneck channels (" +
                               std::to_string(plan.bottleneck_channels) +
                               ") must be divisible by groups (" +
                               std::to_string(config.groups) + ")");
    }

    if (plan.merge == MergeMode::Add) {
      if (in_channels != config.filters) {
        throw ConfigurationError("a stride-1 unit needs input channels equal to filters");
      }
      plan.expand_channels = config.filters;
    } else {
      if (config.filters <= in_channels) {
        throw ConfigurationError("a stride-2 unit needs filters greater than input channels");
      }
      plan.expand_channels = config.filters - in_channels;
    }
    check_grouping(plan.bottleneck_channels, plan.expand_channels, config.groups);
  } catch (const ConfigurationError &e) {
    throw ConfigurationError(where + ": " + e.what());
  }
  return plan;
}

TensorHandle shuffle_unit(Backend &backend, const TensorHandle &x, const UnitConfig &config) {
  const UnitPlan plan = plan_unit(config, x.channels());
  const size_t axis = x.channel_axis();

  TensorHandle y;
  if (plan.bottleneck == BottleneckMode::Plain) {
    y = backend.conv2d(x, plan.bottleneck_channels, config.kernel_size, {1, 1}, Padding::Same,
                       false);
  } else {
    y = group_conv(backend, x, plan.bottleneck_channels, {1, 1}, 1, config.groups);
  }
  y = backend.batchnorm(y, axis);
  y = backend.activation(y, ActivationKind::ReLU);

  y = channel_shuffle(backend, y, config.groups);

  y = backend.depthwise_conv2d(y, config.kernel_size, {config.stride, config.stride}, 1,
                               Padding::Same);
  y = backend.batchnorm(y, axis);

  y = group_conv(backend, y, plan.expand_channels, {1, 1}, 1, config.groups);
  y = backend.batchnorm(y, axis);

  if (plan.merge == MergeMode::Add) {
    return backend.add(y, x);
  }
  TensorHandle shortcut = backend.pool2d(x, PoolKind::Avg, {3, 3}, {2, 2}, Padding::Same);
  return backend.concat({y, shortcut}, axis);
}

std::string to_string(BottleneckMode mode) {
  return mode == BottleneckMode::Plain ? "plain" : "grouped";
}

std::string to_string(MergeMode mode) {
  return mode == MergeMode::Add ? "add" : "concat";
}

}  // namespace snet
