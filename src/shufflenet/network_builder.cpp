/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "shufflenet/network_builder.hpp"

#include "common/errors.hpp"
#include "logging/logger.hpp"
#include "nn/graph_builder.hpp"
#include "shufflenet/stage.hpp"

namespace snet {

namespace {

constexpr Size2 STEM_KERNEL{3, 3};
constexpr Size2 STEM_STRIDE{2, 2};
constexpr Size2 STEM_POOL{3, 3};

} // namespace

void validate(const NetworkConfig &config) {
  if (config.input_shape.size() != 3) {
    throw ConfigurationError("input_shape must be {height, width, channels}, got " +
                             format_shape(config.input_shape));
  }
  for (size_t dim : config.input_shape) {
    if (dim == 0) {
      throw ConfigurationError("input_shape must be positive, got " +
                               format_shape(config.input_shape));
    }
  }
  if (config.num_classes == 0) {
    throw ConfigurationError("num_classes must be positive");
  }
  if (config.stem_filters == 0) {
    throw ConfigurationError("stem_filters must be positive");
  }
  if (config.stages.empty()) {
    throw ConfigurationError("at least one stage is required");
  }

  size_t channels = config.stem_filters;
  for (const auto &stage_config : config.stages) {
    channels = plan_stage(stage_config, channels, config.bottleneck_ratio).back().out_channels;
  }
}

NetworkHandles build_graph(Backend &backend, const NetworkConfig &config) {
  validate(config);

  const size_t height = config.input_shape[0];
  const size_t width = config.input_shape[1];
  const size_t channels = config.input_shape[2];

  NetworkHandles handles;
  handles.input =
      backend.input(make_image_shape(config.layout, 0, height, width, channels), config.layout);

  TensorHandle x = backend.conv2d(handles.input, config.stem_filters, STEM_KERNEL, STEM_STRIDE,
                                  Padding::Same, true);
  x = backend.activation(x, ActivationKind::ReLU);
  x = backend.pool2d(x, PoolKind::Max, STEM_POOL, STEM_STRIDE, Padding::Same);

  for (const auto &stage_config : config.stages) {
    x = stage(backend, x, stage_config, config.bottleneck_ratio);
    GlobalLogger::debug("stage {} output {}", stage_config.stage, format_shape(x.shape()));
    handles.stage_outputs.push_back(x);
  }

  x = backend.global_avg_pool(x);
  x = backend.dense(x, config.num_classes);
  handles.output = backend.activation(x, ActivationKind::Softmax);
  return handles;
}

Model build_network(Backend &backend, const NetworkConfig &config) {
  NetworkHandles handles = build_graph(backend, config);
  Model model = backend.assemble(handles.input, handles.output, "shufflenet");
  GlobalLogger::info("Built {} ({}): {} operations, {} parameters, output {}", model.name(),
                     to_string(config.layout), model.num_operations(), model.num_parameters(),
                     format_shape(model.output_shape()));
  return model;
}

Model build_network(Backend &backend, const std::vector<size_t> &input_shape, size_t num_classes,
                    const std::vector<StageConfig> &stages) {
  NetworkConfig config;
  config.input_shape = input_shape;
  config.num_classes = num_classes;
  config.stages = stages;
  return build_network(backend, config);
}

Model create_shufflenet(const NetworkConfig &config) {
  GraphBuilder builder(config.seed);
  return build_network(builder, config);
}

}  // namespace snet
