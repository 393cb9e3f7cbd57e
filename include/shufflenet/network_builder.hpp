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
#include "nn/model.hpp"

namespace snet {

struct NetworkHandles {
  TensorHandle input;
  std::vector<TensorHandle> stage_outputs;  // one per configured stage, in order
  TensorHandle output;
};

/**
 * @brief Checks the whole network before anything is built.
 *
 * Walks the channel flow from the stem through every unit of every stage.
 * @throws ConfigurationError naming the offending values.
 */
void validate(const NetworkConfig &config);

/**
 * @brief Emits the full graph: stem conv + max pool, the stages, then
 * global average pool, dense projection and softmax.
 */
NetworkHandles build_graph(Backend &backend, const NetworkConfig &config);

// Builds and assembles the network on `backend`.
Model build_network(Backend &backend, const NetworkConfig &config);

Model build_network(Backend &backend, const std::vector<size_t> &input_shape,
                    size_t num_classes,
                    const std::vector<StageConfig> &stages = default_stages());

// Builds `config` on a fresh GraphBuilder seeded with `config.seed`.
Model create_shufflenet(const NetworkConfig &config);

}  // namespace snet
