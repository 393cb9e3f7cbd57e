/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "nn/backend.hpp"
#include "nn/operation.hpp"

namespace snet {

/**
 * @brief Host backend: an arena of operation nodes with static shape inference.
 *
 * Nodes are created eagerly and never mutated. assemble() moves the nodes reachable from
 * the requested output into a Model and resets the builder, invalidating earlier handles.
 */
class GraphBuilder : public Backend {
public:
  explicit GraphBuilder(unsigned long long seed = 0);

  TensorHandle input(const std::vector<size_t> &shape, Layout layout) override;
  TensorHandle conv2d(const TensorHandle &x, size_t filters, Size2 kernel, Size2 stride,
                      Padding padding, bool use_bias) override;
  TensorHandle depthwise_conv2d(const TensorHandle &x, Size2 kernel, Size2 stride,
                                size_t depth_multiplier, Padding padding) override;
  TensorHandle batchnorm(const TensorHandle &x, size_t channel_axis) override;
  TensorHandle activation(const TensorHandle &x, ActivationKind kind) override;
  TensorHandle pool2d(const TensorHandle &x, PoolKind kind, Size2 pool_size, Size2 stride,
                      Padding padding) override;
  TensorHandle concat(const std::vector<TensorHandle> &xs, size_t axis) override;
  TensorHandle add(const TensorHandle &a, const TensorHandle &b) override;
  TensorHandle reshape(const TensorHandle &x, const std::vector<size_t> &shape) override;
  TensorHandle transpose(const TensorHandle &x, const std::vector<size_t> &axes) override;
  TensorHandle slice_channels(const TensorHandle &x, size_t start, size_t length) override;
  TensorHandle dense(const TensorHandle &x, size_t units) override;
  TensorHandle global_avg_pool(const TensorHandle &x) override;
  Model assemble(const TensorHandle &input, const TensorHandle &output,
                 const std::string &name = "model") override;

  size_t num_nodes() const { return nodes_.size(); }

private:
  struct Node {
    std::unique_ptr<Operation> op;
    std::vector<size_t> inputs;
    std::vector<size_t> output_shape;
    Layout layout;
  };

  uint64_t graph_id_;
  unsigned long long seed_;
  std::vector<Node> nodes_;
  std::unordered_map<std::string, size_t> name_counts_;

  TensorHandle add_node(std::unique_ptr<Operation> op, const std::vector<TensorHandle> &inputs);
  void check_handle(const TensorHandle &handle) const;
  std::string unique_name(const std::string &type);

  // Topological order of the nodes `output` depends on; throws on cycles.
  std::vector<size_t> sort(size_t output) const;
  void init_params(Model::Step &step, unsigned long long seed) const;
  void reset();
};

}  // namespace snet
