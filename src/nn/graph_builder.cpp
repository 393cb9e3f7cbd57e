/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/graph_builder.hpp"

#include <atomic>
#include <cmath>

#include "common/errors.hpp"
#include "logging/logger.hpp"
#include "nn/ops_impl/activation_op.hpp"
#include "nn/ops_impl/batchnorm_op.hpp"
#include "nn/ops_impl/conv2d_op.hpp"
#include "nn/ops_impl/dense_op.hpp"
#include "nn/ops_impl/pool2d_op.hpp"
#include "nn/ops_impl/shape_op.hpp"

namespace snet {

namespace {

uint64_t next_graph_id() {
  static std::atomic<uint64_t> counter{0};
  return ++counter;
}

} // namespace

GraphBuilder::GraphBuilder(unsigned long long seed) : graph_id_(next_graph_id()), seed_(seed) {}

void GraphBuilder::check_handle(const TensorHandle &handle) const {
  if (!handle.valid()) {
    throw BackendError("Tensor handle is empty");
  }
  if (handle.graph_id() != graph_id_) {
    throw BackendError("Tensor handle belongs to another graph");
  }
  if (handle.node_id() >= nodes_.size()) {
    throw BackendError("Tensor handle refers to unknown node " + std::to_string(handle.node_id()));
  }
}

std::string GraphBuilder::unique_name(const std::string &type) {
  return type + "_" + std::to_string(++name_counts_[type]);
}

TensorHandle GraphBuilder::add_node(std::unique_ptr<Operation> op,
                                    const std::vector<TensorHandle> &inputs) {
  Vec<std::vector<size_t>> input_shapes;
  std::vector<size_t> input_ids;
  for (const auto &handle : inputs) {
    check_handle(handle);
    input_shapes.push_back(nodes_[handle.node_id()].output_shape);
    input_ids.push_back(handle.node_id());
  }
  Layout layout = inputs.empty() ? Layout::NHWC : inputs.front().layout();

  op->set_name(unique_name(op->type()));
  std::vector<size_t> output_shape = op->compute_output_shape(input_shapes);

  nodes_.push_back({std::move(op), std::move(input_ids), output_shape, layout});
  return TensorHandle(graph_id_, nodes_.size() - 1, std::move(output_shape), layout);
}

TensorHandle GraphBuilder::input(const std::vector<size_t> &shape, Layout layout) {
  if (shape.empty()) {
    throw BackendError("Input shape must have at least one axis");
  }
  for (size_t i = 1; i < shape.size(); ++i) {
    if (shape[i] == 0) {
      throw BackendError("Input shape " + format_shape(shape) +
                         " may only leave the batch axis dynamic");
    }
  }
  auto op = std::make_unique<InputOp>(shape);
  op->set_name(unique_name(op->type()));
  nodes_.push_back({std::move(op), {}, shape, layout});
  return TensorHandle(graph_id_, nodes_.size() - 1, shape, layout);
}

TensorHandle GraphBuilder::conv2d(const TensorHandle &x, size_t filters, Size2 kernel,
                                  Size2 stride, Padding padding, bool use_bias) {
  check_handle(x);
  return add_node(std::make_unique<Conv2DOp>(x.layout(), x.channels(), filters, kernel, stride,
                                             padding, use_bias),
                  {x});
}

TensorHandle GraphBuilder::depthwise_conv2d(const TensorHandle &x, Size2 kernel, Size2 stride,
                                            size_t depth_multiplier, Padding padding) {
  check_handle(x);
  return add_node(std::make_unique<DepthwiseConv2DOp>(x.layout(), x.channels(), kernel, stride,
                                                      depth_multiplier, padding),
                  {x});
}

TensorHandle GraphBuilder::batchnorm(const TensorHandle &x, size_t channel_axis) {
  check_handle(x);
  if (channel_axis == 0 || channel_axis >= x.rank()) {
    throw BackendError("batchnorm axis " + std::to_string(channel_axis) +
                       " is invalid for shape " + format_shape(x.shape()));
  }
  return add_node(std::make_unique<BatchNormOp>(channel_axis, x.shape()[channel_axis]), {x});
}

TensorHandle GraphBuilder::activation(const TensorHandle &x, ActivationKind kind) {
  return add_node(std::make_unique<ActivationOp>(kind), {x});
}

TensorHandle GraphBuilder::pool2d(const TensorHandle &x, PoolKind kind, Size2 pool_size,
                                  Size2 stride, Padding padding) {
  check_handle(x);
  return add_node(std::make_unique<Pool2DOp>(x.layout(), kind, pool_size, stride, padding), {x});
}

TensorHandle GraphBuilder::concat(const std::vector<TensorHandle> &xs, size_t axis) {
  return add_node(std::make_unique<ConcatOp>(axis), xs);
}

TensorHandle GraphBuilder::add(const TensorHandle &a, const TensorHandle &b) {
  return add_node(std::make_unique<AddOp>(), {a, b});
}

TensorHandle GraphBuilder::reshape(const TensorHandle &x, const std::vector<size_t> &shape) {
  return add_node(std::make_unique<ReshapeOp>(shape), {x});
}

TensorHandle GraphBuilder::transpose(const TensorHandle &x, const std::vector<size_t> &axes) {
  return add_node(std::make_unique<TransposeOp>(axes), {x});
}

TensorHandle GraphBuilder::slice_channels(const TensorHandle &x, size_t start, size_t length) {
  check_handle(x);
  return add_node(std::make_unique<SliceOp>(x.channel_axis(), start, length), {x});
}

TensorHandle GraphBuilder::dense(const TensorHandle &x, size_t units) {
  check_handle(x);
  if (x.rank() != 2) {
    throw BackendError("dense expects a [batch, features] input, got " + format_shape(x.shape()));
  }
  return add_node(std::make_unique<DenseOp>(x.shape()[1], units), {x});
}

TensorHandle GraphBuilder::global_avg_pool(const TensorHandle &x) {
  check_handle(x);
  return add_node(std::make_unique<GlobalAvgPoolOp>(x.layout()), {x});
}

std::vector<size_t> GraphBuilder::sort(size_t output) const {
  enum class Mark { None, Visiting, Done };
  std::vector<Mark> marks(nodes_.size(), Mark::None);
  std::vector<size_t> order;

  // Iterative post-order DFS: (node, next input to visit).
  std::vector<std::pair<size_t, size_t>> stack;
  stack.emplace_back(output, 0);
  marks[output] = Mark::Visiting;

  while (!stack.empty()) {
    auto &[node, next] = stack.back();
    const auto &inputs = nodes_[node].inputs;
    if (next < inputs.size()) {
      size_t child = inputs[next++];
      if (marks[child] == Mark::Visiting) {
        throw BackendError("Cycle detected at '" + nodes_[child].op->name() + "'");
      }
      if (marks[child] == Mark::None) {
        marks[child] = Mark::Visiting;
        stack.emplace_back(child, 0);
      }
    } else {
      marks[node] = Mark::Done;
      order.push_back(node);
      stack.pop_back();
    }
  }
  return order;
}

void GraphBuilder::init_params(Model::Step &step, unsigned long long seed) const {
  for (const auto &desc : step.param_descs) {
    Tensor param(desc.shape);
    switch (desc.init) {
    case ParamInit::Uniform: {
      const float limit = 1.0f / std::sqrt(static_cast<float>(desc.fan_in));
      param.fill_random_uniform(-limit, limit, seed++);
      break;
    }
    case ParamInit::Ones:
      param.fill(1.0f);
      break;
    case ParamInit::Zeros:
      param.fill(0.0f);
      break;
    }
    step.params.push_back(std::move(param));
  }
}

Model GraphBuilder::assemble(const TensorHandle &input, const TensorHandle &output,
                             const std::string &name) {
  check_handle(input);
  check_handle(output);
  if (nodes_[input.node_id()].op->type() != InputOp::TYPE_NAME) {
    throw BackendError("'" + nodes_[input.node_id()].op->name() + "' is not an input");
  }

  std::vector<size_t> order = sort(output.node_id());
  for (size_t id : order) {
    if (nodes_[id].inputs.empty() && id != input.node_id()) {
      throw BackendError("Output depends on '" + nodes_[id].op->name() +
                         "', which is not the model input");
    }
  }
  if (order.front() != input.node_id()) {
    throw BackendError("Output does not depend on input '" + nodes_[input.node_id()].op->name() +
                       "'");
  }

  std::vector<size_t> position(nodes_.size(), 0);
  std::vector<Model::Step> steps;
  steps.reserve(order.size());
  unsigned long long seed = seed_;
  for (size_t id : order) {
    Node &node = nodes_[id];
    position[id] = steps.size();

    Model::Step step;
    step.inputs.reserve(node.inputs.size());
    for (size_t in : node.inputs) {
      step.inputs.push_back(position[in]);
    }
    step.output_shape = node.output_shape;
    step.param_descs = node.op->param_descriptors();
    init_params(step, seed);
    seed += step.param_descs.size();
    step.op = std::move(node.op);
    steps.push_back(std::move(step));
  }

  const size_t dropped = nodes_.size() - order.size();
  if (dropped > 0) {
    GlobalLogger::debug("Dropping {} node(s) unreachable from the output", dropped);
  }
  Layout layout = nodes_[input.node_id()].layout;
  reset();

  Model model(name, layout, std::move(steps));
  GlobalLogger::debug("Assembled '{}': {} operations, {} parameters", model.name(),
                      model.num_operations(), model.num_parameters());
  return model;
}

void GraphBuilder::reset() {
  nodes_.clear();
  name_counts_.clear();
  graph_id_ = next_graph_id();
}

}  // namespace snet
