/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>
#include <vector>

#include "nn/model.hpp"
#include "nn/op_types.hpp"
#include "nn/tensor_handle.hpp"
#include "tensor/layout.hpp"

namespace snet {

/**
 * @brief Tensor-graph capabilities consumed by the network construction code.
 *
 * Every call appends one operation to the graph under construction and returns a fresh
 * handle to its output. Implementations report argument or shape failures as BackendError.
 */
class Backend {
public:
  virtual ~Backend() = default;

  // `shape` includes the batch axis (0 = dynamic) and is ordered according to `layout`.
  virtual TensorHandle input(const std::vector<size_t> &shape, Layout layout) = 0;

  virtual TensorHandle conv2d(const TensorHandle &x, size_t filters, Size2 kernel, Size2 stride,
                              Padding padding, bool use_bias) = 0;
  virtual TensorHandle depthwise_conv2d(const TensorHandle &x, Size2 kernel, Size2 stride,
                                        size_t depth_multiplier, Padding padding) = 0;
  virtual TensorHandle batchnorm(const TensorHandle &x, size_t channel_axis) = 0;
  virtual TensorHandle activation(const TensorHandle &x, ActivationKind kind) = 0;
  virtual TensorHandle pool2d(const TensorHandle &x, PoolKind kind, Size2 pool_size, Size2 stride,
                              Padding padding) = 0;

  virtual TensorHandle concat(const std::vector<TensorHandle> &xs, size_t axis) = 0;
  virtual TensorHandle add(const TensorHandle &a, const TensorHandle &b) = 0;

  virtual TensorHandle reshape(const TensorHandle &x, const std::vector<size_t> &shape) = 0;
  virtual TensorHandle transpose(const TensorHandle &x, const std::vector<size_t> &axes) = 0;
  virtual TensorHandle slice_channels(const TensorHandle &x, size_t start, size_t length) = 0;

  virtual TensorHandle dense(const TensorHandle &x, size_t units) = 0;
  virtual TensorHandle global_avg_pool(const TensorHandle &x) = 0;

  // Packages everything between `input` and `output` into an executable model.
  virtual Model assemble(const TensorHandle &input, const TensorHandle &output,
                         const std::string &name) = 0;
};

}  // namespace snet
