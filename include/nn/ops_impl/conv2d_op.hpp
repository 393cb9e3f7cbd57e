/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>
#include <vector>

#include "nn/op_types.hpp"
#include "nn/operation.hpp"
#include "tensor/layout.hpp"

namespace snet {

class Conv2DOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "conv2d";

  Conv2DOp(Layout layout, size_t in_channels, size_t filters, Size2 kernel, Size2 stride,
           Padding padding, bool use_bias, const std::string &name = "conv2d");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  std::vector<ParamDescriptor> param_descriptors() const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;
  uint64_t forward_flops(const Vec<std::vector<size_t>> &input_shapes) const override;

  size_t filters() const { return filters_; }
  Size2 kernel() const { return kernel_; }
  Size2 stride() const { return stride_; }
  bool use_bias() const { return use_bias_; }

private:
  Layout layout_;
  size_t in_channels_;
  size_t filters_;
  Size2 kernel_;
  Size2 stride_;
  Padding padding_;
  bool use_bias_;
};

class DepthwiseConv2DOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "depthwise_conv2d";

  DepthwiseConv2DOp(Layout layout, size_t in_channels, Size2 kernel, Size2 stride,
                    size_t depth_multiplier, Padding padding,
                    const std::string &name = "depthwise_conv2d");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  std::vector<ParamDescriptor> param_descriptors() const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;
  uint64_t forward_flops(const Vec<std::vector<size_t>> &input_shapes) const override;

  Size2 kernel() const { return kernel_; }
  Size2 stride() const { return stride_; }

private:
  Layout layout_;
  size_t in_channels_;
  Size2 kernel_;
  Size2 stride_;
  size_t depth_multiplier_;
  Padding padding_;
};

}  // namespace snet
