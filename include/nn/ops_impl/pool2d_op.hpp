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

class Pool2DOp : public Operation {
public:
  Pool2DOp(Layout layout, PoolKind kind, Size2 pool_size, Size2 stride, Padding padding,
           const std::string &name = "pool2d");

  std::string type() const override {
    return kind_ == PoolKind::Avg ? "avg_pool2d" : "max_pool2d";
  }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;
  uint64_t forward_flops(const Vec<std::vector<size_t>> &input_shapes) const override;

  PoolKind kind() const { return kind_; }

private:
  Layout layout_;
  PoolKind kind_;
  Size2 pool_size_;
  Size2 stride_;
  Padding padding_;
};

// Average over all spatial positions: image tensor -> [N, C].
class GlobalAvgPoolOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "global_avg_pool";

  explicit GlobalAvgPoolOp(Layout layout, const std::string &name = "global_avg_pool");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

private:
  Layout layout_;
};

}  // namespace snet
