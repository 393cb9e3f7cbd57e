/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>
#include <vector>

#include "nn/operation.hpp"

namespace snet {

// Linear projection of [N, in_features] to [N, units].
class DenseOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "dense";

  DenseOp(size_t in_features, size_t units, bool use_bias = true,
          const std::string &name = "dense");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  std::vector<ParamDescriptor> param_descriptors() const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;
  uint64_t forward_flops(const Vec<std::vector<size_t>> &input_shapes) const override;

private:
  size_t in_features_;
  size_t units_;
  bool use_bias_;
};

}  // namespace snet
