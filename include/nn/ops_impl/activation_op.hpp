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

namespace snet {

// ReLU is elementwise; softmax normalizes over the last axis.
class ActivationOp : public Operation {
public:
  explicit ActivationOp(ActivationKind kind, const std::string &name = "activation");

  std::string type() const override { return to_string(kind_); }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

  ActivationKind kind() const { return kind_; }

private:
  ActivationKind kind_;
};

}  // namespace snet
