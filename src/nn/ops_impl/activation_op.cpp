/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/activation_op.hpp"

#include "common/errors.hpp"
#include "nn/ops_impl/cpu/activation_ops.hpp"

namespace snet {

ActivationOp::ActivationOp(ActivationKind kind, const std::string &name)
    : Operation(name), kind_(kind) {}

std::vector<size_t>
ActivationOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  if (input_shapes[0].empty()) {
    throw BackendError(type() + " '" + name_ + "' cannot be applied to a scalar");
  }
  return input_shapes[0];
}

void ActivationOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                           Tensor &output) const {
  (void)params;
  const Tensor &input = *inputs[0];
  if (kind_ == ActivationKind::ReLU) {
    cpu::relu<float>(input.data(), output.data(), input.size());
    return;
  }
  const size_t cols = input.shape().back();
  const size_t rows = cols == 0 ? 0 : input.size() / cols;
  cpu::softmax<float>(input.data(), output.data(), rows, cols);
}

}  // namespace snet
