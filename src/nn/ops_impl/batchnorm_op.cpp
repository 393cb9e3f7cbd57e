/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/batchnorm_op.hpp"

#include "common/errors.hpp"
#include "nn/ops_impl/cpu/batchnorm_ops.hpp"

namespace snet {

BatchNormOp::BatchNormOp(size_t channel_axis, size_t channels, float epsilon,
                         const std::string &name)
    : Operation(name), channel_axis_(channel_axis), channels_(channels), epsilon_(epsilon) {}

std::vector<size_t>
BatchNormOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  const auto &shape = input_shapes[0];
  if (channel_axis_ >= shape.size() || shape[channel_axis_] != channels_) {
    throw BackendError("batchnorm '" + name_ + "' expects " + std::to_string(channels_) +
                       " channels on axis " + std::to_string(channel_axis_) + ", got " +
                       format_shape(shape));
  }
  return shape;
}

std::vector<ParamDescriptor> BatchNormOp::param_descriptors() const {
  return {
      {"gamma", {channels_}, ParamInit::Ones, 1, true},
      {"beta", {channels_}, ParamInit::Zeros, 1, true},
      {"moving_mean", {channels_}, ParamInit::Zeros, 1, false},
      {"moving_variance", {channels_}, ParamInit::Ones, 1, false},
  };
}

void BatchNormOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                          Tensor &output) const {
  const Tensor &input = *inputs[0];
  const auto &shape = input.shape();
  size_t outer = 1;
  for (size_t i = 0; i < channel_axis_; ++i) {
    outer *= shape[i];
  }
  size_t inner = 1;
  for (size_t i = channel_axis_ + 1; i < shape.size(); ++i) {
    inner *= shape[i];
  }
  cpu::batchnorm::inference<float>(input.data(), output.data(), params[0].data(),
                                   params[1].data(), params[2].data(), params[3].data(), epsilon_,
                                   outer, channels_, inner);
}

}  // namespace snet
