/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/dense_op.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "nn/ops_impl/cpu/dense_ops.hpp"

namespace snet {

DenseOp::DenseOp(size_t in_features, size_t units, bool use_bias, const std::string &name)
    : Operation(name), in_features_(in_features), units_(units), use_bias_(use_bias) {}

std::vector<size_t>
DenseOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  expect_rank(input_shapes[0], 2);
  if (input_shapes[0][1] != in_features_) {
    throw BackendError("dense '" + name_ + "' expects " + std::to_string(in_features_) +
                       " features, got " + format_shape(input_shapes[0]));
  }
  if (units_ == 0) {
    throw BackendError("dense '" + name_ + "' requires at least one unit");
  }
  return {input_shapes[0][0], units_};
}

std::vector<ParamDescriptor> DenseOp::param_descriptors() const {
  // Uniform(-bound, bound) with bound = 1 / sqrt(fan_in)
  std::vector<ParamDescriptor> descs;
  descs.push_back({"kernel", {units_, in_features_}, ParamInit::Uniform, in_features_});
  if (use_bias_) {
    descs.push_back({"bias", {units_}, ParamInit::Uniform, in_features_});
  }
  return descs;
}

void DenseOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                      Tensor &output) const {
  const Tensor &input = *inputs[0];
  const float *bias = use_bias_ ? params[1].data() : nullptr;
  cpu::dense::forward<float>(input.data(), params[0].data(), bias, output.data(),
                             input.dimension(0), in_features_, units_);
}

uint64_t DenseOp::forward_flops(const Vec<std::vector<size_t>> &input_shapes) const {
  const size_t batch = std::max<size_t>(input_shapes.at(0).at(0), 1);
  return 2ULL * batch * in_features_ * units_;
}

}  // namespace snet
