/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/shape_op.hpp"

#include <algorithm>
#include <cstring>

#include "common/errors.hpp"
#include "nn/ops_impl/cpu/tensor_ops.hpp"

namespace snet {

InputOp::InputOp(std::vector<size_t> shape, const std::string &name)
    : Operation(name), shape_(std::move(shape)) {}

std::vector<size_t>
InputOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 0);
  return shape_;
}

void InputOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                      Tensor &output) const {
  (void)inputs;
  (void)params;
  (void)output;
  throw BackendError("input '" + name_ + "' is fed by the caller and cannot be executed");
}

ReshapeOp::ReshapeOp(std::vector<size_t> target_shape, const std::string &name)
    : Operation(name), target_shape_(std::move(target_shape)) {}

std::vector<size_t>
ReshapeOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  const auto &in = input_shapes[0];
  if (in.empty() || target_shape_.empty()) {
    throw BackendError("reshape '" + name_ + "' requires non-scalar shapes");
  }
  std::vector<size_t> out = target_shape_;
  if (out[0] == 0) {
    out[0] = in[0];
  }

  // Compare per-sample sizes so a dynamic (0) batch still validates.
  const size_t in_sample = shape_size(std::vector<size_t>(in.begin() + 1, in.end()));
  const size_t out_sample = shape_size(std::vector<size_t>(out.begin() + 1, out.end()));
  if (in_sample != out_sample || in[0] != out[0]) {
    throw BackendError("reshape '" + name_ + "' cannot map " + format_shape(in) + " to " +
                       format_shape(target_shape_));
  }
  return out;
}

void ReshapeOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                        Tensor &output) const {
  (void)params;
  const Tensor &input = *inputs[0];
  std::memcpy(output.data(), input.data(), input.size() * sizeof(float));
}

TransposeOp::TransposeOp(std::vector<size_t> axes, const std::string &name)
    : Operation(name), axes_(std::move(axes)) {}

std::vector<size_t>
TransposeOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  const auto &in = input_shapes[0];
  std::vector<size_t> sorted = axes_;
  std::sort(sorted.begin(), sorted.end());
  bool is_permutation = sorted.size() == in.size();
  for (size_t i = 0; is_permutation && i < sorted.size(); ++i) {
    is_permutation = sorted[i] == i;
  }
  if (!is_permutation) {
    std::string axes_str;
    for (size_t axis : axes_) {
      axes_str += (axes_str.empty() ? "" : ",") + std::to_string(axis);
    }
    throw BackendError("transpose '" + name_ + "' axes [" + axes_str +
                       "] are not a permutation of rank " + std::to_string(in.size()));
  }

  std::vector<size_t> out(in.size());
  for (size_t i = 0; i < axes_.size(); ++i) {
    out[i] = in[axes_[i]];
  }
  return out;
}

void TransposeOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                          Tensor &output) const {
  (void)params;
  const Tensor &input = *inputs[0];
  cpu::permute<float>(input.data(), output.data(), input.shape(), axes_);
}

SliceOp::SliceOp(size_t axis, size_t start, size_t length, const std::string &name)
    : Operation(name), axis_(axis), start_(start), length_(length) {}

std::vector<size_t>
SliceOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  const auto &in = input_shapes[0];
  if (axis_ >= in.size()) {
    throw BackendError("slice '" + name_ + "' axis " + std::to_string(axis_) +
                       " out of bounds for " + format_shape(in));
  }
  if (length_ == 0 || start_ + length_ > in[axis_]) {
    throw BackendError("slice '" + name_ + "' range [" + std::to_string(start_) + ", " +
                       std::to_string(start_ + length_) + ") out of bounds for " +
                       format_shape(in));
  }

  std::vector<size_t> out = in;
  out[axis_] = length_;
  return out;
}

void SliceOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                      Tensor &output) const {
  (void)params;
  const Tensor &input = *inputs[0];
  cpu::slice_forward<float>(input.data(), output.data(), input.shape(), axis_, start_, length_);
}

ConcatOp::ConcatOp(size_t axis, const std::string &name) : Operation(name), axis_(axis) {}

std::vector<size_t>
ConcatOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  if (input_shapes.empty()) {
    throw BackendError("concat '" + name_ + "' requires at least one input");
  }
  const auto &first = input_shapes[0];
  if (axis_ >= first.size()) {
    throw BackendError("concat '" + name_ + "' axis " + std::to_string(axis_) +
                       " out of bounds for " + format_shape(first));
  }

  std::vector<size_t> out = first;
  out[axis_] = 0;
  for (const auto &shape : input_shapes) {
    bool compatible = shape.size() == first.size();
    for (size_t i = 0; compatible && i < shape.size(); ++i) {
      compatible = i == axis_ || shape[i] == first[i];
    }
    if (!compatible) {
      throw BackendError("concat '" + name_ + "' cannot join " + format_shape(first) + " and " +
                         format_shape(shape) + " along axis " + std::to_string(axis_));
    }
    out[axis_] += shape[axis_];
  }
  return out;
}

void ConcatOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                       Tensor &output) const {
  (void)params;
  std::vector<const float *> data;
  std::vector<std::vector<size_t>> shapes;
  data.reserve(inputs.size());
  shapes.reserve(inputs.size());
  for (const Tensor *input : inputs) {
    data.push_back(input->data());
    shapes.push_back(input->shape());
  }
  cpu::concat_forward<float>(data, shapes, output.data(), axis_);
}

AddOp::AddOp(const std::string &name) : Operation(name) {}

std::vector<size_t>
AddOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 2);
  if (input_shapes[0] != input_shapes[1]) {
    throw BackendError("add '" + name_ + "' shape mismatch: " + format_shape(input_shapes[0]) +
                       " vs " + format_shape(input_shapes[1]));
  }
  return input_shapes[0];
}

void AddOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                    Tensor &output) const {
  (void)params;
  cpu::add<float>(inputs[0]->data(), inputs[1]->data(), output.data(), output.size());
}

uint64_t AddOp::forward_flops(const Vec<std::vector<size_t>> &input_shapes) const {
  std::vector<size_t> shape = input_shapes.at(0);
  if (!shape.empty() && shape[0] == 0) {
    shape[0] = 1;
  }
  return shape_size(shape);
}

}  // namespace snet
