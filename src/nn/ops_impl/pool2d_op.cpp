/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/pool2d_op.hpp"

#include <algorithm>

#include "nn/ops_impl/cpu/pool_ops.hpp"

namespace snet {

Pool2DOp::Pool2DOp(Layout layout, PoolKind kind, Size2 pool_size, Size2 stride, Padding padding,
                   const std::string &name)
    : Operation(name), layout_(layout), kind_(kind), pool_size_(pool_size), stride_(stride),
      padding_(padding) {}

std::vector<size_t>
Pool2DOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  expect_rank(input_shapes[0], 4);
  ImageDims in(layout_, input_shapes[0]);
  AxisGeometry gh = resolve_axis(in.h, pool_size_.h, stride_.h, padding_);
  AxisGeometry gw = resolve_axis(in.w, pool_size_.w, stride_.w, padding_);
  return make_image_shape(layout_, in.n, gh.out, gw.out, in.c);
}

void Pool2DOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                       Tensor &output) const {
  (void)params;
  const Tensor &input = *inputs[0];
  ImageDims in(layout_, input.shape());
  ImageDims out(layout_, output.shape());
  AxisGeometry gh = resolve_axis(in.h, pool_size_.h, stride_.h, padding_);
  AxisGeometry gw = resolve_axis(in.w, pool_size_.w, stride_.w, padding_);
  if (kind_ == PoolKind::Avg) {
    cpu::avgpool_forward<float>(input.data(), output.data(), in, out, pool_size_.h, pool_size_.w,
                                stride_.h, stride_.w, gh.pad_before, gw.pad_before);
  } else {
    cpu::maxpool_forward<float>(input.data(), output.data(), in, out, pool_size_.h, pool_size_.w,
                                stride_.h, stride_.w, gh.pad_before, gw.pad_before);
  }
}

uint64_t Pool2DOp::forward_flops(const Vec<std::vector<size_t>> &input_shapes) const {
  ImageDims out(layout_, compute_output_shape(input_shapes));
  return static_cast<uint64_t>(std::max<size_t>(out.n, 1)) * out.h * out.w * out.c *
         pool_size_.h * pool_size_.w;
}

GlobalAvgPoolOp::GlobalAvgPoolOp(Layout layout, const std::string &name)
    : Operation(name), layout_(layout) {}

std::vector<size_t>
GlobalAvgPoolOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  expect_rank(input_shapes[0], 4);
  ImageDims in(layout_, input_shapes[0]);
  return {in.n, in.c};
}

void GlobalAvgPoolOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                              Tensor &output) const {
  (void)params;
  const Tensor &input = *inputs[0];
  cpu::global_avgpool_forward<float>(input.data(), output.data(), ImageDims(layout_, input.shape()));
}

}  // namespace snet
