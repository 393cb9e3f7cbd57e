/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/conv2d_op.hpp"

#include <algorithm>

#include "common/errors.hpp"
#include "nn/ops_impl/cpu/conv2d_ops.hpp"

namespace snet {

namespace {

std::vector<size_t> conv_output_shape(const ImageDims &in, Layout layout, size_t out_c,
                                      Size2 kernel, Size2 stride, Padding padding) {
  AxisGeometry gh = resolve_axis(in.h, kernel.h, stride.h, padding);
  AxisGeometry gw = resolve_axis(in.w, kernel.w, stride.w, padding);
  return make_image_shape(layout, in.n, gh.out, gw.out, out_c);
}

} // namespace

Conv2DOp::Conv2DOp(Layout layout, size_t in_channels, size_t filters, Size2 kernel, Size2 stride,
                   Padding padding, bool use_bias, const std::string &name)
    : Operation(name), layout_(layout), in_channels_(in_channels), filters_(filters),
      kernel_(kernel), stride_(stride), padding_(padding), use_bias_(use_bias) {}

std::vector<size_t>
Conv2DOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  expect_rank(input_shapes[0], 4);
  ImageDims in(layout_, input_shapes[0]);
  if (in.c != in_channels_) {
    throw BackendError("conv2d '" + name_ + "' built for " + std::to_string(in_channels_) +
                       " input channels, got " + format_shape(input_shapes[0]));
  }
  if (filters_ == 0) {
    throw BackendError("conv2d '" + name_ + "' requires at least one filter");
  }
  return conv_output_shape(in, layout_, filters_, kernel_, stride_, padding_);
}

std::vector<ParamDescriptor> Conv2DOp::param_descriptors() const {
  const size_t fan_in = in_channels_ * kernel_.h * kernel_.w;
  std::vector<ParamDescriptor> descs;
  descs.push_back(
      {"kernel", {filters_, in_channels_, kernel_.h, kernel_.w}, ParamInit::Uniform, fan_in});
  if (use_bias_) {
    descs.push_back({"bias", {filters_}, ParamInit::Uniform, fan_in});
  }
  return descs;
}

void Conv2DOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                       Tensor &output) const {
  const Tensor &input = *inputs[0];
  ImageDims in(layout_, input.shape());
  ImageDims out(layout_, output.shape());
  AxisGeometry gh = resolve_axis(in.h, kernel_.h, stride_.h, padding_);
  AxisGeometry gw = resolve_axis(in.w, kernel_.w, stride_.w, padding_);
  const float *bias = use_bias_ ? params[1].data() : nullptr;
  cpu::conv2d::forward<float>(input.data(), params[0].data(), bias, output.data(), in, out,
                              kernel_.h, kernel_.w, stride_.h, stride_.w, gh.pad_before,
                              gw.pad_before);
}

uint64_t Conv2DOp::forward_flops(const Vec<std::vector<size_t>> &input_shapes) const {
  std::vector<size_t> out_shape = compute_output_shape(input_shapes);
  ImageDims out(layout_, out_shape);
  uint64_t macs = static_cast<uint64_t>(out.h) * out.w * out.c * in_channels_ * kernel_.h *
                  kernel_.w * std::max<size_t>(out.n, 1);
  return 2 * macs;
}

DepthwiseConv2DOp::DepthwiseConv2DOp(Layout layout, size_t in_channels, Size2 kernel,
                                     Size2 stride, size_t depth_multiplier, Padding padding,
                                     const std::string &name)
    : Operation(name), layout_(layout), in_channels_(in_channels), kernel_(kernel),
      stride_(stride), depth_multiplier_(depth_multiplier), padding_(padding) {}

std::vector<size_t>
DepthwiseConv2DOp::compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const {
  expect_inputs(input_shapes, 1);
  expect_rank(input_shapes[0], 4);
  ImageDims in(layout_, input_shapes[0]);
  if (in.c != in_channels_) {
    throw BackendError("depthwise_conv2d '" + name_ + "' built for " +
                       std::to_string(in_channels_) + " input channels, got " +
                       format_shape(input_shapes[0]));
  }
  if (depth_multiplier_ == 0) {
    throw BackendError("depthwise_conv2d '" + name_ + "' requires a positive depth multiplier");
  }
  return conv_output_shape(in, layout_, in_channels_ * depth_multiplier_, kernel_, stride_,
                           padding_);
}

std::vector<ParamDescriptor> DepthwiseConv2DOp::param_descriptors() const {
  return {{"depthwise_kernel",
           {in_channels_ * depth_multiplier_, kernel_.h, kernel_.w},
           ParamInit::Uniform,
           kernel_.h * kernel_.w}};
}

void DepthwiseConv2DOp::forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                                Tensor &output) const {
  const Tensor &input = *inputs[0];
  ImageDims in(layout_, input.shape());
  ImageDims out(layout_, output.shape());
  AxisGeometry gh = resolve_axis(in.h, kernel_.h, stride_.h, padding_);
  AxisGeometry gw = resolve_axis(in.w, kernel_.w, stride_.w, padding_);
  cpu::conv2d::depthwise_forward<float>(input.data(), params[0].data(), output.data(), in, out,
                                        depth_multiplier_, kernel_.h, kernel_.w, stride_.h,
                                        stride_.w, gh.pad_before, gw.pad_before);
}

uint64_t DepthwiseConv2DOp::forward_flops(const Vec<std::vector<size_t>> &input_shapes) const {
  std::vector<size_t> out_shape = compute_output_shape(input_shapes);
  ImageDims out(layout_, out_shape);
  uint64_t macs = static_cast<uint64_t>(out.h) * out.w * out.c * kernel_.h * kernel_.w *
                  std::max<size_t>(out.n, 1);
  return 2 * macs;
}

}  // namespace snet
