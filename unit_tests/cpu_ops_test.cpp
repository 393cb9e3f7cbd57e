/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "nn/ops_impl/cpu/activation_ops.hpp"
#include "nn/ops_impl/cpu/conv2d_ops.hpp"
#include "nn/ops_impl/cpu/pool_ops.hpp"
#include "nn/ops_impl/cpu/tensor_ops.hpp"
#include "tensor/layout.hpp"
#include "tensor/tensor.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace snet;

namespace {

std::vector<float> iota_values(size_t size, float scale = 0.1f) {
  std::vector<float> values(size);
  for (size_t i = 0; i < size; ++i) {
    values[i] = scale * static_cast<float>(i % 17) - 0.5f;
  }
  return values;
}

// NHWC copy of an NCHW buffer.
std::vector<float> to_nhwc(const std::vector<float> &nchw, size_t n, size_t c, size_t h,
                           size_t w) {
  std::vector<float> out(nchw.size());
  cpu::permute(nchw.data(), out.data(), {n, c, h, w}, {0, 2, 3, 1});
  return out;
}

} // namespace

TEST(CPUConv2DOps, MatchesReferenceWithSamePadding) {
  const size_t n = 2, c = 3, h = 5, w = 4, oc = 2, k = 3, s = 2;
  const size_t oh = 3, ow = 2, pad = 1;
  ImageDims in(Layout::NCHW, {n, c, h, w});
  ImageDims out(Layout::NCHW, {n, oc, oh, ow});

  std::vector<float> input = iota_values(in.size());
  std::vector<float> weights = iota_values(oc * c * k * k, 0.05f);
  std::vector<float> bias = {0.25f, -0.5f};
  std::vector<float> output(out.size());

  cpu::conv2d::forward(input.data(), weights.data(), bias.data(), output.data(), in, out, k, k, s,
                       s, pad, pad);

  for (size_t b = 0; b < n; ++b) {
    for (size_t o = 0; o < oc; ++o) {
      for (size_t y = 0; y < oh; ++y) {
        for (size_t x = 0; x < ow; ++x) {
          float expected = bias[o];
          for (size_t ic = 0; ic < c; ++ic) {
            for (size_t ky = 0; ky < k; ++ky) {
              for (size_t kx = 0; kx < k; ++kx) {
                int iy = static_cast<int>(y * s + ky) - static_cast<int>(pad);
                int ix = static_cast<int>(x * s + kx) - static_cast<int>(pad);
                if (iy >= 0 && iy < static_cast<int>(h) && ix >= 0 && ix < static_cast<int>(w)) {
                  expected += input[in.offset(b, iy, ix, ic)] *
                              weights[((o * c + ic) * k + ky) * k + kx];
                }
              }
            }
          }
          EXPECT_NEAR(output[out.offset(b, y, x, o)], expected, 1e-4f)
              << "Mismatch at batch=" << b << ", channel=" << o << ", y=" << y << ", x=" << x;
        }
      }
    }
  }
}

TEST(CPUConv2DOps, LayoutsAgree) {
  const size_t n = 1, c = 4, h = 6, w = 6, oc = 3, k = 3;
  std::vector<float> input_nchw = iota_values(n * c * h * w);
  std::vector<float> input_nhwc = to_nhwc(input_nchw, n, c, h, w);
  std::vector<float> weights = iota_values(oc * c * k * k, 0.03f);

  std::vector<float> out_nchw(n * oc * h * w), out_nhwc(n * oc * h * w);
  cpu::conv2d::forward(input_nchw.data(), weights.data(), static_cast<const float *>(nullptr),
                       out_nchw.data(), ImageDims(Layout::NCHW, {n, c, h, w}),
                       ImageDims(Layout::NCHW, {n, oc, h, w}), k, k, 1, 1, 1, 1);
  cpu::conv2d::forward(input_nhwc.data(), weights.data(), static_cast<const float *>(nullptr),
                       out_nhwc.data(), ImageDims(Layout::NHWC, {n, h, w, c}),
                       ImageDims(Layout::NHWC, {n, h, w, oc}), k, k, 1, 1, 1, 1);

  std::vector<float> expected = to_nhwc(out_nchw, n, oc, h, w);
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_NEAR(out_nhwc[i], expected[i], 1e-5f);
  }
}

TEST(CPUConv2DOps, DepthwiseKeepsChannelsIndependent) {
  const size_t c = 2, h = 3, w = 3;
  ImageDims dims(Layout::NHWC, {1, h, w, c});
  std::vector<float> input(dims.size(), 0.0f);
  for (size_t y = 0; y < h; ++y) {
    for (size_t x = 0; x < w; ++x) {
      input[dims.offset(0, y, x, 0)] = 1.0f;
    }
  }
  // Channel 0 sums its window, channel 1 weights are irrelevant because its input is zero.
  std::vector<float> weights(c * 9, 1.0f);
  std::vector<float> output(dims.size());
  cpu::conv2d::depthwise_forward(input.data(), weights.data(), output.data(), dims, dims, 1, 3, 3,
                                 1, 1, 1, 1);

  EXPECT_FLOAT_EQ(output[dims.offset(0, 1, 1, 0)], 9.0f);
  EXPECT_FLOAT_EQ(output[dims.offset(0, 0, 0, 0)], 4.0f);
  EXPECT_FLOAT_EQ(output[dims.offset(0, 0, 1, 0)], 6.0f);
  for (size_t y = 0; y < h; ++y) {
    for (size_t x = 0; x < w; ++x) {
      EXPECT_FLOAT_EQ(output[dims.offset(0, y, x, 1)], 0.0f);
    }
  }
}

TEST(CPUPoolOps, AvgPoolExcludesPadding) {
  ImageDims in(Layout::NHWC, {1, 4, 4, 1});
  ImageDims out(Layout::NHWC, {1, 2, 2, 1});
  std::vector<float> input(16, 2.0f);
  std::vector<float> output(4);

  // 3x3 / 2 with "same" padding on 4x4: total pad 1, placed after.
  cpu::avgpool_forward(input.data(), output.data(), in, out, 3, 3, 2, 2, 0, 0);

  for (float v : output) {
    EXPECT_FLOAT_EQ(v, 2.0f);
  }
}

TEST(CPUPoolOps, MaxPoolPicksWindowMaximum) {
  ImageDims in(Layout::NCHW, {1, 1, 4, 4});
  ImageDims out(Layout::NCHW, {1, 1, 2, 2});
  std::vector<float> input(16);
  for (size_t i = 0; i < 16; ++i) {
    input[i] = static_cast<float>(i);
  }
  std::vector<float> output(4);
  cpu::maxpool_forward(input.data(), output.data(), in, out, 2, 2, 2, 2, 0, 0);

  EXPECT_FLOAT_EQ(output[0], 5.0f);
  EXPECT_FLOAT_EQ(output[1], 7.0f);
  EXPECT_FLOAT_EQ(output[2], 13.0f);
  EXPECT_FLOAT_EQ(output[3], 15.0f);
}

TEST(CPUPoolOps, GlobalAveragePoolPerChannel) {
  ImageDims in(Layout::NHWC, {2, 2, 2, 3});
  std::vector<float> input(in.size());
  for (size_t b = 0; b < 2; ++b) {
    for (size_t y = 0; y < 2; ++y) {
      for (size_t x = 0; x < 2; ++x) {
        for (size_t ch = 0; ch < 3; ++ch) {
          input[in.offset(b, y, x, ch)] = static_cast<float>(b * 10 + ch + y * 2 + x);
        }
      }
    }
  }
  std::vector<float> output(6);
  cpu::global_avgpool_forward(input.data(), output.data(), in);

  for (size_t b = 0; b < 2; ++b) {
    for (size_t ch = 0; ch < 3; ++ch) {
      EXPECT_FLOAT_EQ(output[b * 3 + ch], static_cast<float>(b * 10 + ch) + 1.5f);
    }
  }
}

TEST(CPUActivationOps, SoftmaxRowsSumToOne) {
  const size_t rows = 3, cols = 5;
  std::vector<float> input = {1, 2, 3, 4, 5, -1000, 0, 1000, 2, 3, 0, 0, 0, 0, 0};
  std::vector<float> output(rows * cols);
  cpu::softmax(input.data(), output.data(), rows, cols);

  for (size_t r = 0; r < rows; ++r) {
    float sum = 0.0f;
    for (size_t k = 0; k < cols; ++k) {
      EXPECT_GE(output[r * cols + k], 0.0f);
      EXPECT_FALSE(std::isnan(output[r * cols + k]));
      sum += output[r * cols + k];
    }
    EXPECT_NEAR(sum, 1.0f, 1e-5f);
  }
  EXPECT_NEAR(output[2 * cols], 0.2f, 1e-6f);
  EXPECT_NEAR(output[cols + 2], 1.0f, 1e-6f);
}

TEST(CPUActivationOps, ReluClampsNegatives) {
  std::vector<float> input = {-2.0f, -0.0f, 0.5f, 3.0f};
  std::vector<float> output(4);
  cpu::relu(input.data(), output.data(), input.size());
  EXPECT_FLOAT_EQ(output[0], 0.0f);
  EXPECT_FLOAT_EQ(output[1], 0.0f);
  EXPECT_FLOAT_EQ(output[2], 0.5f);
  EXPECT_FLOAT_EQ(output[3], 3.0f);
}

TEST(CPUTensorOps, PermuteSwapsLastAxes) {
  // [1, 2, 3] -> axes (0, 2, 1) -> [1, 3, 2]
  std::vector<float> input = {0, 1, 2, 3, 4, 5};
  std::vector<float> output(6);
  cpu::permute(input.data(), output.data(), {1, 2, 3}, {0, 2, 1});
  std::vector<float> expected = {0, 3, 1, 4, 2, 5};
  EXPECT_EQ(output, expected);
}

TEST(CPUTensorOps, SliceThenConcatRestoresInput) {
  const std::vector<size_t> shape = {2, 3, 4};
  std::vector<float> input = iota_values(shape_size(shape));

  std::vector<float> first(2 * 3 * 1), second(2 * 3 * 3);
  cpu::slice_forward(input.data(), first.data(), shape, 2, 0, 1);
  cpu::slice_forward(input.data(), second.data(), shape, 2, 1, 3);

  for (size_t o = 0; o < 6; ++o) {
    EXPECT_FLOAT_EQ(first[o], input[o * 4]);
    for (size_t l = 0; l < 3; ++l) {
      EXPECT_FLOAT_EQ(second[o * 3 + l], input[o * 4 + 1 + l]);
    }
  }

  std::vector<float> joined(input.size());
  cpu::concat_forward<float>({first.data(), second.data()}, {{2, 3, 1}, {2, 3, 3}},
                             joined.data(), 2);
  EXPECT_EQ(joined, input);
}

TEST(CPUTensorOps, AddIsElementwise) {
  std::vector<float> a = {1, 2, 3};
  std::vector<float> b = {0.5f, -2, 10};
  std::vector<float> out(3);
  cpu::add(a.data(), b.data(), out.data(), 3);
  EXPECT_FLOAT_EQ(out[0], 1.5f);
  EXPECT_FLOAT_EQ(out[1], 0.0f);
  EXPECT_FLOAT_EQ(out[2], 13.0f);
}
