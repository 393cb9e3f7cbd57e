/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <gmock/gmock.h>

#include "nn/backend.hpp"

namespace snet {

class MockBackend : public Backend {
public:
  MOCK_METHOD(TensorHandle, input, (const std::vector<size_t> &shape, Layout layout),
              (override));
  MOCK_METHOD(TensorHandle, conv2d,
              (const TensorHandle &x, size_t filters, Size2 kernel, Size2 stride, Padding padding,
               bool use_bias),
              (override));
  MOCK_METHOD(TensorHandle, depthwise_conv2d,
              (const TensorHandle &x, Size2 kernel, Size2 stride, size_t depth_multiplier,
               Padding padding),
              (override));
  MOCK_METHOD(TensorHandle, batchnorm, (const TensorHandle &x, size_t channel_axis), (override));
  MOCK_METHOD(TensorHandle, activation, (const TensorHandle &x, ActivationKind kind), (override));
  MOCK_METHOD(TensorHandle, pool2d,
              (const TensorHandle &x, PoolKind kind, Size2 pool_size, Size2 stride,
               Padding padding),
              (override));
  MOCK_METHOD(TensorHandle, concat, (const std::vector<TensorHandle> &xs, size_t axis),
              (override));
  MOCK_METHOD(TensorHandle, add, (const TensorHandle &a, const TensorHandle &b), (override));
  MOCK_METHOD(TensorHandle, reshape, (const TensorHandle &x, const std::vector<size_t> &shape),
              (override));
  MOCK_METHOD(TensorHandle, transpose, (const TensorHandle &x, const std::vector<size_t> &axes),
              (override));
  MOCK_METHOD(TensorHandle, slice_channels, (const TensorHandle &x, size_t start, size_t length),
              (override));
  MOCK_METHOD(TensorHandle, dense, (const TensorHandle &x, size_t units), (override));
  MOCK_METHOD(TensorHandle, global_avg_pool, (const TensorHandle &x), (override));
  MOCK_METHOD(Model, assemble,
              (const TensorHandle &input, const TensorHandle &output, const std::string &name),
              (override));

  // Fails the test on any call.
  void expect_no_calls() {
    using ::testing::_;
    EXPECT_CALL(*this, input(_, _)).Times(0);
    EXPECT_CALL(*this, conv2d(_, _, _, _, _, _)).Times(0);
    EXPECT_CALL(*this, depthwise_conv2d(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*this, batchnorm(_, _)).Times(0);
    EXPECT_CALL(*this, activation(_, _)).Times(0);
    EXPECT_CALL(*this, pool2d(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*this, concat(_, _)).Times(0);
    EXPECT_CALL(*this, add(_, _)).Times(0);
    EXPECT_CALL(*this, reshape(_, _)).Times(0);
    EXPECT_CALL(*this, transpose(_, _)).Times(0);
    EXPECT_CALL(*this, slice_channels(_, _, _)).Times(0);
    EXPECT_CALL(*this, dense(_, _)).Times(0);
    EXPECT_CALL(*this, global_avg_pool(_)).Times(0);
    EXPECT_CALL(*this, assemble(_, _, _)).Times(0);
  }
};

// Handle for a detached NHWC/NCHW image, usable with a mock backend.
inline TensorHandle image_handle(Layout layout, size_t h, size_t w, size_t c) {
  return TensorHandle(1, 0, make_image_shape(layout, 0, h, w, c), layout);
}

}  // namespace snet
