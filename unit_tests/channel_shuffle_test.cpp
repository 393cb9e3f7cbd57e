/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "common/errors.hpp"
#include "mock_backend.hpp"
#include "nn/graph_builder.hpp"
#include "shufflenet/channel_shuffle.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace snet;

namespace {

// Every element holds its channel index.
Tensor channel_index_tensor(Layout layout, size_t batch, size_t h, size_t w, size_t c) {
  Tensor t(make_image_shape(layout, batch, h, w, c));
  ImageDims dims(layout, t.shape());
  for (size_t b = 0; b < batch; ++b) {
    for (size_t y = 0; y < h; ++y) {
      for (size_t x = 0; x < w; ++x) {
        for (size_t ch = 0; ch < c; ++ch) {
          t[dims.offset(b, y, x, ch)] = static_cast<float>(ch);
        }
      }
    }
  }
  return t;
}

} // namespace

class ChannelShuffleTest : public ::testing::TestWithParam<Layout> {};

TEST_P(ChannelShuffleTest, MovesChannelToExpectedPosition) {
  const Layout layout = GetParam();
  const size_t c = 12, groups = 3, per_group = c / groups;
  GraphBuilder builder;
  TensorHandle x = builder.input(make_image_shape(layout, 0, 2, 3, c), layout);
  TensorHandle y = channel_shuffle(builder, x, groups);
  EXPECT_EQ(y.shape(), x.shape());
  Model model = builder.assemble(x, y);

  Tensor input = channel_index_tensor(layout, 2, 2, 3, c);
  Tensor output = model.forward(input);
  ImageDims dims(layout, output.shape());

  for (size_t k = 0; k < c; ++k) {
    const size_t moved_to = (k % per_group) * groups + k / per_group;
    for (size_t b = 0; b < 2; ++b) {
      EXPECT_FLOAT_EQ(output[dims.offset(b, 1, 2, moved_to)], static_cast<float>(k))
          << "channel " << k;
    }
  }
}

TEST_P(ChannelShuffleTest, ShufflingTwiceRestoresOrder) {
  const Layout layout = GetParam();
  for (size_t groups : {1u, 2u, 4u, 8u}) {
    const size_t c = 16;
    GraphBuilder builder;
    TensorHandle x = builder.input(make_image_shape(layout, 0, 3, 3, c), layout);
    TensorHandle once = channel_shuffle(builder, x, groups);
    TensorHandle twice = channel_shuffle(builder, once, c / groups);
    Model model = builder.assemble(x, twice);

    Tensor input(make_image_shape(layout, 2, 3, 3, c));
    input.fill_random_uniform(-1.0f, 1.0f, groups);
    Tensor output = model.forward(input);
    ASSERT_EQ(output.shape(), input.shape());
    for (size_t i = 0; i < input.size(); ++i) {
      EXPECT_FLOAT_EQ(output[i], input[i]) << "groups=" << groups << " index=" << i;
    }
  }
}

TEST_P(ChannelShuffleTest, HasNoParameters) {
  const Layout layout = GetParam();
  GraphBuilder builder;
  TensorHandle x = builder.input(make_image_shape(layout, 0, 5, 5, 24), layout);
  Model model = builder.assemble(x, channel_shuffle(builder, x, 8));
  EXPECT_EQ(model.num_parameters(), 0u);
  EXPECT_EQ(model.count_operations("reshape"), 2u);
  EXPECT_EQ(model.count_operations("transpose"), 1u);
}

INSTANTIATE_TEST_SUITE_P(Layouts, ChannelShuffleTest,
                         ::testing::Values(Layout::NHWC, Layout::NCHW));

TEST(ChannelShuffleErrorsTest, RejectsIndivisibleGroups) {
  MockBackend backend;
  backend.expect_no_calls();
  EXPECT_THROW(channel_shuffle(backend, image_handle(Layout::NHWC, 4, 4, 10), 4),
               ConfigurationError);
  EXPECT_THROW(channel_shuffle(backend, image_handle(Layout::NCHW, 4, 4, 10), 0),
               ConfigurationError);
}
