/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "common/errors.hpp"
#include "mock_backend.hpp"
#include "nn/graph_builder.hpp"
#include "shufflenet/group_conv.hpp"

#include <gtest/gtest.h>

#include <tuple>
#include <vector>

using namespace snet;

struct GroupConvCase {
  size_t channels;
  size_t groups;
  size_t filters;
};

class GroupConvChannelsTest : public ::testing::TestWithParam<std::tuple<Layout, GroupConvCase>> {
};

TEST_P(GroupConvChannelsTest, OutputChannelsEqualFilters) {
  const auto [layout, c] = GetParam();
  GraphBuilder builder;
  TensorHandle x = builder.input(make_image_shape(layout, 0, 14, 14, c.channels), layout);
  TensorHandle y = group_conv(builder, x, c.filters, {1, 1}, 1, c.groups);

  EXPECT_EQ(y.channels(), c.filters);
  EXPECT_EQ(y.height(), 14u);
  EXPECT_EQ(y.width(), 14u);
  EXPECT_EQ(y.layout(), layout);
}

INSTANTIATE_TEST_SUITE_P(
    Groupings, GroupConvChannelsTest,
    ::testing::Combine(::testing::Values(Layout::NHWC, Layout::NCHW),
                       ::testing::Values(GroupConvCase{24, 8, 384}, GroupConvCase{384, 8, 96},
                                         GroupConvCase{12, 3, 6}, GroupConvCase{16, 4, 4},
                                         GroupConvCase{5, 1, 7}, GroupConvCase{60, 3, 216})));

TEST(GroupConvTest, SingleGroupIsADirectConvolution) {
  GraphBuilder builder;
  TensorHandle x = builder.input({0, 9, 11, 6}, Layout::NHWC);
  TensorHandle grouped = group_conv(builder, x, 10, {3, 3}, 2, 1);
  TensorHandle direct = builder.conv2d(x, 10, {3, 3}, {2, 2}, Padding::Same, false);
  EXPECT_EQ(grouped.shape(), direct.shape());
  EXPECT_EQ(grouped.shape(), (std::vector<size_t>{0, 5, 6, 10}));

  Model model = builder.assemble(x, grouped);
  EXPECT_EQ(model.count_operations("conv2d"), 1u);
  EXPECT_EQ(model.count_operations("slice"), 0u);
  EXPECT_EQ(model.count_operations("concat"), 0u);
}

TEST(GroupConvTest, EmitsOneConvolutionPerGroup) {
  GraphBuilder builder;
  TensorHandle x = builder.input({0, 4, 4, 12}, Layout::NHWC);
  Model model = builder.assemble(x, group_conv(builder, x, 8, {1, 1}, 1, 4));

  EXPECT_EQ(model.count_operations("slice"), 4u);
  EXPECT_EQ(model.count_operations("conv2d"), 4u);
  EXPECT_EQ(model.count_operations("concat"), 1u);
  // 4 groups x (2 outputs x 3 inputs), no bias
  EXPECT_EQ(model.num_parameters(), 24u);
}

TEST(GroupConvTest, GroupsDoNotMixChannels) {
  const size_t groups = 3, per_group = 2, filters = 6;
  GraphBuilder builder(3);
  TensorHandle x = builder.input({0, 3, 3, groups * per_group}, Layout::NHWC);
  Model model = builder.assemble(x, group_conv(builder, x, filters, {3, 3}, 1, groups));

  Tensor input({1, 3, 3, groups * per_group});
  input.fill_random_uniform(-1.0f, 1.0f, 11);
  Tensor base = model.forward(input);

  // Perturb only the middle group's input channels.
  Tensor perturbed = input;
  ImageDims dims(Layout::NHWC, input.shape());
  for (size_t y = 0; y < 3; ++y) {
    for (size_t x_pos = 0; x_pos < 3; ++x_pos) {
      for (size_t ch = per_group; ch < 2 * per_group; ++ch) {
        perturbed[dims.offset(0, y, x_pos, ch)] += 5.0f;
      }
    }
  }
  Tensor changed = model.forward(perturbed);

  ImageDims out(Layout::NHWC, base.shape());
  const size_t out_per_group = filters / groups;
  bool middle_changed = false;
  for (size_t y = 0; y < 3; ++y) {
    for (size_t x_pos = 0; x_pos < 3; ++x_pos) {
      for (size_t ch = 0; ch < filters; ++ch) {
        const size_t idx = out.offset(0, y, x_pos, ch);
        if (ch / out_per_group == 1) {
          middle_changed = middle_changed || base[idx] != changed[idx];
        } else {
          EXPECT_FLOAT_EQ(base[idx], changed[idx]) << "channel " << ch;
        }
      }
    }
  }
  EXPECT_TRUE(middle_changed);
}

TEST(GroupConvTest, InvalidGroupingFailsBeforeAnyBackendCall) {
  MockBackend backend;
  backend.expect_no_calls();
  TensorHandle x = image_handle(Layout::NHWC, 8, 8, 24);

  EXPECT_THROW(group_conv(backend, x, 30, {1, 1}, 1, 8), ConfigurationError);
  EXPECT_THROW(group_conv(backend, x, 32, {1, 1}, 1, 5), ConfigurationError);
  EXPECT_THROW(group_conv(backend, x, 32, {1, 1}, 1, 0), ConfigurationError);
  EXPECT_THROW(group_conv(backend, x, 0, {1, 1}, 1, 8), ConfigurationError);
  EXPECT_THROW(group_conv(backend, x, 32, {1, 1}, 0, 8), ConfigurationError);
}

TEST(GroupConvTest, ErrorMessageNamesTheValues) {
  MockBackend backend;
  backend.expect_no_calls();
  TensorHandle x = image_handle(Layout::NCHW, 8, 8, 10);
  try {
    group_conv(backend, x, 16, {1, 1}, 1, 4);
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError &e) {
    EXPECT_NE(std::string(e.what()).find("10"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("4"), std::string::npos);
  }
}
