/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "shufflenet/channel_shuffle.hpp"

#include <vector>

#include "common/errors.hpp"

namespace snet {

TensorHandle channel_shuffle(Backend &backend, const TensorHandle &x, size_t groups) {
  const size_t channels = x.channels();
  if (groups == 0 || channels % groups != 0) {
    throw ConfigurationError("channel shuffle: channels (" + std::to_string(channels) +
                             ") must be divisible by groups (" + std::to_string(groups) + ")");
  }
  const size_t per_group = channels / groups;
  const size_t height = x.height();
  const size_t width = x.width();

  std::vector<size_t> grouped_shape;
  std::vector<size_t> axes;
  if (x.layout() == Layout::NHWC) {
    grouped_shape = {0, height, width, groups, per_group};
    axes = {0, 1, 2, 4, 3};
  } else {
    grouped_shape = {0, groups, per_group, height, width};
    axes = {0, 2, 1, 3, 4};
  }

  TensorHandle grouped = backend.reshape(x, grouped_shape);
  TensorHandle swapped = backend.transpose(grouped, axes);
  return backend.reshape(swapped, make_image_shape(x.layout(), 0, height, width, channels));
}

}  // namespace snet
