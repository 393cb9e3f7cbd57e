/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "shufflenet/group_conv.hpp"

#include <vector>

#include "common/errors.hpp"

namespace snet {

void check_grouping(size_t in_channels, size_t filters, size_t groups) {
  if (groups == 0) {
    throw ConfigurationError("groups must be positive");
  }
  if (filters == 0) {
    throw ConfigurationError("filters must be positive");
  }
  if (filters % groups != 0) {
    throw ConfigurationError("filters (" + std::to_string(filters) +
                             ") must be divisible by groups (" + std::to_string(groups) + ")");
  }
  if (in_channels % groups != 0) {
    throw ConfigurationError("input channels (" + std::to_string(in_channels) +
                             ") must be divisible by groups (" + std::to_string(groups) + ")");
  }
}

TensorHandle group_conv(Backend &backend, const TensorHandle &x, size_t filters, Size2 kernel,
                        size_t stride, size_t groups) {
  const size_t in_channels = x.channels();
  check_grouping(in_channels, filters, groups);
  if (stride == 0) {
    throw ConfigurationError("stride must be positive");
  }

  if (groups == 1) {
    return backend.conv2d(x, filters, kernel, {stride, stride}, Padding::Same, false);
  }

  const size_t in_per_group = in_channels / groups;
  const size_t out_per_group = filters / groups;

  std::vector<TensorHandle> outputs;
  outputs.reserve(groups);
  for (size_t i = 0; i < groups; ++i) {
    TensorHandle slice = backend.slice_channels(x, i * in_per_group, in_per_group);
    outputs.push_back(
        backend.conv2d(slice, out_per_group, kernel, {stride, stride}, Padding::Same, false));
  }
  return backend.concat(outputs, x.channel_axis());
}

}  // namespace snet
