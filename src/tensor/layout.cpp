/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "tensor/layout.hpp"

#include <algorithm>
#include <cctype>

#include "common/errors.hpp"

namespace snet {

ImageDims::ImageDims(Layout layout, const std::vector<size_t> &shape) : layout(layout) {
  if (shape.size() != 4) {
    throw BackendError("Expected a 4-D image tensor, got rank " + std::to_string(shape.size()));
  }
  n = shape[0];
  h = shape[height_axis(layout)];
  w = shape[width_axis(layout)];
  c = shape[channel_axis(layout)];
}

std::vector<size_t> make_image_shape(Layout layout, size_t n, size_t h, size_t w, size_t c) {
  if (layout == Layout::NHWC) {
    return {n, h, w, c};
  }
  return {n, c, h, w};
}

Layout layout_from_string(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  if (lowered == "nhwc" || lowered == "channels_last") {
    return Layout::NHWC;
  }
  if (lowered == "nchw" || lowered == "channels_first") {
    return Layout::NCHW;
  }
  throw ConfigurationError("Unsupported layout convention: '" + name +
                           "' (expected channels_last/nhwc or channels_first/nchw)");
}

std::string to_string(Layout layout) {
  return layout == Layout::NHWC ? "channels_last" : "channels_first";
}

}  // namespace snet
