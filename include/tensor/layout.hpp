/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace snet {

// Position of the channel axis among the spatial axes of a 4-D image tensor.
enum class Layout { NHWC, NCHW };

inline constexpr size_t channel_axis(Layout layout) { return layout == Layout::NHWC ? 3 : 1; }
inline constexpr size_t height_axis(Layout layout) { return layout == Layout::NHWC ? 1 : 2; }
inline constexpr size_t width_axis(Layout layout) { return layout == Layout::NHWC ? 2 : 3; }

// Index helper for a 4-D image tensor, independent of layout.
struct ImageDims {
  Layout layout;
  size_t n, h, w, c;

  ImageDims(Layout layout, const std::vector<size_t> &shape);

  size_t offset(size_t b, size_t y, size_t x, size_t ch) const {
    if (layout == Layout::NHWC) {
      return ((b * h + y) * w + x) * c + ch;
    }
    return ((b * c + ch) * h + y) * w + x;
  }

  size_t size() const { return n * h * w * c; }
};

std::vector<size_t> make_image_shape(Layout layout, size_t n, size_t h, size_t w, size_t c);

Layout layout_from_string(const std::string &name);
std::string to_string(Layout layout);

}  // namespace snet
