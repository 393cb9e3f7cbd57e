/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>

#include "tensor/layout.hpp"

namespace snet {
namespace cpu {
namespace conv2d {

// Weights: [OC, IC, KH, KW] for both layouts. p_h/p_w are the leading (top/left) paddings;
// trailing padding is implied by the output size.
template <typename T>
void forward(const T *input, const T *weights, const T *bias, T *output, const ImageDims &in,
             const ImageDims &out, size_t k_h, size_t k_w, size_t s_h, size_t s_w, size_t p_h,
             size_t p_w);

// Weights: [C * multiplier, KH, KW]; output channel c * multiplier + m reads input channel c.
template <typename T>
void depthwise_forward(const T *input, const T *weights, T *output, const ImageDims &in,
                       const ImageDims &out, size_t multiplier, size_t k_h, size_t k_w,
                       size_t s_h, size_t s_w, size_t p_h, size_t p_w);

} // namespace conv2d
} // namespace cpu
} // namespace snet
