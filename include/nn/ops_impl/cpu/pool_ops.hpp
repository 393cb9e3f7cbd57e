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

// Padded positions are excluded from the average.
template <typename T>
void avgpool_forward(const T *input, T *output, const ImageDims &in, const ImageDims &out,
                     size_t pool_h, size_t pool_w, size_t stride_h, size_t stride_w, size_t pad_h,
                     size_t pad_w);

template <typename T>
void maxpool_forward(const T *input, T *output, const ImageDims &in, const ImageDims &out,
                     size_t pool_h, size_t pool_w, size_t stride_h, size_t stride_w, size_t pad_h,
                     size_t pad_w);

// Output: [N, C]
template <typename T> void global_avgpool_forward(const T *input, T *output, const ImageDims &in);

} // namespace cpu
} // namespace snet
