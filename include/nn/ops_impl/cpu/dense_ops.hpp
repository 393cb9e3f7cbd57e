/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>

namespace snet {
namespace cpu {
namespace dense {

// input: [batch, in_features], weights: [out_features, in_features], output: [batch, out_features]
template <typename T>
void forward(const T *input, const T *weights, const T *bias, T *output, size_t batch_size,
             size_t in_features, size_t out_features);

} // namespace dense
} // namespace cpu
} // namespace snet
