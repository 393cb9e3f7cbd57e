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

template <typename T> void relu(const T *input, T *output, size_t size);

// Softmax over the last axis of a [rows, cols] view.
template <typename T> void softmax(const T *input, T *output, size_t rows, size_t cols);

} // namespace cpu
} // namespace snet
