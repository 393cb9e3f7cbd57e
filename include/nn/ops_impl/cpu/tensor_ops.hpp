/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <vector>

namespace snet {
namespace cpu {

// Copies [start, start + length) along `axis` of input into a contiguous output.
template <typename T>
void slice_forward(const T *input, T *output, const std::vector<size_t> &input_shape, size_t axis,
                   size_t start, size_t length);

// Concatenates inputs along `axis`; every input shares all other dimensions.
template <typename T>
void concat_forward(const std::vector<const T *> &inputs,
                    const std::vector<std::vector<size_t>> &input_shapes, T *output, size_t axis);

// output[perm(idx)] = input[idx] where output axis i is input axis axes[i].
template <typename T>
void permute(const T *input, T *output, const std::vector<size_t> &input_shape,
             const std::vector<size_t> &axes);

template <typename T> void add(const T *a, const T *b, T *output, size_t size);

} // namespace cpu
} // namespace snet
