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
namespace batchnorm {

/**
 * Inference-mode normalization with running statistics over a tensor viewed as
 * [outer, channels, inner], where the channel axis sits between outer and inner.
 */
template <typename T>
void inference(const T *input, T *output, const T *gamma, const T *beta, const T *running_mean,
               const T *running_var, T epsilon, size_t outer, size_t channels, size_t inner);

} // namespace batchnorm
} // namespace cpu
} // namespace snet
