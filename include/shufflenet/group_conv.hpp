/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include "nn/backend.hpp"

namespace snet {

/**
 * @brief Grouped convolution built from per-group slice, conv and concat.
 *
 * Channels of `x` are split into `groups` contiguous ranges; each range gets its own
 * convolution with `filters / groups` outputs ("same" padding, no bias) and the results
 * are concatenated in group order. With one group a single direct convolution is emitted.
 *
 * @throws ConfigurationError if `filters` or the input channels are not divisible by
 *         `groups`, or any count is zero. Nothing is added to the graph in that case.
 */
TensorHandle group_conv(Backend &backend, const TensorHandle &x, size_t filters, Size2 kernel,
                        size_t stride, size_t groups);

// Throws ConfigurationError for an invalid grouping; shared with the unit planner.
void check_grouping(size_t in_channels, size_t filters, size_t groups);

}  // namespace snet
