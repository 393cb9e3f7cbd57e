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
 * @brief Reorders channels so each group's outputs are spread over all groups.
 *
 * The channel axis of length C is viewed as (groups, C / groups), the two axes are
 * swapped and flattened again: output channel j reads input channel
 * (j % groups) * (C / groups) + j / groups. Shuffling again with C / groups groups
 * restores the original order.
 *
 * @throws ConfigurationError if `groups` is zero or does not divide the channel count.
 */
TensorHandle channel_shuffle(Backend &backend, const TensorHandle &x, size_t groups);

}  // namespace snet
