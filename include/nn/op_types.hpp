/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <string>

namespace snet {

enum class Padding { Same, Valid };
enum class ActivationKind { ReLU, Softmax };
enum class PoolKind { Avg, Max };

struct Size2 {
  size_t h = 1;
  size_t w = 1;

  bool operator==(const Size2 &other) const = default;
};

// Output extent and leading padding of one spatial axis.
struct AxisGeometry {
  size_t out;
  size_t pad_before;
};

/**
 * @brief Resolves one spatial axis.
 * Same:  out = ceil(in / stride), total padding split with the smaller half before.
 * Valid: out = (in - kernel) / stride + 1, no padding.
 * Throws BackendError when the window does not fit or sizes are zero.
 */
AxisGeometry resolve_axis(size_t in, size_t kernel, size_t stride, Padding padding);

std::string to_string(Padding padding);
std::string to_string(ActivationKind kind);
std::string to_string(PoolKind kind);

}  // namespace snet
