/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/op_types.hpp"

#include "common/errors.hpp"

namespace snet {

AxisGeometry resolve_axis(size_t in, size_t kernel, size_t stride, Padding padding) {
  if (kernel == 0 || stride == 0) {
    throw BackendError("Kernel and stride must be positive (kernel=" + std::to_string(kernel) +
                       ", stride=" + std::to_string(stride) + ")");
  }
  if (padding == Padding::Same) {
    size_t out = (in + stride - 1) / stride;
    size_t needed = (out > 0 ? (out - 1) * stride : 0) + kernel;
    size_t pad_total = needed > in ? needed - in : 0;
    return {out, pad_total / 2};
  }
  if (in < kernel) {
    throw BackendError("Window of size " + std::to_string(kernel) +
                       " does not fit input extent " + std::to_string(in) +
                       " with valid padding");
  }
  return {(in - kernel) / stride + 1, 0};
}

std::string to_string(Padding padding) { return padding == Padding::Same ? "same" : "valid"; }

std::string to_string(ActivationKind kind) {
  return kind == ActivationKind::ReLU ? "relu" : "softmax";
}

std::string to_string(PoolKind kind) { return kind == PoolKind::Avg ? "avg" : "max"; }

}  // namespace snet
