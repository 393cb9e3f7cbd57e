/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/cpu/activation_ops.hpp"

#include <cmath>

#include "threading/thread_handler.hpp"

namespace snet {
namespace cpu {

template <typename T> void relu(const T *input, T *output, size_t size) {
  parallel_for<size_t>(0, size, [&](size_t i) { output[i] = input[i] > T(0) ? input[i] : T(0); });
}

template <typename T> void softmax(const T *input, T *output, size_t rows, size_t cols) {
  parallel_for<size_t>(0, rows, [&](size_t r) {
    const T *in_row = input + r * cols;
    T *out_row = output + r * cols;

    // Find max value for numerical stability
    T max_val = in_row[0];
    for (size_t c = 1; c < cols; ++c) {
      if (in_row[c] > max_val) {
        max_val = in_row[c];
      }
    }

    T sum_exp = T(0);
    for (size_t c = 0; c < cols; ++c) {
      T exp_val = std::exp(in_row[c] - max_val);
      out_row[c] = exp_val;
      sum_exp += exp_val;
    }

    for (size_t c = 0; c < cols; ++c) {
      out_row[c] /= sum_exp;
    }
  });
}

template void relu<float>(const float *, float *, size_t);
template void softmax<float>(const float *, float *, size_t, size_t);

} // namespace cpu
} // namespace snet
