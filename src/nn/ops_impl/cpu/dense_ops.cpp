/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/cpu/dense_ops.hpp"

#include "threading/thread_handler.hpp"

namespace snet {
namespace cpu {
namespace dense {

template <typename T>
void forward(const T *input, const T *weights, const T *bias, T *output, size_t batch_size,
             size_t in_features, size_t out_features) {
  parallel_for_2d<size_t>(batch_size, out_features, [&](size_t n, size_t o) {
    const T *x = input + n * in_features;
    const T *w = weights + o * in_features;
    T sum = bias ? bias[o] : T(0);
    for (size_t i = 0; i < in_features; ++i) {
      sum += x[i] * w[i];
    }
    output[n * out_features + o] = sum;
  });
}

template void forward<float>(const float *, const float *, const float *, float *, size_t, size_t,
                             size_t);

} // namespace dense
} // namespace cpu
} // namespace snet
