/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/cpu/batchnorm_ops.hpp"

#include <cmath>

#include "threading/thread_handler.hpp"

namespace snet {
namespace cpu {
namespace batchnorm {

template <typename T>
void inference(const T *input, T *output, const T *gamma, const T *beta, const T *running_mean,
               const T *running_var, T epsilon, size_t outer, size_t channels, size_t inner) {
  parallel_for<size_t>(0, outer, [&](size_t o) {
    for (size_t c = 0; c < channels; ++c) {
      const T inv_std = T(1) / std::sqrt(running_var[c] + epsilon);
      const T scale = gamma[c] * inv_std;
      const T shift = beta[c] - running_mean[c] * scale;
      const size_t base = (o * channels + c) * inner;
      for (size_t i = 0; i < inner; ++i) {
        output[base + i] = input[base + i] * scale + shift;
      }
    }
  });
}

template void inference<float>(const float *, float *, const float *, const float *,
                               const float *, const float *, float, size_t, size_t, size_t);

} // namespace batchnorm
} // namespace cpu
} // namespace snet
