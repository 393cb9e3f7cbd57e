/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/cpu/conv2d_ops.hpp"

#include "threading/thread_handler.hpp"

namespace snet {
namespace cpu {
namespace conv2d {

template <typename T>
void forward(const T *input, const T *weights, const T *bias, T *output, const ImageDims &in,
             const ImageDims &out, size_t k_h, size_t k_w, size_t s_h, size_t s_w, size_t p_h,
             size_t p_w) {
  const size_t in_c = in.c;
  parallel_for_2d<size_t>(out.n, out.c, [&](size_t n, size_t oc) {
    const T *w_oc = weights + oc * in_c * k_h * k_w;
    for (size_t oh = 0; oh < out.h; ++oh) {
      for (size_t ow = 0; ow < out.w; ++ow) {
        T sum = bias ? bias[oc] : T(0);
        for (size_t kh = 0; kh < k_h; ++kh) {
          int ih = static_cast<int>(oh * s_h + kh) - static_cast<int>(p_h);
          if (ih < 0 || ih >= static_cast<int>(in.h)) continue;

          for (size_t kw = 0; kw < k_w; ++kw) {
            int iw = static_cast<int>(ow * s_w + kw) - static_cast<int>(p_w);
            if (iw < 0 || iw >= static_cast<int>(in.w)) continue;

            for (size_t ic = 0; ic < in_c; ++ic) {
              sum += input[in.offset(n, ih, iw, ic)] * w_oc[(ic * k_h + kh) * k_w + kw];
            }
          }
        }
        output[out.offset(n, oh, ow, oc)] = sum;
      }
    }
  });
}

template <typename T>
void depthwise_forward(const T *input, const T *weights, T *output, const ImageDims &in,
                       const ImageDims &out, size_t multiplier, size_t k_h, size_t k_w,
                       size_t s_h, size_t s_w, size_t p_h, size_t p_w) {
  parallel_for_2d<size_t>(out.n, out.c, [&](size_t n, size_t oc) {
    const size_t ic = oc / multiplier;
    const T *w_oc = weights + oc * k_h * k_w;
    for (size_t oh = 0; oh < out.h; ++oh) {
      for (size_t ow = 0; ow < out.w; ++ow) {
        T sum = T(0);
        for (size_t kh = 0; kh < k_h; ++kh) {
          int ih = static_cast<int>(oh * s_h + kh) - static_cast<int>(p_h);
          if (ih < 0 || ih >= static_cast<int>(in.h)) continue;

          for (size_t kw = 0; kw < k_w; ++kw) {
            int iw = static_cast<int>(ow * s_w + kw) - static_cast<int>(p_w);
            if (iw < 0 || iw >= static_cast<int>(in.w)) continue;

            sum += input[in.offset(n, ih, iw, ic)] * w_oc[kh * k_w + kw];
          }
        }
        output[out.offset(n, oh, ow, oc)] = sum;
      }
    }
  });
}

#define INSTANTIATE_CONV2D(T)                                                                   \
  template void forward<T>(const T *input, const T *weights, const T *bias, T *output,          \
                           const ImageDims &in, const ImageDims &out, size_t k_h, size_t k_w,   \
                           size_t s_h, size_t s_w, size_t p_h, size_t p_w);                     \
  template void depthwise_forward<T>(const T *input, const T *weights, T *output,               \
                                     const ImageDims &in, const ImageDims &out,                 \
                                     size_t multiplier, size_t k_h, size_t k_w, size_t s_h,     \
                                     size_t s_w, size_t p_h, size_t p_w);
INSTANTIATE_CONV2D(float)
#undef INSTANTIATE_CONV2D

} // namespace conv2d
} // namespace cpu
} // namespace snet
