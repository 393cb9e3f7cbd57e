/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/cpu/pool_ops.hpp"

#include <algorithm>
#include <limits>

#include "threading/thread_handler.hpp"

namespace snet {
namespace cpu {

namespace {

struct Window {
  int h_start, h_end, w_start, w_end;
};

inline Window pool_window(size_t oh, size_t ow, const ImageDims &in, size_t pool_h,
                          size_t pool_w, size_t stride_h, size_t stride_w, size_t pad_h,
                          size_t pad_w) {
  int h_start = static_cast<int>(oh * stride_h) - static_cast<int>(pad_h);
  int w_start = static_cast<int>(ow * stride_w) - static_cast<int>(pad_w);
  int h_end = std::min(h_start + static_cast<int>(pool_h), static_cast<int>(in.h));
  int w_end = std::min(w_start + static_cast<int>(pool_w), static_cast<int>(in.w));
  return {std::max(h_start, 0), h_end, std::max(w_start, 0), w_end};
}

} // namespace

template <typename T>
void avgpool_forward(const T *input, T *output, const ImageDims &in, const ImageDims &out,
                     size_t pool_h, size_t pool_w, size_t stride_h, size_t stride_w, size_t pad_h,
                     size_t pad_w) {
  parallel_for_2d<size_t>(out.n, out.c, [&](size_t b, size_t c) {
    for (size_t oh = 0; oh < out.h; ++oh) {
      for (size_t ow = 0; ow < out.w; ++ow) {
        Window win = pool_window(oh, ow, in, pool_h, pool_w, stride_h, stride_w, pad_h, pad_w);
        double sum = 0.0;
        int count = 0;
        for (int h = win.h_start; h < win.h_end; ++h) {
          for (int w = win.w_start; w < win.w_end; ++w) {
            sum += static_cast<double>(input[in.offset(b, h, w, c)]);
            ++count;
          }
        }
        output[out.offset(b, oh, ow, c)] = static_cast<T>(count > 0 ? sum / count : 0.0);
      }
    }
  });
}

template <typename T>
void maxpool_forward(const T *input, T *output, const ImageDims &in, const ImageDims &out,
                     size_t pool_h, size_t pool_w, size_t stride_h, size_t stride_w, size_t pad_h,
                     size_t pad_w) {
  parallel_for_2d<size_t>(out.n, out.c, [&](size_t b, size_t c) {
    for (size_t oh = 0; oh < out.h; ++oh) {
      for (size_t ow = 0; ow < out.w; ++ow) {
        Window win = pool_window(oh, ow, in, pool_h, pool_w, stride_h, stride_w, pad_h, pad_w);
        T max_val = std::numeric_limits<T>::lowest();
        for (int h = win.h_start; h < win.h_end; ++h) {
          for (int w = win.w_start; w < win.w_end; ++w) {
            max_val = std::max(max_val, input[in.offset(b, h, w, c)]);
          }
        }
        output[out.offset(b, oh, ow, c)] = max_val;
      }
    }
  });
}

template <typename T> void global_avgpool_forward(const T *input, T *output, const ImageDims &in) {
  const double spatial = static_cast<double>(in.h * in.w);
  parallel_for_2d<size_t>(in.n, in.c, [&](size_t b, size_t c) {
    double sum = 0.0;
    for (size_t h = 0; h < in.h; ++h) {
      for (size_t w = 0; w < in.w; ++w) {
        sum += static_cast<double>(input[in.offset(b, h, w, c)]);
      }
    }
    output[b * in.c + c] = static_cast<T>(sum / spatial);
  });
}

#define INSTANTIATE_POOL(T)                                                                     \
  template void avgpool_forward<T>(const T *input, T *output, const ImageDims &in,              \
                                   const ImageDims &out, size_t pool_h, size_t pool_w,          \
                                   size_t stride_h, size_t stride_w, size_t pad_h,              \
                                   size_t pad_w);                                               \
  template void maxpool_forward<T>(const T *input, T *output, const ImageDims &in,              \
                                   const ImageDims &out, size_t pool_h, size_t pool_w,          \
                                   size_t stride_h, size_t stride_w, size_t pad_h,              \
                                   size_t pad_w);                                               \
  template void global_avgpool_forward<T>(const T *input, T *output, const ImageDims &in);
INSTANTIATE_POOL(float)
#undef INSTANTIATE_POOL

} // namespace cpu
} // namespace snet
