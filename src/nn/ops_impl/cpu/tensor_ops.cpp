/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/ops_impl/cpu/tensor_ops.hpp"

#include <cstring>

#include "threading/thread_handler.hpp"

namespace snet {
namespace cpu {

template <typename T>
void slice_forward(const T *input, T *output, const std::vector<size_t> &input_shape, size_t axis,
                   size_t start, size_t length) {
  size_t outer_size = 1;
  for (size_t i = 0; i < axis; ++i) {
    outer_size *= input_shape[i];
  }

  size_t inner_size = 1;
  for (size_t i = axis + 1; i < input_shape.size(); ++i) {
    inner_size *= input_shape[i];
  }

  const size_t axis_size = input_shape[axis];
  const size_t copy_count = length * inner_size;

  parallel_for<size_t>(0, outer_size, [&](size_t o) {
    const T *src = input + (o * axis_size + start) * inner_size;
    T *dst = output + o * copy_count;
    std::memcpy(dst, src, copy_count * sizeof(T));
  });
}

template <typename T>
void concat_forward(const std::vector<const T *> &inputs,
                    const std::vector<std::vector<size_t>> &input_shapes, T *output,
                    size_t axis) {
  const std::vector<size_t> &first = input_shapes.front();
  size_t outer_size = 1;
  for (size_t i = 0; i < axis; ++i) {
    outer_size *= first[i];
  }

  size_t inner_size = 1;
  for (size_t i = axis + 1; i < first.size(); ++i) {
    inner_size *= first[i];
  }

  size_t out_axis = 0;
  for (const auto &shape : input_shapes) {
    out_axis += shape[axis];
  }

  parallel_for<size_t>(0, outer_size, [&](size_t o) {
    size_t offset = 0;
    for (size_t k = 0; k < inputs.size(); ++k) {
      const size_t block = input_shapes[k][axis] * inner_size;
      std::memcpy(output + (o * out_axis * inner_size) + offset, inputs[k] + o * block,
                  block * sizeof(T));
      offset += block;
    }
  });
}

template <typename T>
void permute(const T *input, T *output, const std::vector<size_t> &input_shape,
             const std::vector<size_t> &axes) {
  const size_t rank = input_shape.size();
  std::vector<size_t> in_strides(rank, 1);
  for (size_t i = rank - 1; i > 0; --i) {
    in_strides[i - 1] = in_strides[i] * input_shape[i];
  }

  std::vector<size_t> out_shape(rank);
  std::vector<size_t> src_strides(rank);
  for (size_t i = 0; i < rank; ++i) {
    out_shape[i] = input_shape[axes[i]];
    src_strides[i] = in_strides[axes[i]];
  }

  // Iterate over the leading output axis in parallel, odometer over the rest.
  const size_t lead = out_shape[0];
  size_t lead_block = 1;
  for (size_t i = 1; i < rank; ++i) {
    lead_block *= out_shape[i];
  }

  parallel_for<size_t>(0, lead, [&](size_t l) {
    std::vector<size_t> index(rank, 0);
    index[0] = l;
    T *dst = output + l * lead_block;
    for (size_t flat = 0; flat < lead_block; ++flat) {
      size_t src_offset = 0;
      for (size_t i = 0; i < rank; ++i) {
        src_offset += index[i] * src_strides[i];
      }
      dst[flat] = input[src_offset];

      for (size_t i = rank - 1; i > 0; --i) {
        if (++index[i] < out_shape[i]) {
          break;
        }
        index[i] = 0;
      }
    }
  });
}

template <typename T> void add(const T *a, const T *b, T *output, size_t size) {
  parallel_for<size_t>(0, size, [&](size_t i) { output[i] = a[i] + b[i]; });
}

#define INSTANTIATE_TENSOR_OPS(T)                                                               \
  template void slice_forward<T>(const T *input, T *output,                                    \
                                 const std::vector<size_t> &input_shape, size_t axis,          \
                                 size_t start, size_t length);                                 \
  template void concat_forward<T>(const std::vector<const T *> &inputs,                        \
                                  const std::vector<std::vector<size_t>> &input_shapes,        \
                                  T *output, size_t axis);                                     \
  template void permute<T>(const T *input, T *output, const std::vector<size_t> &input_shape,  \
                           const std::vector<size_t> &axes);                                   \
  template void add<T>(const T *a, const T *b, T *output, size_t size);
INSTANTIATE_TENSOR_OPS(float)
#undef INSTANTIATE_TENSOR_OPS

} // namespace cpu
} // namespace snet
