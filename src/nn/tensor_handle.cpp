/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "nn/tensor_handle.hpp"

#include "common/errors.hpp"
#include "tensor/tensor.hpp"

namespace snet {

size_t TensorHandle::channel_axis() const {
  if (shape_.size() == 4) {
    return snet::channel_axis(layout_);
  }
  if (shape_.size() == 2) {
    return 1;
  }
  throw BackendError("Tensor of shape " + format_shape(shape_) + " has no channel axis");
}

size_t TensorHandle::channels() const { return shape_[channel_axis()]; }

size_t TensorHandle::height() const {
  if (shape_.size() != 4) {
    throw BackendError("Tensor of shape " + format_shape(shape_) + " has no spatial axes");
  }
  return shape_[height_axis(layout_)];
}

size_t TensorHandle::width() const {
  if (shape_.size() != 4) {
    throw BackendError("Tensor of shape " + format_shape(shape_) + " has no spatial axes");
  }
  return shape_[width_axis(layout_)];
}

}  // namespace snet
