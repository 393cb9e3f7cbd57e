/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "tensor/tensor.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace snet {

std::string format_shape(const std::vector<size_t> &shape) {
  std::string shape_str = "(";
  for (size_t j = 0; j < shape.size(); ++j) {
    if (j > 0)
      shape_str += ",";
    shape_str += shape[j] == 0 ? std::string("?") : std::to_string(shape[j]);
  }
  shape_str += ")";
  return shape_str;
}

Tensor::Tensor(std::vector<size_t> shape, float value)
    : shape_(std::move(shape)), data_(shape_size(shape_), value) {}

Tensor::Tensor(std::vector<size_t> shape, std::vector<float> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
  if (data_.size() != shape_size(shape_)) {
    throw std::invalid_argument("Tensor data size " + std::to_string(data_.size()) +
                                " does not match shape " + format_shape(shape_));
  }
}

size_t Tensor::dimension(size_t axis) const {
  if (axis >= shape_.size()) {
    throw std::out_of_range("Tensor axis " + std::to_string(axis) + " out of range for shape " +
                            format_shape(shape_));
  }
  return shape_[axis];
}

void Tensor::ensure(const std::vector<size_t> &shape) {
  size_t new_size = shape_size(shape);
  if (new_size != data_.size()) {
    data_.resize(new_size);
  }
  shape_ = shape;
}

void Tensor::fill(float value) { std::fill(data_.begin(), data_.end(), value); }

void Tensor::fill_random_uniform(float min_val, float max_val, unsigned long long seed) {
  std::mt19937_64 gen(seed);
  std::uniform_real_distribution<float> dist(min_val, max_val);
  for (auto &value : data_) {
    value = dist(gen);
  }
}

}  // namespace snet
