/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <numeric>
#include <string>
#include <vector>

namespace snet {

inline size_t shape_size(const std::vector<size_t> &shape) {
  return std::accumulate(shape.begin(), shape.end(), size_t(1), std::multiplies<size_t>());
}

std::string format_shape(const std::vector<size_t> &shape);

/**
 * @brief Dense, contiguous, row-major float32 tensor on the host.
 *
 * Holds parameters and concrete activations when an assembled model is executed.
 * The interpretation of the axes (NHWC or NCHW) belongs to the caller.
 */
class Tensor {
public:
  Tensor() = default;
  explicit Tensor(std::vector<size_t> shape, float value = 0.0f);
  Tensor(std::vector<size_t> shape, std::vector<float> data);

  const std::vector<size_t> &shape() const { return shape_; }
  size_t dims() const { return shape_.size(); }
  size_t dimension(size_t axis) const;
  size_t size() const { return data_.size(); }
  bool empty() const { return data_.empty(); }

  float *data() { return data_.data(); }
  const float *data() const { return data_.data(); }

  float &operator[](size_t index) { return data_[index]; }
  const float &operator[](size_t index) const { return data_[index]; }

  // Resizes the buffer if the element count changes; contents are unspecified afterwards.
  void ensure(const std::vector<size_t> &shape);

  void fill(float value);
  void fill_random_uniform(float min_val, float max_val, unsigned long long seed);

private:
  std::vector<size_t> shape_;
  std::vector<float> data_;
};

}  // namespace snet
