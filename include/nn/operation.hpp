/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "tensor/tensor.hpp"

namespace snet {

template <typename T> using Vec = std::vector<T>;

enum class ParamInit {
  Uniform,  // U(-1/sqrt(fan_in), 1/sqrt(fan_in))
  Ones,
  Zeros,
};

struct ParamDescriptor {
  std::string name;
  std::vector<size_t> shape;
  ParamInit init = ParamInit::Zeros;
  size_t fan_in = 1;
  bool trainable = true;
};

/**
 * @brief A graph operation: static shape inference plus a CPU forward kernel.
 *
 * Shapes use 0 for a dynamic batch axis during graph construction. When a model runs,
 * the same compute_output_shape is evaluated on concrete shapes.
 */
class Operation {
public:
  explicit Operation(std::string name) : name_(std::move(name)) {}
  virtual ~Operation() = default;

  Operation(const Operation &) = delete;
  Operation &operator=(const Operation &) = delete;

  const std::string &name() const { return name_; }
  void set_name(const std::string &name) { name_ = name; }

  virtual std::string type() const = 0;

  // Throws BackendError when the inputs are not acceptable.
  virtual std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const = 0;

  virtual std::vector<ParamDescriptor> param_descriptors() const { return {}; }

  // `output` has already been sized by compute_output_shape.
  virtual void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
                       Tensor &output) const = 0;

  virtual uint64_t forward_flops(const Vec<std::vector<size_t>> &input_shapes) const {
    (void)input_shapes;
    return 0;
  }

protected:
  std::string name_;

  void expect_inputs(const Vec<std::vector<size_t>> &input_shapes, size_t count) const;
  void expect_rank(const std::vector<size_t> &shape, size_t rank) const;
};

}  // namespace snet
