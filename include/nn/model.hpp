/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "nn/operation.hpp"
#include "tensor/layout.hpp"
#include "tensor/tensor.hpp"

namespace snet {

/**
 * @brief An assembled, executable graph.
 *
 * Operations are stored in topological order; step 0 is the input placeholder and the
 * last step produces the output. Parameters are owned per step.
 */
class Model {
public:
  struct Step {
    std::unique_ptr<Operation> op;
    std::vector<size_t> inputs;  // indices of earlier steps
    std::vector<size_t> output_shape;
    std::vector<ParamDescriptor> param_descs;
    std::vector<Tensor> params;
  };

  Model() = default;
  Model(std::string name, Layout layout, std::vector<Step> steps);

  Model(Model &&) = default;
  Model &operator=(Model &&) = default;
  Model(const Model &) = delete;
  Model &operator=(const Model &) = delete;

  const std::string &name() const { return name_; }
  void set_name(const std::string &name) { name_ = name; }
  Layout layout() const { return layout_; }
  bool empty() const { return steps_.empty(); }

  const std::vector<size_t> &input_shape() const;
  const std::vector<size_t> &output_shape() const;

  // Excludes the input placeholder.
  size_t num_operations() const { return steps_.empty() ? 0 : steps_.size() - 1; }
  size_t count_operations(const std::string &type) const;
  size_t num_parameters() const;
  size_t num_trainable_parameters() const;
  // Dynamic batch axes are evaluated at `batch`.
  uint64_t forward_flops(size_t batch = 1) const;

  const std::vector<Step> &steps() const { return steps_; }

  /**
   * @brief Inference-mode forward pass on the host.
   * @param input Concrete batch; must match the input shape on every non-batch axis.
   * @return Output tensor with the concrete batch extent.
   */
  Tensor forward(const Tensor &input) const;

  void print_summary(std::ostream &os = std::cout) const;

private:
  std::string name_;
  Layout layout_ = Layout::NHWC;
  std::vector<Step> steps_;
  std::vector<size_t> last_use_;

  void check_input(const Tensor &input) const;
  Vec<std::vector<size_t>> static_input_shapes(size_t index, size_t batch) const;
};

}  // namespace snet
