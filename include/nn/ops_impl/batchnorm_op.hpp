/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>
#include <vector>

#include "nn/operation.hpp"

namespace snet {

/**
 * @brief Batch normalization over `channel_axis`, evaluated with running statistics.
 * Parameters: gamma, beta (trainable), moving_mean, moving_variance (non-trainable).
 */
class BatchNormOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "batchnorm";

  BatchNormOp(size_t channel_axis, size_t channels, float epsilon = 1e-3f,
              const std::string &name = "batchnorm");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  std::vector<ParamDescriptor> param_descriptors() const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

  size_t channel_axis() const { return channel_axis_; }

private:
  size_t channel_axis_;
  size_t channels_;
  float epsilon_;
};

}  // namespace snet
