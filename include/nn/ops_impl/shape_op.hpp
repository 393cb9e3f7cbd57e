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

// Graph entry point. Holds the placeholder shape; never executed.
class InputOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "input";

  explicit InputOp(std::vector<size_t> shape, const std::string &name = "input");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

  const std::vector<size_t> &shape() const { return shape_; }

private:
  std::vector<size_t> shape_;
};

// A leading 0 in the target shape copies the input batch extent.
class ReshapeOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "reshape";

  explicit ReshapeOp(std::vector<size_t> target_shape, const std::string &name = "reshape");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

private:
  std::vector<size_t> target_shape_;
};

// Output axis i is input axis axes[i].
class TransposeOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "transpose";

  explicit TransposeOp(std::vector<size_t> axes, const std::string &name = "transpose");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

private:
  std::vector<size_t> axes_;
};

class SliceOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "slice";

  SliceOp(size_t axis, size_t start, size_t length, const std::string &name = "slice");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

  size_t start() const { return start_; }
  size_t length() const { return length_; }

private:
  size_t axis_;
  size_t start_;
  size_t length_;
};

class ConcatOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "concat";

  explicit ConcatOp(size_t axis, const std::string &name = "concat");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;

private:
  size_t axis_;
};

class AddOp : public Operation {
public:
  static constexpr const char *TYPE_NAME = "add";

  explicit AddOp(const std::string &name = "add");

  std::string type() const override { return TYPE_NAME; }
  std::vector<size_t>
  compute_output_shape(const Vec<std::vector<size_t>> &input_shapes) const override;
  void forward(const Vec<const Tensor *> &inputs, const Vec<Tensor> &params,
               Tensor &output) const override;
  uint64_t forward_flops(const Vec<std::vector<size_t>> &input_shapes) const override;
};

}  // namespace snet
